#pragma once

#include "duckdb.hpp"
#include <cstdio>
#include <string>
#include <utility>

#include "../models/export_config.hpp"
#include "../utils/error_handler.hpp"
#include "../utils/string_utils.hpp"

// Lists the tables and views of the database, optionally only those of one schema
inline ExportConfig GetExportConfigFromDatabase(duckdb::Connection &con, ExportConfigMetaData meta,
                                                const std::string &schema_filter = "") {
    std::string query = "SELECT table_schema, table_name "
                        "FROM information_schema.tables "
                        "WHERE table_type IN ('BASE TABLE', 'VIEW')";

    if (!schema_filter.empty()) {
        std::string escaped_schema = schema_filter;
        ReplaceAll(escaped_schema, "'", "''");
        query += " AND lower(table_schema) = lower('" + escaped_schema + "')";
    }
    query += " ORDER BY table_schema, table_name";

    auto result = con.Query(query);
    if (result->HasError()) {
        ErrorHandler::HandleRuntimeError("Listing tables failed: " + result->GetError());
        return ExportConfig{meta, {}};
    }

    printf("Found %llu tables in the database.\n", static_cast<unsigned long long>(result->RowCount()));

    std::vector<TableConfig> tables;
    tables.reserve(result->RowCount());
    for (duckdb::idx_t row_idx = 0; row_idx < result->RowCount(); row_idx++) {
        auto table_schema = result->GetValue(0, row_idx).ToString();
        auto table_name = result->GetValue(1, row_idx).ToString();
        tables.push_back(TableConfig{std::move(table_schema), std::move(table_name)});
    }

    return ExportConfig{
        meta,
        tables
    };
}
