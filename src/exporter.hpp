#pragma once

#include "duckdb.hpp"

#include <chrono>
#include <cstdio>
#include <filesystem>
#include <memory>
#include <string>
#include <system_error>
#include <vector>

#include "format/record_writer.hpp"
#include "models/export_config.hpp"
#include "models/export_result.hpp"
#include "sinks/lz4_frame_sink.hpp"
#include "sinks/output_sink.hpp"
#include "utils/error_handler.hpp"
#include "utils/string_utils.hpp"


inline std::string BuildSelectQuery(const ExportConfigMetaData &config, const TableConfig &table_config) {
    std::string columns = "*";
    if (!config.columns.empty()) {
        columns.clear();
        for (size_t i = 0; i < config.columns.size(); i++) {
            if (i > 0) columns += ", ";
            columns += QuoteIdentifier(config.columns[i]);
        }
    }

    std::string where_clause = "";
    if (!config.where_clause.empty()) {
        where_clause = "WHERE " + config.where_clause;
    }

    std::string query = "SELECT {{COLUMNS}} FROM {{TABLE_NAME}} {{WHERE_CLAUSE}}";
    ReplaceAll(query, "{{COLUMNS}}", columns);
    ReplaceAll(query, "{{TABLE_NAME}}", table_config.QualifiedName());
    ReplaceAll(query, "{{WHERE_CLAUSE}}", where_clause);
    return query;
}

inline std::filesystem::path GetOutputPath(const ExportConfigMetaData &config, const TableConfig &table_config) {
    const std::string extension = config.compress ? ".txt.lz4" : ".txt";
    return config.output_dir / (table_config.FileStem() + extension);
}

inline std::unique_ptr<IOutputSink> OpenSink(const std::filesystem::path &file_path, const bool compress) {
    if (compress) {
        return std::make_unique<LZ4FrameSink>(file_path);
    }
    return std::make_unique<FileSink>(file_path);
}

// Streams the query result chunk by chunk into the writer, returns the number of rows
inline uint64_t WriteQueryResult(duckdb::QueryResult &query_result, RecordWriter &writer) {
    uint64_t n_rows = 0;
    Record record;

    auto current_chunk = query_result.Fetch();
    while (current_chunk) {
        const duckdb::idx_t n_columns = current_chunk->ColumnCount();
        for (duckdb::idx_t row_idx = 0; row_idx < current_chunk->size(); row_idx++) {
            record.clear();
            for (duckdb::idx_t col_idx = 0; col_idx < n_columns; col_idx++) {
                const duckdb::Value value = current_chunk->GetValue(col_idx, row_idx);
                if (value.IsNull()) {
                    record.emplace_back(std::nullopt);
                } else {
                    record.emplace_back(value.ToString());
                }
            }
            writer.WriteRecord(record);
            n_rows++;
        }
        current_chunk = query_result.Fetch();
    }
    return n_rows;
}

inline ExportResult ExportTable(duckdb::Connection &con, const ExportConfig &config, const TableConfig &table_config) {
    using clock = std::chrono::high_resolution_clock;

    const auto output_path = GetOutputPath(config, table_config);
    ExportResult result(table_config.FileStem(), output_path);
    const uint64_t errors_before = ErrorHandler::LoggedErrorCount();

    const std::string query = BuildSelectQuery(config, table_config);

    const auto fail = [&](const std::string &message) {
        result.SetError(message);
        ErrorHandler::LogError(table_config.FileStem() + ": " + message);
    };

    try {
        const auto t0 = clock::now();

        const auto query_result = con.SendQuery(query);
        if (query_result->HasError()) {
            fail(query_result->GetError());
            return result;
        }

        const auto sink = OpenSink(output_path, config.compress);
        RecordWriter writer(*sink, config.delimiters, config.null_string);
        const uint64_t n_rows = WriteQueryResult(*query_result, writer);
        sink->Close();

        const auto t1 = clock::now();

        // a streamed result reports execution errors by ending the stream early
        if (query_result->HasError()) {
            fail("export stopped after " + std::to_string(n_rows) + " rows: " + query_result->GetError());
        }

        result.SetCounts(n_rows, sink->BytesWritten(), sink->BytesOnDisk());
        result.SetExportTime(std::chrono::duration_cast<std::chrono::nanoseconds>(t1 - t0).count() / 1e6);
    } catch (const std::exception &e) {
        fail(e.what());
    }

    if (ErrorHandler::LoggedErrorCount() > errors_before) {
        result.SetError("errors were logged while exporting this table");
    }
    return result;
}


inline std::vector<ExportResult> RunExport(duckdb::Connection &con, const ExportConfig &config) {
    std::vector<ExportResult> results;

    std::error_code ec;
    std::filesystem::create_directories(config.output_dir, ec);
    if (ec) {
        ErrorHandler::HandleIOError("Cannot create output directory " + config.output_dir.string() + ": " +
                                    ec.message());
        return results;
    }

    const uint64_t n_tables = config.tables.size();
    uint64_t current_table_index = 0;

    for (const auto &table: config.tables) {
        printf("Started table %llu of %llu: %s\n",
               static_cast<unsigned long long>(current_table_index),
               static_cast<unsigned long long>(n_tables),
               table.FileStem().c_str());

        results.push_back(ExportTable(con, config, table));

        current_table_index += 1;
        printf("Finished table %llu of %llu: %s (%llu rows)\n",
               static_cast<unsigned long long>(current_table_index),
               static_cast<unsigned long long>(n_tables),
               table.FileStem().c_str(),
               static_cast<unsigned long long>(results.back().GetNumRows()));
    }
    return results;
}
