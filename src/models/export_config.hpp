#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "delimiter_set.hpp"
#include "../utils/string_utils.hpp"

constexpr const char *DEFAULT_SCHEMA = "main";

struct TableConfig {
    std::string schema;
    std::string table;

    // "schema"."table", ready to be used in a query
    std::string QualifiedName() const {
        return QuoteIdentifier(schema) + "." + QuoteIdentifier(table);
    }

    // schema.table, used to name the output file; path separators and NUL become '_'
    std::string FileStem() const {
        std::string stem = schema + "." + table;
        for (char &c: stem) {
            if (c == '/' || c == '\\' || c == '\0') {
                c = '_';
            }
        }
        return stem;
    }

    // Accepts "table" or "schema.table"
    static TableConfig FromArgument(const std::string &arg, const std::string &default_schema) {
        const auto dot = arg.find('.');
        if (dot == std::string::npos) {
            return TableConfig{default_schema.empty() ? DEFAULT_SCHEMA : default_schema, arg};
        }
        return TableConfig{arg.substr(0, dot), arg.substr(dot + 1)};
    }
};

struct ExportConfigMetaData {
    std::filesystem::path output_dir;
    DelimiterSet delimiters;
    std::string null_string;
    // empty means all columns
    std::vector<std::string> columns;
    // empty means all rows
    std::string where_clause;
    bool compress;
};

struct ExportConfig : ExportConfigMetaData {
    std::vector<TableConfig> tables;
};
