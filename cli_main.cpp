#include <iostream>
#include <string>
#include <vector>
#include "src/exporter.hpp"
#include "src/models/delimiter_set.hpp"
#include "src/models/export_config.hpp"
#include "src/models/export_result.hpp"
#include "src/schema/config_creator.hpp"
#include "src/utils/error_handler.hpp"
#include "src/utils/string_utils.hpp"

void printUsage(const char* programName) {
    std::cout << "Usage: " << programName << " [options] <duckdb_file> <output_dir>\n";
    std::cout << "  --log-errors:                  Log errors to stderr instead of throwing exceptions\n";
    std::cout << "  --schema <name>:               Only export tables of this schema\n";
    std::cout << "  --table <name>:                Export this table, may be repeated (default: all tables)\n";
    std::cout << "  --columns <c1,c2,...>:         Export only these columns\n";
    std::cout << "  --where <condition>:           Only export rows matching the condition\n";
    std::cout << "  --fields-terminated-by <c>:    Field delimiter (default: ,)\n";
    std::cout << "  --lines-terminated-by <c>:     Record delimiter (default: \\n)\n";
    std::cout << "  --enclosed-by <c>:             Enclose every field with <c>\n";
    std::cout << "  --optionally-enclosed-by <c>:  Enclose fields with <c> only when needed\n";
    std::cout << "  --escaped-by <c>:              Escape character\n";
    std::cout << "  --mysql-delimiters:            Use MySQL's default delimiters: , \\n ' \\\\\n";
    std::cout << "  --null-string <s>:             Text written for NULL values (default: null)\n";
    std::cout << "  --compress:                    Write LZ4 frame files (.txt.lz4)\n";
    std::cout << "  --summary <csv>:               Write per-table statistics to a CSV file\n";
    std::cout << "  duckdb_file:                   Path to the DuckDB database file\n";
    std::cout << "  output_dir:                    Directory receiving one file per table\n";
    std::cout << "Delimiters are a single character or one of \\t \\n \\r \\b \\0 \\\\ \\' \\\", \\0ooo, \\0x<hh>\n";
}

int main(int argc, char* argv[]) {
    // Parse arguments
    std::vector<std::string> positional_args;
    bool log_errors = false;
    std::string schema_name = "";
    std::string summary_csv = "";
    std::vector<std::string> table_args;

    ExportConfigMetaData meta = {
        "",
        DelimiterSet::Default(),
        DEFAULT_NULL_STRING,
        {},
        "",
        false
    };

    try {
        for (int i = 1; i < argc; i++) {
            std::string arg = argv[i];

            const auto next_value = [&]() -> std::string {
                if (i + 1 >= argc) {
                    throw std::invalid_argument(arg + " requires a value");
                }
                return argv[++i];
            };

            if (arg == "--log-errors") {
                log_errors = true;
            } else if (arg == "--schema") {
                schema_name = next_value();
            } else if (arg == "--table") {
                table_args.push_back(next_value());
            } else if (arg == "--columns") {
                for (const auto &column: Split(next_value(), ',')) {
                    const auto trimmed = Trim(column);
                    if (!trimmed.empty()) meta.columns.push_back(trimmed);
                }
            } else if (arg == "--where") {
                meta.where_clause = next_value();
            } else if (arg == "--fields-terminated-by") {
                meta.delimiters.field_delim = ParseDelimiter(next_value());
            } else if (arg == "--lines-terminated-by") {
                meta.delimiters.record_delim = ParseDelimiter(next_value());
            } else if (arg == "--enclosed-by") {
                meta.delimiters.enclosed_by = ParseDelimiter(next_value());
                meta.delimiters.enclose_required = true;
            } else if (arg == "--optionally-enclosed-by") {
                meta.delimiters.enclosed_by = ParseDelimiter(next_value());
                meta.delimiters.enclose_required = false;
            } else if (arg == "--escaped-by") {
                meta.delimiters.escaped_by = ParseDelimiter(next_value());
            } else if (arg == "--mysql-delimiters") {
                meta.delimiters = DelimiterSet::MySQL();
            } else if (arg == "--null-string") {
                meta.null_string = next_value();
            } else if (arg == "--compress") {
                meta.compress = true;
            } else if (arg == "--summary") {
                summary_csv = next_value();
            } else if (arg.rfind("--", 0) == 0) {
                throw std::invalid_argument("Unknown option " + arg);
            } else {
                positional_args.push_back(arg);
            }
        }
    } catch (const std::exception &e) {
        std::cerr << "Error: " << e.what() << "\n\n";
        printUsage(argv[0]);
        return 1;
    }

    if (positional_args.size() != 2) {
        std::cerr << "Error: Invalid number of arguments\n\n";
        printUsage(argv[0]);
        return 1;
    }

    const std::string duckdb_path = positional_args[0];
    meta.output_dir = positional_args[1];

    // Set error handling mode
    ErrorHandler::SetLogErrorsMode(log_errors);

    for (const auto &problem: meta.delimiters.ReadBackProblems()) {
        ErrorHandler::LogWarning("Exported files may not be readable back: " + problem);
    }

    try {
        duckdb::DuckDB db(duckdb_path);
        duckdb::Connection con(db);

        con.Query("SELECT version()")->GetValue(0,0).Print();

        ExportConfig config;
        if (table_args.empty()) {
            config = GetExportConfigFromDatabase(con, meta, schema_name);
        } else {
            config = ExportConfig{meta, {}};
            for (const auto &table_arg: table_args) {
                config.tables.push_back(TableConfig::FromArgument(table_arg, schema_name));
            }
        }

        const auto results = RunExport(con, config);

        bool has_error = ErrorHandler::LoggedErrorCount() > 0;
        for (const auto &res: results) {
            res.PrettyPrint();
            has_error = has_error || res.HasError();
        }

        if (!summary_csv.empty()) {
            SaveSummaryAsCSV(results, summary_csv);
        }

        if (has_error) {
            std::cerr << "Export finished with errors." << std::endl;
            return 1;
        }
        std::cout << "Export completed successfully. Files saved to: " << meta.output_dir.string() << std::endl;
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
