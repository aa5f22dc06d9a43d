#pragma once

#include <cstdio>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include "../format/record_writer.hpp"
#include "../sinks/output_sink.hpp"

class ExportResult {
public:
    explicit ExportResult(std::string table_name, std::filesystem::path output_path)
        : table_name_(std::move(table_name)), output_path_(std::move(output_path)) {
    }

    void SetCounts(const uint64_t n_rows, const uint64_t bytes_written, const uint64_t bytes_on_disk) {
        n_rows_ = n_rows;
        bytes_written_ = bytes_written;
        bytes_on_disk_ = bytes_on_disk;
    }

    void SetExportTime(const double export_time_ms) { export_time_ms_ = export_time_ms; }

    void SetError(const std::string &message) {
        has_error_ = true;
        if (!error_message_.empty()) error_message_ += "; ";
        error_message_ += message;
    }

    [[nodiscard]] const std::string &table_name() const { return table_name_; }
    [[nodiscard]] const std::filesystem::path &output_path() const { return output_path_; }
    [[nodiscard]] uint64_t GetNumRows() const { return n_rows_; }
    [[nodiscard]] uint64_t GetBytesWritten() const { return bytes_written_; }
    [[nodiscard]] uint64_t GetBytesOnDisk() const { return bytes_on_disk_; }
    [[nodiscard]] double GetExportTimeMs() const { return export_time_ms_; }
    [[nodiscard]] bool HasError() const { return has_error_; }
    [[nodiscard]] const std::string &error_message() const { return error_message_; }

    void PrettyPrint(std::ostream &os = std::cout) const {
        os << "ExportResult " << table_name_ << "\n";
        os << "  File: " << output_path_.string() << "\n";
        os << "  Rows: " << n_rows_ << ", " << bytes_written_ << " bytes";
        if (bytes_on_disk_ != bytes_written_ && bytes_on_disk_ > 0) {
            const double factor = static_cast<double>(bytes_written_) / static_cast<double>(bytes_on_disk_);
            os << " (" << bytes_on_disk_ << " on disk, " << std::fixed << std::setprecision(2) << factor
               << "x smaller)";
        }
        os << ", " << std::fixed << std::setprecision(3) << export_time_ms_ << " ms\n";
        if (has_error_) {
            os << "  Error: " << error_message_ << "\n";
        }
    }

private:
    const std::string table_name_;
    const std::filesystem::path output_path_;

    uint64_t n_rows_ = 0;
    uint64_t bytes_written_ = 0;
    uint64_t bytes_on_disk_ = 0;
    double export_time_ms_ = 0.0;

    bool has_error_ = false;
    std::string error_message_;
};

// Dialect of the summary file: comma separated, quoted when needed, backslash escapes
inline DelimiterSet SummaryDelimiters() {
    return DelimiterSet{',', '\n', '"', '\\', false};
}

inline void WriteSummary(const std::vector<ExportResult> &results, IOutputSink &sink) {
    RecordWriter writer(sink, SummaryDelimiters(), "");

    writer.WriteFields({
        "table", "file", "n_rows", "bytes_written", "bytes_on_disk", "export_time_ms", "has_error", "error_message"
    });

    for (const auto &res: results) {
        std::ostringstream time_ms;
        time_ms << std::fixed << std::setprecision(3) << res.GetExportTimeMs();

        writer.WriteFields({
            res.table_name(),
            res.output_path().string(),
            std::to_string(res.GetNumRows()),
            std::to_string(res.GetBytesWritten()),
            std::to_string(res.GetBytesOnDisk()),
            time_ms.str(),
            res.HasError() ? "1" : "0",
            res.error_message()
        });
    }
}

inline void SaveSummaryAsCSV(const std::vector<ExportResult> &results, const std::filesystem::path &file_path) {
    printf("Saving summary to %s\n", file_path.string().c_str());
    FileSink sink(file_path);
    WriteSummary(results, sink);
    sink.Close();
}
