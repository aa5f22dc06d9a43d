#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "field_formatter.hpp"
#include "../models/delimiter_set.hpp"
#include "../sinks/output_sink.hpp"

using Record = std::vector<std::optional<std::string>>;

constexpr const char *DEFAULT_NULL_STRING = "null";

// Formats records in a given dialect and hands them to an output sink
class RecordWriter {
public:
    explicit RecordWriter(IOutputSink &sink,
                          const DelimiterSet &delimiters = DelimiterSet::Default(),
                          std::string null_string = DEFAULT_NULL_STRING)
        : sink_(sink), delimiters_(delimiters), null_string_(std::move(null_string)),
          escape_(delimiters.EscapeToken()), enclose_(delimiters.EncloseToken()),
          must_enclose_for_(delimiters.MustEncloseFor()) {
    }

    // Formats a single field, a null value is written as the null string
    std::string FormatField(const std::optional<std::string> &value) const {
        const std::optional<std::string> formatted = EscapeAndEnclose(value ? *value : null_string_,
                                                                      escape_, enclose_,
                                                                      must_enclose_for_,
                                                                      delimiters_.enclose_required);
        return *formatted;
    }

    std::string FormatRecord(const Record &record) const {
        std::string line;
        for (size_t i = 0; i < record.size(); i++) {
            if (i > 0 && delimiters_.field_delim != NULL_CHAR) {
                line.push_back(delimiters_.field_delim);
            }
            line += FormatField(record[i]);
        }
        if (delimiters_.record_delim != NULL_CHAR) {
            line.push_back(delimiters_.record_delim);
        }
        return line;
    }

    void WriteRecord(const Record &record) {
        sink_.Write(FormatRecord(record));
        records_written_++;
    }

    // Convenience for records without nulls, e.g. a header line
    void WriteFields(const std::vector<std::string> &fields) {
        Record record;
        record.reserve(fields.size());
        for (const auto &field: fields) {
            record.emplace_back(field);
        }
        WriteRecord(record);
    }

    uint64_t RecordsWritten() const { return records_written_; }
    const DelimiterSet &delimiters() const { return delimiters_; }

private:
    IOutputSink &sink_;
    const DelimiterSet delimiters_;
    const std::string null_string_;

    const std::string escape_;
    const std::string enclose_;
    const std::vector<char> must_enclose_for_;

    uint64_t records_written_ = 0;
};
