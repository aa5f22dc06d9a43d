#pragma once

#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "../models/delimiter_set.hpp"

class ParseError : public std::runtime_error {
public:
    explicit ParseError(const std::string &message) : std::runtime_error(message) {
    }
};

enum class ParseState {
    FIELD_START,
    ENCLOSED_FIELD,
    UNENCLOSED_FIELD,
    ENCLOSED_ESCAPE,
    ENCLOSED_EXPECT_DELIMITER,
    UNENCLOSED_ESCAPE,
};

/**
 * Splits a record written by RecordWriter back into its fields.
 *
 * The escape character makes the following character literal. An enclosed field must be
 * followed by a field delimiter, a record delimiter or the end of the input. Parsing stops
 * at the first record delimiter.
 */
class RecordParser {
public:
    explicit RecordParser(const DelimiterSet &delimiters) : delimiters_(delimiters) {
    }

    std::vector<std::string> Parse(std::string_view record) const {
        std::vector<std::string> fields;
        std::string current;
        ParseState state = ParseState::FIELD_START;

        for (size_t pos = 0; pos < record.size(); pos++) {
            const char c = record[pos];

            if (state == ParseState::FIELD_START) {
                if (IsEncloser(c)) {
                    state = ParseState::ENCLOSED_FIELD;
                    continue;
                }
                state = ParseState::UNENCLOSED_FIELD;
            }

            switch (state) {
                case ParseState::UNENCLOSED_FIELD:
                    if (IsFieldDelim(c)) {
                        fields.push_back(std::move(current));
                        current.clear();
                        state = ParseState::FIELD_START;
                    } else if (IsRecordDelim(c)) {
                        fields.push_back(std::move(current));
                        return fields;
                    } else if (IsEscape(c)) {
                        state = ParseState::UNENCLOSED_ESCAPE;
                    } else {
                        current.push_back(c);
                    }
                    break;

                case ParseState::UNENCLOSED_ESCAPE:
                    current.push_back(c);
                    state = ParseState::UNENCLOSED_FIELD;
                    break;

                case ParseState::ENCLOSED_FIELD:
                    if (IsEscape(c)) {
                        state = ParseState::ENCLOSED_ESCAPE;
                    } else if (IsEncloser(c)) {
                        state = ParseState::ENCLOSED_EXPECT_DELIMITER;
                    } else {
                        current.push_back(c);
                    }
                    break;

                case ParseState::ENCLOSED_ESCAPE:
                    current.push_back(c);
                    state = ParseState::ENCLOSED_FIELD;
                    break;

                case ParseState::ENCLOSED_EXPECT_DELIMITER:
                    if (IsFieldDelim(c)) {
                        fields.push_back(std::move(current));
                        current.clear();
                        state = ParseState::FIELD_START;
                    } else if (IsRecordDelim(c)) {
                        fields.push_back(std::move(current));
                        return fields;
                    } else {
                        throw ParseError("Expected delimiter after enclosed field at position " +
                                         std::to_string(pos));
                    }
                    break;

                case ParseState::FIELD_START:
                    break;
            }
        }

        switch (state) {
            case ParseState::ENCLOSED_FIELD:
            case ParseState::ENCLOSED_ESCAPE:
                throw ParseError("Enclosed field is not terminated");
            case ParseState::UNENCLOSED_ESCAPE:
                throw ParseError("Escape character at end of record");
            default:
                break;
        }

        fields.push_back(std::move(current));
        return fields;
    }

private:
    bool IsFieldDelim(const char c) const {
        return delimiters_.field_delim != NULL_CHAR && c == delimiters_.field_delim;
    }

    bool IsRecordDelim(const char c) const {
        return delimiters_.record_delim != NULL_CHAR && c == delimiters_.record_delim;
    }

    bool IsEncloser(const char c) const {
        return delimiters_.enclosed_by != NULL_CHAR && c == delimiters_.enclosed_by;
    }

    bool IsEscape(const char c) const {
        return delimiters_.escaped_by != NULL_CHAR && c == delimiters_.escaped_by;
    }

    const DelimiterSet delimiters_;
};
