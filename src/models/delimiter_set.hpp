#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "../utils/error_handler.hpp"

constexpr char NULL_CHAR = '\0';

// Describes the dialect of a delimited text file. NULL_CHAR marks a character as unset.
struct DelimiterSet {
    char field_delim;
    char record_delim;
    char enclosed_by;
    char escaped_by;
    // if true, every field is enclosed, otherwise only fields containing a delimiter
    bool enclose_required;

    static DelimiterSet Default() {
        return DelimiterSet{',', '\n', NULL_CHAR, NULL_CHAR, false};
    }

    // The dialect of MySQL's SELECT ... INTO OUTFILE
    static DelimiterSet MySQL() {
        return DelimiterSet{',', '\n', '\'', '\\', false};
    }

    std::vector<char> MustEncloseFor() const {
        return {field_delim, record_delim};
    }

    // one character token for the field formatter, "\0" when unset
    std::string EscapeToken() const { return std::string(1, escaped_by); }
    std::string EncloseToken() const { return std::string(1, enclosed_by); }

    // Reasons why a file written in this dialect may not parse back into the same fields
    [[nodiscard]] std::vector<std::string> ReadBackProblems() const {
        std::vector<std::string> problems;
        const bool has_delimiter = field_delim != NULL_CHAR || record_delim != NULL_CHAR;
        if (has_delimiter && enclosed_by == NULL_CHAR) {
            problems.emplace_back("no enclosing character: values containing a delimiter are written as is");
        }
        if (enclosed_by != NULL_CHAR && escaped_by == NULL_CHAR) {
            problems.emplace_back("no escape character: enclosing characters inside values are not escaped");
        }
        if (enclosed_by != NULL_CHAR && enclosed_by == escaped_by) {
            problems.emplace_back("escape and enclosing character are the same: escapes are applied twice");
        }
        return problems;
    }

    bool operator==(const DelimiterSet &other) const {
        return field_delim == other.field_delim && record_delim == other.record_delim &&
               enclosed_by == other.enclosed_by && escaped_by == other.escaped_by &&
               enclose_required == other.enclose_required;
    }
};

inline int ParseNumber(std::string_view digits, const int base, std::string_view arg) {
    if (digits.empty()) {
        ErrorHandler::HandleInvalidArgumentError("Missing digits in delimiter: " + std::string(arg));
        return -1;
    }
    int value = 0;
    for (const char c: digits) {
        int digit;
        if (c >= '0' && c <= '9') {
            digit = c - '0';
        } else if (c >= 'a' && c <= 'f') {
            digit = c - 'a' + 10;
        } else if (c >= 'A' && c <= 'F') {
            digit = c - 'A' + 10;
        } else {
            digit = base;
        }
        if (digit >= base) {
            ErrorHandler::HandleInvalidArgumentError("Invalid digit '" + std::string(1, c) + "' in delimiter: " +
                                                     std::string(arg));
            return -1;
        }
        value = value * base + digit;
        if (value > 0xFF) {
            ErrorHandler::HandleOutOfRangeError("Delimiter does not fit in one byte: " + std::string(arg));
            return -1;
        }
    }
    return value;
}

/**
 * Parses a delimiter given on the command line. Accepts a single character, one of the
 * escapes \t \n \r \b \0 \\ \' \", an octal escape \0ooo or a hex escape \0x<hh>.
 * Returns NULL_CHAR if the argument was rejected in log mode.
 */
inline char ParseDelimiter(std::string_view arg) {
    if (arg.size() == 1) {
        return arg[0];
    }
    if (arg.size() < 2 || arg[0] != '\\') {
        ErrorHandler::HandleInvalidArgumentError("Delimiter must be a single character or an escape: " +
                                                 std::string(arg));
        return NULL_CHAR;
    }

    if (arg.size() == 2) {
        switch (arg[1]) {
            case 't': return '\t';
            case 'n': return '\n';
            case 'r': return '\r';
            case 'b': return '\b';
            case '0': return NULL_CHAR;
            case '\\': return '\\';
            case '\'': return '\'';
            case '"': return '"';
            default:
                ErrorHandler::HandleInvalidArgumentError("Unknown escape in delimiter: " + std::string(arg));
                return NULL_CHAR;
        }
    }

    if (arg[1] != '0') {
        ErrorHandler::HandleInvalidArgumentError("Unknown escape in delimiter: " + std::string(arg));
        return NULL_CHAR;
    }

    int value;
    if (arg[2] == 'x' || arg[2] == 'X') {
        value = ParseNumber(arg.substr(3), 16, arg);
    } else {
        value = ParseNumber(arg.substr(2), 8, arg);
    }
    if (value < 0) {
        return NULL_CHAR;
    }
    return static_cast<char>(value);
}
