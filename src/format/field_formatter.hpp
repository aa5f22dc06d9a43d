#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "../utils/string_utils.hpp"

// A token equal to this string means "no character configured"
constexpr std::string_view NULL_CHARACTER_TOKEN{"\0", 1};

inline bool IsTokenSet(std::string_view token) {
    return !token.empty() && token != NULL_CHARACTER_TOKEN;
}

/**
 * Escapes and encloses a single field value for delimited text output.
 *
 * The escape sequence is first doubled wherever it appears in the value. If an enclosing
 * sequence is configured as well, every occurrence of it is then prefixed with the (single)
 * escape sequence. The value is wrapped in the enclosing sequence if enclose_required is set
 * or if any of the must_enclose_for characters is present in the original value.
 *
 * An empty or NUL token disables escaping or enclosing. A null value stays null.
 */
inline std::optional<std::string> EscapeAndEnclose(const std::optional<std::string> &value,
                                                   std::string_view escape,
                                                   std::string_view enclose,
                                                   const std::vector<char> &must_enclose_for,
                                                   const bool enclose_required) {
    if (!value) {
        return std::nullopt;
    }

    const bool escaping_legal = IsTokenSet(escape);
    std::string with_escapes = *value;

    if (escaping_legal) {
        const std::string escape_str(escape);
        ReplaceAll(with_escapes, escape_str, escape_str + escape_str);
    }

    if (!IsTokenSet(enclose)) {
        return with_escapes;
    }

    const std::string enclose_str(enclose);

    // the encloser must always be escaped when we can
    if (escaping_legal) {
        ReplaceAll(with_escapes, enclose_str, std::string(escape) + enclose_str);
    }

    bool do_enclose = enclose_required;
    if (!do_enclose) {
        // triggers are checked against the raw value, not the escaped one
        for (const char reason: must_enclose_for) {
            if (value->find(reason) != std::string::npos) {
                do_enclose = true;
                break;
            }
        }
    }

    if (!do_enclose) {
        return with_escapes;
    }
    return enclose_str + with_escapes + enclose_str;
}
