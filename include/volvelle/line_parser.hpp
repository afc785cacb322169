#pragma once
/**
 * Line Parser
 *
 * Splits transliteration text into LineEntry records. Grammar per line:
 *
 *   blank        only whitespace
 *   comment      first non-space character is '#'
 *   full_line    <locus>  token.token.token
 *   content_only token.token.token
 *
 * A locus header is a '<' immediately followed by an alphanumeric character.
 * Its body must read <identifier>.<locus-suffix>, e.g. "f1r.1,@P0".
 * Tokens split on '.' and whitespace outside of <...>, [...] and {...} spans;
 * empty pieces are dropped.
 *
 * Parsing is total: structural problems are stored in LineEntry::error and
 * never thrown.
 */

#include <string>
#include <string_view>
#include <vector>

#include "volvelle/types.hpp"

namespace volvelle {

class LineParser {
public:
    std::vector<LineEntry> parse(std::string_view text) const;

    // Parses one physical line (without its terminator)
    LineEntry parse_line(std::string_view line, size_t line_number) const;

    // Loose header grammar used for classification
    static bool is_locus(const std::string& locus);

    // Zandbergen-Landini style locus: f<n><r|v>[n].<n>[a-z][,<marker><type>]
    static bool is_canonical_locus(const std::string& locus);

    // Splits line content into raw tokens; returns false and fills `error`
    // when an opened span is not closed
    static bool split_tokens(std::string_view content, size_t column_offset,
                             std::vector<std::string>& tokens, std::string& error);
};

// Splits text into physical lines, tolerating CRLF and a missing final newline
std::vector<std::string_view> split_physical_lines(std::string_view text);

} // namespace volvelle
