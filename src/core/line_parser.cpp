/**
 * Line Parser Implementation
 */

#include "volvelle/line_parser.hpp"

#include <cctype>
#include <regex>

namespace volvelle {

const char* line_type_name(LineType type) {
    switch (type) {
        case LineType::FULL_LINE:    return "full_line";
        case LineType::CONTENT_ONLY: return "content_only";
        case LineType::BLANK:        return "blank";
        case LineType::COMMENT:      return "comment";
    }
    return "unknown";
}

namespace {

bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\f' || c == '\v';
}

char closer_for(char opener) {
    switch (opener) {
        case '<': return '>';
        case '[': return ']';
        case '{': return '}';
        default:  return 0;
    }
}

} // anonymous namespace

std::vector<std::string_view> split_physical_lines(std::string_view text) {
    std::vector<std::string_view> lines;
    size_t start = 0;
    while (start < text.size()) {
        size_t end = text.find('\n', start);
        if (end == std::string_view::npos) end = text.size();

        std::string_view line = text.substr(start, end - start);
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
        lines.push_back(line);
        start = end + 1;
    }
    return lines;
}

bool LineParser::is_locus(const std::string& locus) {
    static const std::regex re(R"(^[A-Za-z0-9]+\.[A-Za-z0-9.,;:@+*=&~\-]+$)");
    return std::regex_match(locus, re);
}

bool LineParser::is_canonical_locus(const std::string& locus) {
    static const std::regex re(R"(^f[0-9]+[rv][0-9]*\.[0-9]+[a-z]?(,[@+*=&~\-][A-Za-z]+[0-9]*)?$)");
    return std::regex_match(locus, re);
}

bool LineParser::split_tokens(std::string_view content, size_t column_offset,
                              std::vector<std::string>& tokens, std::string& error) {
    std::string current;
    char closer = 0;
    char opener = 0;
    size_t open_col = 0;

    auto flush = [&]() {
        if (!current.empty()) {
            tokens.push_back(std::move(current));
            current.clear();
        }
    };

    for (size_t i = 0; i < content.size(); ++i) {
        char c = content[i];
        size_t column = column_offset + i + 1;

        if (static_cast<unsigned char>(c) < 0x20 && c != '\t') {
            error = "unexpected control character at column " + std::to_string(column);
            return false;
        }

        if (closer) {
            current += c;
            if (c == closer) closer = 0;
            continue;
        }

        char expected = closer_for(c);
        if (expected) {
            closer = expected;
            opener = c;
            open_col = column;
            current += c;
            continue;
        }

        if (c == TOKEN_SEPARATOR || c == ' ' || c == '\t') {
            flush();
            continue;
        }

        current += c;
    }

    if (closer) {
        error = std::string("unterminated '") + opener + "' construct starting at column " +
                std::to_string(open_col);
        return false;
    }

    flush();
    return true;
}

LineEntry LineParser::parse_line(std::string_view line, size_t line_number) const {
    LineEntry entry;
    entry.line_number = line_number;

    size_t first = 0;
    while (first < line.size() && is_space(line[first])) ++first;
    size_t last = line.size();
    while (last > first && is_space(line[last - 1])) --last;
    std::string_view body = line.substr(first, last - first);

    if (body.empty()) {
        entry.line_type = LineType::BLANK;
        return entry;
    }

    if (body.front() == COMMENT_MARKER) {
        entry.line_type = LineType::COMMENT;
        return entry;
    }

    std::string error;
    bool header_like = body.size() > 1 && body[0] == '<' &&
                       std::isalnum(static_cast<unsigned char>(body[1]));

    if (!header_like) {
        entry.line_type = LineType::CONTENT_ONLY;
        if (!split_tokens(body, first, entry.tokens, error)) {
            entry.tokens.clear();
            entry.error = error;
        }
        return entry;
    }

    entry.line_type = LineType::FULL_LINE;

    size_t close = body.find('>');
    if (close == std::string_view::npos) {
        entry.error = "unterminated locus header";
        return entry;
    }

    std::string locus(body.substr(1, close - 1));
    if (!is_locus(locus)) {
        entry.error = "malformed locus header <" + locus + ">";
        return entry;
    }

    std::string_view rest = body.substr(close + 1);
    if (!rest.empty() && !is_space(rest.front())) {
        entry.error = "locus header <" + locus + "> must be followed by whitespace";
        return entry;
    }

    if (!split_tokens(rest, first + close + 1, entry.tokens, error)) {
        entry.tokens.clear();
        entry.error = error;
        return entry;
    }

    entry.location = std::move(locus);
    return entry;
}

std::vector<LineEntry> LineParser::parse(std::string_view text) const {
    std::vector<LineEntry> entries;
    auto lines = split_physical_lines(text);
    entries.reserve(lines.size());

    size_t line_number = 0;
    for (auto line : lines) {
        entries.push_back(parse_line(line, ++line_number));
    }
    return entries;
}

} // namespace volvelle
