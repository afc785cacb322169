#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace volvelle {

// Lattice state identifier in [0, W)
using WindowId = int32_t;

// Canonical device geometry
constexpr int32_t CANONICAL_NUM_WINDOWS = 50;
constexpr WindowId CANONICAL_HUB_WINDOW = 18;

// Token separator used by the transliteration convention
constexpr char TOKEN_SEPARATOR = '.';
constexpr char COMMENT_MARKER = '#';

enum class LineType {
    FULL_LINE,
    CONTENT_ONLY,
    BLANK,
    COMMENT
};

const char* line_type_name(LineType type);

/**
 * One physical input line after structural parsing. Produced once per line
 * by the parser and never modified afterwards.
 */
struct LineEntry {
    size_t line_number = 0;                 // 1-based, source order
    LineType line_type = LineType::BLANK;
    std::optional<std::string> location;    // locus header, full_line only
    std::vector<std::string> tokens;        // raw tokens in source order
    std::optional<std::string> error;

    bool has_error() const { return error.has_value(); }
    bool carries_tokens() const {
        return line_type == LineType::FULL_LINE || line_type == LineType::CONTENT_ONLY;
    }
};

inline bool has_uppercase(const std::string& s) {
    for (char c : s) {
        if (c >= 'A' && c <= 'Z') return true;
    }
    return false;
}

} // namespace volvelle
