/**
 * Token Sanitizer Implementation
 */

#include "volvelle/sanitizer.hpp"

#include <algorithm>
#include <regex>

namespace volvelle {

namespace {

const std::regex& inline_meta_re() {
    static const std::regex re(R"(<!.*?>)");
    return re;
}

const std::regex& angle_tag_re() {
    static const std::regex re(R"(<.*?>)");
    return re;
}

const std::regex& angle_unclosed_re() {
    static const std::regex re(R"(<[!%$].*)");
    return re;
}

const std::regex& bracket_span_re() {
    static const std::regex re(R"(\[(.*?)\])");
    return re;
}

const std::regex& loose_symbol_re() {
    static const std::regex re(R"([{}*$<>])");
    return re;
}

const std::regex& punctuation_re() {
    static const std::regex re(R"([,.;])");
    return re;
}

bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f' || c == '\v';
}

std::string trim(const std::string& s) {
    size_t first = 0;
    while (first < s.size() && is_space(s[first])) ++first;
    size_t last = s.size();
    while (last > first && is_space(s[last - 1])) --last;
    return s.substr(first, last - first);
}

} // anonymous namespace

std::string Sanitizer::resolve_alternatives(const std::string& text) const {
    if (options_.alternatives == AlternativeReadingPolicy::DROP_SPAN) {
        return std::regex_replace(text, bracket_span_re(), "");
    }

    std::string out;
    out.reserve(text.size());

    auto begin = text.cbegin();
    std::smatch match;
    while (std::regex_search(begin, text.cend(), match, bracket_span_re())) {
        out.append(begin, match[0].first);

        std::string body = match[1].str();
        size_t colon = body.find(':');
        if (colon != std::string::npos) {
            std::string reading = options_.alternatives == AlternativeReadingPolicy::FIRST_READING
                ? body.substr(0, colon)
                : body.substr(colon + 1);
            // A reading never reopens a span, otherwise a second pass could differ
            reading.erase(std::remove(reading.begin(), reading.end(), '['), reading.end());
            out += reading;
        }

        begin = match[0].second;
    }
    out.append(begin, text.cend());
    return out;
}

std::string Sanitizer::operator()(std::string_view token) const {
    std::string t(token);
    t = std::regex_replace(t, inline_meta_re(), "");
    t = std::regex_replace(t, angle_tag_re(), "");
    t = std::regex_replace(t, angle_unclosed_re(), "");
    t = resolve_alternatives(t);
    t = std::regex_replace(t, loose_symbol_re(), "");
    t = std::regex_replace(t, punctuation_re(), "");
    return trim(t);
}

std::vector<std::string> Sanitizer::sanitize_all(const std::vector<std::string>& tokens) const {
    std::vector<std::string> out;
    out.reserve(tokens.size());
    for (const auto& token : tokens) {
        std::string s = (*this)(token);
        if (!s.empty()) {
            out.push_back(std::move(s));
        }
    }
    return out;
}

std::string sanitize(std::string_view token) {
    static const Sanitizer default_sanitizer;
    return default_sanitizer(token);
}

} // namespace volvelle
