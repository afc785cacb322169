#pragma once
/**
 * Token Sanitizer
 *
 * Strips transliteration markup from a raw token. Ordered passes:
 *   1. inline metadata spans      <!...>
 *   2. closed angle tags          <...>
 *   3. unterminated openers       <!  <%  <$  (to end of token)
 *   4. alternative readings       [...]
 *   5. loose symbols              { } * $ < >
 *   6. embedded punctuation       , . ;
 *   7. surrounding whitespace
 *
 * Sanitization is pure, total and idempotent. The result may be empty.
 */

#include <string>
#include <string_view>
#include <vector>

namespace volvelle {

// How pass 4 treats "[a:b]" alternative-reading spans
enum class AlternativeReadingPolicy {
    DROP_SPAN,        // delete the whole span (default)
    FIRST_READING,    // keep "a"
    SECOND_READING    // keep "b"
};

struct SanitizerOptions {
    AlternativeReadingPolicy alternatives = AlternativeReadingPolicy::DROP_SPAN;
};

class Sanitizer {
public:
    Sanitizer() = default;
    explicit Sanitizer(SanitizerOptions options) : options_(options) {}

    std::string operator()(std::string_view token) const;

    // Sanitizes every token and drops the empty results
    std::vector<std::string> sanitize_all(const std::vector<std::string>& tokens) const;

    const SanitizerOptions& options() const { return options_; }

private:
    std::string resolve_alternatives(const std::string& text) const;

    SanitizerOptions options_;
};

// Default-policy sanitization
std::string sanitize(std::string_view token);

} // namespace volvelle
