/**
 * Lattice Text Generator Implementation
 */

#include "volvelle/generator.hpp"
#include "volvelle/config.hpp"
#include "volvelle/error.hpp"
#include "volvelle/line_parser.hpp"

#include <charconv>
#include <limits>
#include <regex>
#include <system_error>
#include <unordered_set>

namespace volvelle {

namespace {

// Separates the locus header from the content in FULL_LOCUS output
constexpr const char* LOCUS_PADDING = "      ";

// f<leaf><r|v>[panel], e.g. f85r3 for the third panel of a foldout
const std::regex& folio_re() {
    static const std::regex re(R"(^f([0-9]+)([rv])([0-9]*)$)");
    return re;
}

bool is_canonical_folio(const std::string& folio) {
    return std::regex_match(folio, folio_re()) && LineParser::is_canonical_locus(folio + ".1,@P0");
}

std::string make_locus(const std::string& folio, size_t line_on_page) {
    const char* marker = line_on_page == 1 ? "@P0" : "+P0";
    return folio + "." + std::to_string(line_on_page) + "," + marker;
}

} // anonymous namespace

const char* output_format_name(OutputFormat format) {
    switch (format) {
        case OutputFormat::CONTENT_ONLY: return "content";
        case OutputFormat::FULL_LOCUS:   return "locus";
    }
    return "unknown";
}

// ============================================================================
// ScribeProfile
// ============================================================================

double ScribeProfile::score(const std::string& word, const std::string& previous) const {
    double score = 1.0;
    for (const auto& [suffix, weight] : suffix_weights) {
        if (word.size() >= suffix.size() &&
            word.compare(word.size() - suffix.size(), suffix.size(), suffix) == 0) {
            score += weight;
        }
    }
    if (!previous.empty()) {
        std::unordered_set<char> seen(previous.begin(), previous.end());
        size_t overlap = 0;
        for (char c : word) {
            if (seen.count(c)) ++overlap;
        }
        score += static_cast<double>(overlap) * overlap_weight;
    }
    return score;
}

const ScribeProfile& ScribeProfile::hand1() {
    static const ScribeProfile profile{"hand1", {{"dy", 12}, {"in", 4}, {"y", 8}, {"m", 3}}, 2};
    return profile;
}

const ScribeProfile& ScribeProfile::hand2() {
    static const ScribeProfile profile{"hand2", {{"in", 20}, {"dy", 2}, {"m", 10}, {"y", 5}}, 2};
    return profile;
}

const ScribeProfile& ScribeProfile::by_name(const std::string& name) {
    if (name == "hand1") return hand1();
    if (name == "hand2") return hand2();
    throw InvalidArgumentError("Unknown scribe profile '" + name + "'", __func__,
                               "Use one of: hand1, hand2");
}

// ============================================================================
// GenerationRequest
// ============================================================================

GenerationRequest GenerationRequest::from_config(const Config& config) {
    GenerationRequest request;

    int seed = config.get<int>("generator.seed", 42);
    request.seed = static_cast<uint32_t>(seed);

    int line_count = config.get<int>("generator.line_count", 9);
    int words_min = config.get<int>("generator.words_min", 6);
    int words_max = config.get<int>("generator.words_max", 12);
    int lines_per_page = config.get<int>("generator.lines_per_page", 0);
    if (line_count < 0 || words_min < 0 || words_max < 0 || lines_per_page < 0) {
        throw ConfigError("Generator counts must not be negative", "generator.*");
    }
    request.line_count = static_cast<size_t>(line_count);
    request.words_per_line_min = static_cast<size_t>(words_min);
    request.words_per_line_max = static_cast<size_t>(words_max);
    request.lines_per_page = static_cast<size_t>(lines_per_page);

    request.start_window = config.get_window("generator.start_window");

    std::string format = config.get<std::string>("generator.format", "content");
    if (format == "content") {
        request.output_format = OutputFormat::CONTENT_ONLY;
    } else if (format == "locus") {
        request.output_format = OutputFormat::FULL_LOCUS;
    } else {
        throw ConfigError("Unknown generator format '" + format + "'", "generator.format",
                          "Use one of: content, locus");
    }

    std::string selection = config.get<std::string>("generator.selection", "uniform");
    if (selection == "uniform") {
        request.selection = SelectionPolicy::UNIFORM;
    } else if (selection == "hand1" || selection == "hand2") {
        request.selection = SelectionPolicy::SCRIBE_PROFILE;
        request.profile = ScribeProfile::by_name(selection);
    } else {
        throw ConfigError("Unknown generator selection '" + selection + "'", "generator.selection",
                          "Use one of: uniform, hand1, hand2");
    }

    request.reset_at_page_boundary = config.get<bool>("generator.reset_at_page_boundary", false);
    request.folio_label = config.get<std::string>("generator.folio_label", DEFAULT_FOLIO_LABEL);
    return request;
}

void GenerationRequest::validate(const LatticeModel& lattice) const {
    VOLVELLE_CHECK_REQUEST(words_per_line_min > 0, "words_per_line_min must be at least 1");
    VOLVELLE_CHECK_REQUEST(words_per_line_min <= words_per_line_max,
                           "words_per_line_min (" + std::to_string(words_per_line_min) +
                           ") exceeds words_per_line_max (" + std::to_string(words_per_line_max) + ")");
    VOLVELLE_CHECK_REQUEST(line_count > 0, "line_count must be at least 1");
    if (start_window) {
        VOLVELLE_CHECK_REQUEST(lattice.valid_window(*start_window),
                               "start_window " + std::to_string(*start_window) + " outside [0, " +
                               std::to_string(lattice.num_windows()) + ")");
    }
    VOLVELLE_CHECK_REQUEST(!reset_at_page_boundary || lines_per_page > 0,
                           "reset_at_page_boundary requires lines_per_page");
    VOLVELLE_CHECK_REQUEST(lattice.has_generatable_vocabulary(),
                           "Lattice has no generatable vocabulary");
}

// ============================================================================
// Output
// ============================================================================

std::string LineOutput::content() const {
    std::string out;
    for (size_t i = 0; i < tokens.size(); ++i) {
        if (i > 0) out += TOKEN_SEPARATOR;
        out += tokens[i];
    }
    return out;
}

std::string LineOutput::render() const {
    if (!locus) {
        return content();
    }
    return "<" + *locus + ">" + LOCUS_PADDING + content();
}

std::string GenerationResult::text() const {
    std::string out;
    for (const auto& line : lines) {
        out += line.render();
        out += '\n';
    }
    return out;
}

double GenerationResult::avg_words_per_line() const {
    if (lines.empty()) return 0.0;
    size_t words = 0;
    for (const auto& line : lines) {
        words += line.tokens.size();
    }
    return static_cast<double>(words) / static_cast<double>(lines.size());
}

// ============================================================================
// Generator
// ============================================================================

Generator::Generator(const LatticeModel& lattice, const Logger& logger)
    : lattice_(lattice), logger_(logger) {}

std::string Generator::next_folio(const std::string& folio) {
    std::smatch match;
    if (!std::regex_match(folio, match, folio_re()) || !is_canonical_folio(folio)) {
        throw InvalidArgumentError("Folio label '" + folio + "' is not canonical", __func__);
    }
    const std::string leaf = match[1].str();

    // The panel number stays with the leaf; a new leaf starts unpaneled
    if (match[2].str() == "r") {
        return "f" + leaf + "v" + match[3].str();
    }

    unsigned long long number = 0;
    auto [end, ec] = std::from_chars(leaf.data(), leaf.data() + leaf.size(), number);
    if (ec != std::errc() || end != leaf.data() + leaf.size() ||
        number == std::numeric_limits<unsigned long long>::max()) {
        throw RequestError("Folio number in '" + folio + "' is too large to advance", __func__,
                           "Start from a smaller folio label");
    }
    return "f" + std::to_string(number + 1) + "r";
}

const std::string& Generator::choose(const std::vector<std::string>& vocabulary,
                                     const std::string& previous,
                                     const GenerationRequest& request,
                                     std::mt19937& rng) const {
    if (request.selection == SelectionPolicy::UNIFORM || vocabulary.size() == 1) {
        std::uniform_int_distribution<size_t> pick(0, vocabulary.size() - 1);
        return vocabulary[pick(rng)];
    }

    std::vector<double> weights;
    weights.reserve(vocabulary.size());
    for (const auto& word : vocabulary) {
        weights.push_back(request.profile.score(word, previous));
    }
    std::discrete_distribution<size_t> pick(weights.begin(), weights.end());
    return vocabulary[pick(rng)];
}

GenerationResult Generator::generate_stream(const GenerationRequest& request,
                                            const LineCallback& on_line) const {
    request.validate(lattice_);

    GenerationResult result;

    std::string folio = request.folio_label;
    if (request.output_format == OutputFormat::FULL_LOCUS && !is_canonical_folio(folio)) {
        std::string warning = "Folio label '" + folio + "' is not canonical; using " +
                              DEFAULT_FOLIO_LABEL;
        VOLVELLE_LOG_WARN(logger_, warning);
        result.warnings.push_back(std::move(warning));
        folio = DEFAULT_FOLIO_LABEL;
    }

    std::mt19937 rng(request.seed);
    std::uniform_int_distribution<size_t> word_count(request.words_per_line_min,
                                                     request.words_per_line_max);

    WindowId current = request.start_window.value_or(lattice_.hub_window());
    size_t line_on_page = 0;

    for (size_t i = 0; i < request.line_count; ++i) {
        if (request.lines_per_page > 0 && i > 0 && i % request.lines_per_page == 0) {
            line_on_page = 0;
            if (request.output_format == OutputFormat::FULL_LOCUS) {
                folio = next_folio(folio);
            }
            if (request.reset_at_page_boundary) {
                current = lattice_.hub_window();
            }
        }
        ++line_on_page;

        LineOutput line;
        line.line_index = i;
        if (request.output_format == OutputFormat::FULL_LOCUS) {
            line.locus = make_locus(folio, line_on_page);
        }

        size_t n = word_count(rng);
        line.tokens.reserve(n);
        line.windows.reserve(n);

        std::string previous;
        for (size_t k = 0; k < n; ++k) {
            WindowId window = lattice_.settle(current);
            const std::string& token = choose(lattice_.generatable(window), previous, request, rng);
            line.tokens.push_back(token);
            line.windows.push_back(window);
            current = lattice_.next_window(window, token);
            previous = token;
        }

        VOLVELLE_LOG_DEBUG(logger_, "Line ", i, ": ", line.tokens.size(), " tokens, next window ", current);
        on_line(line);
    }

    result.final_window = current;
    VOLVELLE_LOG_INFO(logger_, "Generated ", request.line_count, " lines (seed=", request.seed,
                      ", format=", output_format_name(request.output_format), ")");
    return result;
}

GenerationResult Generator::generate(const GenerationRequest& request) const {
    std::vector<LineOutput> lines;
    lines.reserve(request.line_count);
    GenerationResult result = generate_stream(request, [&lines](const LineOutput& line) {
        lines.push_back(line);
    });
    result.lines = std::move(lines);
    return result;
}

} // namespace volvelle
