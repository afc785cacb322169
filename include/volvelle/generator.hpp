#pragma once
/**
 * Lattice Text Generator
 *
 * Walks the lattice from a start window, drawing one token per position from
 * the (settled) current window and following the corrected transition of the
 * token drawn. A single std::mt19937 stream seeded from the request drives
 * every random choice, so a request plus a lattice fully determines the output.
 *
 * Usage:
 *   Generator gen(lattice, logger);
 *   GenerationRequest req;
 *   req.seed = 7;
 *   req.output_format = OutputFormat::FULL_LOCUS;
 *   auto result = gen.generate(req);
 *   std::cout << result.text();
 */

#include <cstdint>
#include <functional>
#include <optional>
#include <random>
#include <string>
#include <utility>
#include <vector>

#include "volvelle/lattice_model.hpp"
#include "volvelle/logging.hpp"
#include "volvelle/types.hpp"

namespace volvelle {

class Config;

enum class OutputFormat {
    CONTENT_ONLY,   // bare token.token.token
    FULL_LOCUS      // <f1000r.1,@P0>      token.token.token
};

enum class SelectionPolicy {
    UNIFORM,
    SCRIBE_PROFILE
};

const char* output_format_name(OutputFormat format);

/**
 * Weighted selection profile modelled on a scribal hand:
 *   score(w) = 1 + sum(weight of each listed suffix w ends with)
 *                + overlap_weight * |{chars of w also present in previous word}|
 */
struct ScribeProfile {
    std::string name;
    std::vector<std::pair<std::string, int>> suffix_weights;
    int overlap_weight = 2;

    double score(const std::string& word, const std::string& previous) const;

    static const ScribeProfile& hand1();
    static const ScribeProfile& hand2();
    static const ScribeProfile& by_name(const std::string& name);
};

constexpr const char* DEFAULT_FOLIO_LABEL = "f1000r";

struct GenerationRequest {
    uint32_t seed = 42;
    size_t line_count = 9;
    size_t words_per_line_min = 6;
    size_t words_per_line_max = 12;
    std::optional<WindowId> start_window;     // nullopt = hub window
    OutputFormat output_format = OutputFormat::CONTENT_ONLY;
    SelectionPolicy selection = SelectionPolicy::UNIFORM;
    ScribeProfile profile = ScribeProfile::hand1();
    size_t lines_per_page = 0;                // 0 = one page
    bool reset_at_page_boundary = false;
    std::string folio_label = DEFAULT_FOLIO_LABEL;

    static GenerationRequest from_config(const Config& config);

    // Throws RequestError on a request-shape violation
    void validate(const LatticeModel& lattice) const;
};

struct LineOutput {
    size_t line_index = 0;                    // 0-based across the whole run
    std::optional<std::string> locus;         // FULL_LOCUS only
    std::vector<std::string> tokens;
    std::vector<WindowId> windows;            // window each token was drawn from

    std::string content() const;
    std::string render() const;
};

struct GenerationResult {
    std::vector<LineOutput> lines;
    std::vector<std::string> warnings;
    WindowId final_window = 0;

    std::string text() const;
    double avg_words_per_line() const;
};

using LineCallback = std::function<void(const LineOutput&)>;

class Generator {
public:
    explicit Generator(const LatticeModel& lattice, const Logger& logger = Logger::null());

    GenerationResult generate(const GenerationRequest& request) const;

    // Emits each line as soon as it is complete. The returned result carries
    // warnings and the final window but no lines.
    GenerationResult generate_stream(const GenerationRequest& request,
                                     const LineCallback& on_line) const;

    // f1r -> f1v -> f2r, f85r3 -> f85v3 -> f86r. Throws InvalidArgumentError
    // for a non-canonical label and RequestError when the leaf number overflows.
    static std::string next_folio(const std::string& folio);

private:
    const std::string& choose(const std::vector<std::string>& vocabulary,
                              const std::string& previous,
                              const GenerationRequest& request,
                              std::mt19937& rng) const;

    const LatticeModel& lattice_;
    const Logger& logger_;
};

} // namespace volvelle
