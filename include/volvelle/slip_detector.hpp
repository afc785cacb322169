#pragma once
/**
 * Mechanical Slip Detector
 *
 * Replays the lattice walk over sanitized lines and records every token that
 * missed the expected window but landed in an adjacent one. Adjacency comes
 * from LatticeWalker, the same primitive behind the validator's drift metrics.
 */

#include <optional>
#include <string>
#include <vector>

#include "volvelle/lattice_model.hpp"
#include "volvelle/logging.hpp"

namespace volvelle {

struct SlipDetectorOptions {
    AdjacencyRule adjacency = AdjacencyRule::BOTH;
    std::optional<WindowId> start_window;     // nullopt = hub window
};

struct Slip {
    size_t line_index = 0;      // 0-based index into the analysed lines
    size_t position = 0;        // 0-based token position within the line
    std::string token;
    WindowId expected_window = 0;
    WindowId matched_window = 0;
    Adjacency adjacency = Adjacency::NONE;
};

struct SlipReport {
    std::vector<Slip> slips;
    size_t tokens_examined = 0;
    size_t numeric_count = 0;
    size_t vertical_count = 0;

    double slip_rate() const {
        return tokens_examined == 0 ? 0.0
                                    : static_cast<double>(slips.size()) / static_cast<double>(tokens_examined);
    }
};

class SlipDetector {
public:
    explicit SlipDetector(const LatticeModel& lattice, const Logger& logger = Logger::null());

    SlipReport detect(const std::vector<std::vector<std::string>>& lines,
                      const SlipDetectorOptions& options = SlipDetectorOptions{}) const;

private:
    const LatticeModel& lattice_;
    const Logger& logger_;
};

} // namespace volvelle
