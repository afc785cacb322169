/**
 * Mechanical Slip Detector Implementation
 */

#include "volvelle/slip_detector.hpp"
#include "volvelle/lattice_walker.hpp"

namespace volvelle {

SlipDetector::SlipDetector(const LatticeModel& lattice, const Logger& logger)
    : lattice_(lattice), logger_(logger) {}

SlipReport SlipDetector::detect(const std::vector<std::vector<std::string>>& lines,
                                const SlipDetectorOptions& options) const {
    LatticeWalker walker(lattice_, WalkOptions{options.start_window, options.adjacency});
    SlipReport report;

    for (size_t i = 0; i < lines.size(); ++i) {
        const auto& line = lines[i];
        for (size_t p = 0; p < line.size(); ++p) {
            WalkStep step = walker.step(line[p]);
            ++report.tokens_examined;
            if (step.admission != Admission::DRIFT) {
                continue;
            }

            Slip slip;
            slip.line_index = i;
            slip.position = p;
            slip.token = line[p];
            slip.expected_window = step.expected;
            slip.matched_window = *step.matched;
            slip.adjacency = step.adjacency;

            if (slip.adjacency == Adjacency::NUMERIC) {
                ++report.numeric_count;
            } else {
                ++report.vertical_count;
            }
            VOLVELLE_LOG_DEBUG(logger_, "Slip at line ", i, " pos ", p, ": '", slip.token,
                               "' expected window ", slip.expected_window, ", matched ",
                               slip.matched_window, " (", adjacency_name(slip.adjacency), ")");
            report.slips.push_back(std::move(slip));
        }
        walker.end_line();
    }

    VOLVELLE_LOG_INFO(logger_, "Slip scan: ", report.slips.size(), " slips in ",
                      report.tokens_examined, " tokens (numeric=", report.numeric_count,
                      ", vertical=", report.vertical_count, ")");
    return report;
}

} // namespace volvelle
