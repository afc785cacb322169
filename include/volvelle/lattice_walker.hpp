#pragma once
/**
 * Lattice Walker
 *
 * Replays the generator's transition algorithm over an observed token stream
 * and classifies every token against the window the device should be in.
 * The validator's admissibility metrics and the slip detector both consume
 * these steps, so the two can never disagree about adjacency.
 */

#include <optional>
#include <string>
#include <string_view>

#include "volvelle/lattice_model.hpp"

namespace volvelle {

enum class Admission {
    STRICT,      // token is in the expected window
    DRIFT,       // token is in an adjacent window
    UNMATCHED,   // token is in the lattice but nowhere near the expected window
    UNCOVERED    // token is in no window
};

const char* admission_name(Admission admission);

struct WalkOptions {
    std::optional<WindowId> start_window;   // nullopt = hub window
    AdjacencyRule adjacency = AdjacencyRule::BOTH;
};

struct WalkStep {
    Admission admission = Admission::UNCOVERED;
    WindowId expected = 0;
    std::optional<WindowId> matched;        // window the token was resolved in
    Adjacency adjacency = Adjacency::NONE;  // set for DRIFT only
    WindowId next = 0;                      // state after the token
};

class LatticeWalker {
public:
    LatticeWalker(const LatticeModel& lattice, WalkOptions options = {});

    WalkStep step(std::string_view token);

    // Marks a line boundary; the window that resolved the line's last token
    // becomes the vertical-adjacency candidate for the next line
    void end_line();

    void reset();

    WindowId current() const { return current_; }
    std::optional<WindowId> vertical_window() const { return vertical_; }

private:
    const LatticeModel& lattice_;
    WalkOptions options_;
    WindowId current_;
    std::optional<WindowId> vertical_;
    std::optional<WindowId> last_resolved_;
};

} // namespace volvelle
