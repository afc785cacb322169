/**
 * Lattice Walker Implementation
 */

#include "volvelle/lattice_walker.hpp"
#include "volvelle/error.hpp"

namespace volvelle {

const char* admission_name(Admission admission) {
    switch (admission) {
        case Admission::STRICT:    return "strict";
        case Admission::DRIFT:     return "drift";
        case Admission::UNMATCHED: return "unmatched";
        case Admission::UNCOVERED: return "uncovered";
    }
    return "unknown";
}

LatticeWalker::LatticeWalker(const LatticeModel& lattice, WalkOptions options)
    : lattice_(lattice), options_(options), current_(lattice.hub_window()) {
    if (options_.start_window && !lattice_.valid_window(*options_.start_window)) {
        throw RequestError("Start window " + std::to_string(*options_.start_window) +
                           " outside [0, " + std::to_string(lattice_.num_windows()) + ")");
    }
    reset();
}

void LatticeWalker::reset() {
    current_ = options_.start_window.value_or(lattice_.hub_window());
    vertical_.reset();
    last_resolved_.reset();
}

WalkStep LatticeWalker::step(std::string_view token) {
    WalkStep result;
    // A token held by the current window is strict even when that window has
    // nothing the generator could draw; only otherwise does the walk settle
    result.expected = lattice_.contains(current_, token) ? current_ : lattice_.settle(current_);

    if (lattice_.contains(result.expected, token)) {
        result.admission = Admission::STRICT;
        result.matched = result.expected;
    } else {
        const auto& candidates = lattice_.windows_of(token);
        if (candidates.empty()) {
            result.admission = Admission::UNCOVERED;
            result.next = current_;
            return result;
        }

        // Numeric neighbours take precedence over the vertical window
        for (WindowId c : candidates) {
            Adjacency a = lattice_.adjacency(result.expected, c, std::nullopt, options_.adjacency);
            if (a != Adjacency::NONE) {
                result.matched = c;
                result.adjacency = a;
                break;
            }
        }
        if (!result.matched) {
            for (WindowId c : candidates) {
                Adjacency a = lattice_.adjacency(result.expected, c, vertical_, options_.adjacency);
                if (a != Adjacency::NONE) {
                    result.matched = c;
                    result.adjacency = a;
                    break;
                }
            }
        }

        if (result.matched) {
            result.admission = Admission::DRIFT;
        } else {
            result.admission = Admission::UNMATCHED;
            result.matched = candidates.front();
        }
    }

    last_resolved_ = result.matched;
    current_ = lattice_.next_window(*result.matched, token);
    result.next = current_;
    return result;
}

void LatticeWalker::end_line() {
    if (last_resolved_) {
        vertical_ = last_resolved_;
    }
    last_resolved_.reset();
}

} // namespace volvelle
