#pragma once
/**
 * Window Lattice Model
 *
 * Immutable, load-once description of the codebook device:
 * - W windows, each with an ordered vocabulary and a correction offset
 * - a token -> raw next-window table
 * - a reverse index token -> candidate windows, built at load time
 *
 * Transition rule for a token drawn while in window k:
 *     next = (raw(token) + correction(k)) mod W
 * where raw(token) falls back to k + 1 when the table has no entry.
 *
 * The model is never mutated after build(); concurrent readers need no locking.
 */

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "volvelle/types.hpp"

namespace volvelle {

struct WindowSpec {
    WindowId id = 0;
    std::vector<std::string> vocabulary;   // ordered, sanitized tokens
    int32_t correction_offset = 0;
};

// Raw dataset prior to validation
struct LatticeData {
    int32_t num_windows = CANONICAL_NUM_WINDOWS;
    WindowId hub_window = CANONICAL_HUB_WINDOW;
    std::vector<WindowSpec> windows;
    std::unordered_map<std::string, WindowId> transitions;   // lattice map
};

enum class Adjacency {
    NONE,
    NUMERIC,    // candidate is expected +/- 1 (mod W)
    VERTICAL    // candidate resolved the previous line's last token
};

enum class AdjacencyRule {
    BOTH,
    NUMERIC_ONLY,
    VERTICAL_ONLY
};

const char* adjacency_name(Adjacency adjacency);
const char* adjacency_rule_name(AdjacencyRule rule);
AdjacencyRule parse_adjacency_rule(const std::string& name);

class LatticeModel {
public:
    // Validates `data` and builds the reverse index.
    // Throws LatticeLoadError describing the first inconsistency found.
    static LatticeModel build(LatticeData data);

    int32_t num_windows() const { return num_windows_; }
    WindowId hub_window() const { return hub_window_; }

    const std::vector<std::string>& vocabulary(WindowId window) const;
    int32_t correction_of(WindowId window) const;

    // Candidate windows holding `token`, ascending; empty when uncovered
    const std::vector<WindowId>& windows_of(std::string_view token) const;
    bool is_covered(std::string_view token) const { return !windows_of(token).empty(); }
    bool contains(WindowId window, std::string_view token) const;

    std::optional<WindowId> raw_transition(std::string_view token) const;
    WindowId next_window(WindowId current, std::string_view token) const;

    // Vocabulary usable by the generator (no uppercase entries)
    const std::vector<std::string>& generatable(WindowId window) const;
    bool has_generatable_vocabulary() const { return any_generatable_; }

    // First window at or after `window` (cyclic) with generatable vocabulary
    WindowId settle(WindowId window) const;

    Adjacency adjacency(WindowId expected, WindowId candidate,
                        std::optional<WindowId> vertical,
                        AdjacencyRule rule = AdjacencyRule::BOTH) const;

    bool is_adjacent(WindowId w1, WindowId w2,
                     std::optional<WindowId> vertical = std::nullopt,
                     AdjacencyRule rule = AdjacencyRule::BOTH) const {
        return adjacency(w1, w2, vertical, rule) != Adjacency::NONE;
    }

    WindowId wrap(int64_t value) const;
    bool valid_window(int64_t window) const { return window >= 0 && window < num_windows_; }

    size_t vocabulary_size() const { return reverse_index_.size(); }
    size_t total_entries() const { return total_entries_; }
    double mean_window_size() const;

private:
    LatticeModel() = default;

    void check_window(WindowId window) const;

    int32_t num_windows_ = CANONICAL_NUM_WINDOWS;
    WindowId hub_window_ = CANONICAL_HUB_WINDOW;
    std::vector<std::vector<std::string>> vocabularies_;
    std::vector<std::unordered_set<std::string>> members_;
    std::vector<std::vector<std::string>> generatable_;
    std::vector<int32_t> corrections_;
    std::unordered_map<std::string, WindowId> transitions_;
    std::unordered_map<std::string, std::vector<WindowId>> reverse_index_;
    size_t total_entries_ = 0;
    bool any_generatable_ = false;
};

} // namespace volvelle
