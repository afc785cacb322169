/**
 * Window Lattice Model Implementation
 */

#include "volvelle/lattice_model.hpp"
#include "volvelle/error.hpp"
#include "volvelle/line_parser.hpp"
#include "volvelle/sanitizer.hpp"

#include <algorithm>

namespace volvelle {

const char* adjacency_name(Adjacency adjacency) {
    switch (adjacency) {
        case Adjacency::NONE:     return "none";
        case Adjacency::NUMERIC:  return "numeric";
        case Adjacency::VERTICAL: return "vertical";
    }
    return "unknown";
}

const char* adjacency_rule_name(AdjacencyRule rule) {
    switch (rule) {
        case AdjacencyRule::BOTH:          return "both";
        case AdjacencyRule::NUMERIC_ONLY:  return "numeric";
        case AdjacencyRule::VERTICAL_ONLY: return "vertical";
    }
    return "unknown";
}

AdjacencyRule parse_adjacency_rule(const std::string& name) {
    if (name == "both") return AdjacencyRule::BOTH;
    if (name == "numeric") return AdjacencyRule::NUMERIC_ONLY;
    if (name == "vertical") return AdjacencyRule::VERTICAL_ONLY;
    throw InvalidArgumentError("Unknown adjacency rule '" + name + "'", __func__,
                               "Use one of: both, numeric, vertical");
}

namespace {

bool contains_space(const std::string& s) {
    return std::any_of(s.begin(), s.end(), [](char c) {
        return c == ' ' || c == '\t' || c == '\r' || c == '\n';
    });
}

bool has_control(const std::string& s) {
    return std::any_of(s.begin(), s.end(), [](char c) {
        auto u = static_cast<unsigned char>(c);
        return u < 0x20 || u == 0x7f;
    });
}

// The line parser must read the entry back as exactly one token
bool reads_back(const std::string& token) {
    if (token.front() == COMMENT_MARKER) return false;
    std::vector<std::string> pieces;
    std::string error;
    return LineParser::split_tokens(token, 0, pieces, error) &&
           pieces.size() == 1 && pieces.front() == token;
}

std::string window_context(WindowId id) {
    return "window " + std::to_string(id);
}

} // anonymous namespace

LatticeModel LatticeModel::build(LatticeData data) {
    const int32_t W = data.num_windows;
    if (W <= 0) {
        throw LatticeLoadError(ErrorCode::LATTICE_WINDOW_RANGE,
                               "Window count must be positive, got " + std::to_string(W));
    }
    if (data.hub_window < 0 || data.hub_window >= W) {
        throw LatticeLoadError(ErrorCode::LATTICE_WINDOW_RANGE,
                               "Hub window " + std::to_string(data.hub_window) +
                               " outside [0, " + std::to_string(W) + ")");
    }

    LatticeModel model;
    model.num_windows_ = W;
    model.hub_window_ = data.hub_window;
    model.vocabularies_.assign(W, {});
    model.members_.assign(W, {});
    model.generatable_.assign(W, {});
    model.corrections_.assign(W, 0);

    std::vector<bool> seen(W, false);

    for (auto& spec : data.windows) {
        if (spec.id < 0 || spec.id >= W) {
            throw LatticeLoadError(ErrorCode::LATTICE_WINDOW_RANGE,
                                   "Window id " + std::to_string(spec.id) +
                                   " outside [0, " + std::to_string(W) + ")");
        }
        if (seen[spec.id]) {
            throw LatticeLoadError(ErrorCode::LATTICE_DUPLICATE_WINDOW,
                                   "Duplicate window id " + std::to_string(spec.id));
        }
        seen[spec.id] = true;

        if (spec.correction_offset < -W || spec.correction_offset > W) {
            throw LatticeLoadError(ErrorCode::LATTICE_OFFSET_RANGE,
                                   "Correction offset " + std::to_string(spec.correction_offset) +
                                   " outside [-" + std::to_string(W) + ", " + std::to_string(W) + "]",
                                   window_context(spec.id));
        }
        model.corrections_[spec.id] = spec.correction_offset;

        auto& members = model.members_[spec.id];
        for (const auto& token : spec.vocabulary) {
            if (token.empty() || contains_space(token) || sanitize(token) != token) {
                throw LatticeLoadError(ErrorCode::LATTICE_INCONSISTENT_VOCABULARY,
                                       "Vocabulary entry '" + token + "' is not a sanitized token",
                                       window_context(spec.id));
            }
            if (has_control(token) || !reads_back(token)) {
                throw LatticeLoadError(ErrorCode::LATTICE_INCONSISTENT_VOCABULARY,
                                       "Vocabulary entry '" + token + "' does not parse back as one token",
                                       window_context(spec.id));
            }
            if (!members.insert(token).second) {
                throw LatticeLoadError(ErrorCode::LATTICE_INCONSISTENT_VOCABULARY,
                                       "Token '" + token + "' listed twice",
                                       window_context(spec.id));
            }
            model.reverse_index_[token].push_back(spec.id);
            if (!has_uppercase(token)) {
                model.generatable_[spec.id].push_back(token);
            }
        }
        model.total_entries_ += spec.vocabulary.size();
        model.vocabularies_[spec.id] = std::move(spec.vocabulary);
    }

    for (const auto& [token, target] : data.transitions) {
        if (token.empty()) {
            throw LatticeLoadError(ErrorCode::LATTICE_INCONSISTENT_VOCABULARY,
                                   "Lattice map contains an empty token");
        }
        if (target < 0 || target >= W) {
            throw LatticeLoadError(ErrorCode::LATTICE_WINDOW_RANGE,
                                   "Transition target " + std::to_string(target) + " for '" + token +
                                   "' outside [0, " + std::to_string(W) + ")");
        }
    }
    model.transitions_ = std::move(data.transitions);

    for (auto& [token, windows] : model.reverse_index_) {
        std::sort(windows.begin(), windows.end());
        if (windows.size() > 1 && model.transitions_.find(token) == model.transitions_.end()) {
            throw LatticeLoadError(ErrorCode::LATTICE_INCONSISTENT_VOCABULARY,
                                   "Token '" + token + "' appears in " + std::to_string(windows.size()) +
                                   " windows but has no lattice map entry",
                                   "", "Give shared tokens an explicit transition target");
        }
    }

    model.any_generatable_ = std::any_of(model.generatable_.begin(), model.generatable_.end(),
                                         [](const auto& v) { return !v.empty(); });
    return model;
}

void LatticeModel::check_window(WindowId window) const {
    if (!valid_window(window)) {
        throw InvalidArgumentError("Window " + std::to_string(window) + " outside [0, " +
                                   std::to_string(num_windows_) + ")");
    }
}

const std::vector<std::string>& LatticeModel::vocabulary(WindowId window) const {
    check_window(window);
    return vocabularies_[window];
}

int32_t LatticeModel::correction_of(WindowId window) const {
    check_window(window);
    return corrections_[window];
}

const std::vector<WindowId>& LatticeModel::windows_of(std::string_view token) const {
    static const std::vector<WindowId> none;
    auto it = reverse_index_.find(std::string(token));
    return it == reverse_index_.end() ? none : it->second;
}

bool LatticeModel::contains(WindowId window, std::string_view token) const {
    check_window(window);
    return members_[window].count(std::string(token)) != 0;
}

std::optional<WindowId> LatticeModel::raw_transition(std::string_view token) const {
    auto it = transitions_.find(std::string(token));
    if (it == transitions_.end()) return std::nullopt;
    return it->second;
}

WindowId LatticeModel::next_window(WindowId current, std::string_view token) const {
    check_window(current);
    int64_t raw = raw_transition(token).value_or(current + 1);
    return wrap(raw + corrections_[current]);
}

const std::vector<std::string>& LatticeModel::generatable(WindowId window) const {
    check_window(window);
    return generatable_[window];
}

WindowId LatticeModel::settle(WindowId window) const {
    check_window(window);
    for (int32_t i = 0; i < num_windows_; ++i) {
        WindowId w = wrap(static_cast<int64_t>(window) + i);
        if (!generatable_[w].empty()) return w;
    }
    return window;
}

Adjacency LatticeModel::adjacency(WindowId expected, WindowId candidate,
                                  std::optional<WindowId> vertical,
                                  AdjacencyRule rule) const {
    if (candidate == expected) return Adjacency::NONE;

    if (rule != AdjacencyRule::VERTICAL_ONLY) {
        if (candidate == wrap(static_cast<int64_t>(expected) - 1) ||
            candidate == wrap(static_cast<int64_t>(expected) + 1)) {
            return Adjacency::NUMERIC;
        }
    }

    if (rule != AdjacencyRule::NUMERIC_ONLY && vertical && *vertical == candidate) {
        return Adjacency::VERTICAL;
    }

    return Adjacency::NONE;
}

WindowId LatticeModel::wrap(int64_t value) const {
    int64_t m = value % num_windows_;
    if (m < 0) m += num_windows_;
    return static_cast<WindowId>(m);
}

double LatticeModel::mean_window_size() const {
    return static_cast<double>(total_entries_) / static_cast<double>(num_windows_);
}

} // namespace volvelle
