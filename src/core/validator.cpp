/**
 * Transliteration Validator Implementation
 */

#include "volvelle/validator.hpp"
#include "volvelle/config.hpp"
#include "volvelle/error.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace volvelle {

namespace {

// Drift admits the expected window and its two numeric neighbours
constexpr double DRIFT_CHANCE_FACTOR = 3.0;

std::string join(const std::vector<std::string>& parts, const std::string& separator) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) out += separator;
        out += parts[i];
    }
    return out;
}

void append_line(std::string& text, const std::vector<std::string>& tokens) {
    if (tokens.empty()) return;
    if (!text.empty()) text += '\n';
    text += join(tokens, std::string(1, TOKEN_SEPARATOR));
}

std::string percent(double fraction) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(1) << fraction * 100.0 << "%";
    return ss.str();
}

} // anonymous namespace

const char* validation_mode_name(ValidationMode mode) {
    switch (mode) {
        case ValidationMode::SYNTAX:    return "syntax";
        case ValidationMode::SANITIZED: return "sanitized";
        case ValidationMode::LATTICE:   return "lattice";
    }
    return "unknown";
}

ValidationMode parse_validation_mode(const std::string& name) {
    if (name == "syntax") return ValidationMode::SYNTAX;
    if (name == "sanitized") return ValidationMode::SANITIZED;
    if (name == "lattice") return ValidationMode::LATTICE;
    throw InvalidArgumentError("Unknown validation mode '" + name + "'", __func__,
                               "Use one of: syntax, sanitized, lattice");
}

ValidatorOptions ValidatorOptions::from_config(const Config& config) {
    ValidatorOptions options;
    options.strict_canonical = config.get<bool>("validator.strict_canonical", true);
    options.coverage_warning_threshold =
        config.get<double>("validator.coverage_warning_threshold", 0.2);
    options.adjacency = parse_adjacency_rule(config.get<std::string>("validator.adjacency", "both"));
    options.start_window = config.get_window("validator.start_window");
    return options;
}

// ============================================================================
// ValidationSession
// ============================================================================

ValidationSession::ValidationSession(const Validator& validator, ValidationMode mode,
                                     ValidatorOptions options)
    : validator_(validator)
    , options_(std::move(options))
    , sanitizer_(options_.sanitizer) {
    double threshold = options_.coverage_warning_threshold;
    VOLVELLE_CHECK_REQUEST(threshold >= 0.0 && threshold <= 1.0,
                           "coverage_warning_threshold must lie in [0, 1]");

    report_.mode = mode;
    report_.strict_canonical = options_.strict_canonical;

    if (mode == ValidationMode::LATTICE) {
        VOLVELLE_CHECK_REQUEST(validator_.lattice() != nullptr,
                               "Lattice mode requires a loaded lattice");
        walker_.emplace(*validator_.lattice(), WalkOptions{options_.start_window, options_.adjacency});
    }
}

void ValidationSession::feed(std::string_view chunk) {
    VOLVELLE_CHECK_REQUEST(!finished_, "Validation session already finished");

    pending_.append(chunk.data(), chunk.size());

    size_t start = 0;
    size_t newline;
    while ((newline = pending_.find('\n', start)) != std::string::npos) {
        process_line(std::string_view(pending_.data() + start, newline - start));
        start = newline + 1;
    }
    pending_.erase(0, start);
}

ValidationReport ValidationSession::finish() {
    VOLVELLE_CHECK_REQUEST(!finished_, "Validation session already finished");

    if (!pending_.empty()) {
        process_line(pending_);
        pending_.clear();
    }
    finished_ = true;
    report_.valid = report_.errors.empty();

    if (report_.mode != ValidationMode::SYNTAX && report_.total_sanitized_tokens == 0) {
        report_.warnings.push_back("No sanitized tokens remained after cleanup");
    }

    if (options_.strict_canonical && report_.valid) {
        size_t content_only = std::count_if(
            report_.diagnostics.begin(), report_.diagnostics.end(), [](const LineDiagnostic& d) {
                return d.status == DiagnosticStatus::OK && d.line_type == LineType::CONTENT_ONLY;
            });
        if (content_only > 0) {
            report_.warnings.push_back("Processed " + std::to_string(content_only) +
                                       " content-only lines; canonical input carries a locus header on every line");
        }
    }

    if (walker_) {
        finalize_lattice_metrics();
    }

    VOLVELLE_LOG_INFO(validator_.logger(), "Validated ", report_.line_count, " lines (",
                      validation_mode_name(report_.mode), "): ", report_.errors.size(),
                      " errors, ", report_.warnings.size(), " warnings");
    return std::move(report_);
}

void ValidationSession::process_line(std::string_view line) {
    if (!line.empty() && line.back() == '\r') {
        line.remove_suffix(1);
    }
    LineEntry entry = validator_.parser().parse_line(line, next_line_number_++);
    process_entry(entry);
}

void ValidationSession::process_entry(const LineEntry& entry) {
    if (!entry.carries_tokens()) {
        return;
    }
    ++report_.line_count;

    LineDiagnostic diag;
    diag.line_number = entry.line_number;
    diag.line_type = entry.line_type;
    diag.location = entry.location;
    diag.token_count = entry.tokens.size();

    if (entry.has_error()) {
        diag.status = DiagnosticStatus::ERROR;
        diag.message = *entry.error;
        VOLVELLE_LOG_DEBUG(validator_.logger(), "Line ", entry.line_number, ": ", diag.message);
        report_.errors.push_back(diag);
        report_.diagnostics.push_back(std::move(diag));
        return;
    }

    std::vector<std::string> problems;
    if (entry.location && !LineParser::is_canonical_locus(*entry.location)) {
        problems.push_back("non-canonical locus <" + *entry.location + ">");
    }

    std::vector<std::string> sanitized;
    sanitized.reserve(entry.tokens.size());
    for (const auto& raw : entry.tokens) {
        std::string token = sanitizer_(raw);
        if (token.empty()) continue;
        if (has_uppercase(token)) {
            problems.push_back("uppercase token '" + token + "'");
        }
        sanitized.push_back(std::move(token));
    }

    if (!problems.empty()) {
        std::string message = join(problems, "; ");
        if (options_.strict_canonical) {
            diag.status = DiagnosticStatus::ERROR;
            diag.message = message;
            VOLVELLE_LOG_DEBUG(validator_.logger(), "Line ", entry.line_number, ": ", message);
            report_.errors.push_back(diag);
            report_.diagnostics.push_back(std::move(diag));
            return;
        }
        report_.warnings.push_back("Line " + std::to_string(entry.line_number) + ": " + message);
    }

    diag.status = DiagnosticStatus::OK;
    diag.sanitized_count = sanitized.size();
    diag.message = std::to_string(sanitized.size()) + " tokens";
    report_.diagnostics.push_back(std::move(diag));

    report_.total_sanitized_tokens += sanitized.size();
    append_line(report_.normalized_text, entry.tokens);
    append_line(report_.sanitized_text, sanitized);

    if (!sanitized.empty()) {
        if (walker_) {
            walk_line(sanitized);
        }
        report_.sanitized_lines.push_back(std::move(sanitized));
    }
}

void ValidationSession::walk_line(const std::vector<std::string>& tokens) {
    for (const auto& token : tokens) {
        WalkStep step = walker_->step(token);
        ++metrics_.total;
        switch (step.admission) {
            case Admission::STRICT:
                ++metrics_.covered;
                ++metrics_.strict;
                ++metrics_.drift;
                break;
            case Admission::DRIFT:
                ++metrics_.covered;
                ++metrics_.drift;
                if (step.adjacency == Adjacency::NUMERIC) {
                    ++metrics_.numeric_drift;
                } else {
                    ++metrics_.vertical_drift;
                }
                break;
            case Admission::UNMATCHED:
                ++metrics_.covered;
                break;
            case Admission::UNCOVERED:
                break;
        }
    }
    walker_->end_line();
}

void ValidationSession::finalize_lattice_metrics() {
    const LatticeModel& lattice = *validator_.lattice();

    if (metrics_.total > 0) {
        double total = static_cast<double>(metrics_.total);
        metrics_.strict_rate = static_cast<double>(metrics_.strict) / total;
        metrics_.drift_rate = static_cast<double>(metrics_.drift) / total;
    }
    if (lattice.vocabulary_size() > 0) {
        metrics_.strict_chance =
            lattice.mean_window_size() / static_cast<double>(lattice.vocabulary_size());
        metrics_.drift_chance = std::min(1.0, DRIFT_CHANCE_FACTOR * metrics_.strict_chance);
    }

    double coverage = metrics_.total > 0
        ? static_cast<double>(metrics_.covered) / static_cast<double>(metrics_.total)
        : 0.0;
    report_.coverage_rate = coverage;
    report_.admissibility = metrics_;

    if (coverage < options_.coverage_warning_threshold) {
        std::string warning = "Low lattice coverage: " + percent(coverage) +
                              " of sanitized tokens found in the lattice (threshold " +
                              percent(options_.coverage_warning_threshold) +
                              "); the transliteration convention may not match the model";
        VOLVELLE_LOG_WARN(validator_.logger(), warning);
        report_.warnings.push_back(std::move(warning));
    }
}

// ============================================================================
// Validator
// ============================================================================

Validator::Validator(const Logger& logger)
    : logger_(logger) {}

Validator::Validator(const LatticeModel& lattice, const Logger& logger)
    : lattice_(&lattice), logger_(logger) {}

ValidationSession Validator::session(ValidationMode mode, const ValidatorOptions& options) const {
    return ValidationSession(*this, mode, options);
}

ValidationReport Validator::validate(std::string_view text, ValidationMode mode,
                                     const ValidatorOptions& options) const {
    ValidationSession session(*this, mode, options);
    session.feed(text);
    return session.finish();
}

} // namespace volvelle
