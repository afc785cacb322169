#pragma once
/**
 * Transliteration Validator
 *
 * Modes:
 *   SYNTAX     structural parse checks only
 *   SANITIZED  SYNTAX + sanitized-token reporting
 *   LATTICE    SANITIZED + coverage and admissibility against a LatticeModel
 *
 * Any input text yields a report; malformed lines are described in it.
 * Only request-shape problems (lattice mode without a lattice, a threshold
 * outside [0, 1]) throw RequestError.
 */

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "volvelle/lattice_model.hpp"
#include "volvelle/lattice_walker.hpp"
#include "volvelle/line_parser.hpp"
#include "volvelle/logging.hpp"
#include "volvelle/sanitizer.hpp"
#include "volvelle/types.hpp"

namespace volvelle {

class Config;

enum class ValidationMode {
    SYNTAX,
    SANITIZED,
    LATTICE
};

const char* validation_mode_name(ValidationMode mode);
ValidationMode parse_validation_mode(const std::string& name);

struct ValidatorOptions {
    bool strict_canonical = true;
    double coverage_warning_threshold = 0.2;
    AdjacencyRule adjacency = AdjacencyRule::BOTH;
    std::optional<WindowId> start_window;     // nullopt = hub window
    SanitizerOptions sanitizer;

    static ValidatorOptions from_config(const Config& config);
};

enum class DiagnosticStatus {
    OK,
    ERROR
};

struct LineDiagnostic {
    size_t line_number = 0;
    LineType line_type = LineType::CONTENT_ONLY;
    DiagnosticStatus status = DiagnosticStatus::OK;
    std::string message;
    std::optional<std::string> location;
    size_t token_count = 0;
    size_t sanitized_count = 0;
};

struct AdmissibilityMetrics {
    size_t total = 0;
    size_t covered = 0;
    size_t strict = 0;
    size_t drift = 0;            // strict + adjacent
    size_t numeric_drift = 0;
    size_t vertical_drift = 0;
    double strict_rate = 0.0;
    double drift_rate = 0.0;
    double strict_chance = 0.0;
    double drift_chance = 0.0;
};

struct ValidationReport {
    ValidationMode mode = ValidationMode::SYNTAX;
    bool strict_canonical = true;
    bool valid = true;
    size_t line_count = 0;                 // token-bearing lines processed
    size_t total_sanitized_tokens = 0;
    std::vector<LineDiagnostic> diagnostics;
    std::vector<LineDiagnostic> errors;
    std::vector<std::string> warnings;
    std::optional<double> coverage_rate;   // lattice mode only
    std::optional<AdmissibilityMetrics> admissibility;
    std::string normalized_text;
    std::string sanitized_text;
    std::vector<std::vector<std::string>> sanitized_lines;

    size_t error_count() const { return errors.size(); }
};

class Validator;

/**
 * Incremental validation. Text may arrive in arbitrary chunks; a line that
 * straddles two chunks is held back until its terminator arrives.
 */
class ValidationSession {
public:
    ValidationSession(const Validator& validator, ValidationMode mode, ValidatorOptions options);

    void feed(std::string_view chunk);
    ValidationReport finish();

    size_t lines_seen() const { return next_line_number_ - 1; }

private:
    void process_line(std::string_view line);
    void process_entry(const LineEntry& entry);
    void walk_line(const std::vector<std::string>& tokens);
    void finalize_lattice_metrics();

    const Validator& validator_;
    ValidatorOptions options_;
    Sanitizer sanitizer_;
    ValidationReport report_;
    std::optional<LatticeWalker> walker_;
    AdmissibilityMetrics metrics_;
    std::string pending_;
    size_t next_line_number_ = 1;
    bool finished_ = false;
};

class Validator {
public:
    explicit Validator(const Logger& logger = Logger::null());
    explicit Validator(const LatticeModel& lattice, const Logger& logger = Logger::null());

    ValidationReport validate(std::string_view text, ValidationMode mode,
                              const ValidatorOptions& options = ValidatorOptions{}) const;

    ValidationSession session(ValidationMode mode,
                              const ValidatorOptions& options = ValidatorOptions{}) const;

    const LatticeModel* lattice() const { return lattice_; }
    const Logger& logger() const { return logger_; }
    const LineParser& parser() const { return parser_; }

private:
    const LatticeModel* lattice_ = nullptr;
    const Logger& logger_;
    LineParser parser_;
};

} // namespace volvelle
