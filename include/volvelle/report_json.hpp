#pragma once
/**
 * JSON wire form of engine results (Boost.JSON).
 *
 * Keys are camelCase to match the report contract consumed by hosts:
 *   {"mode": "lattice", "valid": true, "lineCount": 3, "diagnostics": [...],
 *    "errors": [...], "warnings": [...], "coverageRate": 0.5,
 *    "normalizedText": "...", "sanitizedText": "..."}
 * coverageRate and admissibility are emitted only in lattice mode.
 */

#include <string>

#include <boost/json.hpp>

#include "volvelle/generator.hpp"
#include "volvelle/slip_detector.hpp"
#include "volvelle/validator.hpp"

namespace volvelle {

boost::json::object to_json(const LineDiagnostic& diagnostic);
boost::json::object to_json(const AdmissibilityMetrics& metrics);
boost::json::object to_json(const ValidationReport& report);
boost::json::object to_json(const LineOutput& line);
boost::json::object to_json(const GenerationResult& result);
boost::json::object to_json(const Slip& slip);
boost::json::object to_json(const SlipReport& report);

template<typename T>
std::string to_json_string(const T& value) {
    return boost::json::serialize(to_json(value));
}

} // namespace volvelle
