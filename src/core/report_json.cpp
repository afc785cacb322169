/**
 * JSON wire form of engine results
 */

#include "volvelle/report_json.hpp"

namespace volvelle {

namespace json = boost::json;

namespace {

json::array string_array(const std::vector<std::string>& items) {
    json::array out;
    out.reserve(items.size());
    for (const auto& item : items) {
        out.emplace_back(item);
    }
    return out;
}

} // anonymous namespace

json::object to_json(const LineDiagnostic& diagnostic) {
    json::object obj;
    obj["lineNumber"] = diagnostic.line_number;
    obj["lineType"] = line_type_name(diagnostic.line_type);
    obj["status"] = diagnostic.status == DiagnosticStatus::OK ? "ok" : "error";
    obj["message"] = diagnostic.message;
    if (diagnostic.location) {
        obj["location"] = *diagnostic.location;
    } else {
        obj["location"] = nullptr;
    }
    obj["tokenCount"] = diagnostic.token_count;
    obj["sanitizedCount"] = diagnostic.sanitized_count;
    return obj;
}

json::object to_json(const AdmissibilityMetrics& metrics) {
    json::object obj;
    obj["total"] = metrics.total;
    obj["covered"] = metrics.covered;
    obj["strict"] = metrics.strict;
    obj["drift"] = metrics.drift;
    obj["numericDrift"] = metrics.numeric_drift;
    obj["verticalDrift"] = metrics.vertical_drift;
    obj["strictRate"] = metrics.strict_rate;
    obj["driftRate"] = metrics.drift_rate;
    obj["strictChance"] = metrics.strict_chance;
    obj["driftChance"] = metrics.drift_chance;
    return obj;
}

json::object to_json(const ValidationReport& report) {
    json::object obj;
    obj["mode"] = validation_mode_name(report.mode);
    obj["strictCanonical"] = report.strict_canonical;
    obj["valid"] = report.valid;
    obj["lineCount"] = report.line_count;
    obj["errorCount"] = report.error_count();
    obj["totalSanitizedTokens"] = report.total_sanitized_tokens;

    json::array diagnostics;
    for (const auto& d : report.diagnostics) {
        diagnostics.emplace_back(to_json(d));
    }
    obj["diagnostics"] = std::move(diagnostics);

    json::array errors;
    for (const auto& e : report.errors) {
        errors.emplace_back(to_json(e));
    }
    obj["errors"] = std::move(errors);

    obj["warnings"] = string_array(report.warnings);

    if (report.coverage_rate) {
        obj["coverageRate"] = *report.coverage_rate;
    }
    if (report.admissibility) {
        obj["admissibility"] = to_json(*report.admissibility);
    }

    obj["normalizedText"] = report.normalized_text;
    obj["sanitizedText"] = report.sanitized_text;
    return obj;
}

json::object to_json(const LineOutput& line) {
    json::object obj;
    obj["lineIndex"] = line.line_index;
    if (line.locus) {
        obj["locus"] = *line.locus;
    }
    obj["tokens"] = string_array(line.tokens);

    json::array windows;
    for (WindowId w : line.windows) {
        windows.emplace_back(w);
    }
    obj["windows"] = std::move(windows);
    obj["text"] = line.render();
    return obj;
}

json::object to_json(const GenerationResult& result) {
    json::object obj;
    json::array lines;
    for (const auto& line : result.lines) {
        lines.emplace_back(to_json(line));
    }
    obj["lines"] = std::move(lines);
    obj["warnings"] = string_array(result.warnings);
    obj["finalWindow"] = result.final_window;
    obj["avgWordsPerLine"] = result.avg_words_per_line();
    return obj;
}

json::object to_json(const Slip& slip) {
    json::object obj;
    obj["lineIndex"] = slip.line_index;
    obj["position"] = slip.position;
    obj["token"] = slip.token;
    obj["expectedWindow"] = slip.expected_window;
    obj["matchedWindow"] = slip.matched_window;
    obj["adjacency"] = adjacency_name(slip.adjacency);
    return obj;
}

json::object to_json(const SlipReport& report) {
    json::object obj;
    json::array slips;
    for (const auto& slip : report.slips) {
        slips.emplace_back(to_json(slip));
    }
    obj["slips"] = std::move(slips);
    obj["slipCount"] = report.slips.size();
    obj["tokensExamined"] = report.tokens_examined;
    obj["numericCount"] = report.numeric_count;
    obj["verticalCount"] = report.vertical_count;
    obj["slipRate"] = report.slip_rate();
    return obj;
}

} // namespace volvelle
