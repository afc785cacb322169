#pragma once

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <map>
#include <optional>
#include <sstream>
#include <string>
#include <type_traits>
#include <vector>

#include "volvelle/error.hpp"
#include "volvelle/logging.hpp"

namespace volvelle {

/**
 * Host configuration: defaults, then VOLVELLE_* environment variables, then
 * an optional key=value file. The engine never reads this directly; hosts
 * turn it into ValidatorOptions / GenerationRequest via their from_config().
 */
class Config {
public:
    explicit Config(const Logger& logger = Logger::null()) : logger_(&logger) {
        load_defaults();
    }

    // Load configuration from environment variables and optional config file
    bool load(const std::string& config_file = "") {
        load_from_env();

        if (!config_file.empty()) {
            if (!std::filesystem::exists(config_file)) {
                VOLVELLE_LOG_WARN(*logger_, "Config file not found: ", config_file);
            } else {
                load_from_file(config_file);
            }
        }

        auto problems = validate();
        for (const auto& p : problems) {
            VOLVELLE_LOG_ERROR(*logger_, p);
        }
        return problems.empty();
    }

    // key = value lines; '#' and ';' start comments
    void load_from_string(const std::string& text) {
        std::istringstream stream(text);
        std::string line;
        while (std::getline(stream, line)) {
            parse_line(line);
        }
    }

    // Get configuration value with default
    template<typename T>
    T get(const std::string& key, T default_value = T{}) const {
        auto it = values_.find(key);
        if (it == values_.end()) {
            return default_value;
        }

        try {
            if constexpr (std::is_same_v<T, int>) {
                size_t used = 0;
                int v = std::stoi(it->second, &used);
                if (used != it->second.size()) throw std::invalid_argument(key);
                return v;
            } else if constexpr (std::is_same_v<T, double>) {
                size_t used = 0;
                double v = std::stod(it->second, &used);
                if (used != it->second.size()) throw std::invalid_argument(key);
                return v;
            } else if constexpr (std::is_same_v<T, bool>) {
                std::string val = it->second;
                std::transform(val.begin(), val.end(), val.begin(),
                               [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
                if (val == "true" || val == "1" || val == "yes" || val == "on") return true;
                if (val == "false" || val == "0" || val == "no" || val == "off") return false;
                throw std::invalid_argument(key);
            } else {
                return it->second;
            }
        } catch (const std::exception&) {
            VOLVELLE_LOG_WARN(*logger_, "Failed to parse config value for key '", key, "', using default");
            return default_value;
        }
    }

    // "auto" or empty yields nullopt; anything else must be a window id
    std::optional<int> get_window(const std::string& key) const {
        std::string value = get<std::string>(key, "auto");
        if (value.empty() || value == "auto") {
            return std::nullopt;
        }
        size_t used = 0;
        int window = -1;
        try {
            window = std::stoi(value, &used);
        } catch (const std::exception&) {
            used = 0;
        }
        if (used != value.size() || window < 0) {
            throw ConfigError("Invalid window id '" + value + "'", key,
                              "Use 'auto' or a non-negative integer");
        }
        return window;
    }

    void set(const std::string& key, const std::string& value) {
        values_[key] = value;
    }

    bool has(const std::string& key) const {
        return values_.count(key) != 0;
    }

    const std::map<std::string, std::string>& values() const { return values_; }

    void print() const {
        VOLVELLE_LOG_INFO(*logger_, "Current configuration:");
        for (const auto& [key, value] : values_) {
            VOLVELLE_LOG_INFO(*logger_, "  ", key, " = ", value);
        }
    }

    std::vector<std::string> validate() const {
        std::vector<std::string> problems;

        std::string log_level = get<std::string>("log.level");
        if (log_level != "debug" && log_level != "info" && log_level != "warn" &&
            log_level != "error" && log_level != "off") {
            problems.push_back("Unknown log level '" + log_level + "'");
        }

        std::string mode = get<std::string>("validator.mode");
        if (mode != "syntax" && mode != "sanitized" && mode != "lattice") {
            problems.push_back("Unknown validator mode '" + mode + "'");
        }

        double threshold = get<double>("validator.coverage_warning_threshold", -1.0);
        if (threshold < 0.0 || threshold > 1.0) {
            problems.push_back("validator.coverage_warning_threshold must lie in [0, 1]");
        }

        std::string adjacency = get<std::string>("validator.adjacency");
        if (adjacency != "both" && adjacency != "numeric" && adjacency != "vertical") {
            problems.push_back("Unknown adjacency rule '" + adjacency + "'");
        }

        int words_min = get<int>("generator.words_min", 0);
        int words_max = get<int>("generator.words_max", 0);
        if (words_min < 1 || words_max < words_min) {
            problems.push_back("generator.words_min/words_max must satisfy 1 <= min <= max");
        }

        if (get<int>("generator.line_count", 0) < 1) {
            problems.push_back("generator.line_count must be positive");
        }

        std::string format = get<std::string>("generator.format");
        if (format != "content" && format != "locus") {
            problems.push_back("Unknown generator format '" + format + "'");
        }

        std::string selection = get<std::string>("generator.selection");
        if (selection != "uniform" && selection != "hand1" && selection != "hand2") {
            problems.push_back("Unknown generator selection '" + selection + "'");
        }

        return problems;
    }

private:
    void load_defaults() {
        values_["log.level"] = "info";
        values_["lattice.path"] = "";

        values_["validator.mode"] = "syntax";
        values_["validator.strict_canonical"] = "true";
        values_["validator.coverage_warning_threshold"] = "0.2";
        values_["validator.adjacency"] = "both";
        values_["validator.start_window"] = "auto";

        values_["generator.seed"] = "42";
        values_["generator.line_count"] = "9";
        values_["generator.words_min"] = "6";
        values_["generator.words_max"] = "12";
        values_["generator.start_window"] = "auto";
        values_["generator.format"] = "content";
        values_["generator.selection"] = "uniform";
        values_["generator.lines_per_page"] = "0";
        values_["generator.reset_at_page_boundary"] = "false";
        values_["generator.folio_label"] = "f1000r";
    }

    void load_from_env() {
        set_if_env("log.level", "VOLVELLE_LOG_LEVEL");
        set_if_env("lattice.path", "VOLVELLE_LATTICE_PATH");
        set_if_env("validator.strict_canonical", "VOLVELLE_STRICT_CANONICAL");
        set_if_env("generator.seed", "VOLVELLE_SEED");
    }

    void set_if_env(const std::string& key, const char* env_var) {
        const char* env_value = std::getenv(env_var);
        if (env_value && *env_value) {
            values_[key] = env_value;
        }
    }

    void load_from_file(const std::string& filename) {
        std::ifstream file(filename);
        if (!file.is_open()) {
            VOLVELLE_LOG_WARN(*logger_, "Could not open config file: ", filename);
            return;
        }

        std::string line;
        while (std::getline(file, line)) {
            parse_line(line);
        }

        VOLVELLE_LOG_INFO(*logger_, "Loaded configuration from file: ", filename);
    }

    void parse_line(const std::string& raw) {
        std::string line = trim(raw);
        // Skip comments and empty lines
        if (line.empty() || line[0] == '#' || line[0] == ';') return;

        size_t equals_pos = line.find('=');
        if (equals_pos == std::string::npos) {
            VOLVELLE_LOG_WARN(*logger_, "Ignoring config line without '=': ", line);
            return;
        }

        std::string key = trim(line.substr(0, equals_pos));
        std::string value = trim(line.substr(equals_pos + 1));
        if (!key.empty()) {
            values_[key] = value;
        }
    }

    static std::string trim(const std::string& s) {
        auto first = std::find_if(s.begin(), s.end(), [](unsigned char ch) { return !std::isspace(ch); });
        auto last = std::find_if(s.rbegin(), s.rend(), [](unsigned char ch) { return !std::isspace(ch); }).base();
        return first < last ? std::string(first, last) : std::string();
    }

    const Logger* logger_;
    std::map<std::string, std::string> values_;
};

// Host-side logger wiring from log.level
inline Logger make_logger(const Config& config, std::shared_ptr<LogSink> sink) {
    return Logger(std::move(sink), parse_log_level(config.get<std::string>("log.level")));
}

} // namespace volvelle
