/**
 * Lattice dataset loading
 */

#include "volvelle/lattice_loader.hpp"
#include "volvelle/error.hpp"

#include <boost/json.hpp>

#include <charconv>
#include <fstream>
#include <limits>
#include <map>
#include <sstream>
#include <string>

namespace volvelle {

namespace json = boost::json;

namespace {

std::string to_string(const json::string& s) {
    return std::string(s.data(), s.size());
}

int32_t to_int32(const json::value& v, const std::string& what) {
    if (!v.is_number()) {
        throw LatticeLoadError(what + " must be an integer");
    }
    boost::system::error_code ec;
    auto n = v.to_number<int64_t>(ec);
    if (ec) {
        throw LatticeLoadError(what + " must be an integer", ec.message());
    }
    if (n < std::numeric_limits<int32_t>::min() || n > std::numeric_limits<int32_t>::max()) {
        throw LatticeLoadError(ErrorCode::LATTICE_WINDOW_RANGE, what + " out of range");
    }
    return static_cast<int32_t>(n);
}

WindowId parse_window_key(std::string_view key) {
    WindowId id = 0;
    const char* begin = key.data();
    const char* end = key.data() + key.size();
    auto [ptr, ec] = std::from_chars(begin, end, id);
    if (key.empty() || ec != std::errc() || ptr != end) {
        throw LatticeLoadError("Window key '" + std::string(key) + "' is not an integer");
    }
    return id;
}

std::vector<std::string> parse_vocabulary(const json::value& v, WindowId id) {
    if (!v.is_array()) {
        throw LatticeLoadError("Vocabulary must be an array", "window " + std::to_string(id));
    }
    std::vector<std::string> words;
    words.reserve(v.as_array().size());
    for (const auto& item : v.as_array()) {
        if (!item.is_string()) {
            throw LatticeLoadError("Vocabulary entries must be strings", "window " + std::to_string(id));
        }
        words.push_back(to_string(item.as_string()));
    }
    return words;
}

const json::value* first_present(const json::object& obj,
                                 std::initializer_list<const char*> keys) {
    for (const char* key : keys) {
        if (const json::value* v = obj.if_contains(key)) return v;
    }
    return nullptr;
}

// Collects window specs keyed by id, rejecting ids that collide after
// normalisation ("5" and "05")
class SpecTable {
public:
    WindowSpec& add(WindowId id) {
        auto [it, inserted] = specs_.try_emplace(id);
        if (!inserted) {
            throw LatticeLoadError(ErrorCode::LATTICE_DUPLICATE_WINDOW,
                                   "Duplicate window id " + std::to_string(id));
        }
        it->second.id = id;
        return it->second;
    }

    WindowSpec& get_or_add(WindowId id) {
        auto& spec = specs_[id];
        spec.id = id;
        return spec;
    }

    std::vector<WindowSpec> release() {
        std::vector<WindowSpec> out;
        out.reserve(specs_.size());
        for (auto& [id, spec] : specs_) {
            out.push_back(std::move(spec));
        }
        return out;
    }

private:
    std::map<WindowId, WindowSpec> specs_;
};

void read_window_entry(const json::object& entry, WindowSpec& spec, std::map<WindowId, bool>& explicit_offset) {
    const json::value* vocab = first_present(entry, {"vocabulary", "words"});
    if (!vocab) {
        throw LatticeLoadError("Window entry has no vocabulary", "window " + std::to_string(spec.id));
    }
    spec.vocabulary = parse_vocabulary(*vocab, spec.id);

    if (const json::value* off = entry.if_contains("correction_offset")) {
        spec.correction_offset = to_int32(*off, "correction_offset of window " + std::to_string(spec.id));
        explicit_offset[spec.id] = true;
    }
}

} // anonymous namespace

LatticeData parse_lattice_json(std::string_view json_text) {
    // Repeated keys would silently collapse two window entries into one
    json::parse_options opts;
    opts.allow_duplicate_keys = false;

    boost::system::error_code ec;
    json::value root = json::parse(json::string_view(json_text.data(), json_text.size()), ec,
                                   json::storage_ptr(), opts);
    if (ec == json::error::duplicate_key) {
        throw LatticeLoadError(ErrorCode::LATTICE_DUPLICATE_WINDOW,
                               "Lattice JSON repeats an object key", ec.message());
    }
    if (ec) {
        throw LatticeLoadError("Invalid lattice JSON", ec.message());
    }
    if (!root.is_object()) {
        throw LatticeLoadError("Lattice dataset must be a JSON object");
    }

    const json::object* obj = &root.as_object();
    if (const json::value* results = obj->if_contains("results"); results && results->is_object()) {
        obj = &results->as_object();
    }

    LatticeData data;
    if (const json::value* n = obj->if_contains("num_windows")) {
        data.num_windows = to_int32(*n, "num_windows");
    }
    if (const json::value* hub = obj->if_contains("hub_window")) {
        data.hub_window = to_int32(*hub, "hub_window");
    }

    SpecTable table;
    std::map<WindowId, bool> explicit_offset;

    if (const json::value* windows = obj->if_contains("windows")) {
        if (windows->is_array()) {
            for (const auto& item : windows->as_array()) {
                if (!item.is_object()) {
                    throw LatticeLoadError("Entries of 'windows' must be objects");
                }
                const json::object& entry = item.as_object();
                const json::value* id = entry.if_contains("id");
                if (!id) {
                    throw LatticeLoadError("Window entry without 'id'");
                }
                WindowSpec& spec = table.add(to_int32(*id, "window id"));
                read_window_entry(entry, spec, explicit_offset);
            }
        } else if (windows->is_object()) {
            for (const auto& kv : windows->as_object()) {
                if (!kv.value().is_object()) {
                    throw LatticeLoadError("Entries of 'windows' must be objects");
                }
                WindowSpec& spec = table.add(parse_window_key(std::string_view(kv.key().data(), kv.key().size())));
                read_window_entry(kv.value().as_object(), spec, explicit_offset);
            }
        } else {
            throw LatticeLoadError("'windows' must be an array or an object");
        }
    } else if (const json::value* contents =
                   first_present(*obj, {"reordered_window_contents", "window_contents"})) {
        if (!contents->is_object()) {
            throw LatticeLoadError("'window_contents' must be an object");
        }
        for (const auto& kv : contents->as_object()) {
            WindowSpec& spec = table.add(parse_window_key(std::string_view(kv.key().data(), kv.key().size())));
            spec.vocabulary = parse_vocabulary(kv.value(), spec.id);
        }
    } else {
        throw LatticeLoadError("Lattice dataset has no window vocabulary",
                               "expected 'windows' or 'window_contents'");
    }

    if (const json::value* corrections = obj->if_contains("corrections")) {
        if (!corrections->is_object()) {
            throw LatticeLoadError("'corrections' must be an object");
        }
        std::map<WindowId, bool> seen;
        for (const auto& kv : corrections->as_object()) {
            WindowId id = parse_window_key(std::string_view(kv.key().data(), kv.key().size()));
            if (seen[id]) {
                throw LatticeLoadError(ErrorCode::LATTICE_DUPLICATE_WINDOW,
                                       "Duplicate correction for window " + std::to_string(id));
            }
            seen[id] = true;
            if (explicit_offset[id]) {
                throw LatticeLoadError(ErrorCode::LATTICE_DUPLICATE_WINDOW,
                                       "Window " + std::to_string(id) +
                                       " has both correction_offset and a 'corrections' entry");
            }
            table.get_or_add(id).correction_offset =
                to_int32(kv.value(), "correction of window " + std::to_string(id));
        }
    }

    if (const json::value* map = first_present(*obj, {"reordered_lattice_map", "lattice_map"})) {
        if (!map->is_object()) {
            throw LatticeLoadError("'lattice_map' must be an object");
        }
        for (const auto& kv : map->as_object()) {
            std::string token(kv.key().data(), kv.key().size());
            data.transitions[token] = to_int32(kv.value(), "lattice map entry '" + token + "'");
        }
    }

    data.windows = table.release();
    return data;
}

LatticeModel load_lattice(std::string_view json_text, const Logger& logger) {
    LatticeData data = parse_lattice_json(json_text);
    if (data.transitions.empty()) {
        VOLVELLE_LOG_WARN(logger, "Lattice dataset has no lattice map; every transition falls back to +1");
    }

    LatticeModel model = LatticeModel::build(std::move(data));
    VOLVELLE_LOG_INFO(logger, "Loaded lattice: windows=", model.num_windows(),
                      ", vocabulary=", model.vocabulary_size(),
                      ", hub=", model.hub_window());
    return model;
}

LatticeModel load_lattice_file(const std::string& path, const Logger& logger) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw IOError("Cannot open lattice dataset", path,
                      "Set lattice.path or VOLVELLE_LATTICE_PATH to an existing JSON file");
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        throw IOError("Failed reading lattice dataset", path);
    }

    VOLVELLE_LOG_DEBUG(logger, "Read lattice dataset ", path);
    return load_lattice(buffer.str(), logger);
}

} // namespace volvelle
