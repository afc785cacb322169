#pragma once
/**
 * Lattice dataset loading (Boost.JSON)
 *
 * Accepted shapes, optionally wrapped in a top-level "results" object:
 *
 *   canonical  {"num_windows": 50, "hub_window": 18,
 *               "windows": [{"id": 0, "vocabulary": [...], "correction_offset": 0}],
 *               "lattice_map": {"daiin": 18}}
 *              ("windows" may also be an object keyed by window id)
 *
 *   palette    {"window_contents": {"0": [...]}, "lattice_map": {...},
 *               "corrections": {"0": -3}}
 *              (reordered_window_contents / reordered_lattice_map win if present)
 *
 * Any malformation throws LatticeLoadError; no partially-loaded model escapes.
 * load_lattice_file() reads the artifact first and throws IOError when it
 * cannot.
 */

#include <string>
#include <string_view>

#include "volvelle/lattice_model.hpp"
#include "volvelle/logging.hpp"

namespace volvelle {

LatticeData parse_lattice_json(std::string_view json_text);

LatticeModel load_lattice(std::string_view json_text, const Logger& logger = Logger::null());

LatticeModel load_lattice_file(const std::string& path, const Logger& logger = Logger::null());

} // namespace volvelle
