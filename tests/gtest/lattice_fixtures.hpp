#pragma once
// =============================================================================
// Shared lattice datasets for the test suite
// =============================================================================

namespace volvelle {
namespace testdata {

// Windows 4 and 5 share "qokeedy"; drawing "shedy" in window 5 leads to window 3.
inline constexpr const char* SLIP_LATTICE = R"({
    "num_windows": 10,
    "hub_window": 0,
    "windows": [
        {"id": 0, "vocabulary": ["daiin"]},
        {"id": 3, "vocabulary": ["chol"]},
        {"id": 4, "vocabulary": ["qokeedy", "otedy"]},
        {"id": 5, "vocabulary": ["shedy", "qokeedy"]}
    ],
    "lattice_map": {"shedy": 3, "qokeedy": 6, "daiin": 0}
})";

// Small palette-shaped lattice for generation. Window 3 is empty and
// "Qokal" is never drawn.
inline constexpr const char* GENERATOR_LATTICE = R"({
    "num_windows": 6,
    "hub_window": 0,
    "window_contents": {
        "0": ["daiin", "chedy", "Qokal"],
        "1": ["qokeedy", "shol"],
        "2": ["otedy", "chor", "dy"],
        "3": [],
        "4": ["okaiin", "qotain"],
        "5": ["sain", "ol"]
    },
    "corrections": {"4": -1},
    "lattice_map": {"daiin": 2, "chedy": 4, "qokeedy": 5, "otedy": 3, "okaiin": 1}
})";

// Only window 0 holds a token.
inline constexpr const char* SINGLE_TOKEN_LATTICE = R"({
    "windows": [{"id": 0, "vocabulary": ["daiin"]}]
})";

} // namespace testdata
} // namespace volvelle
