// =============================================================================
// Lattice Loader Tests
// =============================================================================

#include <gtest/gtest.h>
#include "volvelle/error.hpp"
#include "volvelle/lattice_loader.hpp"
#include "volvelle/logging.hpp"
#include "lattice_fixtures.hpp"
#include <filesystem>
#include <fstream>
#include <memory>
#include <optional>
#include <string>

using namespace volvelle;

class LatticeLoaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        sink_ = std::make_shared<MemorySink>();
        logger_ = Logger(sink_, LogLevel::DEBUG);
    }

    void TearDown() override {
        sink_->clear();
    }

    static std::optional<ErrorCode> failure_code(const std::string& json) {
        try {
            load_lattice(json);
        } catch (const LatticeLoadError& e) {
            return e.code();
        }
        return std::nullopt;
    }

    std::shared_ptr<MemorySink> sink_;
    Logger logger_;
};

TEST_F(LatticeLoaderTest, CanonicalShape) {
    auto model = load_lattice(testdata::SLIP_LATTICE, logger_);
    EXPECT_EQ(model.num_windows(), 10);
    EXPECT_EQ(model.hub_window(), 0);
    EXPECT_TRUE(model.contains(3, "chol"));
    EXPECT_EQ(model.raw_transition("shedy").value_or(-1), 3);
    EXPECT_EQ(sink_->count(LogLevel::INFO), 1u);
}

TEST_F(LatticeLoaderTest, PaletteShapeWithCorrections) {
    auto model = load_lattice(testdata::GENERATOR_LATTICE);
    EXPECT_EQ(model.num_windows(), 6);
    EXPECT_EQ(model.correction_of(4), -1);
    EXPECT_EQ(model.correction_of(0), 0);
    EXPECT_TRUE(model.vocabulary(3).empty());
    EXPECT_EQ(model.generatable(0).size(), 2u);
}

TEST_F(LatticeLoaderTest, CanonicalDefaults) {
    auto model = load_lattice(testdata::SINGLE_TOKEN_LATTICE, logger_);
    EXPECT_EQ(model.num_windows(), CANONICAL_NUM_WINDOWS);
    EXPECT_EQ(model.hub_window(), CANONICAL_HUB_WINDOW);
    // no lattice map
    EXPECT_EQ(sink_->count(LogLevel::WARN), 1u);
}

TEST_F(LatticeLoaderTest, WindowsKeyedObjectAndResultsWrapper) {
    auto model = load_lattice(R"({"results": {
        "num_windows": 4, "hub_window": 1,
        "windows": {"2": {"words": ["daiin"], "correction_offset": 1}},
        "lattice_map": {"daiin": 0}
    }})");
    EXPECT_EQ(model.num_windows(), 4);
    EXPECT_TRUE(model.contains(2, "daiin"));
    EXPECT_EQ(model.next_window(2, "daiin"), 1);
}

TEST_F(LatticeLoaderTest, ReorderedKeysTakePrecedence) {
    auto model = load_lattice(R"({
        "num_windows": 4, "hub_window": 0,
        "window_contents": {"0": ["daiin"]},
        "reordered_window_contents": {"1": ["daiin"]},
        "lattice_map": {"daiin": 2},
        "reordered_lattice_map": {"daiin": 3}
    })");
    EXPECT_TRUE(model.contains(1, "daiin"));
    EXPECT_FALSE(model.contains(0, "daiin"));
    EXPECT_EQ(model.raw_transition("daiin").value_or(-1), 3);
}

TEST_F(LatticeLoaderTest, FailureModes) {
    EXPECT_EQ(failure_code("{not json"), ErrorCode::LATTICE_PARSE_FAILED);
    EXPECT_EQ(failure_code("[1, 2]"), ErrorCode::LATTICE_PARSE_FAILED);
    EXPECT_EQ(failure_code(R"({"lattice_map": {}})"), ErrorCode::LATTICE_PARSE_FAILED);
    EXPECT_EQ(failure_code(R"({"window_contents": {"x": ["daiin"]}})"), ErrorCode::LATTICE_PARSE_FAILED);
    EXPECT_EQ(failure_code(R"({"window_contents": {"0": "daiin"}})"), ErrorCode::LATTICE_PARSE_FAILED);
    EXPECT_EQ(failure_code(R"({"window_contents": {"0": [1]}})"), ErrorCode::LATTICE_PARSE_FAILED);

    EXPECT_EQ(failure_code(R"({"window_contents": {"5": ["daiin"], "05": ["ol"]}})"),
              ErrorCode::LATTICE_DUPLICATE_WINDOW);
    EXPECT_EQ(failure_code(R"({"windows": [{"id": 1, "vocabulary": []}, {"id": 1, "vocabulary": []}]})"),
              ErrorCode::LATTICE_DUPLICATE_WINDOW);
    EXPECT_EQ(failure_code(R"({"windows": [{"id": 1, "vocabulary": [], "correction_offset": 2}],
                               "corrections": {"1": 3}})"),
              ErrorCode::LATTICE_DUPLICATE_WINDOW);

    EXPECT_EQ(failure_code(R"({"window_contents": {"50": ["daiin"]}})"), ErrorCode::LATTICE_WINDOW_RANGE);
    EXPECT_EQ(failure_code(R"({"window_contents": {"0": ["daiin"]}, "lattice_map": {"daiin": 50}})"),
              ErrorCode::LATTICE_WINDOW_RANGE);
    EXPECT_EQ(failure_code(R"({"window_contents": {"0": ["daiin"]}, "corrections": {"0": 51}})"),
              ErrorCode::LATTICE_OFFSET_RANGE);

    EXPECT_EQ(failure_code(R"({"window_contents": {"0": [""]}})"),
              ErrorCode::LATTICE_INCONSISTENT_VOCABULARY);
    EXPECT_EQ(failure_code(R"({"window_contents": {"0": ["dai in"]}})"),
              ErrorCode::LATTICE_INCONSISTENT_VOCABULARY);
    EXPECT_EQ(failure_code(R"({"window_contents": {"0": ["daiin", "daiin"]}})"),
              ErrorCode::LATTICE_INCONSISTENT_VOCABULARY);
    EXPECT_EQ(failure_code(R"({"window_contents": {"0": ["daiin"], "1": ["daiin"]}})"),
              ErrorCode::LATTICE_INCONSISTENT_VOCABULARY);
}

// Literally repeated keys are rejected, not merged
TEST_F(LatticeLoaderTest, RepeatedKeysAreDuplicateWindows) {
    EXPECT_EQ(failure_code(R"({"window_contents": {"5": ["daiin"], "5": ["ol"]}})"),
              ErrorCode::LATTICE_DUPLICATE_WINDOW);
    EXPECT_EQ(failure_code(R"({"window_contents": {"0": ["daiin"]}, "corrections": {"0": 1, "0": 2}})"),
              ErrorCode::LATTICE_DUPLICATE_WINDOW);
    EXPECT_EQ(failure_code(R"({"windows": {"3": {"words": ["ol"]}, "3": {"words": ["chol"]}}})"),
              ErrorCode::LATTICE_DUPLICATE_WINDOW);
}

// Entries the line parser could not read back as one token
TEST_F(LatticeLoaderTest, VocabularyMustParseBack) {
    EXPECT_EQ(failure_code(R"({"window_contents": {"0": ["qo[k"]}})"),
              ErrorCode::LATTICE_INCONSISTENT_VOCABULARY);
    EXPECT_EQ(failure_code(R"({"window_contents": {"0": ["#daiin"]}})"),
              ErrorCode::LATTICE_INCONSISTENT_VOCABULARY);
    EXPECT_EQ(failure_code(R"({"window_contents": {"0": ["dai\u0001in"]}})"),
              ErrorCode::LATTICE_INCONSISTENT_VOCABULARY);
    EXPECT_EQ(failure_code(R"({"window_contents": {"0": ["dai\u007fin"]}})"),
              ErrorCode::LATTICE_INCONSISTENT_VOCABULARY);

    EXPECT_FALSE(failure_code(R"({"window_contents": {"0": ["daiin", "qo'k", "cth"]}})").has_value());
}

TEST_F(LatticeLoaderTest, ErrorCarriesContext) {
    try {
        load_lattice(R"({"window_contents": {"7": ["ok<$>"]}})");
        FAIL() << "expected LatticeLoadError";
    } catch (const LatticeLoadError& e) {
        EXPECT_EQ(e.context(), "window 7");
        EXPECT_NE(std::string(e.what()).find("ok<$>"), std::string::npos);
    }
}

TEST_F(LatticeLoaderTest, LoadsFromFile) {
    auto path = std::filesystem::temp_directory_path() / "volvelle_lattice_test.json";
    {
        std::ofstream out(path);
        out << testdata::SLIP_LATTICE;
    }
    auto model = load_lattice_file(path.string(), logger_);
    EXPECT_EQ(model.num_windows(), 10);
    std::filesystem::remove(path);

    EXPECT_THROW(load_lattice_file("/nonexistent/lattice.json"), IOError);
}
