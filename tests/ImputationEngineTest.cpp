#include <gtest/gtest.h>
#include <string>
#include <vector>

#include "ImputationEngine.h"

using Kind = MissingStrategy::Kind;

namespace {
std::vector<std::string> vals(std::initializer_list<const char*> items) {
    return std::vector<std::string>(items.begin(), items.end());
}

double asDouble(const std::optional<CellValue>& v) {
    return std::get<double>(v.value());
}
}

// ============================================================================
// REPLACEMENT VALUES
// ============================================================================

TEST(ImputationEngineTest, MeanSkipsNonNumericValues) {
    auto r = ImputationEngine::computeReplacement(vals({"1", "2", "x", "6"}), MissingStrategy::of(Kind::MEAN));
    EXPECT_DOUBLE_EQ(asDouble(r), 3.0);
}

TEST(ImputationEngineTest, MedianOfEvenCount) {
    auto r = ImputationEngine::computeReplacement(vals({"5", "1", "3", "2"}), MissingStrategy::of(Kind::MEDIAN));
    EXPECT_DOUBLE_EQ(asDouble(r), 2.5);
}

TEST(ImputationEngineTest, MeanAndMedianStayWithinObservedRange) {
    const auto values = vals({"0.1", "0.1", "0.1", "0.7", "1e-3", "-4.25"});
    for (Kind kind : {Kind::MEAN, Kind::MEDIAN}) {
        const double r = asDouble(ImputationEngine::computeReplacement(values, MissingStrategy::of(kind)));
        EXPECT_GE(r, -4.25);
        EXPECT_LE(r, 0.7);
    }
    const double same = asDouble(ImputationEngine::computeReplacement(vals({"0.1", "0.1", "0.1"}),
                                                                      MissingStrategy::of(Kind::MEAN)));
    EXPECT_DOUBLE_EQ(same, 0.1);
}

TEST(ImputationEngineTest, ModeTieGoesToFirstSeen) {
    auto r = ImputationEngine::computeReplacement(vals({"b", "a", "b", "a"}), MissingStrategy::of(Kind::MODE));
    EXPECT_EQ(std::get<std::string>(r.value()), "b");

    r = ImputationEngine::computeReplacement(vals({"a", "b", "b"}), MissingStrategy::of(Kind::MODE));
    EXPECT_EQ(std::get<std::string>(r.value()), "b");
}

TEST(ImputationEngineTest, FixedReplacements) {
    EXPECT_DOUBLE_EQ(asDouble(ImputationEngine::computeReplacement({}, MissingStrategy::of(Kind::ZERO))), 0.0);
    auto c = ImputationEngine::computeReplacement({}, MissingStrategy::constant("fill"));
    EXPECT_EQ(std::get<std::string>(c.value()), "fill");
    EXPECT_FALSE(ImputationEngine::computeReplacement(vals({"1"}), MissingStrategy::of(Kind::LEAVE)).has_value());
    EXPECT_FALSE(ImputationEngine::computeReplacement(vals({"1"}), MissingStrategy::of(Kind::DROP_ROW)).has_value());
}

TEST(ImputationEngineTest, NothingToAggregateFallsBackToZero) {
    EXPECT_DOUBLE_EQ(asDouble(ImputationEngine::computeReplacement({}, MissingStrategy::of(Kind::MEAN))), 0.0);
    EXPECT_DOUBLE_EQ(asDouble(ImputationEngine::computeReplacement({}, MissingStrategy::of(Kind::MODE))), 0.0);
    EXPECT_DOUBLE_EQ(asDouble(ImputationEngine::computeReplacement(vals({"x", "y"}),
                                                                   MissingStrategy::of(Kind::MEDIAN))), 0.0);
}

// ============================================================================
// FULL PASS
// ============================================================================

class ImputationRunTest : public ::testing::Test {
protected:
    ResolvedPolicy policyFor(const IngestionConfig& config) {
        return PolicyResolver::resolve({"a", "b"}, std::string("t"), config);
    }

    ImputationResult run(const CSVUtils::RawRows& rows, const IngestionConfig& config) {
        // columns: a, b, t, note
        return ImputationEngine::run(rows, 4, {0, 1}, size_t{2}, policyFor(config));
    }
};

TEST_F(ImputationRunTest, ImputesFeaturesButNeverTheTarget) {
    IngestionConfig config;
    config.columnStrategies["a"] = MissingStrategy::of(Kind::MEAN);
    config.columnStrategies["b"] = MissingStrategy::of(Kind::ZERO);
    CSVUtils::RawRows rows = {
        {"1", "NA", "y1", "NA"},
        {"", "3", "y2", "ok"},
        {"3", "4", "?"}
    };

    auto result = run(rows, config);

    ASSERT_EQ(result.rows.size(), 3u) << "Imputation alone never removes rows";
    EXPECT_EQ(result.droppedRowCount, 0u);
    EXPECT_DOUBLE_EQ(std::get<double>(result.rows[0][1]), 0.0);
    EXPECT_DOUBLE_EQ(std::get<double>(result.rows[1][0]), 2.0);
    EXPECT_TRUE(CellValues::isMissing(result.rows[2][2])) << "Placeholder target is normalized, not imputed";
    EXPECT_EQ(std::get<std::string>(result.rows[0][3]), "NA") << "Untracked columns keep raw text";
    EXPECT_TRUE(CellValues::isMissing(result.rows[2][3])) << "Short rows are padded";
}

TEST_F(ImputationRunTest, GlobalDropRemovesIncompleteRows) {
    IngestionConfig config;
    config.globalStrategy = MissingStrategy::of(Kind::DROP_ROW);
    CSVUtils::RawRows rows = {
        {"1", "2", "p", ""},
        {"NA", "2", "q", ""},
        {"3", "4", "", ""},
        {"5", "6", "r", ""}
    };

    auto result = run(rows, config);

    ASSERT_EQ(result.rows.size(), 2u);
    EXPECT_EQ(result.originalRowCount, 4u);
    EXPECT_EQ(result.droppedRowCount, 2u);
    for (const auto& row : result.rows) {
        EXPECT_FALSE(CellValues::isMissing(row[0]));
        EXPECT_FALSE(CellValues::isMissing(row[1]));
        EXPECT_FALSE(CellValues::isMissing(row[2]));
    }
}

TEST_F(ImputationRunTest, ReplacementsUseRowsThatAreLaterDropped) {
    IngestionConfig config;
    config.columnStrategies["a"] = MissingStrategy::of(Kind::DROP_ROW);
    config.columnStrategies["b"] = MissingStrategy::of(Kind::MEAN);
    CSVUtils::RawRows rows = {
        {"", "10", "t", ""},
        {"1", "", "t", ""},
        {"2", "20", "t", ""}
    };

    auto result = run(rows, config);

    ASSERT_EQ(result.rows.size(), 2u);
    EXPECT_DOUBLE_EQ(std::get<double>(result.rows[0][1]), 15.0);
    EXPECT_DOUBLE_EQ(asDouble(result.replacements[1]), 15.0);
    EXPECT_FALSE(result.replacements[0].has_value());
}

TEST_F(ImputationRunTest, FeatureDropAlsoDropsMissingTarget) {
    IngestionConfig config;
    config.columnStrategies["a"] = MissingStrategy::of(Kind::DROP_ROW);
    CSVUtils::RawRows rows = {
        {"1", "", "", ""},
        {"2", "", "t", ""}
    };

    EXPECT_EQ(run(rows, config).rows.size(), 1u);

    config.targetDropFallback = false;
    EXPECT_EQ(run(rows, config).rows.size(), 2u);
}
