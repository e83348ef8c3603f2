#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include <vector>

#include "CurateExceptions.h"
#include "DatasetFinalizer.h"

namespace {
std::vector<CellValue> numbers(const std::vector<double>& values) {
    return std::vector<CellValue>(values.begin(), values.end());
}
}

// ============================================================================
// TARGET TYPE INFERENCE
// ============================================================================

TEST(DatasetFinalizerTest, BinaryTargetIsClassification) {
    auto values = numbers({1, 0, 1, 0, 1, 0, 1, 0, 1, 0});

    EXPECT_EQ(DatasetFinalizer::inferTargetType(values), TargetType::CLASSIFICATION);
    EXPECT_EQ(DatasetFinalizer::countClasses(values), 2u);
}

TEST(DatasetFinalizerTest, ConstantTargetIsRegression) {
    EXPECT_EQ(DatasetFinalizer::inferTargetType(numbers({1, 1, 1, 1, 1})), TargetType::REGRESSION)
        << "A single 0/1 level is not a binary series";
    EXPECT_EQ(DatasetFinalizer::inferTargetType(numbers({0, 0, 0})), TargetType::REGRESSION);
}

TEST(DatasetFinalizerTest, DistinctContinuousValuesAreRegression) {
    std::vector<double> values;
    for (int i = 0; i < 50; ++i) values.push_back(1.1 + 0.37 * i);

    EXPECT_EQ(DatasetFinalizer::inferTargetType(numbers(values)), TargetType::REGRESSION);
}

TEST(DatasetFinalizerTest, FewRepeatedNumericLevelsAreClassification) {
    std::vector<double> values;
    for (int i = 0; i < 60; ++i) values.push_back(static_cast<double>(i % 3 + 1));

    EXPECT_EQ(DatasetFinalizer::inferTargetType(numbers(values)), TargetType::CLASSIFICATION);
}

TEST(DatasetFinalizerTest, ModeratelyRepeatedLevelsFavorRegression) {
    // 5 levels over 30 samples: 5 is not below 10% of 30.
    std::vector<double> values;
    for (int i = 0; i < 30; ++i) values.push_back(static_cast<double>(i % 5 + 2));

    EXPECT_EQ(DatasetFinalizer::inferTargetType(numbers(values)), TargetType::REGRESSION);
}

TEST(DatasetFinalizerTest, TextTargetIsClassification) {
    std::vector<CellValue> values = {CellValue{std::string("cat")}, CellValue{2.0}, CellValue{std::string("")}};

    EXPECT_EQ(DatasetFinalizer::inferTargetType(values), TargetType::CLASSIFICATION);
    EXPECT_EQ(DatasetFinalizer::countClasses(values), 2u) << "Missing values are not a class";
}

TEST(DatasetFinalizerTest, AllMissingTargetIsRegression) {
    std::vector<CellValue> values = {CellValue{std::string("")}};
    EXPECT_EQ(DatasetFinalizer::inferTargetType(values), TargetType::REGRESSION);
    EXPECT_EQ(DatasetFinalizer::inferTargetType({}), TargetType::REGRESSION);
}

TEST(DatasetFinalizerTest, TypedValues) {
    EXPECT_TRUE(CellValues::isNumeric(DatasetFinalizer::toTypedValue(" 4 ")));
    EXPECT_DOUBLE_EQ(std::get<double>(DatasetFinalizer::toTypedValue("+1.5e2")), 150.0);
    EXPECT_EQ(std::get<std::string>(DatasetFinalizer::toTypedValue("inf")), "inf");
    EXPECT_EQ(std::get<std::string>(DatasetFinalizer::toTypedValue("12abc")), "12abc");
}

// ============================================================================
// PACKAGING
// ============================================================================

class DatasetPackagingTest : public ::testing::Test {
protected:
    Dataset build() {
        IngestionConfig config;
        config.skipRows = 2;
        config.headerRow = 1;
        config.columnStrategies["x"] = MissingStrategy::of(MissingStrategy::Kind::DROP_ROW);
        ResolvedPolicy policy = PolicyResolver::resolve({"x", "note"}, std::string("label"), config);

        ImputationResult imputed;
        imputed.rows = {
            {CellValue{std::string("1")}, CellValue{std::string("a, b")}, CellValue{std::string("yes")}},
            {CellValue{std::string("2.5")}, CellValue{std::string("")}, CellValue{std::string("no")}}
        };
        imputed.originalRowCount = 3;
        imputed.droppedRowCount = 1;
        return DatasetFinalizer::finalize({"x", "note", "label"}, std::move(imputed), policy, config);
    }
};

TEST_F(DatasetPackagingTest, CarriesMetadata) {
    Dataset ds = build();

    EXPECT_EQ(ds.numSamples, 2u);
    EXPECT_EQ(ds.numFeatures, 2u);
    EXPECT_EQ(ds.target, "label");
    EXPECT_EQ(ds.targetType, TargetType::CLASSIFICATION);
    EXPECT_EQ(ds.numClasses.value_or(0), 2u);
    EXPECT_EQ(ds.skipRows, 2u);
    EXPECT_EQ(ds.headerRow, 1u);

    const auto& summary = ds.imputationSummary;
    EXPECT_EQ(summary.originalRowCount, 3u);
    EXPECT_EQ(summary.droppedRowCount, 1u);
    EXPECT_TRUE(summary.dropApplied);
    EXPECT_EQ(summary.dropColumns, (std::vector<std::string>{"x"}));
    EXPECT_TRUE(summary.targetDrop);
    EXPECT_FALSE(summary.globalDrop);
}

TEST_F(DatasetPackagingTest, NumericTextBecomesNumbers) {
    Dataset ds = build();

    EXPECT_DOUBLE_EQ(std::get<double>(ds.at(1, "x")), 2.5);
    EXPECT_TRUE(CellValues::isMissing(ds.at(1, "note")));
    EXPECT_THROW(ds.at(0, "nope"), Curate::DatasetException);
    EXPECT_THROW(ds.at(9, "x"), Curate::DatasetException);
}

TEST_F(DatasetPackagingTest, WritesQuotedCsv) {
    Dataset ds = build();
    std::ostringstream out;
    ds.writeCsv(out);

    EXPECT_EQ(out.str(), "x,note,label\n1,\"a, b\",yes\n2.5,,no\n");
}
