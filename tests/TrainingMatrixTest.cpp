#include <gtest/gtest.h>
#include <cmath>
#include <string>
#include <vector>

#include "CurateExceptions.h"
#include "TrainingMatrix.h"

class TrainingMatrixTest : public ::testing::Test {
protected:
    Dataset dataset;

    void SetUp() override {
        dataset.columns = {"x1", "x2", "label"};
        dataset.features = {"x1", "x2"};
        dataset.target = "label";
        dataset.targetType = TargetType::CLASSIFICATION;
        dataset.rows = {
            {CellValue{1.0}, CellValue{std::string("red")}, CellValue{std::string("dog")}},
            {CellValue{3.0}, CellValue{5.0}, CellValue{std::string("cat")}},
            {CellValue{5.0}, CellValue{std::string("")}, CellValue{std::string("dog")}}
        };
        dataset.numSamples = 3;
        dataset.numFeatures = 2;
        dataset.numClasses = 2;
    }
};

TEST_F(TrainingMatrixTest, ClassIndicesFollowFirstSeenOrder) {
    auto matrix = TrainingMatrixBuilder::build(dataset);

    EXPECT_EQ(matrix.targets, (std::vector<double>{0.0, 1.0, 0.0}));
    ASSERT_EQ(matrix.classLabels.size(), 2u);
    EXPECT_EQ(std::get<std::string>(matrix.classLabels[0]), "dog");
    EXPECT_EQ(std::get<std::string>(matrix.classLabels[1]), "cat");
}

TEST_F(TrainingMatrixTest, NonNumericFeatureCellsBecomeZero) {
    auto matrix = TrainingMatrixBuilder::build(dataset);

    ASSERT_EQ(matrix.features.size(), 3u);
    EXPECT_EQ(matrix.features[0], (std::vector<double>{1.0, 0.0}));
    EXPECT_EQ(matrix.features[1], (std::vector<double>{3.0, 5.0}));
    EXPECT_EQ(matrix.features[2], (std::vector<double>{5.0, 0.0}));
}

TEST_F(TrainingMatrixTest, FeatureStatsAndNormalization) {
    auto matrix = TrainingMatrixBuilder::build(dataset);

    EXPECT_DOUBLE_EQ(matrix.featureStats.mean[0], 3.0);
    EXPECT_NEAR(matrix.featureStats.stddev[0], std::sqrt(8.0 / 3.0), 1e-12);

    auto z = TrainingMatrixBuilder::normalizeFeatures(matrix.features, matrix.featureStats);
    EXPECT_NEAR(z[0][0] + z[1][0] + z[2][0], 0.0, 1e-12);
    EXPECT_DOUBLE_EQ(z[1][0], 0.0);
}

TEST_F(TrainingMatrixTest, ConstantColumnNormalizesToZero) {
    FeatureStats stats{{2.0}, {0.0}};
    auto z = TrainingMatrixBuilder::normalizeFeatures({{2.0}, {2.0}}, stats);

    EXPECT_DOUBLE_EQ(z[0][0], 0.0);
    EXPECT_DOUBLE_EQ(z[1][0], 0.0);
}

TEST_F(TrainingMatrixTest, RegressionTargetsStayNumeric) {
    dataset.targetType = TargetType::REGRESSION;
    dataset.numClasses.reset();
    dataset.rows[0][2] = CellValue{1.5};
    dataset.rows[1][2] = CellValue{std::string("2.5")};
    dataset.rows[2][2] = CellValue{std::string("")};

    auto matrix = TrainingMatrixBuilder::build(dataset);

    EXPECT_EQ(matrix.targets, (std::vector<double>{1.5, 2.5, 0.0}));
    EXPECT_TRUE(matrix.classLabels.empty());
}

TEST_F(TrainingMatrixTest, MissingColumnThrows) {
    dataset.features.push_back("ghost");
    EXPECT_THROW(TrainingMatrixBuilder::build(dataset), Curate::DatasetException);
}

TEST(TrainingMatrixOneHotTest, EncodesLabels) {
    auto encoded = TrainingMatrixBuilder::oneHotEncode({0.0, 2.0}, 3);

    EXPECT_EQ(encoded[0], (std::vector<double>{1.0, 0.0, 0.0}));
    EXPECT_EQ(encoded[1], (std::vector<double>{0.0, 0.0, 1.0}));
}

TEST(TrainingMatrixOneHotTest, RejectsOutOfRangeLabels) {
    EXPECT_THROW(TrainingMatrixBuilder::oneHotEncode({3.0}, 3), Curate::DatasetException);
    EXPECT_THROW(TrainingMatrixBuilder::oneHotEncode({-1.0}, 3), Curate::DatasetException);
    EXPECT_THROW(TrainingMatrixBuilder::oneHotEncode({0.5}, 3), Curate::DatasetException);
}
