#pragma once
#include "Dataset.h"
#include <string>
#include <vector>

struct FeatureStats {
    std::vector<double> mean;
    std::vector<double> stddev;   // population standard deviation
};

struct TrainingMatrix {
    std::vector<std::vector<double>> features;   // numSamples x numFeatures
    std::vector<double> targets;                 // class index (classification) or value (regression)
    std::vector<CellValue> classLabels;          // first-seen distinct targets; classification only
    FeatureStats featureStats;
};

namespace TrainingMatrixBuilder {
/**
 * @brief Numeric view of a finalized dataset for model training.
 * @details Text cells that do not parse as numbers become 0. Classification targets map to
 *          the index of their label in first-seen order; a missing target maps to 0.
 * @throws Curate::DatasetException when a feature or the target is not a dataset column.
 */
TrainingMatrix build(const Dataset& dataset);

// z-score per column; a zero standard deviation yields 0.
std::vector<std::vector<double>> normalizeFeatures(const std::vector<std::vector<double>>& features,
                                                   const FeatureStats& stats);

/**
 * @throws Curate::DatasetException when a label is not an integer in [0, numClasses).
 */
std::vector<std::vector<double>> oneHotEncode(const std::vector<double>& targets, size_t numClasses);
}
