#include "TrainingMatrix.h"
#include "CommonUtils.h"
#include "CurateExceptions.h"
#include <cmath>
#include <map>

namespace {
double numericOrZero(const CellValue& v) {
    if (const auto* d = std::get_if<double>(&v)) return *d;
    double parsed = 0.0;
    return CommonUtils::parseNumber(std::get<std::string>(v), parsed) ? parsed : 0.0;
}

size_t requireColumn(const Dataset& dataset, const std::string& name) {
    const int idx = dataset.findColumnIndex(name);
    if (idx < 0) throw Curate::DatasetException("Column not found in dataset: " + name);
    return static_cast<size_t>(idx);
}
}

namespace TrainingMatrixBuilder {
TrainingMatrix build(const Dataset& dataset) {
    TrainingMatrix out;
    std::vector<size_t> featureIdx;
    featureIdx.reserve(dataset.features.size());
    for (const auto& f : dataset.features) featureIdx.push_back(requireColumn(dataset, f));
    const size_t targetIdx = requireColumn(dataset, dataset.target);

    out.features.reserve(dataset.rows.size());
    for (const auto& row : dataset.rows) {
        std::vector<double> x(featureIdx.size(), 0.0);
        for (size_t i = 0; i < featureIdx.size(); ++i) x[i] = numericOrZero(row[featureIdx[i]]);
        out.features.push_back(std::move(x));
    }

    if (dataset.targetType == TargetType::CLASSIFICATION) {
        std::map<CellValue, size_t> labelIndex;
        for (const auto& row : dataset.rows) {
            const CellValue& v = row[targetIdx];
            if (CellValues::isMissing(v) || labelIndex.count(v)) continue;
            labelIndex.emplace(v, out.classLabels.size());
            out.classLabels.push_back(v);
        }
        out.targets.reserve(dataset.rows.size());
        for (const auto& row : dataset.rows) {
            const auto it = labelIndex.find(row[targetIdx]);
            out.targets.push_back(it == labelIndex.end() ? 0.0 : static_cast<double>(it->second));
        }
    } else {
        out.targets.reserve(dataset.rows.size());
        for (const auto& row : dataset.rows) out.targets.push_back(numericOrZero(row[targetIdx]));
    }

    const size_t n = out.features.size();
    out.featureStats.mean.assign(featureIdx.size(), 0.0);
    out.featureStats.stddev.assign(featureIdx.size(), 0.0);
    if (n == 0) return out;
    for (size_t j = 0; j < featureIdx.size(); ++j) {
        double sum = 0.0;
        for (const auto& x : out.features) sum += x[j];
        const double mean = sum / static_cast<double>(n);
        double var = 0.0;
        for (const auto& x : out.features) {
            const double d = x[j] - mean;
            var += d * d;
        }
        out.featureStats.mean[j] = mean;
        out.featureStats.stddev[j] = std::sqrt(var / static_cast<double>(n));
    }
    return out;
}

std::vector<std::vector<double>> normalizeFeatures(const std::vector<std::vector<double>>& features,
                                                   const FeatureStats& stats) {
    std::vector<std::vector<double>> out;
    out.reserve(features.size());
    for (const auto& row : features) {
        std::vector<double> z(row.size(), 0.0);
        for (size_t j = 0; j < row.size() && j < stats.mean.size(); ++j) {
            const double sd = stats.stddev[j];
            z[j] = sd == 0.0 ? 0.0 : (row[j] - stats.mean[j]) / sd;
        }
        out.push_back(std::move(z));
    }
    return out;
}

std::vector<std::vector<double>> oneHotEncode(const std::vector<double>& targets, size_t numClasses) {
    std::vector<std::vector<double>> out;
    out.reserve(targets.size());
    for (double t : targets) {
        if (t < 0.0 || std::floor(t) != t || t >= static_cast<double>(numClasses)) {
            throw Curate::DatasetException("Class label " + CommonUtils::formatNumber(t) +
                                           " is outside [0, " + std::to_string(numClasses) + ")");
        }
        std::vector<double> encoded(numClasses, 0.0);
        encoded[static_cast<size_t>(t)] = 1.0;
        out.push_back(std::move(encoded));
    }
    return out;
}
}
