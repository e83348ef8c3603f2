#include "DatasetFinalizer.h"
#include "CommonUtils.h"
#include <cmath>
#include <set>

namespace {
constexpr size_t kMaxDiscreteClasses = 10;
constexpr double kDiscreteRatio = 0.1;

bool isBinarySeries(const std::vector<double>& values) {
    bool seenZero = false;
    bool seenOne = false;
    for (double v : values) {
        if (std::abs(v) <= 1e-9) {
            seenZero = true;
        } else if (std::abs(v - 1.0) <= 1e-9) {
            seenOne = true;
        } else {
            return false;
        }
    }
    return seenZero && seenOne;
}
}

CellValue DatasetFinalizer::toTypedValue(const std::string& raw) {
    double dv = 0.0;
    if (CommonUtils::parseNumber(raw, dv)) return CellValue{dv};
    return CellValue{raw};
}

TargetType DatasetFinalizer::inferTargetType(const std::vector<CellValue>& targetValues) {
    std::vector<double> numeric;
    size_t present = 0;
    for (const auto& v : targetValues) {
        if (CellValues::isMissing(v)) continue;
        ++present;
        const auto* d = std::get_if<double>(&v);
        if (d == nullptr) return TargetType::CLASSIFICATION;
        numeric.push_back(*d);
    }
    if (present == 0) return TargetType::REGRESSION;
    if (isBinarySeries(numeric)) return TargetType::CLASSIFICATION;

    const std::set<double> distinct(numeric.begin(), numeric.end());
    const bool discrete = distinct.size() <= kMaxDiscreteClasses &&
                          static_cast<double>(distinct.size()) < static_cast<double>(present) * kDiscreteRatio;
    return discrete ? TargetType::CLASSIFICATION : TargetType::REGRESSION;
}

size_t DatasetFinalizer::countClasses(const std::vector<CellValue>& targetValues) {
    std::set<CellValue> distinct;
    for (const auto& v : targetValues) {
        if (!CellValues::isMissing(v)) distinct.insert(v);
    }
    return distinct.size();
}

Dataset DatasetFinalizer::finalize(const std::vector<std::string>& columns,
                                   ImputationResult imputed,
                                   const ResolvedPolicy& policy,
                                   const IngestionConfig& config) {
    Dataset ds;
    ds.columns = columns;
    ds.rows = std::move(imputed.rows);
    for (auto& row : ds.rows) {
        for (auto& cell : row) {
            if (const auto* s = std::get_if<std::string>(&cell)) {
                if (!s->empty()) cell = toTypedValue(*s);
            }
        }
    }

    ds.features = policy.features;
    ds.target = policy.target.value_or("");
    ds.numSamples = ds.rows.size();
    ds.numFeatures = ds.features.size();
    ds.skipRows = config.skipRows;
    ds.headerRow = config.headerRow;

    if (!ds.target.empty()) {
        const auto targetValues = ds.columnValues(ds.target);
        ds.targetType = inferTargetType(targetValues);
        if (ds.targetType == TargetType::CLASSIFICATION) ds.numClasses = countClasses(targetValues);
    }

    auto& summary = ds.imputationSummary;
    summary.originalRowCount = imputed.originalRowCount;
    summary.droppedRowCount = imputed.droppedRowCount;
    summary.dropApplied = policy.dropApplied();
    summary.dropColumns = policy.dropColumns;
    summary.globalDrop = policy.globalDrop;
    summary.targetDrop = policy.targetDrop;
    return ds;
}
