#include "ImputationEngine.h"
#include "ColumnProfiler.h"
#include "CommonUtils.h"
#include "StructuralResolver.h"
#include <algorithm>
#include <cstdint>
#include <unordered_map>
#ifdef USE_OPENMP
#include <omp.h>
#endif

namespace {
using Kind = MissingStrategy::Kind;
using StrVec = std::vector<std::string>;
using MissingMask = std::vector<uint8_t>;

double meanOf(const std::vector<double>& values) {
    long double sum = 0.0L;
    for (double v : values) sum += v;
    const double mean = static_cast<double>(sum / static_cast<long double>(values.size()));
    // Rounding can push the mean of near-identical values just outside their range.
    const auto mm = std::minmax_element(values.begin(), values.end());
    return std::min(std::max(mean, *mm.first), *mm.second);
}

std::string modeOf(const StrVec& values) {
    std::unordered_map<std::string, size_t> freq;
    StrVec order;
    for (const auto& v : values) {
        if (freq[v]++ == 0) order.push_back(v);
    }

    std::string best = order.front();
    size_t bestCount = 0;
    for (const auto& v : order) {
        const size_t count = freq[v];
        if (count > bestCount) {
            bestCount = count;
            best = v;
        }
    }
    return best;
}

bool anyMissing(const CSVUtils::RawRow& row, const std::vector<size_t>& indices, const MissingMask& selected) {
    for (size_t i = 0; i < indices.size(); ++i) {
        if (!selected[i]) continue;
        if (row[indices[i]].empty()) return true;
    }
    return false;
}
}

std::optional<CellValue> ImputationEngine::computeReplacement(const StrVec& presentValues,
                                                              const MissingStrategy& strategy) {
    switch (strategy.kind) {
        case Kind::LEAVE:
        case Kind::DROP_ROW:
            return std::nullopt;
        case Kind::ZERO:
            return CellValue{0.0};
        case Kind::CONSTANT:
            return CellValue{strategy.constantValue};
        case Kind::MEAN:
        case Kind::MEDIAN:
        case Kind::MODE:
            break;
    }

    if (presentValues.empty()) return CellValue{0.0};
    if (strategy.kind == Kind::MODE) return CellValue{modeOf(presentValues)};

    std::vector<double> numeric;
    numeric.reserve(presentValues.size());
    for (const auto& v : presentValues) {
        double dv = 0.0;
        if (CommonUtils::parseNumber(v, dv)) numeric.push_back(dv);
    }
    if (numeric.empty()) return CellValue{0.0};

    if (strategy.kind == Kind::MEDIAN) return CellValue{CommonUtils::medianByNth(std::move(numeric))};
    return CellValue{meanOf(numeric)};
}

ImputationResult ImputationEngine::run(const CSVUtils::RawRows& dataRows,
                                       size_t columnCount,
                                       const std::vector<size_t>& featureIndices,
                                       std::optional<size_t> targetIndex,
                                       const ResolvedPolicy& policy) {
    ImputationResult result;
    result.originalRowCount = dataRows.size();

    // Normalization: pad to full width, then fold placeholders into the empty string.
    CSVUtils::RawRows rows;
    rows.reserve(dataRows.size());
    for (const auto& raw : dataRows) {
        CSVUtils::RawRow row(columnCount);
        for (size_t c = 0; c < columnCount; ++c) row[c] = StructuralResolver::cellAt(raw, c);
        for (size_t idx : featureIndices) {
            if (ColumnProfiler::isMissingValue(row[idx])) row[idx].clear();
        }
        if (targetIndex && ColumnProfiler::isMissingValue(row[*targetIndex])) row[*targetIndex].clear();
        rows.push_back(std::move(row));
    }

    // Replacements are computed over every normalized row, before any filtering.
    result.replacements.assign(featureIndices.size(), std::nullopt);
    #ifdef USE_OPENMP
    #pragma omp parallel for schedule(dynamic)
    #endif
    for (size_t pos = 0; pos < featureIndices.size(); ++pos) {
        const MissingStrategy& strategy = policy.featureStrategies[pos];
        if (!strategy.imputes()) continue;

        StrVec present;
        if (strategy.kind == Kind::MEAN || strategy.kind == Kind::MEDIAN || strategy.kind == Kind::MODE) {
            present.reserve(rows.size());
            for (const auto& row : rows) {
                const std::string& cell = row[featureIndices[pos]];
                if (!cell.empty()) present.push_back(cell);
            }
        }
        result.replacements[pos] = computeReplacement(present, strategy);
    }

    MissingMask dropSelected(featureIndices.size(), static_cast<uint8_t>(0));
    MissingMask allSelected(featureIndices.size(), static_cast<uint8_t>(1));
    for (size_t pos = 0; pos < featureIndices.size(); ++pos) {
        if (policy.featureStrategies[pos].dropsRow()) dropSelected[pos] = static_cast<uint8_t>(1);
    }
    const bool filtering = policy.dropApplied();

    result.rows.reserve(rows.size());
    for (auto& row : rows) {
        if (filtering) {
            if (policy.globalDrop && anyMissing(row, featureIndices, allSelected)) continue;
            if (anyMissing(row, featureIndices, dropSelected)) continue;
            if (policy.targetDrop && targetIndex && row[*targetIndex].empty()) continue;
        }

        CellRow out;
        out.reserve(columnCount);
        for (auto& cell : row) out.emplace_back(std::move(cell));
        for (size_t pos = 0; pos < featureIndices.size(); ++pos) {
            const auto& replacement = result.replacements[pos];
            if (!replacement) continue;
            auto& cell = out[featureIndices[pos]];
            if (CellValues::isMissing(cell)) cell = *replacement;
        }
        result.rows.push_back(std::move(out));
    }

    result.droppedRowCount = result.originalRowCount - result.rows.size();
    return result;
}
