#include "ColumnProfiler.h"
#include "CommonUtils.h"
#include "StructuralResolver.h"
#include <algorithm>
#include <unordered_set>
#ifdef USE_OPENMP
#include <omp.h>
#endif

namespace ColumnProfiler {
bool isPlaceholderToken(std::string_view value) {
    static const std::unordered_set<std::string> kPlaceholders = {
        "na", "n/a", "null", "none", "nil", "nan", "?", "-", "missing", "unknown", "."
    };
    const std::string s = CommonUtils::toLower(CommonUtils::trim(value));
    return kPlaceholders.find(s) != kPlaceholders.end();
}

bool isMissingValue(std::string_view value) {
    return CommonUtils::trim(value).empty() || isPlaceholderToken(value);
}

CellFlag classifyCell(std::string_view value) {
    if (CommonUtils::trim(value).empty()) return CellFlag::MISSING;
    if (isPlaceholderToken(value)) return CellFlag::PLACEHOLDER;
    return CellFlag::VALID;
}

const char* toString(CellFlag flag) {
    switch (flag) {
        case CellFlag::MISSING: return "missing";
        case CellFlag::PLACEHOLDER: return "placeholder";
        case CellFlag::VALID: return "valid";
    }
    return "valid";
}

const char* toString(InferredType type) {
    switch (type) {
        case InferredType::NUMERIC: return "numeric";
        case InferredType::CATEGORICAL: return "categorical";
        case InferredType::MIXED: return "mixed";
        case InferredType::EMPTY: return "empty";
    }
    return "empty";
}

std::vector<std::vector<CellFlag>> classifyRows(const CSVUtils::RawRows& window, size_t columnCount) {
    std::vector<std::vector<CellFlag>> out;
    out.reserve(window.size());
    for (const auto& row : window) {
        std::vector<CellFlag> flags(columnCount, CellFlag::MISSING);
        for (size_t c = 0; c < columnCount; ++c) {
            flags[c] = classifyCell(StructuralResolver::cellAt(row, c));
        }
        out.push_back(std::move(flags));
    }
    return out;
}

std::vector<ColumnStats> profile(const CSVUtils::RawRows& window, size_t columnCount, size_t dataStartIndex) {
    std::vector<ColumnStats> out(columnCount);

    #ifdef USE_OPENMP
    #pragma omp parallel for schedule(dynamic)
    #endif
    for (size_t c = 0; c < columnCount; ++c) {
        ColumnStats stats;
        std::unordered_set<std::string> distinct;
        size_t nonMissing = 0;
        size_t valid = 0;
        size_t numericHits = 0;

        for (size_t r = dataStartIndex; r < window.size(); ++r) {
            const std::string& cell = StructuralResolver::cellAt(window[r], c);
            const CellFlag flag = classifyCell(cell);
            if (flag == CellFlag::MISSING) {
                ++stats.missing;
                continue;
            }

            ++nonMissing;
            distinct.insert(cell);
            if (flag == CellFlag::PLACEHOLDER) {
                ++stats.placeholders;
                const std::string token = CommonUtils::toLower(CommonUtils::trim(cell));
                auto& examples = stats.examplePlaceholders;
                if (examples.size() < kMaxExamplePlaceholders &&
                    std::find(examples.begin(), examples.end(), token) == examples.end()) {
                    examples.push_back(token);
                }
                continue;
            }

            ++valid;
            if (CommonUtils::isNumber(cell)) ++numericHits;
        }

        stats.unique = distinct.size();
        if (valid == 0) stats.inferredType = InferredType::EMPTY;
        else if (numericHits == valid) stats.inferredType = InferredType::NUMERIC;
        else if (numericHits == 0) stats.inferredType = InferredType::CATEGORICAL;
        else stats.inferredType = InferredType::MIXED;

        if (nonMissing > 0) {
            stats.numericFraction = static_cast<double>(numericHits) / static_cast<double>(nonMissing);
        }
        out[c] = std::move(stats);
    }
    return out;
}
}
