#pragma once
#include "CSVUtils.h"
#include "Dataset.h"
#include "PolicyResolver.h"
#include <optional>
#include <string>
#include <vector>

struct ImputationResult {
    std::vector<CellRow> rows;                          // full width; untouched cells keep their raw text
    std::vector<std::optional<CellValue>> replacements; // aligned with policy.features
    size_t originalRowCount = 0;
    size_t droppedRowCount = 0;
};

class ImputationEngine {
public:
    /**
     * @brief Normalizes, filters and imputes the complete set of data rows.
     * @details Order: placeholder normalization of feature and target cells, replacement
     *          computation over the whole normalized column, row filtering, then imputation
     *          of the surviving feature cells. The target is only ever filtered, never imputed.
     * @pre featureIndices is aligned with policy.features; targetIndex is set iff policy.target is.
     * @post droppedRowCount == originalRowCount - rows.size().
     */
    static ImputationResult run(const CSVUtils::RawRows& dataRows,
                                size_t columnCount,
                                const std::vector<size_t>& featureIndices,
                                std::optional<size_t> targetIndex,
                                const ResolvedPolicy& policy);

    /**
     * @brief Replacement value for one column.
     * @param presentValues normalized non-missing values in scan order.
     * @details zero -> 0; constant -> its literal; mean/median over the values that coerce
     *          to numbers (0 when none do); mode by raw text, first-seen wins a tie.
     *          Mean/median/mode of an all-missing column is 0. Leave/drop return std::nullopt.
     */
    static std::optional<CellValue> computeReplacement(const std::vector<std::string>& presentValues,
                                                       const MissingStrategy& strategy);
};
