#pragma once
#include "Dataset.h"
#include "ImputationEngine.h"
#include "IngestionConfig.h"
#include "PolicyResolver.h"
#include <string>
#include <vector>

class DatasetFinalizer {
public:
    /**
     * @brief Typed form of a raw cell: finite numbers become double, anything else stays text.
     */
    static CellValue toTypedValue(const std::string& raw);

    /**
     * @brief Classification vs. regression over the non-missing target values.
     * @details No values -> regression. Any non-numeric value -> classification. A series
     *          holding both 0 and 1 and nothing else -> classification. Otherwise
     *          classification iff the distinct count is at most 10 and below a tenth
     *          of the sample count.
     */
    static TargetType inferTargetType(const std::vector<CellValue>& targetValues);

    // Distinct non-missing values.
    static size_t countClasses(const std::vector<CellValue>& targetValues);

    /**
     * @brief Types the imputed rows and packages them with provenance metadata.
     */
    static Dataset finalize(const std::vector<std::string>& columns,
                            ImputationResult imputed,
                            const ResolvedPolicy& policy,
                            const IngestionConfig& config);
};
