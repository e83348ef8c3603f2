#pragma once
#include "IngestionConfig.h"
#include <optional>
#include <string>
#include <vector>

/**
 * @brief One effective strategy per feature plus the row-drop switches,
 *        resolved once before any data pass.
 */
struct ResolvedPolicy {
    std::vector<std::string> features;
    std::vector<MissingStrategy> featureStrategies;   // aligned with features
    std::optional<std::string> target;
    std::optional<MissingStrategy> targetStrategy;    // explicit override or global, if any

    std::vector<std::string> dropColumns;             // features whose strategy is drop-row
    bool globalDrop = false;
    bool targetDrop = false;

    bool dropApplied() const noexcept { return globalDrop || !dropColumns.empty() || targetDrop; }
};

namespace PolicyResolver {
/**
 * @brief Override from columnStrategies, else the global strategy, else leave-as-is.
 */
MissingStrategy effectiveStrategy(const std::string& column, const IngestionConfig& config);

/**
 * @brief Merges global and per-column configuration for the chosen columns.
 * @details targetDrop is true under a global drop-row; otherwise it follows the target's
 *          explicit strategy; with no explicit target strategy it follows the feature
 *          drop columns when config.targetDropFallback is set.
 */
ResolvedPolicy resolve(const std::vector<std::string>& features,
                       const std::optional<std::string>& target,
                       const IngestionConfig& config);
}
