#include "PolicyResolver.h"

namespace PolicyResolver {
MissingStrategy effectiveStrategy(const std::string& column, const IngestionConfig& config) {
    const auto it = config.columnStrategies.find(column);
    if (it != config.columnStrategies.end()) return it->second;
    if (config.globalStrategy) return *config.globalStrategy;
    return MissingStrategy::of(MissingStrategy::Kind::LEAVE);
}

ResolvedPolicy resolve(const std::vector<std::string>& features,
                       const std::optional<std::string>& target,
                       const IngestionConfig& config) {
    ResolvedPolicy policy;
    policy.features = features;
    policy.target = target;
    policy.featureStrategies.reserve(features.size());

    for (const auto& col : features) {
        MissingStrategy strategy = effectiveStrategy(col, config);
        if (strategy.dropsRow()) policy.dropColumns.push_back(col);
        policy.featureStrategies.push_back(std::move(strategy));
    }

    policy.globalDrop = config.globalStrategy && config.globalStrategy->dropsRow();

    if (target) {
        const auto it = config.columnStrategies.find(*target);
        if (it != config.columnStrategies.end()) policy.targetStrategy = it->second;
        else if (config.globalStrategy) policy.targetStrategy = *config.globalStrategy;

        if (policy.globalDrop) {
            policy.targetDrop = true;
        } else if (policy.targetStrategy) {
            policy.targetDrop = policy.targetStrategy->dropsRow();
        } else {
            policy.targetDrop = config.targetDropFallback && !policy.dropColumns.empty();
        }
    }
    return policy;
}
}
