#include "IngestionConfig.h"
#include "CommonUtils.h"
#include "CurateExceptions.h"
#include <algorithm>

MissingStrategy MissingStrategy::parse(const std::string& text) {
    const std::string trimmed = CommonUtils::trim(text);
    const std::string lower = CommonUtils::toLower(trimmed);

    if (lower.rfind("constant:", 0) == 0) {
        return MissingStrategy::constant(CommonUtils::trim(trimmed.substr(9)));
    }

    static const std::unordered_map<std::string, Kind> kinds = {
        {"leave-as-is", Kind::LEAVE},
        {"drop-row", Kind::DROP_ROW},
        {"zero", Kind::ZERO},
        {"mean", Kind::MEAN},
        {"median", Kind::MEDIAN},
        {"mode", Kind::MODE}
    };
    const auto it = kinds.find(lower);
    if (it == kinds.end()) {
        throw Curate::ConfigurationException(
            "Unknown missing-value strategy '" + text +
            "' (allowed: leave-as-is, drop-row, zero, mean, median, mode, constant:<value>)");
    }
    return MissingStrategy::of(it->second);
}

std::string MissingStrategy::toString() const {
    switch (kind) {
        case Kind::LEAVE: return "leave-as-is";
        case Kind::DROP_ROW: return "drop-row";
        case Kind::ZERO: return "zero";
        case Kind::MEAN: return "mean";
        case Kind::MEDIAN: return "median";
        case Kind::MODE: return "mode";
        case Kind::CONSTANT: return "constant:" + constantValue;
    }
    return "leave-as-is";
}

void IngestionConfig::excludeTargetFromFeatures() {
    if (!targetColumn || !featureColumns) return;
    auto& features = *featureColumns;
    features.erase(std::remove(features.begin(), features.end(), *targetColumn), features.end());
}

void IngestionConfig::validate() const {
    if (globalStrategy && globalStrategy->kind == MissingStrategy::Kind::CONSTANT) {
        throw Curate::ConfigurationException("global strategy cannot be a constant override; set it per column");
    }
}
