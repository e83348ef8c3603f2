#include "DatasetLimits.h"

namespace DatasetLimitsCheck {
std::vector<LimitViolation> check(const DatasetLimits& limits, size_t rowCount, size_t columnCount, size_t byteSize) {
    std::vector<LimitViolation> out;
    if (limits.maxRows > 0 && rowCount > limits.maxRows) {
        out.push_back({"maxRows",
                       "Row count " + std::to_string(rowCount) + " exceeds maximum " + std::to_string(limits.maxRows)});
    }
    if (limits.maxColumns > 0 && columnCount > limits.maxColumns) {
        out.push_back({"maxColumns",
                       "Column count " + std::to_string(columnCount) + " exceeds maximum " + std::to_string(limits.maxColumns)});
    }
    if (limits.maxFileBytes > 0 && byteSize > limits.maxFileBytes) {
        out.push_back({"maxFileBytes",
                       "File size " + std::to_string(byteSize) + " bytes exceeds maximum " +
                           std::to_string(limits.maxFileBytes) + " bytes"});
    }
    return out;
}

std::string describe(const std::vector<LimitViolation>& violations) {
    std::string out;
    for (const auto& v : violations) {
        if (!out.empty()) out += "; ";
        out += v.message;
    }
    return out;
}
}
