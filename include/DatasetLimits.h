#pragma once
#include <cstddef>
#include <string>
#include <vector>

struct DatasetLimits {
    size_t maxFileBytes = 10 * 1024 * 1024;   // 10 MiB
    size_t maxColumns = 500;
    size_t maxRows = 500000;
};

struct LimitViolation {
    std::string limit;     // maxFileBytes | maxColumns | maxRows
    std::string message;
};

namespace DatasetLimitsCheck {
/**
 * @brief Compares raw table dimensions against configured maxima.
 * @details A zero maximum disables that check. Violations are reported in the
 *          order rows, columns, bytes.
 */
std::vector<LimitViolation> check(const DatasetLimits& limits, size_t rowCount, size_t columnCount, size_t byteSize);

// "; "-joined messages, for refusals.
std::string describe(const std::vector<LimitViolation>& violations);
}
