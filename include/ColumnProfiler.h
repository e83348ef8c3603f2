#pragma once
#include "CSVUtils.h"
#include <optional>
#include <string>
#include <string_view>
#include <vector>

enum class CellFlag { MISSING, PLACEHOLDER, VALID };
enum class InferredType { NUMERIC, CATEGORICAL, MIXED, EMPTY };

struct ColumnStats {
    size_t missing = 0;
    size_t placeholders = 0;                       // tracked apart from missing
    std::vector<std::string> examplePlaceholders;  // at most 5, lowercase, first-seen order
    InferredType inferredType = InferredType::EMPTY;
    size_t unique = 0;
    // Numeric valid cells over all non-missing cells (placeholders count in the base only).
    std::optional<double> numericFraction;
};

namespace ColumnProfiler {
constexpr size_t kMaxExamplePlaceholders = 5;

// na, n/a, null, none, nil, nan, ?, -, missing, unknown, "." (trimmed, case-insensitive)
bool isPlaceholderToken(std::string_view value);

// Empty after trimming, or a placeholder token. Shared by preview and finalize.
bool isMissingValue(std::string_view value);

CellFlag classifyCell(std::string_view value);

const char* toString(CellFlag flag);
const char* toString(InferredType type);

/**
 * @brief Per-cell flags for each row of a window, padded to columnCount.
 */
std::vector<std::vector<CellFlag>> classifyRows(const CSVUtils::RawRows& window, size_t columnCount);

/**
 * @brief Aggregates per-column statistics over the data rows of a window.
 * @details Rows with an index below dataStartIndex (skipped rows, the header) are ignored.
 * @post result.size() == columnCount.
 */
std::vector<ColumnStats> profile(const CSVUtils::RawRows& window, size_t columnCount, size_t dataStartIndex);
}
