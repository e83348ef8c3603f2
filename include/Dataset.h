#pragma once
#include <optional>
#include <ostream>
#include <string>
#include <variant>
#include <vector>

// Final cell: a finite number, or text (the empty string marks a missing cell left as-is).
using CellValue = std::variant<std::string, double>;
using CellRow = std::vector<CellValue>;

namespace CellValues {
bool isMissing(const CellValue& v);
bool isNumeric(const CellValue& v);
// Numbers print in shortest round-trip form.
std::string toString(const CellValue& v);
}

enum class TargetType { CLASSIFICATION, REGRESSION };

const char* toString(TargetType type);

struct ImputationSummary {
    size_t originalRowCount = 0;
    size_t droppedRowCount = 0;
    bool dropApplied = false;
    std::vector<std::string> dropColumns;
    bool globalDrop = false;
    bool targetDrop = false;
};

/**
 * @brief Finalized, typed table handed to training code.
 * @details Built once per confirmed ingestion and not mutated afterwards; a new
 *          ingestion produces a new Dataset.
 */
struct Dataset {
    std::vector<std::string> columns;   // every resolved column, in header order
    std::vector<CellRow> rows;          // aligned with columns
    std::vector<std::string> features;
    std::string target;
    TargetType targetType = TargetType::REGRESSION;
    size_t numSamples = 0;
    size_t numFeatures = 0;
    std::optional<size_t> numClasses;   // set iff targetType == CLASSIFICATION
    size_t skipRows = 0;
    size_t headerRow = 0;
    ImputationSummary imputationSummary;

    /**
     * @brief Returns index of named column or -1 when absent.
     */
    int findColumnIndex(const std::string& name) const;

    /**
     * @brief Cell lookup by row and column name.
     * @throws Curate::DatasetException on an unknown column or row out of range.
     */
    const CellValue& at(size_t row, const std::string& column) const;

    /**
     * @brief Values of one column across all rows.
     * @throws Curate::DatasetException on an unknown column.
     */
    std::vector<CellValue> columnValues(const std::string& column) const;

    /**
     * @brief Writes header + rows as RFC-4180 CSV.
     */
    void writeCsv(std::ostream& out, char delimiter = ',') const;

    /**
     * @throws Curate::IOException when the file cannot be opened or written.
     */
    void writeCsv(const std::string& path, char delimiter = ',') const;
};
