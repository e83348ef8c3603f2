#pragma once
#include "CSVUtils.h"
#include <string>
#include <vector>

struct Column {
    std::string name;
    size_t index = 0;
};

struct ResolvedHeader {
    std::vector<Column> columns;
    size_t headerAbsoluteIndex = 0;
    size_t dataStartIndex = 0;

    std::vector<std::string> names() const;

    /**
     * @brief Returns index of named column or -1 when absent.
     */
    int findColumnIndex(const std::string& name) const;
};

namespace StructuralResolver {
// Cell at a column position; rows shorter than the header read as empty.
const std::string& cellAt(const CSVUtils::RawRow& row, size_t index);

/**
 * @brief Trims header cells and makes names unique.
 * @details Empty names become "col"; the k-th repeat of a base name becomes "base_k".
 */
std::vector<std::string> deduplicateNames(const std::vector<std::string>& header);

/**
 * @brief Locates the header row and the first data row.
 * @pre rows is the complete split document (or at least reaches the header row).
 * @post All column names are distinct; dataStartIndex == skipRows + headerRow + 1.
 * @throws Curate::StructuralException when rows is empty or an index is out of range.
 */
ResolvedHeader resolve(const CSVUtils::RawRows& rows, size_t skipRows, size_t headerRow);
}
