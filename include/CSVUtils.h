#pragma once

#include <istream>
#include <string>
#include <vector>

namespace CSVUtils {
// Low-level CSV tokenization (the row splitter collaborator of the pipeline).
// Cells are returned verbatim; this module does not classify or type values.
struct ParseLimits {
	size_t maxFieldBytes = 8 * 1024 * 1024;           // 8 MiB
	size_t maxRecordBytes = 64 * 1024 * 1024;         // 64 MiB
	size_t maxColumns = 20000;
	size_t maxPhysicalLinesPerRecord = 10000;
};

using RawRow = std::vector<std::string>;
using RawRows = std::vector<RawRow>;

struct RowSplitResult {
	RawRows rows;
	std::string error;   // empty on success

	bool ok() const noexcept { return error.empty(); }
};

void skipBOM(std::istream& is);
RawRow parseCSVLine(std::istream& is,
					char delimiter,
					bool* malformed = nullptr,
					size_t* consumedLines = nullptr,
					bool* limitExceeded = nullptr,
					const ParseLimits& limits = ParseLimits{});

/**
 * @brief Splits a whole document into rows of cells.
 * @details Blank lines are skipped. Row order is preserved and no row is merged or dropped
 *          because of embedded delimiters, quotes or newlines inside quoted fields.
 * @post On an unterminated quote or an exceeded parse limit, error names the 1-based
 *       physical line and rows is empty.
 */
RowSplitResult splitRows(const std::string& text, char delimiter = ',', const ParseLimits& limits = ParseLimits{});
}
