#pragma once
#include "CSVUtils.h"
#include "ColumnProfiler.h"
#include "Dataset.h"
#include "DatasetLimits.h"
#include "IngestionConfig.h"
#include <functional>
#include <optional>
#include <string>
#include <vector>

using RowSplitter = std::function<CSVUtils::RowSplitResult(const std::string&)>;

RowSplitter csvRowSplitter(char delimiter = ',');

struct PreviewResult {
    bool success = false;
    std::string error;

    size_t rawRowCount = 0;
    size_t headerAbsoluteIndex = 0;
    size_t dataStartIndex = 0;
    std::vector<std::string> columns;
    // First previewLimit raw rows (header and skipped rows included), padded to columns.size().
    CSVUtils::RawRows previewRows;
    std::vector<std::vector<CellFlag>> cellFlags;   // aligned with previewRows
    std::vector<ColumnStats> stats;                 // aligned with columns
    IngestionConfig config;
    std::vector<LimitViolation> limitErrors;

    bool hasLimitErrors() const noexcept { return !limitErrors.empty(); }
};

struct FinalizeResult {
    std::optional<Dataset> dataset;
    std::string error;

    bool ok() const noexcept { return dataset.has_value(); }
};

/**
 * @brief The two entry points over raw text: a cheap preview and the full finalize.
 * @details Both share cell classification and policy logic. Neither throws: failures
 *          come back inside the result with the original message.
 */
class IngestionPipeline {
public:
    explicit IngestionPipeline(RowSplitter splitter = csvRowSplitter(), DatasetLimits limits = DatasetLimits{});

    const DatasetLimits& limits() const noexcept { return limits_; }

    /**
     * @brief Structural preview over the first config.previewLimit raw rows.
     * @details The whole document is split so row counts and limit checks are exact.
     *          Limit violations are reported in limitErrors without failing the preview.
     */
    PreviewResult generatePreview(const std::string& text, const IngestionConfig& config) const;

    /**
     * @brief Materializes the full dataset.
     * @details Refused while any size limit is violated. Target defaults to the last
     *          column and features to every other column; the target never stays a feature.
     */
    FinalizeResult finalize(const std::string& text, const IngestionConfig& config) const;

private:
    RowSplitter splitter_;
    DatasetLimits limits_;

    Dataset buildDataset(const CSVUtils::RawRows& rows, size_t byteSize, IngestionConfig config) const;
};
