#include "IngestionPipeline.h"
#include "CurateExceptions.h"
#include "DatasetFinalizer.h"
#include "ImputationEngine.h"
#include "PolicyResolver.h"
#include "StructuralResolver.h"
#include <algorithm>
#include <cstddef>

RowSplitter csvRowSplitter(char delimiter) {
    return [delimiter](const std::string& text) { return CSVUtils::splitRows(text, delimiter); };
}

IngestionPipeline::IngestionPipeline(RowSplitter splitter, DatasetLimits limits)
    : splitter_(std::move(splitter)), limits_(limits) {}

PreviewResult IngestionPipeline::generatePreview(const std::string& text, const IngestionConfig& config) const {
    PreviewResult preview;
    preview.config = config;

    try {
        const auto split = splitter_(text);
        if (!split.ok()) {
            preview.error = split.error;
            return preview;
        }
        const auto& rows = split.rows;
        const ResolvedHeader header = StructuralResolver::resolve(rows, config.skipRows, config.headerRow);
        const size_t width = header.columns.size();

        preview.rawRowCount = rows.size();
        preview.headerAbsoluteIndex = header.headerAbsoluteIndex;
        preview.dataStartIndex = header.dataStartIndex;
        preview.columns = header.names();
        preview.limitErrors = DatasetLimitsCheck::check(limits_, rows.size(), width, text.size());

        const size_t windowSize = std::min(config.previewLimit, rows.size());
        preview.previewRows.reserve(windowSize);
        for (size_t r = 0; r < windowSize; ++r) {
            CSVUtils::RawRow row(width);
            for (size_t c = 0; c < width; ++c) row[c] = StructuralResolver::cellAt(rows[r], c);
            preview.previewRows.push_back(std::move(row));
        }
        preview.cellFlags = ColumnProfiler::classifyRows(preview.previewRows, width);
        preview.stats = ColumnProfiler::profile(preview.previewRows, width, header.dataStartIndex);
        preview.success = true;
    } catch (const Curate::CurateException& ex) {
        preview = PreviewResult{};
        preview.config = config;
        preview.error = ex.what();
    } catch (const std::exception& ex) {
        preview = PreviewResult{};
        preview.config = config;
        preview.error = std::string("Unexpected error: ") + ex.what();
    }
    return preview;
}

FinalizeResult IngestionPipeline::finalize(const std::string& text, const IngestionConfig& config) const {
    FinalizeResult result;
    try {
        config.validate();
        const auto split = splitter_(text);
        if (!split.ok()) {
            result.error = split.error;
            return result;
        }
        result.dataset = buildDataset(split.rows, text.size(), config);
    } catch (const Curate::CurateException& ex) {
        result.dataset.reset();
        result.error = ex.what();
    } catch (const std::exception& ex) {
        result.dataset.reset();
        result.error = std::string("Unexpected error: ") + ex.what();
    }
    return result;
}

Dataset IngestionPipeline::buildDataset(const CSVUtils::RawRows& rows, size_t byteSize, IngestionConfig config) const {
    const ResolvedHeader header = StructuralResolver::resolve(rows, config.skipRows, config.headerRow);
    const auto columns = header.names();

    // Limits gate the expensive full pass.
    const auto violations = DatasetLimitsCheck::check(limits_, rows.size(), columns.size(), byteSize);
    if (!violations.empty()) {
        throw Curate::DatasetException("Dataset exceeds configured limits: " + DatasetLimitsCheck::describe(violations));
    }

    if (header.dataStartIndex >= rows.size()) {
        throw Curate::StructuralException("No data rows found after header");
    }
    if (columns.empty()) {
        throw Curate::StructuralException("Header row has no columns");
    }

    if (!config.targetColumn || config.targetColumn->empty()) config.targetColumn = columns.back();
    if (!config.featureColumns) {
        std::vector<std::string> features;
        for (const auto& c : columns) if (c != *config.targetColumn) features.push_back(c);
        config.featureColumns = std::move(features);
    }
    config.excludeTargetFromFeatures();

    auto indexOf = [&](const std::string& name, const char* role) {
        const int idx = header.findColumnIndex(name);
        if (idx < 0) throw Curate::ConfigurationException(std::string(role) + " column not found: " + name);
        return static_cast<size_t>(idx);
    };
    const size_t targetIndex = indexOf(*config.targetColumn, "Target");
    std::vector<size_t> featureIndices;
    featureIndices.reserve(config.featureColumns->size());
    for (const auto& f : *config.featureColumns) featureIndices.push_back(indexOf(f, "Feature"));

    const ResolvedPolicy policy = PolicyResolver::resolve(*config.featureColumns, config.targetColumn, config);

    const CSVUtils::RawRows dataRows(rows.begin() + static_cast<std::ptrdiff_t>(header.dataStartIndex), rows.end());
    ImputationResult imputed = ImputationEngine::run(dataRows, columns.size(), featureIndices, targetIndex, policy);
    return DatasetFinalizer::finalize(columns, std::move(imputed), policy, config);
}
