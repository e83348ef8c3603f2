#include "IngestionSession.h"
#include <algorithm>
#include <iostream>

IngestionSession::IngestionSession(IngestionPipeline pipeline, IngestionConfig initial)
    : pipeline_(std::move(pipeline)), initialConfig_(initial), config_(std::move(initial)) {}

void IngestionSession::loadRawText(std::string text) {
    rawText_ = std::move(text);
    if (verbose_) std::cout << "[Curate] Loaded " << rawText_.size() << " bytes of raw text\n";
    regenerate();
}

void IngestionSession::updateConfig(IngestionConfig next) {
    const bool structural = next.skipRows != config_.skipRows ||
                            next.headerRow != config_.headerRow ||
                            next.previewLimit != config_.previewLimit;
    config_ = std::move(next);
    config_.excludeTargetFromFeatures();
    if (structural) regenerate();
}

void IngestionSession::setTarget(const std::string& target) {
    config_.targetColumn = target;
    if (!config_.featureColumns) config_.featureColumns = std::vector<std::string>{};
    config_.excludeTargetFromFeatures();
}

void IngestionSession::toggleFeature(const std::string& feature) {
    auto& features = config_.featureColumns;
    if (!features) features = std::vector<std::string>{};
    const auto it = std::find(features->begin(), features->end(), feature);
    if (it != features->end()) {
        features->erase(it);
    } else if (!config_.targetColumn || feature != *config_.targetColumn) {
        features->push_back(feature);
    }
}

void IngestionSession::setGlobalStrategy(MissingStrategy strategy) {
    config_.globalStrategy = std::move(strategy);
}

void IngestionSession::setColumnStrategy(const std::string& column, MissingStrategy strategy) {
    config_.columnStrategies[column] = std::move(strategy);
}

void IngestionSession::setColumnConstant(const std::string& column, const std::string& value) {
    setColumnStrategy(column, MissingStrategy::constant(value));
}

FinalizeResult IngestionSession::finalize() {
    FinalizeResult result;
    if (rawText_.empty()) {
        result.error = "No raw text loaded";
        return result;
    }
    if (preview_ && preview_->hasLimitErrors()) {
        result.error = "Dataset exceeds configured limits: " + DatasetLimitsCheck::describe(preview_->limitErrors);
        if (verbose_) std::cout << "[Curate][Warning] " << result.error << "\n";
        return result;
    }

    result = pipeline_.finalize(rawText_, config_);
    if (result.ok()) {
        dataset_ = *result.dataset;
        if (verbose_) {
            const auto& summary = dataset_->imputationSummary;
            std::cout << "[Curate] Finalized " << dataset_->numSamples << " rows ("
                      << summary.droppedRowCount << " of " << summary.originalRowCount << " dropped)\n";
        }
    } else if (verbose_) {
        std::cout << "[Curate][Warning] Finalize failed: " << result.error << "\n";
    }
    return result;
}

void IngestionSession::reset() {
    rawText_.clear();
    config_ = initialConfig_;
    preview_.reset();
    error_.reset();
    dataset_.reset();
    initialized_ = false;
}

void IngestionSession::regenerate() {
    if (rawText_.empty()) {
        preview_.reset();
        return;
    }

    preview_ = pipeline_.generatePreview(rawText_, config_);
    if (!preview_->success) {
        error_ = preview_->error.empty() ? std::string("Preview generation failed") : preview_->error;
        if (verbose_) std::cout << "[Curate][Warning] " << *error_ << "\n";
        return;
    }
    error_.reset();
    if (verbose_ && preview_->hasLimitErrors()) {
        for (const auto& v : preview_->limitErrors) std::cout << "[Curate][Warning] " << v.message << "\n";
    }
    initializeColumns();
}

void IngestionSession::initializeColumns() {
    if (initialized_ || preview_->columns.empty()) return;

    const auto& columns = preview_->columns;
    if (!config_.targetColumn || config_.targetColumn->empty()) config_.targetColumn = columns.back();
    if (!config_.featureColumns || config_.featureColumns->empty()) {
        std::vector<std::string> features;
        for (const auto& c : columns) if (c != *config_.targetColumn) features.push_back(c);
        config_.featureColumns = std::move(features);
    }
    config_.excludeTargetFromFeatures();
    initialized_ = true;
}
