#pragma once
#include "IngestionPipeline.h"
#include <optional>
#include <string>

/**
 * @brief Operator workflow around one raw upload: edit, preview, confirm.
 * @details Structural edits (skipRows, headerRow, previewLimit) regenerate the preview;
 *          target/feature/strategy edits only touch the config. Single writer, no locking.
 */
class IngestionSession {
public:
    explicit IngestionSession(IngestionPipeline pipeline = IngestionPipeline{}, IngestionConfig initial = IngestionConfig{});

    void setVerbose(bool verbose) noexcept { verbose_ = verbose; }

    void loadRawText(std::string text);

    /**
     * @brief Replaces the config; regenerates the preview when a structural field changed.
     */
    void updateConfig(IngestionConfig next);

    // Also removes the new target from the feature list.
    void setTarget(const std::string& target);
    // Adds or removes a feature; the current target is never added.
    void toggleFeature(const std::string& feature);
    void setGlobalStrategy(MissingStrategy strategy);
    void setColumnStrategy(const std::string& column, MissingStrategy strategy);
    void setColumnConstant(const std::string& column, const std::string& value);

    /**
     * @brief Builds the final dataset from the full raw text.
     * @details Refused when no text is loaded or the current preview reports limit
     *          violations. A success replaces the previous dataset wholesale.
     */
    FinalizeResult finalize();

    void reset();

    const std::string& rawText() const noexcept { return rawText_; }
    const IngestionConfig& config() const noexcept { return config_; }
    const std::optional<PreviewResult>& preview() const noexcept { return preview_; }
    const std::optional<std::string>& error() const noexcept { return error_; }
    const Dataset* dataset() const noexcept { return dataset_ ? &*dataset_ : nullptr; }

private:
    IngestionPipeline pipeline_;
    IngestionConfig initialConfig_;
    IngestionConfig config_;
    std::string rawText_;
    std::optional<PreviewResult> preview_;
    std::optional<std::string> error_;
    std::optional<Dataset> dataset_;
    bool initialized_ = false;
    bool verbose_ = false;

    void regenerate();
    void initializeColumns();
};
