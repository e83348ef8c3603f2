#pragma once
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

/**
 * @brief Missing-value policy for one column.
 * @details Tagged value: every kind except CONSTANT ignores constantValue.
 */
struct MissingStrategy {
    enum class Kind { LEAVE, DROP_ROW, ZERO, MEAN, MEDIAN, MODE, CONSTANT };

    Kind kind = Kind::LEAVE;
    std::string constantValue;

    static MissingStrategy of(Kind kind) { return MissingStrategy{kind, {}}; }
    static MissingStrategy constant(std::string value) { return MissingStrategy{Kind::CONSTANT, std::move(value)}; }

    /**
     * @brief Parses "leave-as-is", "drop-row", "zero", "mean", "median", "mode" or "constant:<value>".
     * @throws Curate::ConfigurationException on an unknown keyword.
     */
    static MissingStrategy parse(const std::string& text);

    std::string toString() const;

    // True for strategies that produce a replacement value.
    bool imputes() const noexcept { return kind != Kind::LEAVE && kind != Kind::DROP_ROW; }
    bool dropsRow() const noexcept { return kind == Kind::DROP_ROW; }

    bool operator==(const MissingStrategy& other) const {
        return kind == other.kind && (kind != Kind::CONSTANT || constantValue == other.constantValue);
    }
    bool operator!=(const MissingStrategy& other) const { return !(*this == other); }
};

struct IngestionConfig {
    size_t skipRows = 0;
    size_t headerRow = 0;                  // relative to the rows left after skipRows
    std::optional<std::string> targetColumn;
    std::optional<std::vector<std::string>> featureColumns;
    size_t previewLimit = 50;              // display window only, never bounds the final dataset

    std::optional<MissingStrategy> globalStrategy;
    std::unordered_map<std::string, MissingStrategy> columnStrategies;

    // Without an explicit target rule, a feature drop-row also drops rows with a missing target.
    bool targetDropFallback = true;

    /**
     * @brief Removes the target from featureColumns when both name the same column.
     */
    void excludeTargetFromFeatures();

    /**
     * @throws Curate::ConfigurationException when globalStrategy is a constant override.
     */
    void validate() const;
};
