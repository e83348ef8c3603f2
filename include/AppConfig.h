#pragma once
#include "DatasetLimits.h"
#include "IngestionConfig.h"
#include <string>

struct AppConfig {
    std::string datasetPath;
    char delimiter = ',';
    std::string exportPath;       // empty => no CSV export
    bool previewOnly = false;
    bool verbose = false;

    IngestionConfig ingestion;
    DatasetLimits limits;

    /**
     * @brief Builds config from CLI args and optional config file.
     * @pre argc/argv contain at least dataset path in argv[1].
     * @post Returns a validated config object; CLI flags win over --config file values.
     * @throws Curate::ConfigurationException on invalid arguments or values.
     */
    static AppConfig fromArgs(int argc, char* argv[]);

    /**
     * @brief Loads config values from a lightweight YAML/JSON-like key:value file.
     * @details Per-column strategies use "impute.<column>: <strategy>".
     * @pre configPath points to a readable text file.
     * @post Returns merged config using `base` as defaults.
     * @throws Curate::ConfigurationException on parse/validation failures.
     */
    static AppConfig fromFile(const std::string& configPath, const AppConfig& base);

    /**
     * @brief Applies one normalized key (as used in config files) to this config.
     * @throws Curate::ConfigurationException on unknown keys or invalid values.
     */
    void assign(const std::string& key, const std::string& value);

    /**
     * @brief Validates merged configuration invariants.
     * @throws Curate::ConfigurationException on invalid values.
     */
    void validate() const;

    static std::string usage();
};
