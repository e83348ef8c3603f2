#include "AppConfig.h"
#include "CommonUtils.h"
#include "CurateExceptions.h"
#include <algorithm>
#include <fstream>
#include <limits>
#include <optional>
#include <unordered_map>

namespace {
size_t parseSizeStrict(const std::string& value, const std::string& key) {
    const std::string v = CommonUtils::trim(value);
    if (!v.empty() && v.front() == '-') {
        throw Curate::ConfigurationException("Value for " + key + " must be >= 0");
    }

    unsigned long long parsed = 0;
    size_t pos = 0;
    try {
        parsed = std::stoull(v, &pos);
    } catch (const std::exception&) {
        pos = std::string::npos;
    }
    if (v.empty() || pos != v.size()) {
        throw Curate::ConfigurationException("Invalid unsigned integer for " + key + ": " + value);
    }
    if (parsed > static_cast<unsigned long long>(std::numeric_limits<size_t>::max())) {
        throw Curate::ConfigurationException("Value for " + key + " exceeds size range");
    }
    return static_cast<size_t>(parsed);
}

bool parseBoolStrict(const std::string& value, const std::string& key) {
    std::string v = CommonUtils::toLower(CommonUtils::trim(value));
    if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
    if (v == "0" || v == "false" || v == "no" || v == "off") return false;
    throw Curate::ConfigurationException("Invalid boolean for " + key + ": " + value);
}

std::string unquote(const std::string& text) {
    std::string value = CommonUtils::trim(text);
    if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

struct KeyValue {
    std::string key;
    std::string value;
};

// One "key: value" entry of a loose YAML or JSON-ish file. Braces and a trailing
// comma outside quotes are structure, not content; the first ':' outside quotes splits.
std::optional<KeyValue> splitKeyValue(const std::string& line) {
    std::string key;
    std::string rest;
    bool inQuotes = false;
    bool seenSeparator = false;
    for (char c : line) {
        if (c == '"') inQuotes = !inQuotes;
        if (!inQuotes && (c == '{' || c == '}')) continue;
        if (!inQuotes && !seenSeparator && c == ':') {
            seenSeparator = true;
            continue;
        }
        (seenSeparator ? rest : key).push_back(c);
    }
    if (!seenSeparator) return std::nullopt;

    rest = CommonUtils::trim(rest);
    if (!rest.empty() && rest.back() == ',') rest.pop_back();
    return KeyValue{unquote(key), unquote(rest)};
}

// Column names after "impute." keep their case; every other key is lowercased with '-' -> '_'.
std::string normalizeConfigKey(std::string key) {
    key = CommonUtils::trim(key);
    const std::string lowered = CommonUtils::toLower(key);
    if (lowered.rfind("impute.", 0) == 0) {
        return "impute." + key.substr(7);
    }

    std::string out = lowered;
    std::replace(out.begin(), out.end(), '-', '_');
    return out;
}
}

void AppConfig::assign(const std::string& key, const std::string& value) {
    if (key == "delimiter") {
        const std::string v = value == "\\t" ? "\t" : value;
        if (v.size() != 1) throw Curate::ConfigurationException("delimiter expects a single character");
        delimiter = v[0];
        return;
    }
    if (key == "dataset") {
        datasetPath = value;
        return;
    }
    if (key == "export") {
        exportPath = value;
        return;
    }
    if (key == "target") {
        if (value.empty()) ingestion.targetColumn.reset();
        else ingestion.targetColumn = value;
        return;
    }
    if (key == "features") {
        ingestion.featureColumns = CommonUtils::splitList(value);
        return;
    }
    if (key == "impute") {
        ingestion.globalStrategy = MissingStrategy::parse(value);
        return;
    }
    if (key.rfind("impute.", 0) == 0) {
        const std::string column = CommonUtils::trim(key.substr(7));
        if (column.empty()) {
            throw Curate::ConfigurationException("impute.<column> requires a non-empty column name");
        }
        ingestion.columnStrategies[column] = MissingStrategy::parse(value);
        return;
    }

    static const std::unordered_map<std::string, size_t IngestionConfig::*> ingestionSizeFields = {
        {"skip_rows", &IngestionConfig::skipRows},
        {"header_row", &IngestionConfig::headerRow},
        {"preview_limit", &IngestionConfig::previewLimit}
    };
    static const std::unordered_map<std::string, size_t DatasetLimits::*> limitFields = {
        {"max_rows", &DatasetLimits::maxRows},
        {"max_columns", &DatasetLimits::maxColumns},
        {"max_file_bytes", &DatasetLimits::maxFileBytes}
    };
    static const std::unordered_map<std::string, bool AppConfig::*> boolFields = {
        {"preview_only", &AppConfig::previewOnly},
        {"verbose", &AppConfig::verbose}
    };

    if (const auto it = ingestionSizeFields.find(key); it != ingestionSizeFields.end()) {
        ingestion.*(it->second) = parseSizeStrict(value, key);
        return;
    }
    if (const auto it = limitFields.find(key); it != limitFields.end()) {
        limits.*(it->second) = parseSizeStrict(value, key);
        return;
    }
    if (const auto it = boolFields.find(key); it != boolFields.end()) {
        this->*(it->second) = parseBoolStrict(value, key);
        return;
    }
    if (key == "target_drop_fallback") {
        ingestion.targetDropFallback = parseBoolStrict(value, key);
        return;
    }

    throw Curate::ConfigurationException("Unknown config key: " + key);
}

std::string AppConfig::usage() {
    return "Usage: curate <dataset.csv> [--config path] [--delimiter c] [--skip-rows N] [--header-row N] "
           "[--target col] [--features a,b,c] [--preview-limit N] "
           "[--impute leave-as-is|drop-row|zero|mean|median|mode] "
           "[--impute-column col=<strategy|constant:value>] [--max-rows N] [--max-columns N] "
           "[--max-file-bytes N] [--target-drop-fallback true|false] [--export out.csv] "
           "[--preview-only] [--verbose true|false]";
}

AppConfig AppConfig::fromArgs(int argc, char* argv[]) {
    if (argc < 2) {
        throw Curate::ConfigurationException(usage());
    }

    AppConfig config;
    for (int i = 2; i + 1 < argc; ++i) {
        if (std::string(argv[i]) == "--config") {
            config = fromFile(argv[i + 1], config);
            break;
        }
    }
    config.datasetPath = argv[1];

    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            ++i;
        } else if (arg == "--preview-only") {
            config.previewOnly = true;
        } else if (arg == "--impute-column" && i + 1 < argc) {
            const std::string assignment = argv[++i];
            const size_t eq = assignment.find('=');
            if (eq == std::string::npos) {
                throw Curate::ConfigurationException("--impute-column expects <column>=<strategy>");
            }
            config.assign("impute." + CommonUtils::trim(assignment.substr(0, eq)), assignment.substr(eq + 1));
        } else if (arg.rfind("--", 0) == 0 && arg.size() > 2 && i + 1 < argc) {
            config.assign(normalizeConfigKey(arg.substr(2)), argv[++i]);
        } else {
            throw Curate::ConfigurationException("Unrecognized argument: " + arg);
        }
    }

    config.validate();
    return config;
}

AppConfig AppConfig::fromFile(const std::string& configPath, const AppConfig& base) {
    std::ifstream in(configPath);
    if (!in) throw Curate::ConfigurationException("Could not open config file: " + configPath);

    AppConfig config = base;
    std::string line;
    size_t lineNo = 0;
    while (std::getline(in, line)) {
        ++lineNo;
        line = CommonUtils::trim(line);
        if (line.empty() || line[0] == '#') continue;

        const auto entry = splitKeyValue(line);
        if (!entry) continue;
        const std::string key = normalizeConfigKey(entry->key);
        const std::string& value = entry->value;

        try {
            config.assign(key, value);
        } catch (const Curate::CurateException& ex) {
            throw Curate::ConfigurationException(
                "Config parse error at line " + std::to_string(lineNo) +
                ": '" + line + "' -> " + ex.what());
        }
    }

    return config;
}

void AppConfig::validate() const {
    if (datasetPath.empty()) {
        throw Curate::ConfigurationException("dataset path is required");
    }
    if (ingestion.previewLimit == 0) {
        throw Curate::ConfigurationException("preview_limit must be >= 1");
    }
    if (delimiter == '"' || delimiter == '\n' || delimiter == '\r') {
        throw Curate::ConfigurationException("delimiter cannot be a quote or newline character");
    }
    ingestion.validate();
}
