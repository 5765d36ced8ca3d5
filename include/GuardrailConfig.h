#pragma once
#include "ColumnType.h"

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

struct ThresholdConfig {
    // Categorical when distinct <= fraction * non-null count and distinct <= cap.
    double categoricalMaxDistinctFraction = 0.20;
    size_t categoricalMaxDistinct = 50;
    size_t topN = 10;
    size_t sampleValueCount = 5;
    size_t sampleRowCount = 20;

    // |null rate delta| cut-offs; at or below nullRateMinimum nothing is reported.
    double nullRateCritical = 0.20;
    double nullRateWarning = 0.05;
    double nullRateMinimum = 0.01;

    // Mean shift in units of baseline standard deviation.
    double meanShiftCritical = 3.0;
    double meanShiftWarning = 1.0;
    double stdEpsilon = 1e-9;

    size_t psiBins = 10;
    double psiCritical = 0.25;
    double psiWarning = 0.10;
    double psiSmoothing = 1e-4;

    // Baseline share a category needs before its disappearance is reported.
    double missingCategoryMinShare = 0.05;

    double penaltyCritical = 15.0;
    double penaltyWarning = 5.0;
    double penaltyInfo = 1.0;

    double outlierIqrMultiplier = 1.5;

    // Recommendation triggers.
    double missingWarningRate = 0.05;
    double missingCriticalRate = 0.20;
    double invalidCriticalRate = 0.10;

    void validate() const;
};

struct ServiceConfig {
    std::string host = "0.0.0.0";
    int port = 8000;
    size_t threads = 8;
    std::vector<std::string> corsOrigins = {
        "http://localhost:3000",
        "http://127.0.0.1:3000",
        "http://localhost:5173",
        "http://localhost:8080"
    };
};

struct GuardrailConfig {
    std::string datasetPath;
    std::string baselinePath;
    std::string outputPath;
    char delimiter = ',';
    bool verbose = false;
    bool pretty = true;
    // 0 => one worker per available core.
    size_t threads = 0;

    // Keyed by exact column name.
    std::unordered_map<std::string, ColumnType> columnTypeOverrides;

    ThresholdConfig thresholds;
    ServiceConfig service;

    /**
     * @brief Builds config from CLI args and optional config file override.
     * @pre argv[1] is the dataset path unless @p requireDataset is false.
     * @post Returns a validated config object.
     * @throws Guardrail::ConfigurationException on invalid arguments or values.
     */
    static GuardrailConfig fromArgs(int argc, char* argv[], bool requireDataset = true);

    /**
     * @brief Loads config values from a lightweight YAML/JSON-like key:value file.
     * @pre configPath points to a readable text file.
     * @post Returns merged config using `base` as defaults.
     * @throws Guardrail::ConfigurationException on parse/validation failures.
     */
    static GuardrailConfig fromFile(const std::string& configPath, const GuardrailConfig& base);

    /**
     * @brief Applies one normalized `key`/`value` pair (config file or --key value).
     * @throws Guardrail::ConfigurationException for unknown keys or bad values.
     */
    void assign(const std::string& key, const std::string& value);

    void validate() const;
};
