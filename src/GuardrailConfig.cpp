#include "GuardrailConfig.h"
#include "CommonUtils.h"
#include "GuardrailExceptions.h"
#include <algorithm>
#include <cmath>
#include <fstream>
#include <limits>
#include <utility>

namespace {
std::vector<std::string> splitList(const std::string& s) {
    std::vector<std::string> out;
    std::string cur;
    for (char c : s) {
        if (c == ',') {
            std::string t = CommonUtils::trim(cur);
            if (!t.empty()) out.push_back(t);
            cur.clear();
        } else {
            cur.push_back(c);
        }
    }
    std::string t = CommonUtils::trim(cur);
    if (!t.empty()) out.push_back(t);
    return out;
}

template <typename T, typename Parser>
T parseNumericStrict(const std::string& value,
                     const std::string& key,
                     const std::string& errorPrefix,
                     Parser parser) {
    try {
        size_t pos = 0;
        T parsed = parser(value, &pos);
        if (pos != value.size()) {
            throw Guardrail::ConfigurationException(errorPrefix + key + ": " + value);
        }
        return parsed;
    } catch (const Guardrail::GuardrailException&) {
        throw;
    } catch (const std::exception& ex) {
        throw Guardrail::ConfigurationException(errorPrefix + key + ": " + value + " (" + ex.what() + ")");
    }
}

std::string stripStructuralTokensOutsideQuotes(const std::string& line) {
    std::string out;
    out.reserve(line.size());

    bool inQuotes = false;
    for (char c : line) {
        if (c == '"') {
            inQuotes = !inQuotes;
        } else if (!inQuotes && (c == '{' || c == '}')) {
            continue;
        }
        out.push_back(c);
    }

    const size_t lastNonSpace = out.find_last_not_of(" \t\r\n");
    if (lastNonSpace != std::string::npos && out[lastNonSpace] == ',') {
        out.erase(lastNonSpace, 1);
    }
    return out;
}

size_t findSeparatorOutsideQuotes(const std::string& line, char sep) {
    bool inQuotes = false;
    for (size_t i = 0; i < line.size(); ++i) {
        if (line[i] == '"') {
            inQuotes = !inQuotes;
        } else if (!inQuotes && line[i] == sep) {
            return i;
        }
    }
    return std::string::npos;
}

std::string maybeUnquote(std::string value) {
    value = CommonUtils::trim(value);
    if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

// Column names after "type." keep their case; everything else is lower snake case.
std::string normalizeConfigKey(std::string key) {
    key = CommonUtils::trim(key);
    if (CommonUtils::toLower(key).rfind("type.", 0) == 0) {
        return "type." + key.substr(5);
    }
    std::string out = CommonUtils::toLower(key);
    std::replace(out.begin(), out.end(), '-', '_');
    return out;
}

size_t parseSizeStrict(const std::string& value, const std::string& key, size_t minValue) {
    const unsigned long long parsed = parseNumericStrict<unsigned long long>(
        value,
        key,
        "Invalid unsigned integer for ",
        [](const std::string& v, size_t* pos) { return std::stoull(v, pos); });
    if (!value.empty() && value.front() == '-') {
        throw Guardrail::ConfigurationException("Value for " + key + " must be >= " + std::to_string(minValue));
    }
    if (parsed < minValue) {
        throw Guardrail::ConfigurationException("Value for " + key + " must be >= " + std::to_string(minValue));
    }
    return static_cast<size_t>(parsed);
}

int parseIntStrict(const std::string& value, const std::string& key, int minValue, int maxValue) {
    const int parsed = parseNumericStrict<int>(
        value,
        key,
        "Invalid integer for ",
        [](const std::string& v, size_t* pos) { return std::stoi(v, pos); });
    if (parsed < minValue || parsed > maxValue) {
        throw Guardrail::ConfigurationException("Value for " + key + " must be within [" +
                                                std::to_string(minValue) + "," + std::to_string(maxValue) + "]");
    }
    return parsed;
}

double parseDoubleStrict(const std::string& value, const std::string& key, double minValue) {
    const double parsed = parseNumericStrict<double>(
        value,
        key,
        "Invalid number for ",
        [](const std::string& v, size_t* pos) { return std::stod(v, pos); });
    if (!std::isfinite(parsed)) {
        throw Guardrail::ConfigurationException("Value for " + key + " must be a finite number");
    }
    if (parsed < minValue) {
        throw Guardrail::ConfigurationException("Value for " + key + " must be >= " + std::to_string(minValue));
    }
    return parsed;
}

bool parseBoolStrict(const std::string& value, const std::string& key) {
    const std::string v = CommonUtils::toLower(CommonUtils::trim(value));
    if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
    if (v == "0" || v == "false" || v == "no" || v == "off") return false;
    throw Guardrail::ConfigurationException("Invalid boolean for " + key + ": " + value);
}

char parseDelimiter(const std::string& value, const std::string& key) {
    if (value == "\\t" || CommonUtils::toLower(value) == "tab") return '\t';
    if (value.size() != 1) throw Guardrail::ConfigurationException(key + " expects a single character");
    return value[0];
}
} // namespace

void GuardrailConfig::assign(const std::string& key, const std::string& value) {
    struct DoubleRule {
        double ThresholdConfig::*member;
        double minValue;
    };
    struct SizeRule {
        size_t ThresholdConfig::*member;
        size_t minValue;
    };

    static const std::unordered_map<std::string, std::string GuardrailConfig::*> stringFields = {
        {"dataset", &GuardrailConfig::datasetPath},
        {"baseline", &GuardrailConfig::baselinePath},
        {"output", &GuardrailConfig::outputPath}
    };
    static const std::unordered_map<std::string, bool GuardrailConfig::*> boolFields = {
        {"verbose", &GuardrailConfig::verbose},
        {"pretty", &GuardrailConfig::pretty}
    };
    static const std::unordered_map<std::string, DoubleRule> thresholdDoubleFields = {
        {"categorical_max_distinct_fraction", {&ThresholdConfig::categoricalMaxDistinctFraction, 0.0}},
        {"null_rate_critical", {&ThresholdConfig::nullRateCritical, 0.0}},
        {"null_rate_warning", {&ThresholdConfig::nullRateWarning, 0.0}},
        {"null_rate_min", {&ThresholdConfig::nullRateMinimum, 0.0}},
        {"mean_shift_critical", {&ThresholdConfig::meanShiftCritical, 0.0}},
        {"mean_shift_warning", {&ThresholdConfig::meanShiftWarning, 0.0}},
        {"std_epsilon", {&ThresholdConfig::stdEpsilon, 0.0}},
        {"psi_critical", {&ThresholdConfig::psiCritical, 0.0}},
        {"psi_warning", {&ThresholdConfig::psiWarning, 0.0}},
        {"psi_smoothing", {&ThresholdConfig::psiSmoothing, 0.0}},
        {"missing_category_min_share", {&ThresholdConfig::missingCategoryMinShare, 0.0}},
        {"penalty_critical", {&ThresholdConfig::penaltyCritical, 0.0}},
        {"penalty_warning", {&ThresholdConfig::penaltyWarning, 0.0}},
        {"penalty_info", {&ThresholdConfig::penaltyInfo, 0.0}},
        {"outlier_iqr_multiplier", {&ThresholdConfig::outlierIqrMultiplier, 0.0}},
        {"missing_warning_rate", {&ThresholdConfig::missingWarningRate, 0.0}},
        {"missing_critical_rate", {&ThresholdConfig::missingCriticalRate, 0.0}},
        {"invalid_critical_rate", {&ThresholdConfig::invalidCriticalRate, 0.0}}
    };
    static const std::unordered_map<std::string, SizeRule> thresholdSizeFields = {
        {"categorical_max_distinct", {&ThresholdConfig::categoricalMaxDistinct, 1}},
        {"top_n", {&ThresholdConfig::topN, 1}},
        {"sample_value_count", {&ThresholdConfig::sampleValueCount, 0}},
        {"sample_row_count", {&ThresholdConfig::sampleRowCount, 0}},
        {"psi_bins", {&ThresholdConfig::psiBins, 2}}
    };

    if (key.rfind("type.", 0) == 0) {
        const std::string columnName = key.substr(5);
        if (CommonUtils::trim(columnName).empty()) {
            throw Guardrail::ConfigurationException("type.<column> requires a non-empty column name");
        }
        const auto type = columnTypeFromName(CommonUtils::toLower(CommonUtils::trim(value)));
        if (!type) {
            throw Guardrail::ConfigurationException("invalid column type override '" + value +
                                                    "' (allowed: numeric, boolean, categorical, datetime, text)");
        }
        columnTypeOverrides[columnName] = *type;
        return;
    }
    if (key == "delimiter") {
        delimiter = parseDelimiter(value, key);
        return;
    }
    if (key == "threads") {
        threads = parseSizeStrict(value, key, 0);
        return;
    }
    if (key == "host") {
        service.host = value;
        return;
    }
    if (key == "port") {
        service.port = parseIntStrict(value, key, 1, 65535);
        return;
    }
    if (key == "service_threads") {
        service.threads = parseSizeStrict(value, key, 1);
        return;
    }
    if (key == "cors_origins") {
        service.corsOrigins = splitList(value);
        return;
    }

    if (const auto it = stringFields.find(key); it != stringFields.end()) {
        this->*(it->second) = value;
        return;
    }
    if (const auto it = boolFields.find(key); it != boolFields.end()) {
        this->*(it->second) = parseBoolStrict(value, key);
        return;
    }
    if (const auto it = thresholdDoubleFields.find(key); it != thresholdDoubleFields.end()) {
        thresholds.*(it->second.member) = parseDoubleStrict(value, key, it->second.minValue);
        return;
    }
    if (const auto it = thresholdSizeFields.find(key); it != thresholdSizeFields.end()) {
        thresholds.*(it->second.member) = parseSizeStrict(value, key, it->second.minValue);
        return;
    }

    throw Guardrail::ConfigurationException("Unknown configuration key: " + key);
}

GuardrailConfig GuardrailConfig::fromArgs(int argc, char* argv[], bool requireDataset) {
    GuardrailConfig config;
    int firstOption = 1;
    if (requireDataset) {
        if (argc < 2 || std::string(argv[1]).rfind("--", 0) == 0) {
            throw Guardrail::ConfigurationException(
                "Usage: guardrail <dataset.csv> [--baseline path] [--config path] [--output path] "
                "[--delimiter ,] [--threads N] [--verbose true|false] [--pretty true|false] "
                "[--type.<column> numeric|boolean|categorical|datetime|text] [--<threshold-key> value]");
        }
        config.datasetPath = argv[1];
        firstOption = 2;
    }

    // The config file is the base layer; command-line options override it.
    for (int i = firstOption; i < argc; ++i) {
        if (std::string(argv[i]) == "--config") {
            if (i + 1 >= argc) throw Guardrail::ConfigurationException("--config expects a path");
            const std::string datasetFromArgs = config.datasetPath;
            config = fromFile(argv[i + 1], config);
            if (!datasetFromArgs.empty()) config.datasetPath = datasetFromArgs;
            break;
        }
    }

    for (int i = firstOption; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg.rfind("--", 0) != 0 || arg.size() <= 2) {
            throw Guardrail::ConfigurationException("Unexpected argument: " + arg);
        }
        if (i + 1 >= argc) {
            throw Guardrail::ConfigurationException(arg + " expects a value");
        }
        const std::string value = argv[++i];
        if (arg == "--config") continue;
        config.assign(normalizeConfigKey(arg.substr(2)), value);
    }

    if (requireDataset && config.datasetPath.empty()) {
        throw Guardrail::ConfigurationException("dataset path is required");
    }
    config.validate();
    return config;
}

GuardrailConfig GuardrailConfig::fromFile(const std::string& configPath, const GuardrailConfig& base) {
    std::ifstream in(configPath);
    if (!in) throw Guardrail::ConfigurationException("Could not open config file: " + configPath);

    GuardrailConfig config = base;
    std::string line;
    size_t lineNo = 0;
    while (std::getline(in, line)) {
        ++lineNo;
        line = CommonUtils::trim(line);
        if (line.empty() || line[0] == '#') continue;

        // Support loose YAML (key: value) and loose JSON-ish ("key": "value",)
        line = CommonUtils::trim(stripStructuralTokensOutsideQuotes(line));
        if (line.empty()) continue;

        const size_t sep = findSeparatorOutsideQuotes(line, ':');
        if (sep == std::string::npos) {
            throw Guardrail::ConfigurationException(
                "Config parse error at line " + std::to_string(lineNo) + ": expected 'key: value'");
        }

        const std::string key = normalizeConfigKey(maybeUnquote(line.substr(0, sep)));
        const std::string value = maybeUnquote(line.substr(sep + 1));

        try {
            config.assign(key, value);
        } catch (const Guardrail::GuardrailException& ex) {
            throw Guardrail::ConfigurationException(
                "Config parse error at line " + std::to_string(lineNo) +
                ": '" + line + "' -> " + ex.what());
        }
    }
    config.validate();

    return config;
}

void ThresholdConfig::validate() const {
    const std::pair<double, const char*> numbers[] = {
        {categoricalMaxDistinctFraction, "categorical_max_distinct_fraction"},
        {nullRateCritical, "null_rate_critical"},
        {nullRateWarning, "null_rate_warning"},
        {nullRateMinimum, "null_rate_min"},
        {meanShiftCritical, "mean_shift_critical"},
        {meanShiftWarning, "mean_shift_warning"},
        {stdEpsilon, "std_epsilon"},
        {psiCritical, "psi_critical"},
        {psiWarning, "psi_warning"},
        {psiSmoothing, "psi_smoothing"},
        {missingCategoryMinShare, "missing_category_min_share"},
        {penaltyCritical, "penalty_critical"},
        {penaltyWarning, "penalty_warning"},
        {penaltyInfo, "penalty_info"},
        {outlierIqrMultiplier, "outlier_iqr_multiplier"},
        {missingWarningRate, "missing_warning_rate"},
        {missingCriticalRate, "missing_critical_rate"},
        {invalidCriticalRate, "invalid_critical_rate"},
    };
    for (const auto& [value, key] : numbers) {
        if (!std::isfinite(value)) {
            throw Guardrail::ConfigurationException(std::string(key) + " must be a finite number");
        }
    }

    const auto requireUnit = [](double value, const char* key) {
        if (value < 0.0 || value > 1.0) {
            throw Guardrail::ConfigurationException(std::string(key) + " must be within [0,1]");
        }
    };
    requireUnit(categoricalMaxDistinctFraction, "categorical_max_distinct_fraction");
    requireUnit(nullRateCritical, "null_rate_critical");
    requireUnit(nullRateWarning, "null_rate_warning");
    requireUnit(nullRateMinimum, "null_rate_min");
    requireUnit(missingCategoryMinShare, "missing_category_min_share");
    requireUnit(missingWarningRate, "missing_warning_rate");
    requireUnit(missingCriticalRate, "missing_critical_rate");
    requireUnit(invalidCriticalRate, "invalid_critical_rate");

    if (!(nullRateMinimum <= nullRateWarning && nullRateWarning <= nullRateCritical)) {
        throw Guardrail::ConfigurationException("null rate thresholds must satisfy null_rate_min <= null_rate_warning <= null_rate_critical");
    }
    if (meanShiftWarning > meanShiftCritical) {
        throw Guardrail::ConfigurationException("mean_shift_warning must be <= mean_shift_critical");
    }
    if (psiWarning > psiCritical) {
        throw Guardrail::ConfigurationException("psi_warning must be <= psi_critical");
    }
    if (missingWarningRate > missingCriticalRate) {
        throw Guardrail::ConfigurationException("missing_warning_rate must be <= missing_critical_rate");
    }
    if (stdEpsilon <= 0.0) {
        throw Guardrail::ConfigurationException("std_epsilon must be > 0");
    }
    if (psiSmoothing <= 0.0 || psiSmoothing >= 1.0) {
        throw Guardrail::ConfigurationException("psi_smoothing must be within (0,1)");
    }
    if (psiBins < 2) {
        throw Guardrail::ConfigurationException("psi_bins must be >= 2");
    }
    if (topN < 1 || categoricalMaxDistinct < 1) {
        throw Guardrail::ConfigurationException("top_n and categorical_max_distinct must be >= 1");
    }
}

void GuardrailConfig::validate() const {
    if (delimiter == '"' || delimiter == '\n' || delimiter == '\r') {
        throw Guardrail::ConfigurationException("delimiter cannot be a quote or line break");
    }
    if (service.port < 1 || service.port > 65535) {
        throw Guardrail::ConfigurationException("port must be within [1,65535]");
    }
    if (service.threads < 1) {
        throw Guardrail::ConfigurationException("service_threads must be >= 1");
    }
    thresholds.validate();
}
