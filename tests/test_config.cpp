#include <gtest/gtest.h>

#include "GuardrailConfig.h"
#include "GuardrailExceptions.h"

#include <limits>
#include <string>
#include <vector>

namespace {
GuardrailConfig parseArgs(std::vector<std::string> args, bool requireDataset = true) {
    std::vector<char*> argv;
    for (auto& a : args) argv.push_back(a.data());
    return GuardrailConfig::fromArgs(static_cast<int>(argv.size()), argv.data(), requireDataset);
}

std::string dataFile(const char* name) {
    return std::string(GUARDRAIL_TEST_DATA_DIR) + "/" + name;
}
} // namespace

TEST(GuardrailConfigTest, DefaultsAreValid) {
    const GuardrailConfig config;
    EXPECT_NO_THROW(config.validate());
    EXPECT_EQ(config.delimiter, ',');
    EXPECT_DOUBLE_EQ(config.thresholds.psiCritical, 0.25);
    EXPECT_DOUBLE_EQ(config.thresholds.penaltyCritical, 15.0);
    EXPECT_EQ(config.thresholds.psiBins, 10u);
    EXPECT_EQ(config.service.port, 8000);
}

TEST(GuardrailConfigTest, CommandLineOptions) {
    const GuardrailConfig config = parseArgs({"guardrail", "data.csv", "--baseline", "base.csv",
                                              "--psi-critical", "0.3", "--type.Age", "numeric",
                                              "--verbose", "true", "--delimiter", "tab", "--threads", "4"});
    EXPECT_EQ(config.datasetPath, "data.csv");
    EXPECT_EQ(config.baselinePath, "base.csv");
    EXPECT_DOUBLE_EQ(config.thresholds.psiCritical, 0.3);
    ASSERT_EQ(config.columnTypeOverrides.count("Age"), 1u);
    EXPECT_EQ(config.columnTypeOverrides.at("Age"), ColumnType::NUMERIC);
    EXPECT_TRUE(config.verbose);
    EXPECT_EQ(config.delimiter, '\t');
    EXPECT_EQ(config.threads, 4u);
}

TEST(GuardrailConfigTest, DatasetIsRequiredForTheCli) {
    EXPECT_THROW(parseArgs({"guardrail"}), Guardrail::ConfigurationException);
    EXPECT_THROW(parseArgs({"guardrail", "--baseline", "b.csv"}), Guardrail::ConfigurationException);
    EXPECT_NO_THROW(parseArgs({"guardrail_service", "--port", "9100"}, false));
}

TEST(GuardrailConfigTest, RejectsBadOptions) {
    EXPECT_THROW(parseArgs({"guardrail", "d.csv", "--no-such-key", "1"}), Guardrail::ConfigurationException);
    EXPECT_THROW(parseArgs({"guardrail", "d.csv", "--top_n"}), Guardrail::ConfigurationException);
    EXPECT_THROW(parseArgs({"guardrail", "d.csv", "--psi_bins", "1"}), Guardrail::ConfigurationException);
    EXPECT_THROW(parseArgs({"guardrail", "d.csv", "--null_rate_warning", "0.5"}), Guardrail::ConfigurationException);
    EXPECT_THROW(parseArgs({"guardrail", "d.csv", "--type.x", "decimal"}), Guardrail::ConfigurationException);
    EXPECT_THROW(parseArgs({"guardrail", "d.csv", "--pretty", "maybe"}), Guardrail::ConfigurationException);
    EXPECT_THROW(parseArgs({"guardrail", "d.csv", "--port", "70000"}), Guardrail::ConfigurationException);
    EXPECT_THROW(parseArgs({"guardrail", "d.csv", "--psi_smoothing", "0"}), Guardrail::ConfigurationException);
}

TEST(GuardrailConfigTest, RejectsNonFiniteThresholds) {
    EXPECT_THROW(parseArgs({"guardrail", "d.csv", "--psi_critical", "nan"}), Guardrail::ConfigurationException);
    EXPECT_THROW(parseArgs({"guardrail", "d.csv", "--mean_shift_critical", "nan"}), Guardrail::ConfigurationException);
    EXPECT_THROW(parseArgs({"guardrail", "d.csv", "--mean_shift_critical", "inf"}), Guardrail::ConfigurationException);

    GuardrailConfig config;
    config.thresholds.psiCritical = std::numeric_limits<double>::quiet_NaN();
    EXPECT_THROW(config.validate(), Guardrail::ConfigurationException);
}

TEST(GuardrailConfigTest, LoadsKeyValueFile) {
    const GuardrailConfig config = GuardrailConfig::fromFile(dataFile("guardrail.yaml"), GuardrailConfig{});
    EXPECT_EQ(config.baselinePath, "baseline.csv");
    EXPECT_EQ(config.delimiter, ';');
    EXPECT_EQ(config.threads, 2u);
    EXPECT_EQ(config.thresholds.topN, 5u);
    EXPECT_DOUBLE_EQ(config.thresholds.psiCritical, 0.3);
    EXPECT_DOUBLE_EQ(config.thresholds.meanShiftWarning, 1.5);
    ASSERT_EQ(config.columnTypeOverrides.count("Customer ID"), 1u);
    EXPECT_EQ(config.columnTypeOverrides.at("Customer ID"), ColumnType::TEXT);
    EXPECT_EQ(config.service.corsOrigins, (std::vector<std::string>{"http://localhost:3000", "https://example.org"}));
    EXPECT_EQ(config.service.port, 9000);
}

TEST(GuardrailConfigTest, CommandLineOverridesConfigFile) {
    const GuardrailConfig config = parseArgs({"guardrail", "data.csv", "--config", dataFile("guardrail.yaml"),
                                              "--top_n", "7"});
    EXPECT_EQ(config.datasetPath, "data.csv");
    EXPECT_EQ(config.baselinePath, "baseline.csv");
    EXPECT_EQ(config.thresholds.topN, 7u);
}

TEST(GuardrailConfigTest, MissingConfigFileIsReported) {
    EXPECT_THROW(GuardrailConfig::fromFile("/nonexistent/guardrail.yaml", GuardrailConfig{}),
                 Guardrail::ConfigurationException);
}
