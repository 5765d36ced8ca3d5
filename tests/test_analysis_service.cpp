#include <gtest/gtest.h>

#include "AnalysisService.h"

#include <string>

class AnalysisServiceTest : public ::testing::Test {
protected:
    DataQualityEngine engine{GuardrailConfig{}};
    RequestMonitor monitor;
    AnalysisService service{engine, monitor, ServiceConfig{}};
};

TEST_F(AnalysisServiceTest, MissingDatasetIsABadRequest) {
    const ServiceResponse response = service.handleAnalyze(nullptr, nullptr);
    EXPECT_EQ(response.status, 400);
    EXPECT_NE(response.body.find("\"detail\""), std::string::npos);
}

TEST_F(AnalysisServiceTest, InvalidCsvIsABadRequest) {
    const std::string broken = "a,b\n\"unterminated,1\n";
    const ServiceResponse response = service.handleAnalyze(&broken, nullptr);
    EXPECT_EQ(response.status, 400);
    EXPECT_NE(response.body.find("Invalid dataset CSV"), std::string::npos);

    const std::string good = "a\n1\n";
    const std::string empty;
    EXPECT_EQ(service.handleAnalyze(&empty, nullptr).status, 400);
    const ServiceResponse badBaseline = service.handleAnalyze(&good, &broken);
    EXPECT_EQ(badBaseline.status, 400);
    EXPECT_NE(badBaseline.body.find("Invalid baseline CSV"), std::string::npos);
}

TEST_F(AnalysisServiceTest, AnalyzesUploads) {
    const std::string dataset = "age,status\n30,active\n50,active\n";
    const std::string baseline = "age,status\n31,active\n49,active\n";
    const ServiceResponse response = service.handleAnalyze(&dataset, &baseline);
    EXPECT_EQ(response.status, 200);
    EXPECT_EQ(response.body.rfind("{\"dataset\":{\"rows\":2", 0), 0u);
    EXPECT_NE(response.body.find("\"used\":true"), std::string::npos);
}

TEST_F(AnalysisServiceTest, EmptyBaselineUploadMeansNoBaseline) {
    const std::string dataset = "a\n1\n";
    const std::string baseline;
    const ServiceResponse response = service.handleAnalyze(&dataset, &baseline);
    EXPECT_EQ(response.status, 200);
    EXPECT_NE(response.body.find("\"used\":false"), std::string::npos);
}

TEST_F(AnalysisServiceTest, HealthAndRootPayloads) {
    monitor.recordSuccess("/api/analyze", 4.0);
    monitor.recordError("/api/analyze", 2.0);
    const std::string health = service.healthPayload();
    EXPECT_EQ(health.rfind("{\"status\":\"ok\"", 0), 0u);
    EXPECT_NE(health.find("\"total_requests\":2"), std::string::npos);
    EXPECT_NE(health.find("\"errors\":1"), std::string::npos);
    EXPECT_NE(AnalysisService::rootPayload().find("/api/health"), std::string::npos);
}

TEST_F(AnalysisServiceTest, CorsOriginsAreEchoedWhenAllowed) {
    EXPECT_EQ(service.allowedOrigin("http://localhost:3000"), "http://localhost:3000");
    EXPECT_EQ(service.allowedOrigin("https://evil.example"), "");
    EXPECT_EQ(service.allowedOrigin(""), "");

    ServiceConfig open;
    open.corsOrigins = {"*"};
    const AnalysisService permissive(engine, monitor, open);
    EXPECT_EQ(permissive.allowedOrigin("https://anything.example"), "*");
}

TEST(RequestMonitorTest, AveragesLatency) {
    RequestMonitor monitor;
    monitor.recordSuccess("/api/analyze", 10.0);
    monitor.recordSuccess("/api/health", 20.0);
    const MonitoringSnapshot snapshot = monitor.snapshot();
    EXPECT_EQ(snapshot.totalRequests, 2u);
    EXPECT_EQ(snapshot.analyzeRequests, 1u);
    EXPECT_EQ(snapshot.errorRequests, 0u);
    EXPECT_NEAR(snapshot.averageLatencyMs, 15.0, 1e-9);
}
