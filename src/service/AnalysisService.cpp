#include "AnalysisService.h"

#include <algorithm>
#include <chrono>
#include <iostream>
#include <sstream>

#include <httplib.h>

namespace {
using Clock = std::chrono::steady_clock;

void setJsonResponse(httplib::Response& response, int status, const std::string& payload) {
    response.status = status;
    response.set_content(payload, "application/json");
}

void logMonitoringLine(const std::string& endpoint, int status, double latencyMs, const MonitoringSnapshot& snapshot) {
    std::ostringstream line;
    line << "[GuardrailService][Monitor] endpoint=" << endpoint
         << " status=" << status
         << " latency_ms=" << latencyMs
         << " total=" << snapshot.totalRequests
         << " analyze=" << snapshot.analyzeRequests
         << " errors=" << snapshot.errorRequests
         << " avg_latency_ms=" << snapshot.averageLatencyMs;
    std::cout << line.str() << "\n";
}
} // namespace

int AnalysisService::start() {
    httplib::Server server;
    server.new_task_queue = [threadCount = std::max<size_t>(1, config.threads)] {
        return new httplib::ThreadPool(static_cast<int>(threadCount));
    };

    server.set_post_routing_handler([this](const httplib::Request& request, httplib::Response& response) {
        const std::string origin = allowedOrigin(request.get_header_value("Origin"));
        if (origin.empty()) return;
        response.set_header("Access-Control-Allow-Origin", origin);
        response.set_header("Access-Control-Allow-Credentials", "true");
        response.set_header("Vary", "Origin");
    });

    server.Options(R"(/.*)", [](const httplib::Request&, httplib::Response& response) {
        response.set_header("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
        response.set_header("Access-Control-Allow-Headers", "*");
        response.status = 204;
    });

    server.Get("/", [](const httplib::Request&, httplib::Response& response) {
        setJsonResponse(response, 200, rootPayload());
    });

    server.Get("/api", [](const httplib::Request&, httplib::Response& response) {
        setJsonResponse(response, 200, "{\"status\":\"ok\"}");
    });

    server.Get("/api/health", [this](const httplib::Request&, httplib::Response& response) {
        setJsonResponse(response, 200, healthPayload());
    });

    server.Post("/api/analyze", [this](const httplib::Request& request, httplib::Response& response) {
        const auto started = Clock::now();

        std::string datasetCsv;
        std::string baselineCsv;
        const bool hasDataset = request.has_file("dataset");
        const bool hasBaseline = request.has_file("baseline");
        if (hasDataset) datasetCsv = request.get_file_value("dataset").content;
        if (hasBaseline) baselineCsv = request.get_file_value("baseline").content;

        const ServiceResponse result = handleAnalyze(hasDataset ? &datasetCsv : nullptr,
                                                     hasBaseline ? &baselineCsv : nullptr);

        const double latencyMs = std::chrono::duration<double, std::milli>(Clock::now() - started).count();
        if (result.status == 200) {
            monitor.recordSuccess("/api/analyze", latencyMs);
        } else {
            monitor.recordError("/api/analyze", latencyMs);
        }
        setJsonResponse(response, result.status, result.body);
        logMonitoringLine("/api/analyze", result.status, latencyMs, monitor.snapshot());
    });

    std::cout << "[GuardrailService] host=" << config.host
              << " port=" << config.port
              << " threads=" << std::max<size_t>(1, config.threads)
              << " cors_origins=" << config.corsOrigins.size()
              << "\n";

    if (!server.listen(config.host.c_str(), config.port)) {
        std::cerr << "[GuardrailService] failed_to_bind host=" << config.host << " port=" << config.port << "\n";
        return 1;
    }
    return 0;
}
