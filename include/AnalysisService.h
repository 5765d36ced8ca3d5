#pragma once

#include "DataQualityEngine.h"
#include "GuardrailConfig.h"

#include <atomic>
#include <cstdint>
#include <string>

struct MonitoringSnapshot {
    uint64_t totalRequests = 0;
    uint64_t analyzeRequests = 0;
    uint64_t errorRequests = 0;
    double averageLatencyMs = 0.0;
};

class RequestMonitor {
public:
    void recordSuccess(const std::string& endpoint, double latencyMs);
    void recordError(const std::string& endpoint, double latencyMs);
    MonitoringSnapshot snapshot() const;

private:
    std::atomic<uint64_t> totalRequests{0};
    std::atomic<uint64_t> analyzeRequests{0};
    std::atomic<uint64_t> errorRequests{0};
    std::atomic<uint64_t> totalLatencyMicros{0};
};

struct ServiceResponse {
    int status = 200;
    std::string body;
};

/**
 * @brief HTTP front end over DataQualityEngine.
 * @details Routes: POST /api/analyze (multipart `dataset`, optional `baseline`),
 *          GET /api/health, GET /api and GET /. Each request owns its tables and
 *          report; the engine and monitor are shared.
 */
class AnalysisService {
public:
    AnalysisService(const DataQualityEngine& engine, RequestMonitor& monitor, ServiceConfig config);

    /**
     * @brief Blocks serving requests until the listener stops.
     * @return 0 on clean shutdown, 1 when the socket cannot be bound.
     */
    int start();

    /**
     * @brief Handles one analyze request from raw CSV uploads.
     * @details @p datasetCsv null means the field was not sent; an empty baseline
     *          upload counts as no baseline. Invalid CSV yields 400 with `detail`.
     */
    ServiceResponse handleAnalyze(const std::string* datasetCsv, const std::string* baselineCsv) const;

    std::string healthPayload() const;
    static std::string rootPayload();

    /**
     * @brief Value for Access-Control-Allow-Origin, or empty when @p origin is not allowed.
     */
    std::string allowedOrigin(const std::string& origin) const;

private:
    const DataQualityEngine& engine;
    RequestMonitor& monitor;
    ServiceConfig config;
};
