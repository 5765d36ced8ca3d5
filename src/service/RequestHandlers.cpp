#include "AnalysisService.h"

#include "GuardrailExceptions.h"
#include "ReportJson.h"
#include "TableLoader.h"

#include <algorithm>
#include <cmath>
#include <optional>
#include <sstream>

namespace {
long long toLatencyMicros(double latencyMs) {
    if (!std::isfinite(latencyMs) || latencyMs <= 0.0) return 0;
    return static_cast<long long>(std::llround(latencyMs * 1000.0));
}

std::string makeErrorResponse(const std::string& detail) {
    return "{\"detail\":\"" + ReportJson::escapeJsonString(detail) + "\"}";
}

Table loadUpload(const TableLoader& loader, const std::string& csv, const char* field) {
    try {
        return loader.fromCsvText(csv, field);
    } catch (const Guardrail::GuardrailException& e) {
        throw Guardrail::DatasetException(std::string("Invalid ") + field + " CSV: " + e.what());
    }
}
} // namespace

void RequestMonitor::recordSuccess(const std::string& endpoint, double latencyMs) {
    totalRequests.fetch_add(1, std::memory_order_relaxed);
    if (endpoint == "/api/analyze") {
        analyzeRequests.fetch_add(1, std::memory_order_relaxed);
    }
    totalLatencyMicros.fetch_add(static_cast<uint64_t>(std::max<long long>(0, toLatencyMicros(latencyMs))),
                                 std::memory_order_relaxed);
}

void RequestMonitor::recordError(const std::string& endpoint, double latencyMs) {
    totalRequests.fetch_add(1, std::memory_order_relaxed);
    errorRequests.fetch_add(1, std::memory_order_relaxed);
    if (endpoint == "/api/analyze") {
        analyzeRequests.fetch_add(1, std::memory_order_relaxed);
    }
    totalLatencyMicros.fetch_add(static_cast<uint64_t>(std::max<long long>(0, toLatencyMicros(latencyMs))),
                                 std::memory_order_relaxed);
}

MonitoringSnapshot RequestMonitor::snapshot() const {
    MonitoringSnapshot out;
    out.totalRequests = totalRequests.load(std::memory_order_relaxed);
    out.analyzeRequests = analyzeRequests.load(std::memory_order_relaxed);
    out.errorRequests = errorRequests.load(std::memory_order_relaxed);

    const uint64_t latencyMicros = totalLatencyMicros.load(std::memory_order_relaxed);
    if (out.totalRequests > 0) {
        out.averageLatencyMs = static_cast<double>(latencyMicros) / static_cast<double>(out.totalRequests) / 1000.0;
    }
    return out;
}

AnalysisService::AnalysisService(const DataQualityEngine& engineRef, RequestMonitor& monitorRef, ServiceConfig configValue)
    : engine(engineRef), monitor(monitorRef), config(std::move(configValue)) {}

ServiceResponse AnalysisService::handleAnalyze(const std::string* datasetCsv, const std::string* baselineCsv) const {
    if (datasetCsv == nullptr) {
        return {400, makeErrorResponse("Missing 'dataset' file upload.")};
    }

    const TableLoader loader(engine.config().delimiter);
    std::optional<Table> dataset;
    std::optional<Table> baseline;
    try {
        dataset.emplace(loadUpload(loader, *datasetCsv, "dataset"));
        if (baselineCsv != nullptr && !baselineCsv->empty()) {
            baseline.emplace(loadUpload(loader, *baselineCsv, "baseline"));
        }
    } catch (const Guardrail::DatasetException& e) {
        return {400, makeErrorResponse(e.what())};
    }

    try {
        const Report report = engine.analyze(*dataset, baseline ? &*baseline : nullptr);
        return {200, ReportJson::toJson(report, false)};
    } catch (const std::exception& e) {
        return {500, makeErrorResponse(std::string("Analysis failed: ") + e.what())};
    }
}

std::string AnalysisService::healthPayload() const {
    const MonitoringSnapshot snapshot = monitor.snapshot();
    std::ostringstream out;
    out << "{"
        << "\"status\":\"ok\","
        << "\"monitoring\":{"
        << "\"total_requests\":" << snapshot.totalRequests << ","
        << "\"analyze_requests\":" << snapshot.analyzeRequests << ","
        << "\"errors\":" << snapshot.errorRequests << ","
        << "\"avg_latency_ms\":" << ReportJson::formatDouble(snapshot.averageLatencyMs)
        << "}}";
    return out.str();
}

std::string AnalysisService::rootPayload() {
    return "{\"name\":\"Data Quality Guardrails\",\"status\":\"ok\",\"health\":\"/api/health\","
           "\"analyze\":\"/api/analyze\"}";
}

std::string AnalysisService::allowedOrigin(const std::string& origin) const {
    if (origin.empty()) return "";
    const auto it = std::find(config.corsOrigins.begin(), config.corsOrigins.end(), origin);
    if (it != config.corsOrigins.end()) return origin;
    const auto wildcard = std::find(config.corsOrigins.begin(), config.corsOrigins.end(), "*");
    return wildcard != config.corsOrigins.end() ? "*" : "";
}
