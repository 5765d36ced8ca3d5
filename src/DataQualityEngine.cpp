#include "DataQualityEngine.h"

#include "DriftDetector.h"
#include "FindingAggregator.h"
#include "GuardrailExceptions.h"
#include "SchemaDiffer.h"
#include "SchemaInferencer.h"

#include <chrono>
#include <iostream>

namespace {
std::vector<ColumnProfile> profilesOf(const std::vector<ProfiledColumn>& profiled) {
    std::vector<ColumnProfile> out;
    out.reserve(profiled.size());
    for (const auto& p : profiled) out.push_back(p.profile);
    return out;
}

void checkCancelled(const CancelCheck& shouldCancel, const char* stage) {
    if (shouldCancel && shouldCancel()) {
        throw Guardrail::CancelledException(std::string("analysis stopped before ") + stage);
    }
}
} // namespace

DataQualityEngine::DataQualityEngine(GuardrailConfig config) : config_(std::move(config)) {
    config_.validate();
}

Report DataQualityEngine::analyze(const Table& dataset, const Table* baseline, const CancelCheck& shouldCancel) const {
    const auto started = std::chrono::steady_clock::now();
    const SchemaInferencer inferencer(config_);
    const ColumnProfiler profiler(config_);

    ReportBuilder builder(config_.thresholds.sampleRowCount);

    checkCancelled(shouldCancel, "schema inference");
    const auto schema = inferencer.inferSchema(dataset);
    const auto profiled = profiler.profileTable(dataset, schema, shouldCancel);
    std::vector<ColumnProfile> profiles = profilesOf(profiled);

    for (const auto& p : profiles) {
        if (!p.note.empty()) builder.note("Column '" + p.name + "': " + p.note);
    }

    if (baseline != nullptr && baseline->rowCount() == 0) {
        builder.note("Baseline has no rows; schema and drift comparison skipped.");
        baseline = nullptr;
    }

    std::vector<SchemaFinding> schemaFindings;
    std::vector<DriftFinding> driftFindings;
    if (baseline != nullptr) {
        checkCancelled(shouldCancel, "baseline profiling");
        const auto baselineSchema = inferencer.inferSchema(*baseline);
        const auto baselineProfiled = profiler.profileTable(*baseline, baselineSchema, shouldCancel);

        schemaFindings = SchemaDiffer().diff(profiles, profilesOf(baselineProfiled));

        DriftResult drift = DriftDetector(config_).detect(profiled, baselineProfiled, shouldCancel);
        driftFindings = std::move(drift.findings);
        for (auto& n : drift.notes) builder.note(std::move(n));
        builder.baseline(*baseline);
    }

    AggregatedFindings aggregated = FindingAggregator(config_).aggregate(
        profiles, schemaFindings, std::move(driftFindings), dataset.rowCount(), baseline != nullptr);

    if (config_.verbose) {
        const auto elapsedMs = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started).count();
        std::cerr << "[Guardrail][Engine] rows=" << dataset.rowCount() << " columns=" << dataset.colCount()
                  << " baseline=" << (baseline != nullptr ? "yes" : "no")
                  << " findings=" << aggregated.findings.size()
                  << " score=" << aggregated.qualityScore
                  << " elapsed_ms=" << elapsedMs << "\n";
    }

    return builder.dataset(dataset, std::move(profiles))
        .schemaFindings(std::move(schemaFindings))
        .aggregated(std::move(aggregated))
        .build();
}
