#pragma once

#include "ColumnType.h"

#include <string>

// Declaration order is severity order.
enum class Severity { INFO, WARNING, CRITICAL };

inline const char* severityName(Severity severity) {
    switch (severity) {
        case Severity::INFO: return "info";
        case Severity::WARNING: return "warning";
        case Severity::CRITICAL: return "critical";
    }
    return "info";
}

enum class SchemaChange { COLUMN_ADDED, COLUMN_REMOVED, TYPE_CHANGED };

inline const char* schemaChangeName(SchemaChange kind) {
    switch (kind) {
        case SchemaChange::COLUMN_ADDED: return "column_added";
        case SchemaChange::COLUMN_REMOVED: return "column_removed";
        case SchemaChange::TYPE_CHANGED: return "type_changed";
    }
    return "column_added";
}

struct SchemaFinding {
    SchemaChange kind = SchemaChange::COLUMN_ADDED;
    std::string column;
    // Only meaningful for TYPE_CHANGED.
    ColumnType oldType = ColumnType::TEXT;
    ColumnType newType = ColumnType::TEXT;
    Severity severity = Severity::INFO;
};

enum class DriftMetric { NULL_RATE_DELTA, MEAN_SHIFT, POPULATION_STABILITY_INDEX, NEW_CATEGORY, MISSING_CATEGORY };

inline const char* driftMetricName(DriftMetric metric) {
    switch (metric) {
        case DriftMetric::NULL_RATE_DELTA: return "null_rate_delta";
        case DriftMetric::MEAN_SHIFT: return "mean_shift";
        case DriftMetric::POPULATION_STABILITY_INDEX: return "population_stability_index";
        case DriftMetric::NEW_CATEGORY: return "new_category";
        case DriftMetric::MISSING_CATEGORY: return "missing_category";
    }
    return "null_rate_delta";
}

struct DriftFinding {
    std::string column;
    DriftMetric metric = DriftMetric::NULL_RATE_DELTA;
    // Metric value; for category metrics the category's share on the side where it exists.
    double value = 0.0;
    Severity severity = Severity::INFO;
    // Category label for NEW_CATEGORY / MISSING_CATEGORY, empty otherwise.
    std::string detail;
};

// Flattened view of either finding kind, used for ordering and display.
struct Finding {
    enum class Source { SCHEMA, DRIFT };

    Source source = Source::SCHEMA;
    std::string column;
    std::string kind;
    Severity severity = Severity::INFO;
    double value = 0.0;
    std::string detail;
    std::string message;
};

struct Recommendation {
    std::string column;
    std::string issue;
    std::string recommendation;
    Severity severity = Severity::WARNING;
};
