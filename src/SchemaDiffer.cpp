#include "SchemaDiffer.h"

#include <unordered_map>

namespace {
std::unordered_map<std::string, ColumnType> declaredTypesByName(const std::vector<ColumnProfile>& profiles) {
    std::unordered_map<std::string, ColumnType> byName;
    byName.reserve(profiles.size());
    for (const auto& p : profiles) byName.emplace(p.name, p.declaredType);
    return byName;
}
} // namespace

Severity SchemaDiffer::severityFor(SchemaChange kind) noexcept {
    switch (kind) {
        case SchemaChange::COLUMN_REMOVED: return Severity::CRITICAL;
        case SchemaChange::TYPE_CHANGED: return Severity::CRITICAL;
        case SchemaChange::COLUMN_ADDED: return Severity::WARNING;
    }
    return Severity::WARNING;
}

std::vector<SchemaFinding> SchemaDiffer::diff(const std::vector<ColumnProfile>& dataset,
                                              const std::vector<ColumnProfile>& baseline) const {
    const auto current = declaredTypesByName(dataset);
    const auto previous = declaredTypesByName(baseline);

    std::vector<SchemaFinding> findings;
    for (const auto& b : baseline) {
        if (current.count(b.name) != 0) continue;
        SchemaFinding f;
        f.kind = SchemaChange::COLUMN_REMOVED;
        f.column = b.name;
        f.oldType = b.declaredType;
        f.newType = b.declaredType;
        f.severity = severityFor(f.kind);
        findings.push_back(std::move(f));
    }
    for (const auto& d : dataset) {
        if (previous.count(d.name) != 0) continue;
        SchemaFinding f;
        f.kind = SchemaChange::COLUMN_ADDED;
        f.column = d.name;
        f.oldType = d.declaredType;
        f.newType = d.declaredType;
        f.severity = severityFor(f.kind);
        findings.push_back(std::move(f));
    }
    for (const auto& d : dataset) {
        const auto it = previous.find(d.name);
        if (it == previous.end() || it->second == d.declaredType) continue;
        SchemaFinding f;
        f.kind = SchemaChange::TYPE_CHANGED;
        f.column = d.name;
        f.oldType = it->second;
        f.newType = d.declaredType;
        f.severity = severityFor(f.kind);
        findings.push_back(std::move(f));
    }
    return findings;
}
