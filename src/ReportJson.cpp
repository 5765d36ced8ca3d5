#include "ReportJson.h"

#include <cmath>
#include <cstdint>
#include <cstdio>
#include <iomanip>
#include <sstream>
#include <vector>

namespace ReportJson {

namespace {
// Length of the well-formed UTF-8 sequence starting at i, or 0 when the bytes are invalid.
size_t utf8SequenceLength(const std::string& value, size_t i) {
    const auto byte = [&](size_t k) { return static_cast<unsigned char>(value[k]); };
    const unsigned char lead = byte(i);
    size_t len = 0;
    unsigned char lo = 0x80;
    unsigned char hi = 0xBF;
    if (lead >= 0xC2 && lead <= 0xDF) {
        len = 2;
    } else if (lead >= 0xE0 && lead <= 0xEF) {
        len = 3;
        if (lead == 0xE0) lo = 0xA0;
        if (lead == 0xED) hi = 0x9F;
    } else if (lead >= 0xF0 && lead <= 0xF4) {
        len = 4;
        if (lead == 0xF0) lo = 0x90;
        if (lead == 0xF4) hi = 0x8F;
    } else {
        return 0;
    }
    if (i + len > value.size()) return 0;
    if (byte(i + 1) < lo || byte(i + 1) > hi) return 0;
    for (size_t k = 2; k < len; ++k) {
        if (byte(i + k) < 0x80 || byte(i + k) > 0xBF) return 0;
    }
    return len;
}
} // namespace

std::string escapeJsonString(const std::string& value) {
    std::ostringstream out;
    for (size_t i = 0; i < value.size(); ++i) {
        const char c = value[i];
        switch (c) {
            case '"': out << "\\\""; break;
            case '\\': out << "\\\\"; break;
            case '\n': out << "\\n"; break;
            case '\r': out << "\\r"; break;
            case '\t': out << "\\t"; break;
            case '\b': out << "\\b"; break;
            case '\f': out << "\\f"; break;
            default: {
                const auto u = static_cast<unsigned char>(c);
                if (u < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(u));
                    out << buf;
                } else if (u < 0x80) {
                    out << c;
                } else if (const size_t len = utf8SequenceLength(value, i); len > 0) {
                    out.write(value.data() + i, static_cast<std::streamsize>(len));
                    i += len - 1;
                } else {
                    // Not UTF-8 (e.g. Latin-1 input): one replacement character per bad byte.
                    out << "\\ufffd";
                }
                break;
            }
        }
    }
    return out.str();
}

std::string formatDouble(double value) {
    if (!std::isfinite(value)) {
        return "null";
    }
    std::ostringstream out;
    out << std::setprecision(15) << value;
    return out.str();
}

namespace {
class JsonWriter {
public:
    explicit JsonWriter(bool pretty) : pretty_(pretty) {}

    void beginObject() { open('{'); }
    void endObject() { close('}'); }
    void beginArray() { open('['); }
    void endArray() { close(']'); }

    void key(const char* name) {
        separator();
        out_ << '"' << name << '"' << (pretty_ ? ": " : ":");
        afterKey_ = true;
    }

    void string(const std::string& value) {
        separator();
        out_ << '"' << escapeJsonString(value) << '"';
    }
    void number(double value) {
        separator();
        out_ << formatDouble(value);
    }
    void integer(size_t value) {
        separator();
        out_ << value;
    }
    void integer(int64_t value) {
        separator();
        out_ << value;
    }
    void boolean(bool value) {
        separator();
        out_ << (value ? "true" : "false");
    }
    void null() {
        separator();
        out_ << "null";
    }

    void field(const char* name, const std::string& value) { key(name); string(value); }
    void field(const char* name, const char* value) { key(name); string(value); }
    void field(const char* name, double value) { key(name); number(value); }
    void field(const char* name, size_t value) { key(name); integer(value); }
    void field(const char* name, int64_t value) { key(name); integer(value); }
    void field(const char* name, bool value) { key(name); boolean(value); }

    void stringArray(const char* name, const std::vector<std::string>& values) {
        key(name);
        beginArray();
        for (const auto& v : values) string(v);
        endArray();
    }

    std::string str() const { return out_.str(); }

private:
    void open(char bracket) {
        separator();
        out_ << bracket;
        firstInScope_.push_back(true);
    }

    void close(char bracket) {
        const bool empty = firstInScope_.back();
        firstInScope_.pop_back();
        if (!empty) newline();
        out_ << bracket;
    }

    void separator() {
        if (afterKey_) {
            afterKey_ = false;
            return;
        }
        if (firstInScope_.empty()) return;
        if (!firstInScope_.back()) out_ << ',';
        firstInScope_.back() = false;
        newline();
    }

    void newline() {
        if (!pretty_) return;
        out_ << '\n' << std::string(2 * firstInScope_.size(), ' ');
    }

    std::ostringstream out_;
    bool pretty_;
    bool afterKey_ = false;
    std::vector<bool> firstInScope_;
};

void writeProfile(JsonWriter& w, const ColumnProfile& p) {
    w.beginObject();
    w.field("name", p.name);
    w.field("type", columnTypeName(p.type));
    w.field("declared_type", columnTypeName(p.declaredType));
    w.field("degraded", p.degraded);
    w.field("row_count", p.rowCount);
    w.field("null_count", p.nullCount);
    w.key("null_rate");
    if (p.nullRate) w.number(*p.nullRate); else w.null();
    w.field("distinct_count", p.distinctCount);
    w.field("invalid_count", p.invalidCount);
    w.stringArray("sample_values", p.sampleValues);

    w.key("numeric");
    if (p.numeric) {
        const NumericSummary& n = *p.numeric;
        w.beginObject();
        w.field("min", n.min);
        w.field("max", n.max);
        w.field("mean", n.mean);
        w.field("stddev", n.stddev);
        w.field("p25", n.p25);
        w.field("p50", n.p50);
        w.field("p75", n.p75);
        w.field("outlier_count", n.outlierCount);
        w.endObject();
    } else {
        w.null();
    }

    w.key("top_values");
    w.beginArray();
    for (const auto& c : p.topValues) {
        w.beginObject();
        w.field("value", c.value);
        w.field("count", c.count);
        w.field("share", c.share);
        w.endObject();
    }
    w.endArray();

    w.key("datetime");
    if (p.datetime) {
        const DatetimeSummary& d = *p.datetime;
        w.beginObject();
        w.field("min", d.min);
        w.field("max", d.max);
        w.field("min_epoch_seconds", static_cast<int64_t>(d.minEpochSeconds));
        w.field("max_epoch_seconds", static_cast<int64_t>(d.maxEpochSeconds));
        w.field("granularity", d.granularity);
        w.endObject();
    } else {
        w.null();
    }

    w.key("text");
    if (p.text) {
        w.beginObject();
        w.field("min_length", p.text->minLength);
        w.field("mean_length", p.text->meanLength);
        w.field("max_length", p.text->maxLength);
        w.endObject();
    } else {
        w.null();
    }

    w.key("note");
    if (p.note.empty()) w.null(); else w.string(p.note);
    w.endObject();
}

void writeSchemaFinding(JsonWriter& w, const SchemaFinding& f) {
    w.beginObject();
    w.field("kind", schemaChangeName(f.kind));
    w.field("column", f.column);
    w.key("old_type");
    if (f.kind == SchemaChange::COLUMN_ADDED) w.null(); else w.string(columnTypeName(f.oldType));
    w.key("new_type");
    if (f.kind == SchemaChange::COLUMN_REMOVED) w.null(); else w.string(columnTypeName(f.newType));
    w.field("severity", severityName(f.severity));
    w.endObject();
}

void writeDriftFinding(JsonWriter& w, const DriftFinding& f) {
    w.beginObject();
    w.field("column", f.column);
    w.field("metric", driftMetricName(f.metric));
    w.field("value", f.value);
    w.field("severity", severityName(f.severity));
    w.key("detail");
    if (f.detail.empty()) w.null(); else w.string(f.detail);
    w.endObject();
}

void writeFinding(JsonWriter& w, const Finding& f) {
    w.beginObject();
    w.field("source", f.source == Finding::Source::SCHEMA ? "schema" : "drift");
    w.field("column", f.column);
    w.field("kind", f.kind);
    w.field("severity", severityName(f.severity));
    w.key("value");
    if (f.source == Finding::Source::SCHEMA) w.null(); else w.number(f.value);
    w.key("detail");
    if (f.detail.empty()) w.null(); else w.string(f.detail);
    w.field("message", f.message);
    w.endObject();
}
} // namespace

std::string toJson(const Report& report, bool pretty) {
    JsonWriter w(pretty);
    w.beginObject();

    w.key("dataset");
    w.beginObject();
    w.field("rows", report.datasetRows);
    w.field("columns", report.datasetColumns);
    w.endObject();

    w.key("baseline");
    w.beginObject();
    w.field("used", report.baselineUsed);
    w.field("rows", report.baselineRows);
    w.field("columns", report.baselineColumns);
    w.endObject();

    w.field("quality_score", report.qualityScore);
    w.key("severity_counts");
    w.beginObject();
    w.field("critical", report.severityCounts.critical);
    w.field("warning", report.severityCounts.warning);
    w.field("info", report.severityCounts.info);
    w.endObject();
    w.field("summary", report.summary);

    w.key("columns");
    w.beginArray();
    for (const auto& p : report.columns) writeProfile(w, p);
    w.endArray();

    w.key("schema_findings");
    w.beginArray();
    for (const auto& f : report.schemaFindings) writeSchemaFinding(w, f);
    w.endArray();

    w.key("drift_findings");
    w.beginArray();
    for (const auto& f : report.driftFindings) writeDriftFinding(w, f);
    w.endArray();

    w.key("findings");
    w.beginArray();
    for (const auto& f : report.findings) writeFinding(w, f);
    w.endArray();

    w.key("recommendations");
    w.beginArray();
    for (const auto& r : report.recommendations) {
        w.beginObject();
        w.field("column", r.column);
        w.field("issue", r.issue);
        w.field("recommendation", r.recommendation);
        w.field("severity", severityName(r.severity));
        w.endObject();
    }
    w.endArray();

    w.stringArray("notes", report.notes);

    w.key("sample");
    w.beginObject();
    w.stringArray("columns", report.sampleColumns);
    w.key("rows");
    w.beginArray();
    for (const auto& row : report.sampleRows) {
        w.beginArray();
        for (const auto& cell : row) {
            if (cell) w.string(*cell); else w.null();
        }
        w.endArray();
    }
    w.endArray();
    w.endObject();

    w.endObject();
    return w.str();
}

} // namespace ReportJson
