#include "JsonWriter.h"
#include "CommonUtils.h"
#include <cmath>
#include <sstream>

namespace {

std::string quoted(const std::string& s) {
    return "\"" + JsonWriter::escapeJsonString(s) + "\"";
}

std::string fixed(double value, int digits) {
    return quoted(CommonUtils::formatFixed(value, digits));
}

void writeStringArray(std::ostringstream& out, const std::vector<std::string>& values) {
    out << "[";
    for (size_t i = 0; i < values.size(); ++i) {
        out << (i == 0 ? "" : ",") << quoted(values[i]);
    }
    out << "]";
}

void writeCell(std::ostringstream& out, const Cell& cell) {
    switch (cell.kind()) {
        case Cell::Kind::Null: out << "null"; break;
        case Cell::Kind::Number:
            if (std::isfinite(cell.number())) {
                out << cell.displayString();
            } else {
                out << "null";
            }
            break;
        case Cell::Kind::Text: out << quoted(cell.text()); break;
        case Cell::Kind::Bool: out << (cell.boolean() ? "true" : "false"); break;
    }
}

void writeStats(std::ostringstream& out, const NumericStats& s) {
    out << "{\"count\":" << s.count
        << ",\"mean\":" << fixed(s.mean, 2)
        << ",\"median\":" << fixed(s.median, 2)
        << ",\"min\":" << fixed(s.min, 2)
        << ",\"max\":" << fixed(s.max, 2)
        << ",\"std\":" << fixed(s.stddev, 2)
        << ",\"q1\":" << fixed(s.q1, 2)
        << ",\"q3\":" << fixed(s.q3, 2)
        << ",\"iqr\":" << fixed(s.iqr, 2)
        << ",\"outliers\":" << s.outlierCount
        << ",\"skewness\":" << (s.skewness ? fixed(*s.skewness, 2) : std::string("null"))
        << ",\"lowerWhisker\":" << fixed(s.lowerWhisker, 2)
        << ",\"upperWhisker\":" << fixed(s.upperWhisker, 2) << "}";
}

void writeHistogram(std::ostringstream& out, const Histogram& h) {
    out << "{\"min\":" << fixed(h.min, 2) << ",\"max\":" << fixed(h.max, 2)
        << ",\"binWidth\":" << fixed(h.binWidth, 2) << ",\"counts\":[";
    for (size_t i = 0; i < h.counts.size(); ++i) out << (i == 0 ? "" : ",") << h.counts[i];
    out << "]}";
}

void writeColumn(std::ostringstream& out, const ColumnAnalysis& col) {
    out << "{\"type\":" << quoted(columnTypeName(col.type))
        << ",\"missing\":" << col.missingCount
        << ",\"missingPercent\":" << fixed(col.missingPercent, 1)
        << ",\"unique\":" << col.uniqueCount;
    if (col.stats) {
        out << ",\"stats\":";
        writeStats(out, *col.stats);
    }
    if (col.topValues) {
        out << ",\"topValues\":[";
        for (size_t i = 0; i < col.topValues->size(); ++i) {
            const auto& tv = (*col.topValues)[i];
            out << (i == 0 ? "" : ",") << "{\"value\":" << quoted(tv.first) << ",\"count\":" << tv.second << "}";
        }
        out << "]";
    }
    if (col.histogram) {
        out << ",\"histogram\":";
        writeHistogram(out, *col.histogram);
    }
    out << "}";
}

} // namespace

namespace JsonWriter {

std::string escapeJsonString(const std::string& input) {
    std::string escaped;
    escaped.reserve(input.size());
    for (char ch : input) {
        switch (ch) {
            case '"': escaped += "\\\""; break;
            case '\\': escaped += "\\\\"; break;
            case '\b': escaped += "\\b"; break;
            case '\f': escaped += "\\f"; break;
            case '\n': escaped += "\\n"; break;
            case '\r': escaped += "\\r"; break;
            case '\t': escaped += "\\t"; break;
            default:
                if (static_cast<unsigned char>(ch) < 0x20) {
                    static const char* hex = "0123456789abcdef";
                    escaped += "\\u00";
                    escaped += hex[(static_cast<unsigned char>(ch) >> 4) & 0xF];
                    escaped += hex[static_cast<unsigned char>(ch) & 0xF];
                } else {
                    escaped += ch;
                }
                break;
        }
    }
    return escaped;
}

std::string analysisToJson(const AnalysisResult& analysis) {
    std::ostringstream out;
    out << "{\"rowCount\":" << analysis.rowCount << ",\"columnCount\":" << analysis.columnCount;

    out << ",\"columns\":{";
    for (size_t i = 0; i < analysis.columns.size(); ++i) {
        out << (i == 0 ? "" : ",") << quoted(analysis.columns[i].first) << ":";
        writeColumn(out, analysis.columns[i].second);
    }
    out << "}";

    out << ",\"correlations\":[";
    for (size_t i = 0; i < analysis.correlations.size(); ++i) {
        const auto& c = analysis.correlations[i];
        out << (i == 0 ? "" : ",") << "{\"col1\":" << quoted(c.columnA) << ",\"col2\":" << quoted(c.columnB)
            << ",\"correlation\":" << fixed(c.coefficient, 3) << "}";
    }
    out << "]";

    out << ",\"numericColumns\":";
    writeStringArray(out, analysis.numericColumns);
    out << ",\"categoricalColumns\":";
    writeStringArray(out, analysis.categoricalColumns);
    out << ",\"dateColumns\":";
    writeStringArray(out, analysis.dateColumns);

    out << ",\"hasInfiniteValues\":" << (analysis.hasInfiniteValues ? "true" : "false");
    out << ",\"infiniteValueStats\":{";
    for (size_t i = 0; i < analysis.infiniteValueStats.size(); ++i) {
        const auto& kv = analysis.infiniteValueStats[i];
        out << (i == 0 ? "" : ",") << quoted(kv.first) << ":{\"count\":" << kv.second.count
            << ",\"percentage\":" << fixed(kv.second.percentage, 1) << "}";
    }
    out << "}";

    out << ",\"duplicateStats\":{";
    for (size_t i = 0; i < analysis.duplicateStats.size(); ++i) {
        const auto& kv = analysis.duplicateStats[i];
        const DuplicateStat& d = kv.second;
        out << (i == 0 ? "" : ",") << quoted(kv.first) << ":{\"duplicateCount\":" << d.duplicateCount
            << ",\"duplicatePercentage\":" << fixed(d.duplicatePercentage, 1)
            << ",\"totalValues\":" << d.totalValues
            << ",\"uniqueValues\":" << d.uniqueValues
            << ",\"topDuplicates\":[";
        for (size_t j = 0; j < d.topDuplicates.size(); ++j) {
            out << (j == 0 ? "" : ",") << "{\"value\":" << quoted(d.topDuplicates[j].value)
                << ",\"count\":" << d.topDuplicates[j].count << "}";
        }
        out << "]}";
    }
    out << "}}";
    return out.str();
}

std::string datasetToJson(const Dataset& data) {
    std::ostringstream out;
    out << "[";
    for (size_t r = 0; r < data.rowCount(); ++r) {
        out << (r == 0 ? "{" : ",{");
        const auto& fields = data[r].fields();
        for (size_t i = 0; i < fields.size(); ++i) {
            out << (i == 0 ? "" : ",") << quoted(fields[i].first) << ":";
            writeCell(out, fields[i].second);
        }
        out << "}";
    }
    out << "]";
    return out.str();
}

}
