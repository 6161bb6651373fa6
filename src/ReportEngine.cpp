#include "ReportEngine.h"
#include "CommonUtils.h"
#include "TabulaExceptions.h"
#include <fstream>

namespace {
std::string escapeMarkdownTableCell(const std::string& value) {
    std::string escaped;
    escaped.reserve(value.size() + 8);
    for (char ch : value) {
        if (ch == '|') {
            escaped += "\\|";
        } else if (ch == '\n') {
            escaped += "<br>";
        } else if (ch != '\r') {
            escaped.push_back(ch);
        }
    }
    return escaped;
}

std::string escapeHtml(const std::string& value) {
    std::string escaped;
    escaped.reserve(value.size() + 16);
    for (char ch : value) {
        switch (ch) {
            case '&': escaped += "&amp;"; break;
            case '<': escaped += "&lt;"; break;
            case '>': escaped += "&gt;"; break;
            case '"': escaped += "&quot;"; break;
            case '\n': escaped += "<br>"; break;
            case '\r': break;
            default: escaped.push_back(ch); break;
        }
    }
    return escaped;
}

constexpr size_t kTallTableRowCap = 120;

void appendMarkdownTable(std::string& body,
                         const std::vector<std::string>& headers,
                         const std::vector<std::vector<std::string>>& rows) {
    body += "|";
    for (const auto& h : headers) {
        body += " " + escapeMarkdownTableCell(h) + " |";
    }
    body += "\n|";
    for (size_t i = 0; i < headers.size(); ++i) {
        body += " --- |";
    }
    body += "\n";

    for (const auto& row : rows) {
        body += "|";
        for (size_t i = 0; i < headers.size(); ++i) {
            body += " " + escapeMarkdownTableCell(i < row.size() ? row[i] : "") + " |";
        }
        body += "\n";
    }
    body += "\n";
}

void appendWideHtmlTable(std::string& body,
                         const std::vector<std::string>& headers,
                         const std::vector<std::vector<std::string>>& rows) {
    body += "<div style=\"overflow-x:auto; max-width:100%;\">\n";
    body += "<table>\n  <thead>\n    <tr>\n";
    for (const auto& h : headers) {
        body += "      <th>" + escapeHtml(h) + "</th>\n";
    }
    body += "    </tr>\n  </thead>\n  <tbody>\n";
    for (const auto& row : rows) {
        body += "    <tr>\n";
        for (size_t i = 0; i < headers.size(); ++i) {
            body += "      <td>" + escapeHtml(i < row.size() ? row[i] : "") + "</td>\n";
        }
        body += "    </tr>\n";
    }
    body += "  </tbody>\n</table>\n</div>\n\n";
}

std::string joinOrDash(const std::vector<std::string>& values) {
    if (values.empty()) return "-";
    std::string out;
    for (size_t i = 0; i < values.size(); ++i) {
        if (i > 0) out += ", ";
        out += values[i];
    }
    return out;
}
} // namespace

void ReportEngine::addTitle(const std::string& title) {
    body_ += "# " + title + "\n\n";
}

void ReportEngine::addParagraph(const std::string& text) {
    body_ += text + "\n\n";
}

void ReportEngine::addTable(const std::string& title, const std::vector<std::string>& headers, const std::vector<std::vector<std::string>>& rows) {
    body_ += "## " + title + "\n";
    if (headers.empty()) {
        body_ += "(no columns)\n\n";
        return;
    }

    const bool wideTable = headers.size() >= 10;
    const bool tallTable = rows.size() > kTallTableRowCap;

    if (wideTable) {
        body_ += "_Wide table rendered in a scrollable block for readability._\n\n";
    }
    if (tallTable) {
        body_ += "_Tall table preview shown (" + std::to_string(kTallTableRowCap) + " of " + std::to_string(rows.size()) + " rows)._\n\n";
    }

    const size_t previewCount = tallTable ? kTallTableRowCap : rows.size();
    const std::vector<std::vector<std::string>> previewRows(rows.begin(), rows.begin() + static_cast<long>(previewCount));

    if (wideTable) {
        appendWideHtmlTable(body_, headers, previewRows);
    } else {
        appendMarkdownTable(body_, headers, previewRows);
    }

    if (tallTable) {
        body_ += "<details>\n";
        body_ += "<summary>Show full table (" + std::to_string(rows.size()) + " rows)</summary>\n\n";
        if (wideTable) {
            appendWideHtmlTable(body_, headers, rows);
        } else {
            appendMarkdownTable(body_, headers, rows);
        }
        body_ += "</details>\n\n";
    }
}

void ReportEngine::save(const std::string& filePath) const {
    std::ofstream out(filePath);
    if (!out) throw Tabula::IOException("Could not open report file: " + filePath);
    out << body_;
    out.flush();
    if (!out.good()) throw Tabula::IOException("Failed while writing report file: " + filePath);
}

ReportEngine ReportEngine::buildProfileReport(const AnalysisResult& analysis, const PreprocessReport* preprocess) {
    ReportEngine report;
    report.addTitle("Data Profile");
    report.addParagraph("Rows: " + std::to_string(analysis.rowCount) +
                        "  \nColumns: " + std::to_string(analysis.columnCount) +
                        "  \nNumeric: " + joinOrDash(analysis.numericColumns) +
                        "  \nCategorical: " + joinOrDash(analysis.categoricalColumns) +
                        "  \nDate: " + joinOrDash(analysis.dateColumns));

    std::vector<std::vector<std::string>> columnRows;
    columnRows.reserve(analysis.columns.size());
    for (const auto& kv : analysis.columns) {
        const ColumnAnalysis& col = kv.second;
        std::vector<std::string> row = {
            kv.first,
            columnTypeName(col.type),
            std::to_string(col.missingCount) + " (" + CommonUtils::formatFixed(col.missingPercent, 1) + "%)",
            std::to_string(col.uniqueCount)
        };
        if (col.stats) {
            row.push_back(CommonUtils::formatFixed(col.stats->mean, 2));
            row.push_back(CommonUtils::formatFixed(col.stats->median, 2));
            row.push_back(CommonUtils::formatFixed(col.stats->stddev, 2));
            row.push_back(CommonUtils::formatFixed(col.stats->min, 2) + " / " + CommonUtils::formatFixed(col.stats->max, 2));
            row.push_back(std::to_string(col.stats->outlierCount));
        } else {
            row.insert(row.end(), {"-", "-", "-", "-", "-"});
        }
        columnRows.push_back(std::move(row));
    }
    report.addTable("Columns",
                    {"Column", "Type", "Missing", "Unique", "Mean", "Median", "Std", "Min / Max", "Outliers"},
                    columnRows);

    for (const auto& kv : analysis.columns) {
        if (!kv.second.topValues || kv.second.topValues->empty()) continue;
        std::vector<std::vector<std::string>> rows;
        for (const auto& tv : *kv.second.topValues) rows.push_back({tv.first, std::to_string(tv.second)});
        report.addTable("Top values: " + kv.first, {"Value", "Count"}, rows);
    }

    if (!analysis.correlations.empty()) {
        std::vector<std::vector<std::string>> rows;
        rows.reserve(analysis.correlations.size());
        for (const auto& c : analysis.correlations) {
            rows.push_back({c.columnA, c.columnB, CommonUtils::formatFixed(c.coefficient, 3)});
        }
        report.addTable("Correlations", {"Column A", "Column B", "r"}, rows);
    }

    std::vector<std::vector<std::string>> qualityRows;
    for (const auto& kv : analysis.infiniteValueStats) {
        qualityRows.push_back({kv.first, "Infinite values",
                               std::to_string(kv.second.count) + " (" + CommonUtils::formatFixed(kv.second.percentage, 1) + "%)"});
    }
    for (const auto& kv : analysis.duplicateStats) {
        std::string top;
        for (const auto& d : kv.second.topDuplicates) {
            if (!top.empty()) top += ", ";
            top += d.value + " x" + std::to_string(d.count);
        }
        qualityRows.push_back({kv.first, "Duplicate values",
                               std::to_string(kv.second.duplicateCount) + " (" +
                                   CommonUtils::formatFixed(kv.second.duplicatePercentage, 1) + "%): " + top});
    }
    if (qualityRows.empty()) {
        report.addParagraph("No infinite or duplicate values detected.");
    } else {
        report.addTable("Data Quality", {"Column", "Issue", "Detail"}, qualityRows);
    }

    if (preprocess != nullptr) {
        std::string steps = "Rows: " + std::to_string(preprocess->originalRowCount) + " -> " +
                            std::to_string(preprocess->finalRowCount) + "\n";
        for (const auto& step : preprocess->steps) steps += "\n- " + step;
        if (!preprocess->zeroVarianceColumns.empty()) {
            steps += "\n\nZero-variance columns left unscaled: " + joinOrDash(preprocess->zeroVarianceColumns);
        }
        report.body_ += "## Preprocessing\n";
        report.addParagraph(steps);
    }
    return report;
}
