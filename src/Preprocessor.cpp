#include "Preprocessor.h"
#include "CommonUtils.h"
#include "MathUtils.h"
#include "Statistics.h"
#include "TabulaExceptions.h"
#include <algorithm>
#include <cmath>
#include <optional>
#include <unordered_map>

namespace {

// Per-column parameters keyed by column name, in first-listed order.
// Duplicate names are ignored so each column is rewritten at most once.
template <typename T>
struct ColumnPlan {
    std::vector<std::string> columns;
    std::vector<T> params;
    std::unordered_map<std::string, size_t> slots;

    bool contains(const std::string& column) const { return slots.count(column) != 0; }
    void add(const std::string& column, T value) {
        if (!slots.emplace(column, columns.size()).second) return;
        columns.push_back(column);
        params.push_back(std::move(value));
    }
    bool empty() const { return columns.empty(); }
};

// Keeps report->filledCounts in first-filled order with O(1) lookups.
class FillCounter {
public:
    void bump(const std::string& column, size_t n = 1) {
        if (n == 0) return;
        const auto it = index_.find(column);
        if (it != index_.end()) {
            counts_[it->second].second += n;
            return;
        }
        index_.emplace(column, counts_.size());
        counts_.emplace_back(column, n);
    }

    void flush(PreprocessReport* report) const {
        if (report == nullptr) return;
        for (const auto& kv : counts_) {
            auto existing = std::find_if(report->filledCounts.begin(), report->filledCounts.end(),
                                         [&](const auto& e) { return e.first == kv.first; });
            if (existing != report->filledCounts.end()) {
                existing->second += kv.second;
            } else {
                report->filledCounts.push_back(kv);
            }
        }
    }

private:
    std::unordered_map<std::string, size_t> index_;
    std::vector<std::pair<std::string, size_t>> counts_;
};

/**
 * @brief Single row pass that rewrites the planned columns of every record.
 * @details rewrite(slot, cell) returns the replacement cell or nullopt to keep
 *          the value. A planned column absent from a record is offered as Null
 *          and, when replaced, appended in plan order.
 */
template <typename T, typename Rewrite>
Dataset rewriteColumns(const Dataset& data, const ColumnPlan<T>& plan, Rewrite rewrite) {
    if (plan.empty()) return data;

    const Cell absent;
    std::vector<char> seen(plan.columns.size(), 0);
    Dataset out;
    out.reserve(data.rowCount());
    for (const auto& record : data) {
        Record r = record;
        std::fill(seen.begin(), seen.end(), 0);
        const auto& fields = record.fields();
        for (size_t f = 0; f < fields.size(); ++f) {
            const auto it = plan.slots.find(fields[f].first);
            if (it == plan.slots.end()) continue;
            seen[it->second] = 1;
            if (auto replacement = rewrite(it->second, fields[f].second)) r.setValue(f, std::move(*replacement));
        }
        for (size_t slot = 0; slot < plan.columns.size(); ++slot) {
            if (seen[slot]) continue;
            if (auto replacement = rewrite(slot, absent)) r.append(plan.columns[slot], std::move(*replacement));
        }
        out.addRecord(std::move(r));
    }
    return out;
}

std::unordered_map<std::string, size_t> slotsOf(const std::vector<std::string>& columns) {
    std::unordered_map<std::string, size_t> slots;
    slots.reserve(columns.size());
    for (size_t i = 0; i < columns.size(); ++i) slots.emplace(columns[i], i);
    return slots;
}

Dataset dropRowsWithMissing(const Dataset& data) {
    const std::vector<std::string> columns = data.columnNames();
    const auto slots = slotsOf(columns);
    Dataset out;
    out.reserve(data.rowCount());
    for (const auto& record : data) {
        size_t present = 0;
        bool complete = true;
        for (const auto& field : record.fields()) {
            if (slots.count(field.first) == 0) continue;
            ++present;
            if (field.second.isMissing()) {
                complete = false;
                break;
            }
        }
        // An absent first-record key reads as Null.
        if (complete && present == columns.size()) out.addRecord(record);
    }
    return out;
}

Dataset dropColumnsWithMissing(const Dataset& data, PreprocessReport* report) {
    const std::vector<std::string> columns = data.columnNames();
    const auto slots = slotsOf(columns);
    std::vector<size_t> presentCount(columns.size(), 0);
    std::vector<char> hasMissing(columns.size(), 0);
    for (const auto& record : data) {
        for (const auto& field : record.fields()) {
            const auto it = slots.find(field.first);
            if (it == slots.end()) continue;
            ++presentCount[it->second];
            if (field.second.isMissing()) hasMissing[it->second] = 1;
        }
    }

    std::vector<char> keep(columns.size(), 0);
    size_t kept = 0;
    for (size_t i = 0; i < columns.size(); ++i) {
        keep[i] = !hasMissing[i] && presentCount[i] == data.rowCount();
        if (keep[i]) {
            ++kept;
        } else if (report != nullptr) {
            report->droppedColumns.push_back(columns[i]);
        }
    }

    Dataset out;
    out.reserve(data.rowCount());
    for (const auto& record : data) {
        // Kept columns are present in every record; emit them in first-record order.
        std::vector<const Cell*> row(columns.size(), nullptr);
        for (const auto& field : record.fields()) {
            const auto it = slots.find(field.first);
            if (it != slots.end()) row[it->second] = &field.second;
        }
        Record r;
        r.reserve(kept);
        for (size_t i = 0; i < columns.size(); ++i) {
            if (keep[i]) r.append(columns[i], *row[i]);
        }
        out.addRecord(std::move(r));
    }
    return out;
}

// Fills missing cells of each planned column with its precomputed value.
Dataset fillPlanned(const Dataset& data, const ColumnPlan<Cell>& plan, PreprocessReport* report) {
    std::vector<size_t> filled(plan.columns.size(), 0);
    Dataset out = rewriteColumns(data, plan, [&](size_t slot, const Cell& value) -> std::optional<Cell> {
        if (!value.isMissing()) return std::nullopt;
        ++filled[slot];
        return plan.params[slot];
    });
    FillCounter counter;
    for (size_t i = 0; i < plan.columns.size(); ++i) counter.bump(plan.columns[i], filled[i]);
    counter.flush(report);
    return out;
}

Dataset fillNumeric(const Dataset& data,
                    const std::vector<std::string>& numericColumns,
                    bool useMedian,
                    PreprocessReport* report) {
    ColumnPlan<Cell> plan;
    for (const auto& column : numericColumns) {
        if (plan.contains(column) || data.findColumnIndex(column) < 0) continue;
        std::vector<double> finite = Statistics::finiteValues(data.columnValues(column));
        if (finite.empty()) continue;

        double fill = 0.0;
        if (useMedian) {
            std::sort(finite.begin(), finite.end());
            fill = finite[finite.size() / 2];
        } else {
            fill = MathUtils::mean(finite);
        }
        plan.add(column, Cell(fill));
    }
    return fillPlanned(data, plan, report);
}

Dataset fillMode(const Dataset& data, PreprocessReport* report) {
    ColumnPlan<Cell> plan;
    for (const auto& column : data.columnNames()) {
        const auto counts = countInFirstSeenOrder(data.columnValues(column));
        if (counts.empty()) continue;
        auto best = counts.begin();
        for (auto it = counts.begin(); it != counts.end(); ++it) {
            if (it->second > best->second) best = it;
        }
        plan.add(column, best->first);
    }
    return fillPlanned(data, plan, report);
}

Dataset fillZero(const Dataset& data, PreprocessReport* report) {
    const std::vector<std::string> columns = data.columnNames();
    const auto slots = slotsOf(columns);
    std::vector<char> seen(columns.size(), 0);
    FillCounter counter;

    Dataset out;
    out.reserve(data.rowCount());
    for (const auto& record : data) {
        Record r = record;
        std::fill(seen.begin(), seen.end(), 0);
        const auto& fields = record.fields();
        for (size_t f = 0; f < fields.size(); ++f) {
            const auto it = slots.find(fields[f].first);
            if (it != slots.end()) seen[it->second] = 1;
            if (!fields[f].second.isMissing()) continue;
            r.setValue(f, Cell(0.0));
            counter.bump(fields[f].first);
        }
        for (size_t i = 0; i < columns.size(); ++i) {
            if (seen[i]) continue;
            r.append(columns[i], Cell(0.0));
            counter.bump(columns[i]);
        }
        out.addRecord(std::move(r));
    }
    counter.flush(report);
    return out;
}

using CodeMap = std::unordered_map<Cell, size_t, CellHash>;

Dataset labelEncode(const Dataset& data, const std::vector<std::string>& categoricalColumns) {
    ColumnPlan<CodeMap> plan;
    for (const auto& column : categoricalColumns) {
        if (plan.contains(column) || data.findColumnIndex(column) < 0) continue;
        CodeMap codes;
        const auto counts = countInFirstSeenOrder(data.columnValues(column));
        for (size_t i = 0; i < counts.size(); ++i) codes.emplace(counts[i].first, i);
        plan.add(column, std::move(codes));
    }
    return rewriteColumns(data, plan, [&](size_t slot, const Cell& value) -> std::optional<Cell> {
        if (value.isMissing()) return Cell();
        return Cell(static_cast<double>(plan.params[slot].at(value)));
    });
}

struct OneHotColumn {
    CodeMap index;
    std::vector<std::string> names;
};

// One column at a time; only used when generated names collide with existing ones.
Dataset oneHotEncodeColumn(const Dataset& data, const std::string& column, PreprocessReport* report) {
    std::vector<Cell> categories;
    std::vector<std::string> names;
    for (const auto& kv : countInFirstSeenOrder(data.columnValues(column))) {
        categories.push_back(kv.first);
        names.push_back(column + "_" + kv.first.displayString());
    }

    Dataset out;
    out.reserve(data.rowCount());
    for (const auto& record : data) {
        Record r = record;
        r.erase(column);
        r.reserve(r.size() + categories.size());
        const Cell& value = record.get(column);
        for (size_t i = 0; i < categories.size(); ++i) {
            r.set(names[i], Cell(value == categories[i] ? 1 : 0));
        }
        out.addRecord(std::move(r));
    }

    if (report != nullptr) {
        report->droppedColumns.push_back(column);
        report->addedColumns.insert(report->addedColumns.end(), names.begin(), names.end());
    }
    return out;
}

Dataset oneHotEncode(const Dataset& data, const std::vector<std::string>& categoricalColumns, PreprocessReport* report) {
    ColumnPlan<OneHotColumn> plan;
    for (const auto& column : categoricalColumns) {
        if (plan.contains(column) || data.findColumnIndex(column) < 0) continue;
        OneHotColumn encoded;
        for (const auto& kv : countInFirstSeenOrder(data.columnValues(column))) {
            encoded.index.emplace(kv.first, encoded.names.size());
            encoded.names.push_back(column + "_" + kv.first.displayString());
        }
        plan.add(column, std::move(encoded));
    }
    if (plan.empty()) return data;

    std::unordered_map<std::string, char> generated;
    bool collides = false;
    for (const auto& encoded : plan.params) {
        for (const auto& name : encoded.names) collides |= !generated.emplace(name, 1).second;
    }
    for (const auto& column : data.columnNames()) collides |= generated.count(column) != 0;
    if (collides) {
        Dataset current = data;
        for (const auto& column : plan.columns) current = oneHotEncodeColumn(current, column, report);
        return current;
    }

    size_t added = 0;
    for (const auto& encoded : plan.params) added += encoded.names.size();

    const Cell absent;
    std::vector<const Cell*> values(plan.columns.size(), nullptr);
    Dataset out;
    out.reserve(data.rowCount());
    for (const auto& record : data) {
        std::fill(values.begin(), values.end(), &absent);
        bool rowCollides = false;
        Record r;
        r.reserve(record.size() + added);
        for (const auto& field : record.fields()) {
            const auto it = plan.slots.find(field.first);
            if (it != plan.slots.end()) {
                values[it->second] = &field.second;
                continue;
            }
            rowCollides |= generated.count(field.first) != 0;
            r.append(field.first, field.second);
        }
        for (size_t slot = 0; slot < plan.columns.size(); ++slot) {
            const OneHotColumn& encoded = plan.params[slot];
            const auto hit = encoded.index.find(*values[slot]);
            const size_t hot = (hit == encoded.index.end()) ? encoded.names.size() : hit->second;
            for (size_t i = 0; i < encoded.names.size(); ++i) {
                Cell flag(i == hot ? 1 : 0);
                if (rowCollides) {
                    r.set(encoded.names[i], std::move(flag));
                } else {
                    r.append(encoded.names[i], std::move(flag));
                }
            }
        }
        out.addRecord(std::move(r));
    }

    if (report != nullptr) {
        for (size_t slot = 0; slot < plan.columns.size(); ++slot) {
            report->droppedColumns.push_back(plan.columns[slot]);
            const auto& names = plan.params[slot].names;
            report->addedColumns.insert(report->addedColumns.end(), names.begin(), names.end());
        }
    }
    return out;
}

} // namespace

MissingValueMethod parseMissingValueMethod(const std::string& value) {
    static const std::unordered_map<std::string, MissingValueMethod> methods = {
        {"none", MissingValueMethod::NONE},
        {"dropRows", MissingValueMethod::DROP_ROWS},
        {"dropColumns", MissingValueMethod::DROP_COLUMNS},
        {"fillMean", MissingValueMethod::FILL_MEAN},
        {"fillMedian", MissingValueMethod::FILL_MEDIAN},
        {"fillMode", MissingValueMethod::FILL_MODE},
        {"fillZero", MissingValueMethod::FILL_ZERO}
    };
    const auto it = methods.find(value);
    if (it == methods.end()) throw Tabula::InvalidOptionException("missing_value_method", value);
    return it->second;
}

EncodingMethod parseEncodingMethod(const std::string& value) {
    if (value == "none") return EncodingMethod::NONE;
    if (value == "label") return EncodingMethod::LABEL;
    if (value == "onehot") return EncodingMethod::ONEHOT;
    throw Tabula::InvalidOptionException("encoding_method", value);
}

NormalizationMethod parseNormalizationMethod(const std::string& value) {
    if (value == "none") return NormalizationMethod::NONE;
    if (value == "minmax") return NormalizationMethod::MINMAX;
    if (value == "standard") return NormalizationMethod::STANDARD;
    throw Tabula::InvalidOptionException("normalization_method", value);
}

const char* methodName(MissingValueMethod method) noexcept {
    switch (method) {
        case MissingValueMethod::NONE: return "none";
        case MissingValueMethod::DROP_ROWS: return "dropRows";
        case MissingValueMethod::DROP_COLUMNS: return "dropColumns";
        case MissingValueMethod::FILL_MEAN: return "fillMean";
        case MissingValueMethod::FILL_MEDIAN: return "fillMedian";
        case MissingValueMethod::FILL_MODE: return "fillMode";
        case MissingValueMethod::FILL_ZERO: return "fillZero";
    }
    return "none";
}

const char* methodName(EncodingMethod method) noexcept {
    switch (method) {
        case EncodingMethod::NONE: return "none";
        case EncodingMethod::LABEL: return "label";
        case EncodingMethod::ONEHOT: return "onehot";
    }
    return "none";
}

const char* methodName(NormalizationMethod method) noexcept {
    switch (method) {
        case NormalizationMethod::NONE: return "none";
        case NormalizationMethod::MINMAX: return "minmax";
        case NormalizationMethod::STANDARD: return "standard";
    }
    return "none";
}

PreprocessOptions PreprocessOptions::fromConfig(const AutoConfig& config) {
    PreprocessOptions options;
    options.handleInfinite = config.handleInfinite;
    options.missingValueMethod = parseMissingValueMethod(config.missingValueMethod);
    options.encodingMethod = parseEncodingMethod(config.encodingMethod);
    options.normalizationMethod = parseNormalizationMethod(config.normalizationMethod);
    options.verbose = config.verboseAnalysis;
    return options;
}

Dataset Preprocessor::sanitizeInfinite(const Dataset& data, PreprocessReport* report) {
    size_t replaced = 0;
    Dataset out;
    out.reserve(data.rowCount());
    for (const auto& record : data) {
        Record r;
        r.reserve(record.size());
        for (const auto& field : record.fields()) {
            if (field.second.isNumber() && !std::isfinite(field.second.number())) {
                r.append(field.first, Cell());
                ++replaced;
            } else {
                r.append(field.first, field.second);
            }
        }
        out.addRecord(std::move(r));
    }
    if (report != nullptr) report->infiniteReplaced += replaced;
    return out;
}

Dataset Preprocessor::handleMissingValues(const Dataset& data,
                                          MissingValueMethod method,
                                          const std::vector<std::string>& numericColumns,
                                          PreprocessReport* report) {
    switch (method) {
        case MissingValueMethod::NONE: return data;
        case MissingValueMethod::DROP_ROWS: return dropRowsWithMissing(data);
        case MissingValueMethod::DROP_COLUMNS: return dropColumnsWithMissing(data, report);
        case MissingValueMethod::FILL_MEAN: return fillNumeric(data, numericColumns, false, report);
        case MissingValueMethod::FILL_MEDIAN: return fillNumeric(data, numericColumns, true, report);
        case MissingValueMethod::FILL_MODE: return fillMode(data, report);
        case MissingValueMethod::FILL_ZERO: return fillZero(data, report);
    }
    return data;
}

Dataset Preprocessor::applyCategoricalEncoding(const Dataset& data,
                                               EncodingMethod method,
                                               const std::vector<std::string>& categoricalColumns,
                                               PreprocessReport* report) {
    if (method == EncodingMethod::NONE) return data;
    return (method == EncodingMethod::LABEL) ? labelEncode(data, categoricalColumns)
                                             : oneHotEncode(data, categoricalColumns, report);
}

Dataset Preprocessor::applyNormalization(const Dataset& data,
                                         NormalizationMethod method,
                                         const std::vector<std::string>& numericColumns,
                                         PreprocessReport* report) {
    if (method == NormalizationMethod::NONE) return data;

    ColumnPlan<ScalingParams> plan;
    for (const auto& column : numericColumns) {
        if (plan.contains(column) || data.findColumnIndex(column) < 0) continue;
        const std::vector<double> finite = Statistics::finiteValues(data.columnValues(column));
        if (finite.empty()) continue;

        ScalingParams params;
        params.method = method;
        const auto mm = std::minmax_element(finite.begin(), finite.end());
        params.min = *mm.first;
        params.max = *mm.second;
        params.mean = MathUtils::mean(finite);
        params.stddev = MathUtils::populationStddev(finite, params.mean);

        const double divisor = (method == NormalizationMethod::MINMAX) ? (params.max - params.min) : params.stddev;
        if (!(divisor > 0.0)) {
            if (report != nullptr) report->zeroVarianceColumns.push_back(column);
            continue;
        }
        plan.add(column, params);
        if (report != nullptr) report->scaling.emplace_back(column, params);
    }

    return rewriteColumns(data, plan, [&](size_t slot, const Cell& value) -> std::optional<Cell> {
        const auto x = value.asFiniteNumber();
        if (!x) return std::nullopt;
        const ScalingParams& p = plan.params[slot];
        if (p.method == NormalizationMethod::MINMAX) return Cell((*x - p.min) / (p.max - p.min));
        return Cell((*x - p.mean) / p.stddev);
    });
}

Dataset Preprocessor::run(const Dataset& data,
                          const AnalysisResult& analysis,
                          const PreprocessOptions& options,
                          PreprocessReport* report) {
    PreprocessReport local;
    local.originalRowCount = data.rowCount();
    const bool verbose = options.verbose;

    Dataset current = data;
    if (options.handleInfinite) {
        current = sanitizeInfinite(current, &local);
        local.steps.push_back("Replaced infinite values with NaN");
        CommonUtils::logVerbose(verbose, "[Tabula][Preprocess] Replaced " + std::to_string(local.infiniteReplaced) +
                                             " non-finite cells with null.");
    }

    if (options.missingValueMethod != MissingValueMethod::NONE) {
        const size_t before = current.rowCount();
        current = handleMissingValues(current, options.missingValueMethod, analysis.numericColumns, &local);
        switch (options.missingValueMethod) {
            case MissingValueMethod::DROP_ROWS: local.steps.push_back("Dropped rows with missing values"); break;
            case MissingValueMethod::DROP_COLUMNS: local.steps.push_back("Dropped columns with missing values"); break;
            case MissingValueMethod::FILL_MEAN: local.steps.push_back("Filled missing values with mean"); break;
            case MissingValueMethod::FILL_MEDIAN: local.steps.push_back("Filled missing values with median"); break;
            case MissingValueMethod::FILL_MODE: local.steps.push_back("Filled missing values with mode"); break;
            case MissingValueMethod::FILL_ZERO: local.steps.push_back("Filled missing values with zero"); break;
            case MissingValueMethod::NONE: break;
        }
        CommonUtils::logVerbose(verbose, std::string("[Tabula][Preprocess] Missing values (") +
                                             methodName(options.missingValueMethod) + "): rows " +
                                             std::to_string(before) + " -> " + std::to_string(current.rowCount()));
    }

    if (options.encodingMethod != EncodingMethod::NONE) {
        current = applyCategoricalEncoding(current, options.encodingMethod, analysis.categoricalColumns, &local);
        const std::string count = std::to_string(analysis.categoricalColumns.size());
        local.steps.push_back(options.encodingMethod == EncodingMethod::LABEL
                                  ? "Applied Label Encoding to " + count + " categorical columns"
                                  : "Applied One-Hot Encoding to " + count + " categorical columns");
        CommonUtils::logVerbose(verbose, std::string("[Tabula][Preprocess] Encoded ") + count +
                                             " categorical columns (" + methodName(options.encodingMethod) + ")");
    }

    if (options.normalizationMethod != NormalizationMethod::NONE) {
        current = applyNormalization(current, options.normalizationMethod, analysis.numericColumns, &local);
        const std::string count = std::to_string(analysis.numericColumns.size());
        local.steps.push_back(options.normalizationMethod == NormalizationMethod::MINMAX
                                  ? "Normalized " + count + " numeric columns using Min-Max Scaling (0-1 range)"
                                  : "Normalized " + count + " numeric columns using Standard Scaling (mean=0, std=1)");
        if (verbose) {
            for (const auto& column : local.zeroVarianceColumns) {
                CommonUtils::logWarning("Preprocess", "Column '" + column + "' has zero variance; left unscaled.");
            }
        }
    }

    local.finalRowCount = current.rowCount();
    CommonUtils::logVerbose(verbose, "[Tabula][Preprocess] Done: " + std::to_string(local.steps.size()) +
                                         " steps, " + std::to_string(local.finalRowCount) + " rows.");
    if (report != nullptr) *report = std::move(local);
    return current;
}
