#include "AnalysisEngine.h"
#include "CommonUtils.h"
#include "TabulaExceptions.h"
#include <algorithm>
#include <sstream>
#ifdef USE_OPENMP
#include <omp.h>
#endif

const ColumnAnalysis* AnalysisResult::findColumn(const std::string& name) const {
    for (const auto& kv : columns) {
        if (kv.first == name) return &kv.second;
    }
    return nullptr;
}

const ColumnAnalysis& AnalysisResult::column(const std::string& name) const {
    const ColumnAnalysis* found = findColumn(name);
    if (found == nullptr) throw Tabula::DatasetException("column not present in analysis: " + name);
    return *found;
}

std::vector<std::string> AnalysisResult::columnsOfType(ColumnType type) const {
    std::vector<std::string> out;
    for (const auto& kv : columns) {
        if (kv.second.type == type) out.push_back(kv.first);
    }
    return out;
}

ColumnAnalysis AnalysisEngine::analyzeColumn(const std::vector<Cell>& values, const ProfilingTuning& tuning) {
    ColumnAnalysis col;
    col.type = TypeInference::inferType(values, tuning);
    col.missingCount = static_cast<size_t>(std::count_if(values.begin(), values.end(), [](const Cell& v) {
        return v.isMissing();
    }));
    if (!values.empty()) {
        col.missingPercent = static_cast<double>(col.missingCount) / static_cast<double>(values.size()) * 100.0;
    }
    col.uniqueCount = countDistinct(values);

    if (col.type == ColumnType::NUMERIC) {
        const std::vector<double> finite = Statistics::finiteValues(values);
        col.histogram = Statistics::histogram(finite, tuning.histogramBins);
        col.stats = Statistics::computeStats(finite, tuning.outlierIqrMultiplier);
    } else if (col.type == ColumnType::CATEGORICAL && col.uniqueCount < tuning.topValuesMaxUnique) {
        auto counts = countInFirstSeenOrder(values);
        std::stable_sort(counts.begin(), counts.end(), [](const auto& a, const auto& b) { return a.second > b.second; });
        if (counts.size() > tuning.topValuesLimit) counts.resize(tuning.topValuesLimit);

        std::vector<std::pair<std::string, size_t>> top;
        top.reserve(counts.size());
        for (const auto& kv : counts) top.emplace_back(kv.first.displayString(), kv.second);
        col.topValues = std::move(top);
    }
    return col;
}

AnalysisResult AnalysisEngine::analyze(const Dataset& data) {
    return analyze(data, AutoConfig{});
}

AnalysisResult AnalysisEngine::analyze(const Dataset& data, const AutoConfig& config) {
    if (data.empty()) throw Tabula::EmptyDatasetException();

    const bool verbose = config.verboseAnalysis;
    const ProfilingTuning& tuning = config.tuning;
    const std::vector<std::string> names = data.columnNames();

    CommonUtils::logVerbose(verbose, "[Tabula][Analysis] Profiling " + std::to_string(names.size()) +
                                         " columns over " + std::to_string(data.rowCount()) + " rows...");

    std::vector<ColumnAnalysis> perColumn(names.size());
    std::vector<InfiniteValueStat> infinite(names.size());
    std::vector<std::optional<DuplicateStat>> duplicates(names.size());

    #ifdef USE_OPENMP
    #pragma omp parallel for schedule(dynamic)
    #endif
    for (size_t c = 0; c < names.size(); ++c) {
        const std::vector<Cell> values = data.columnValues(names[c]);
        perColumn[c] = analyzeColumn(values, tuning);
        infinite[c] = QualityDetectors::countInfinite(values);
        duplicates[c] = QualityDetectors::duplicateStat(values, tuning);
    }

    AnalysisResult result;
    result.rowCount = data.rowCount();
    result.columnCount = names.size();
    result.columns.reserve(names.size());
    for (size_t c = 0; c < names.size(); ++c) {
        const ColumnAnalysis& col = perColumn[c];
        if (verbose) {
            std::ostringstream line;
            line << "[Tabula][Analysis] " << names[c] << ": " << columnTypeName(col.type)
                 << ", missing " << CommonUtils::formatFixed(col.missingPercent, 1) << "%"
                 << ", unique " << col.uniqueCount;
            if (col.stats && !col.stats->skewness) line << " (zero variance)";
            CommonUtils::logVerbose(true, line.str());
        }

        switch (col.type) {
            case ColumnType::NUMERIC: result.numericColumns.push_back(names[c]); break;
            case ColumnType::CATEGORICAL: result.categoricalColumns.push_back(names[c]); break;
            case ColumnType::DATETIME: result.dateColumns.push_back(names[c]); break;
            case ColumnType::EMPTY:
            case ColumnType::TEXT: break;
        }
        if (infinite[c].count > 0) {
            result.hasInfiniteValues = true;
            result.infiniteValueStats.emplace_back(names[c], infinite[c]);
        }
        if (duplicates[c]) result.duplicateStats.emplace_back(names[c], std::move(*duplicates[c]));
        result.columns.emplace_back(names[c], std::move(perColumn[c]));
    }

    result.correlations = CorrelationEngine::correlate(data, result.numericColumns);
    CommonUtils::logVerbose(verbose, "[Tabula][Analysis] " + std::to_string(result.numericColumns.size()) +
                                         " numeric columns, " + std::to_string(result.correlations.size()) +
                                         " correlations computed.");
    return result;
}
