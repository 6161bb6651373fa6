#pragma once
#include "AutoConfig.h"
#include "CorrelationEngine.h"
#include "Dataset.h"
#include "QualityDetectors.h"
#include "Statistics.h"
#include "TypeInference.h"
#include <optional>
#include <string>
#include <utility>
#include <vector>

struct ColumnAnalysis {
    ColumnType type = ColumnType::EMPTY;
    size_t missingCount = 0;
    double missingPercent = 0.0;
    size_t uniqueCount = 0;
    // Present iff type == NUMERIC.
    std::optional<NumericStats> stats;
    // Present iff type == CATEGORICAL and uniqueCount < topValuesMaxUnique.
    std::optional<std::vector<std::pair<std::string, size_t>>> topValues;
    // Present iff type == NUMERIC.
    std::optional<Histogram> histogram;
};

struct AnalysisResult {
    size_t rowCount = 0;
    size_t columnCount = 0;
    // Dataset column order.
    std::vector<std::pair<std::string, ColumnAnalysis>> columns;
    std::vector<Correlation> correlations;
    std::vector<std::string> numericColumns;
    std::vector<std::string> categoricalColumns;
    std::vector<std::string> dateColumns;
    std::vector<std::pair<std::string, InfiniteValueStat>> infiniteValueStats;
    bool hasInfiniteValues = false;
    std::vector<std::pair<std::string, DuplicateStat>> duplicateStats;

    /**
     * @brief Returns the named column analysis or nullptr when absent.
     */
    const ColumnAnalysis* findColumn(const std::string& name) const;

    /**
     * @brief Returns the named column analysis.
     * @throws Tabula::DatasetException when the column was not analyzed.
     */
    const ColumnAnalysis& column(const std::string& name) const;

    std::vector<std::string> columnsOfType(ColumnType type) const;
};

class AnalysisEngine {
public:
    /**
     * @brief Profiles every column of the dataset and correlates the numeric ones.
     * @details The column set is the key set of the first record; keys that only
     *          appear in later records are not analyzed.
     * @throws Tabula::EmptyDatasetException when the dataset has no records.
     */
    static AnalysisResult analyze(const Dataset& data);
    static AnalysisResult analyze(const Dataset& data, const AutoConfig& config);

    /**
     * @brief Type, missingness, uniqueness, statistics and top values of one column.
     * @pre values holds one cell per row (absent keys as Null).
     */
    static ColumnAnalysis analyzeColumn(const std::vector<Cell>& values, const ProfilingTuning& tuning = ProfilingTuning{});
};
