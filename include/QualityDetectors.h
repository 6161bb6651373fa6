#pragma once
#include "AutoConfig.h"
#include "Dataset.h"
#include <optional>
#include <string>
#include <utility>
#include <vector>

struct InfiniteValueStat {
    size_t count = 0;
    double percentage = 0.0;
};

struct InfiniteValueReport {
    bool hasInfiniteValues = false;
    // Affected columns only, in dataset column order.
    std::vector<std::pair<std::string, InfiniteValueStat>> columns;
};

struct DuplicateValue {
    std::string value;   // display label, truncated
    size_t count = 0;
};

struct DuplicateStat {
    size_t duplicateCount = 0;
    double duplicatePercentage = 0.0;
    size_t totalValues = 0;
    size_t uniqueValues = 0;
    std::vector<DuplicateValue> topDuplicates;
};

namespace QualityDetectors {

/**
 * @brief Counts +/-infinity Number cells per column (NaN excluded).
 * @post percentage = count / rowCount * 100; only affected columns are listed.
 */
InfiniteValueReport detectInfiniteValues(const Dataset& data);
InfiniteValueStat countInfinite(const std::vector<Cell>& values);

/**
 * @brief Duplicate statistics over non-missing values of each column.
 * @post Only columns with at least one repeated value are listed.
 */
std::vector<std::pair<std::string, DuplicateStat>> detectDuplicates(const Dataset& data,
                                                                    const ProfilingTuning& tuning = ProfilingTuning{});
std::optional<DuplicateStat> duplicateStat(const std::vector<Cell>& values,
                                           const ProfilingTuning& tuning = ProfilingTuning{});

}
