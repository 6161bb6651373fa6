#include "QualityDetectors.h"
#include "CommonUtils.h"
#include <algorithm>

namespace QualityDetectors {

InfiniteValueStat countInfinite(const std::vector<Cell>& values) {
    InfiniteValueStat stat;
    stat.count = static_cast<size_t>(std::count_if(values.begin(), values.end(), [](const Cell& v) {
        return v.isInfinite();
    }));
    if (!values.empty()) {
        stat.percentage = static_cast<double>(stat.count) / static_cast<double>(values.size()) * 100.0;
    }
    return stat;
}

InfiniteValueReport detectInfiniteValues(const Dataset& data) {
    InfiniteValueReport report;
    for (const auto& col : data.columnNames()) {
        const InfiniteValueStat stat = countInfinite(data.columnValues(col));
        if (stat.count == 0) continue;
        report.hasInfiniteValues = true;
        report.columns.emplace_back(col, stat);
    }
    return report;
}

std::optional<DuplicateStat> duplicateStat(const std::vector<Cell>& values, const ProfilingTuning& tuning) {
    auto counts = countInFirstSeenOrder(values);
    size_t total = 0;
    for (const auto& kv : counts) total += kv.second;

    DuplicateStat stat;
    stat.totalValues = total;
    stat.uniqueValues = counts.size();
    stat.duplicateCount = total - counts.size();
    if (stat.duplicateCount == 0) return std::nullopt;
    stat.duplicatePercentage = static_cast<double>(stat.duplicateCount) / static_cast<double>(total) * 100.0;

    counts.erase(std::remove_if(counts.begin(), counts.end(), [](const auto& kv) { return kv.second < 2; }),
                 counts.end());
    std::stable_sort(counts.begin(), counts.end(), [](const auto& a, const auto& b) { return a.second > b.second; });
    if (counts.size() > tuning.topDuplicatesLimit) counts.resize(tuning.topDuplicatesLimit);

    stat.topDuplicates.reserve(counts.size());
    for (const auto& kv : counts) {
        stat.topDuplicates.push_back({CommonUtils::truncateLabel(kv.first.displayString(), tuning.duplicateLabelMaxChars),
                                      kv.second});
    }
    return stat;
}

std::vector<std::pair<std::string, DuplicateStat>> detectDuplicates(const Dataset& data, const ProfilingTuning& tuning) {
    std::vector<std::pair<std::string, DuplicateStat>> out;
    for (const auto& col : data.columnNames()) {
        if (auto stat = duplicateStat(data.columnValues(col), tuning)) {
            out.emplace_back(col, std::move(*stat));
        }
    }
    return out;
}

}
