#include "Statistics.h"
#include "MathUtils.h"

#include <algorithm>
#include <cmath>

namespace Statistics {

std::vector<double> finiteValues(const std::vector<Cell>& values) {
    std::vector<double> out;
    out.reserve(values.size());
    for (const Cell& v : values) {
        if (auto num = v.asFiniteNumber()) out.push_back(*num);
    }
    return out;
}

std::optional<NumericStats> computeStats(const std::vector<Cell>& values, double iqrMultiplier) {
    return computeStats(finiteValues(values), iqrMultiplier);
}

std::optional<NumericStats> computeStats(std::vector<double> finite, double iqrMultiplier) {
    if (finite.empty()) return std::nullopt;

    NumericStats stats;
    const size_t n = finite.size();
    stats.count = n;
    stats.mean = MathUtils::mean(finite);
    stats.stddev = MathUtils::populationStddev(finite, stats.mean);

    if (stats.stddev > 0.0) {
        double m3 = 0.0;
        for (double v : finite) {
            const double z = (v - stats.mean) / stats.stddev;
            m3 += z * z * z;
        }
        stats.skewness = m3 / static_cast<double>(n);
    }

    std::sort(finite.begin(), finite.end());
    stats.min = finite.front();
    stats.max = finite.back();
    stats.median = finite[n / 2];
    stats.q1 = MathUtils::floorQuantileSorted(finite, 0.25);
    stats.q3 = MathUtils::floorQuantileSorted(finite, 0.75);
    stats.iqr = stats.q3 - stats.q1;

    const double lo = stats.q1 - iqrMultiplier * stats.iqr;
    const double hi = stats.q3 + iqrMultiplier * stats.iqr;
    stats.outlierCount = static_cast<size_t>(std::count_if(finite.begin(), finite.end(), [&](double v) {
        return v < lo || v > hi;
    }));
    stats.lowerWhisker = std::max(stats.min, lo);
    stats.upperWhisker = std::min(stats.max, hi);

    return stats;
}

std::optional<Histogram> histogram(const std::vector<double>& finite, size_t bins) {
    if (finite.empty() || bins == 0) return std::nullopt;

    Histogram h;
    auto mm = std::minmax_element(finite.begin(), finite.end());
    h.min = *mm.first;
    h.max = *mm.second;
    h.binWidth = (h.max - h.min) / static_cast<double>(bins);
    h.counts.assign(bins, 0);

    for (double v : finite) {
        size_t idx = 0;
        if (h.binWidth > 0.0) {
            const double pos = std::floor((v - h.min) / h.binWidth);
            idx = pos <= 0.0 ? 0 : static_cast<size_t>(pos);
            if (idx >= bins) idx = bins - 1;
        }
        ++h.counts[idx];
    }
    return h;
}

}
