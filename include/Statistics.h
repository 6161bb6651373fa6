#pragma once

#include "Cell.h"
#include <cstddef>
#include <optional>
#include <vector>

struct NumericStats {
    size_t count = 0;
    double mean = 0.0;
    double median = 0.0;
    double min = 0.0;
    double max = 0.0;
    double stddev = 0.0;
    double q1 = 0.0;
    double q3 = 0.0;
    double iqr = 0.0;
    size_t outlierCount = 0;
    // Absent for zero-variance columns.
    std::optional<double> skewness;
    // Box-plot whiskers, clamped to [min, max].
    double lowerWhisker = 0.0;
    double upperWhisker = 0.0;
};

struct Histogram {
    double min = 0.0;
    double max = 0.0;
    double binWidth = 0.0;
    std::vector<size_t> counts;
};

namespace Statistics {

/**
 * @brief Finite numeric readings of the cells, in input order.
 */
std::vector<double> finiteValues(const std::vector<Cell>& values);

/**
 * @brief Descriptive statistics over the finite numeric values of a column.
 * @details Population variance; median, q1 and q3 index the sorted values at
 *          floor(n/2), floor(n/4) and floor(3n/4) without interpolation.
 * @post Returns std::nullopt when no finite value exists.
 */
std::optional<NumericStats> computeStats(const std::vector<Cell>& values, double iqrMultiplier = 1.5);
std::optional<NumericStats> computeStats(std::vector<double> finite, double iqrMultiplier = 1.5);

/**
 * @brief Equal-width histogram of the finite values.
 * @pre bins > 0.
 * @post counts sums to the number of finite values; a zero-range column lands in bin 0.
 */
std::optional<Histogram> histogram(const std::vector<double>& finite, size_t bins = 25);

}
