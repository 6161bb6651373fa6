#pragma once
#include <cstddef>
#include <optional>
#include <vector>

class MathUtils {
public:
    /**
     * @brief Arithmetic mean; 0 for empty input.
     */
    static double mean(const std::vector<double>& values);

    /**
     * @brief Population standard deviation (divides by n) around the given mean.
     * @post Returns 0 for empty input.
     */
    static double populationStddev(const std::vector<double>& values, double mean);

    /**
     * @brief Pearson's r from paired samples using the sum-of-products form.
     * @pre x.size() == y.size().
     * @post Returns 0 when the denominator is zero or not finite; nullopt for empty input.
     */
    static std::optional<double> calculatePearson(const std::vector<double>& x, const std::vector<double>& y);

    /**
     * @brief Element of a sorted vector at floor(size * q), clamped to the last element.
     * @pre sorted is non-empty and ascending; 0 <= q <= 1.
     */
    static double floorQuantileSorted(const std::vector<double>& sorted, double q);
};
