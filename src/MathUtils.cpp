#include "MathUtils.h"
#include <algorithm>
#include <cmath>
#include <numeric>

double MathUtils::mean(const std::vector<double>& values) {
    if (values.empty()) return 0.0;
    const double sum = std::accumulate(values.begin(), values.end(), 0.0);
    return sum / static_cast<double>(values.size());
}

double MathUtils::populationStddev(const std::vector<double>& values, double mean) {
    if (values.empty()) return 0.0;
    double sumSq = 0.0;
    for (double v : values) {
        const double d = v - mean;
        sumSq += d * d;
    }
    return std::sqrt(sumSq / static_cast<double>(values.size()));
}

std::optional<double> MathUtils::calculatePearson(const std::vector<double>& x, const std::vector<double>& y) {
    const size_t n = std::min(x.size(), y.size());
    if (n == 0) return std::nullopt;

    double sumX = 0.0;
    double sumY = 0.0;
    double sumXSq = 0.0;
    double sumYSq = 0.0;
    double sumXY = 0.0;
    for (size_t i = 0; i < n; ++i) {
        sumX += x[i];
        sumY += y[i];
        sumXSq += x[i] * x[i];
        sumYSq += y[i] * y[i];
        sumXY += x[i] * y[i];
    }

    const double dn = static_cast<double>(n);
    const double num = sumXY - (sumX * sumY) / dn;
    const double den = std::sqrt((sumXSq - (sumX * sumX) / dn) * (sumYSq - (sumY * sumY) / dn));
    if (den == 0.0 || !std::isfinite(den)) return 0.0;
    return std::clamp(num / den, -1.0, 1.0);
}

double MathUtils::floorQuantileSorted(const std::vector<double>& sorted, double q) {
    size_t idx = static_cast<size_t>(std::floor(static_cast<double>(sorted.size()) * q));
    if (idx >= sorted.size()) idx = sorted.size() - 1;
    return sorted[idx];
}
