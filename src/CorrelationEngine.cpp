#include "CorrelationEngine.h"
#include "MathUtils.h"
#include <algorithm>
#include <cmath>
#include <optional>

std::vector<Correlation> CorrelationEngine::correlate(const Dataset& data, const std::vector<std::string>& numericColumns) {
    std::vector<Correlation> out;
    if (numericColumns.size() < 2) return out;

    // Parse each column once; pairs then only align the readings.
    std::vector<std::vector<std::optional<double>>> parsed(numericColumns.size());
    for (size_t c = 0; c < numericColumns.size(); ++c) {
        parsed[c].reserve(data.rowCount());
        for (const auto& record : data) parsed[c].push_back(record.get(numericColumns[c]).asFiniteNumber());
    }

    std::vector<double> x;
    std::vector<double> y;
    for (size_t i = 0; i < numericColumns.size(); ++i) {
        for (size_t j = i + 1; j < numericColumns.size(); ++j) {
            x.clear();
            y.clear();
            for (size_t r = 0; r < data.rowCount(); ++r) {
                const auto& a = parsed[i][r];
                const auto& b = parsed[j][r];
                if (!a || !b) continue;
                x.push_back(*a);
                y.push_back(*b);
            }
            const auto r = MathUtils::calculatePearson(x, y);
            if (!r) continue;
            out.push_back({numericColumns[i], numericColumns[j], *r});
        }
    }

    // Ranked on the unrounded |r|; only exact ties keep discovery order.
    std::stable_sort(out.begin(), out.end(), [](const Correlation& a, const Correlation& b) {
        return std::abs(a.coefficient) > std::abs(b.coefficient);
    });
    return out;
}
