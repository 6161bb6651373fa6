#pragma once
#include "Dataset.h"
#include <string>
#include <vector>

struct Correlation {
    std::string columnA;
    std::string columnB;
    double coefficient = 0.0;
};

class CorrelationEngine {
public:
    /**
     * @brief Pearson correlation for every unordered pair of the given numeric columns.
     * @details Each pair uses only rows where both cells are finite numbers; exclusion
     *          is per pair, not dataset-wide. Pairs without a usable row are omitted.
     * @post Sorted by descending |coefficient|; ties keep column-index discovery order.
     */
    static std::vector<Correlation> correlate(const Dataset& data, const std::vector<std::string>& numericColumns);
};
