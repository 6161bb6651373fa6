#pragma once
#include "AutoConfig.h"
#include "Cell.h"
#include <string>
#include <vector>

enum class ColumnType { EMPTY, NUMERIC, DATETIME, CATEGORICAL, TEXT };

/**
 * @brief Lower-case name used in reports ("empty", "numeric", ...).
 */
const char* columnTypeName(ColumnType type) noexcept;

namespace TypeInference {

/**
 * @brief Classifies a column from its values; first matching rule wins.
 * @details Only non-missing values are scanned. Ratios are compared strictly,
 *          so a column that is exactly 80% numeric is not numeric.
 * @post Deterministic for a given value sequence and tuning.
 */
ColumnType inferType(const std::vector<Cell>& values, const ProfilingTuning& tuning = ProfilingTuning{});

/**
 * @brief True when the display string contains a YYYY-MM-DD prefix or a D/M/YY(YY) group.
 */
bool looksLikeDate(const Cell& value);

}
