#include "TypeInference.h"
#include <regex>

const char* columnTypeName(ColumnType type) noexcept {
    switch (type) {
        case ColumnType::EMPTY: return "empty";
        case ColumnType::NUMERIC: return "numeric";
        case ColumnType::DATETIME: return "datetime";
        case ColumnType::CATEGORICAL: return "categorical";
        case ColumnType::TEXT: return "text";
    }
    return "text";
}

namespace TypeInference {

bool looksLikeDate(const Cell& value) {
    // First alternative is anchored, the second may appear anywhere.
    static const std::regex kDatePattern(R"(^\d{4}-\d{2}-\d{2}|\d{1,2}/\d{1,2}/\d{2,4})");
    switch (value.kind()) {
        case Cell::Kind::Null:
            return false;
        case Cell::Kind::Text:
            return std::regex_search(value.text(), kDatePattern);
        case Cell::Kind::Number:
        case Cell::Kind::Bool:
            return std::regex_search(value.displayString(), kDatePattern);
    }
    return false;
}

ColumnType inferType(const std::vector<Cell>& values, const ProfilingTuning& tuning) {
    std::vector<Cell> nonNull;
    nonNull.reserve(values.size());
    for (const Cell& v : values) {
        if (!v.isMissing()) nonNull.push_back(v);
    }
    if (nonNull.empty()) return ColumnType::EMPTY;

    const double n = static_cast<double>(nonNull.size());

    size_t numericCount = 0;
    for (const Cell& v : nonNull) {
        if (v.asFiniteNumber().has_value()) ++numericCount;
    }
    if (static_cast<double>(numericCount) / n > tuning.numericTypeRatio) return ColumnType::NUMERIC;

    size_t dateCount = 0;
    for (const Cell& v : nonNull) {
        if (looksLikeDate(v)) ++dateCount;
    }
    if (static_cast<double>(dateCount) / n > tuning.datetimeTypeRatio) return ColumnType::DATETIME;

    const double uniqueRatio = static_cast<double>(countDistinct(nonNull)) / n;
    if (uniqueRatio < tuning.categoricalUniqueRatio) return ColumnType::CATEGORICAL;

    return ColumnType::TEXT;
}

}
