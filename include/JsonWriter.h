#pragma once
#include "AnalysisEngine.h"
#include "Dataset.h"
#include <string>

namespace JsonWriter {

std::string escapeJsonString(const std::string& input);

/**
 * @brief Serializes an analysis for the summary layer.
 * @details Statistics are 2-decimal strings, correlation coefficients 3-decimal
 *          strings and percentages 1-decimal strings; an absent skewness is null.
 */
std::string analysisToJson(const AnalysisResult& analysis);

/**
 * @brief Serializes records as an array of objects; non-finite numbers become null.
 */
std::string datasetToJson(const Dataset& data);

}
