#pragma once
#include <cstddef>
#include <string>

struct ProfilingTuning {
    // Type inference: share of non-missing values that must parse as finite numbers (strictly greater).
    double numericTypeRatio = 0.8;
    // Type inference: share of non-missing values matching the date pattern (strictly greater).
    double datetimeTypeRatio = 0.7;
    // Type inference: distinct/non-missing ratio below which a column is categorical.
    double categoricalUniqueRatio = 0.5;

    // Categorical columns with fewer distinct values than this get a top-values table.
    size_t topValuesMaxUnique = 50;
    size_t topValuesLimit = 15;

    size_t topDuplicatesLimit = 5;
    size_t duplicateLabelMaxChars = 30;

    // Tukey fence multiplier for outlier counting and box-plot whiskers.
    double outlierIqrMultiplier = 1.5;

    size_t histogramBins = 25;
};

struct AutoConfig {
    bool handleInfinite = false;
    std::string missingValueMethod = "none";   // none|dropRows|dropColumns|fillMean|fillMedian|fillMode|fillZero
    std::string encodingMethod = "none";       // none|label|onehot
    std::string normalizationMethod = "none";  // none|minmax|standard

    bool verboseAnalysis = false;

    ProfilingTuning tuning;

    /**
     * @brief Loads config values from a lightweight YAML/JSON-like key:value file.
     * @pre configPath points to a readable text file.
     * @post Returns merged config using `base` as defaults.
     * @throws Tabula::IOException when the file cannot be opened.
     * @throws Tabula::ConfigurationException on unknown keys or invalid values.
     */
    static AutoConfig fromFile(const std::string& configPath, const AutoConfig& base);
    static AutoConfig fromFile(const std::string& configPath);

    /**
     * @brief Applies a single key/value pair, e.g. ("missing_value_method", "fillMean").
     * @throws Tabula::ConfigurationException on unknown keys or unparsable values.
     */
    void set(const std::string& key, const std::string& value);

    /**
     * @brief Validates thresholds and enum-like fields.
     * @throws Tabula::InvalidOptionException on unrecognized method names.
     * @throws Tabula::ConfigurationException on out-of-range values.
     */
    void validate() const;
};
