#pragma once
#include "AnalysisEngine.h"
#include "AutoConfig.h"
#include "Dataset.h"
#include <string>
#include <utility>
#include <vector>

enum class MissingValueMethod { NONE, DROP_ROWS, DROP_COLUMNS, FILL_MEAN, FILL_MEDIAN, FILL_MODE, FILL_ZERO };
enum class EncodingMethod { NONE, LABEL, ONEHOT };
enum class NormalizationMethod { NONE, MINMAX, STANDARD };

/**
 * @brief Parses the option spellings used in configs and requests
 *        ("dropRows", "fillMean", "onehot", "minmax", ...).
 * @throws Tabula::InvalidOptionException on any other string.
 */
MissingValueMethod parseMissingValueMethod(const std::string& value);
EncodingMethod parseEncodingMethod(const std::string& value);
NormalizationMethod parseNormalizationMethod(const std::string& value);

const char* methodName(MissingValueMethod method) noexcept;
const char* methodName(EncodingMethod method) noexcept;
const char* methodName(NormalizationMethod method) noexcept;

struct PreprocessOptions {
    bool handleInfinite = false;
    MissingValueMethod missingValueMethod = MissingValueMethod::NONE;
    EncodingMethod encodingMethod = EncodingMethod::NONE;
    NormalizationMethod normalizationMethod = NormalizationMethod::NONE;
    bool verbose = false;

    /**
     * @brief Converts the string options of a config.
     * @throws Tabula::InvalidOptionException on an unrecognized method name.
     */
    static PreprocessOptions fromConfig(const AutoConfig& config);
};

struct ScalingParams {
    NormalizationMethod method = NormalizationMethod::NONE;
    double mean = 0.0;
    double stddev = 1.0;
    double min = 0.0;
    double max = 1.0;
};

struct PreprocessReport {
    size_t originalRowCount = 0;
    size_t finalRowCount = 0;
    std::vector<std::string> droppedColumns;
    std::vector<std::string> addedColumns;
    size_t infiniteReplaced = 0;
    // Cells filled per column, columns with at least one fill only.
    std::vector<std::pair<std::string, size_t>> filledCounts;
    std::vector<std::pair<std::string, ScalingParams>> scaling;
    // Numeric columns left unscaled because max == min or std == 0.
    std::vector<std::string> zeroVarianceColumns;
    // Human-readable log of the applied steps.
    std::vector<std::string> steps;
};

class Preprocessor {
public:
    /**
     * @brief Applies the selected operators in a fixed order: infinite sanitization,
     *        missing-value handling, categorical encoding, normalization.
     * @details Column roles come from the analysis snapshot taken before the call;
     *          the result is not re-analyzed.
     * @post The input dataset is left untouched.
     */
    static Dataset run(const Dataset& data,
                       const AnalysisResult& analysis,
                       const PreprocessOptions& options,
                       PreprocessReport* report = nullptr);

    // Replaces every non-finite Number cell (+/-inf and NaN) with Null.
    static Dataset sanitizeInfinite(const Dataset& data, PreprocessReport* report = nullptr);

    /**
     * @brief Drops or fills missing cells.
     * @param numericColumns columns used by fillMean / fillMedian.
     */
    static Dataset handleMissingValues(const Dataset& data,
                                       MissingValueMethod method,
                                       const std::vector<std::string>& numericColumns,
                                       PreprocessReport* report = nullptr);

    /**
     * @brief Label or one-hot encodes the given columns. Columns absent from the
     *        dataset are skipped.
     */
    static Dataset applyCategoricalEncoding(const Dataset& data,
                                            EncodingMethod method,
                                            const std::vector<std::string>& categoricalColumns,
                                            PreprocessReport* report = nullptr);

    /**
     * @brief Min-max or z-score scaling over finite values. Missing and non-finite
     *        cells pass through; zero-variance columns are left unchanged.
     */
    static Dataset applyNormalization(const Dataset& data,
                                      NormalizationMethod method,
                                      const std::vector<std::string>& numericColumns,
                                      PreprocessReport* report = nullptr);
};
