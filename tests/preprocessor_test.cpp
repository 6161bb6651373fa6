#include <gtest/gtest.h>
#include "MathUtils.h"
#include "Preprocessor.h"
#include "Statistics.h"
#include "TabulaExceptions.h"

#include <cmath>
#include <limits>

namespace {
const double kInf = std::numeric_limits<double>::infinity();

std::vector<std::string> keysOf(const Record& r) {
    std::vector<std::string> keys;
    for (const auto& f : r.fields()) keys.push_back(f.first);
    return keys;
}
}

TEST(PreprocessOptionsTest, ParsesKnownMethods) {
    EXPECT_EQ(parseMissingValueMethod("fillMedian"), MissingValueMethod::FILL_MEDIAN);
    EXPECT_EQ(parseEncodingMethod("onehot"), EncodingMethod::ONEHOT);
    EXPECT_EQ(parseNormalizationMethod("standard"), NormalizationMethod::STANDARD);
    EXPECT_STREQ(methodName(MissingValueMethod::DROP_COLUMNS), "dropColumns");
}

TEST(PreprocessOptionsTest, RejectsUnknownMethods) {
    EXPECT_THROW(parseMissingValueMethod("fillAverage"), Tabula::InvalidOptionException);
    EXPECT_THROW(parseEncodingMethod("OneHot"), Tabula::InvalidOptionException);
    EXPECT_THROW(parseNormalizationMethod(""), Tabula::InvalidOptionException);

    AutoConfig config;
    config.encodingMethod = "binary";
    try {
        PreprocessOptions::fromConfig(config);
        FAIL() << "expected InvalidOptionException";
    } catch (const Tabula::InvalidOptionException& ex) {
        EXPECT_EQ(ex.option(), "encoding_method");
        EXPECT_EQ(ex.value(), "binary");
    }
}

TEST(PreprocessOptionsTest, FromConfig) {
    AutoConfig config;
    config.handleInfinite = true;
    config.missingValueMethod = "dropRows";
    config.normalizationMethod = "minmax";
    const PreprocessOptions options = PreprocessOptions::fromConfig(config);
    EXPECT_TRUE(options.handleInfinite);
    EXPECT_EQ(options.missingValueMethod, MissingValueMethod::DROP_ROWS);
    EXPECT_EQ(options.encodingMethod, EncodingMethod::NONE);
    EXPECT_EQ(options.normalizationMethod, NormalizationMethod::MINMAX);
}

TEST(PreprocessorTest, SanitizeInfinite) {
    const Dataset data{
        Record{{"v", kInf}, {"t", "Infinity"}},
        Record{{"v", 1}, {"t", "a"}},
        Record{{"v", 2}, {"t", "b"}},
        Record{{"v", std::numeric_limits<double>::quiet_NaN()}, {"t", "c"}},
    };
    PreprocessReport report;
    const Dataset out = Preprocessor::sanitizeInfinite(data, &report);
    EXPECT_TRUE(out[0].get("v").isNull());
    EXPECT_EQ(out[1].get("v"), Cell(1));
    EXPECT_EQ(out[2].get("v"), Cell(2));
    EXPECT_TRUE(out[3].get("v").isNull());
    EXPECT_EQ(out[0].get("t"), Cell("Infinity"));
    EXPECT_EQ(report.infiniteReplaced, 2u);
    // The input is untouched.
    EXPECT_TRUE(data[0].get("v").isInfinite());
}

TEST(PreprocessorTest, FillMeanScenario) {
    const Dataset data{Record{{"x", 1}}, Record{{"x", nullptr}}, Record{{"x", 3}}};
    PreprocessReport report;
    const Dataset out = Preprocessor::handleMissingValues(data, MissingValueMethod::FILL_MEAN, {"x"}, &report);
    EXPECT_EQ(out[1].get("x"), Cell(2));
    ASSERT_EQ(report.filledCounts.size(), 1u);
    EXPECT_EQ(report.filledCounts[0], (std::pair<std::string, size_t>{"x", 1}));
}

TEST(PreprocessorTest, FillMedianUsesUpperMedian) {
    const Dataset data{Record{{"x", 10}}, Record{{"x", nullptr}}, Record{{"x", 1}}, Record{{"x", 3}}, Record{{"x", 5}}};
    const Dataset out = Preprocessor::handleMissingValues(data, MissingValueMethod::FILL_MEDIAN, {"x"});
    // Finite values sorted: 1 3 5 10.
    EXPECT_EQ(out[1].get("x"), Cell(5));
}

TEST(PreprocessorTest, FillMeanIgnoresNonNumericColumns) {
    const Dataset data{Record{{"x", 1}, {"s", ""}}, Record{{"x", nullptr}, {"s", "a"}}};
    const Dataset out = Preprocessor::handleMissingValues(data, MissingValueMethod::FILL_MEAN, {"x"});
    EXPECT_EQ(out[1].get("x"), Cell(1));
    EXPECT_TRUE(out[0].get("s").isMissing());
}

TEST(PreprocessorTest, FillModeKeepsKindAndFirstSeenTie) {
    const Dataset data{
        Record{{"n", 7}, {"s", "a"}},
        Record{{"n", 7}, {"s", "b"}},
        Record{{"n", 3}, {"s", nullptr}},
        Record{{"n", nullptr}, {"s", "b"}},
        Record{{"n", 3}, {"s", "a"}},
    };
    const Dataset out = Preprocessor::handleMissingValues(data, MissingValueMethod::FILL_MODE, {});
    EXPECT_EQ(out[3].get("n"), Cell(7));
    EXPECT_TRUE(out[3].get("n").isNumber());
    EXPECT_EQ(out[2].get("s"), Cell("a"));
}

TEST(PreprocessorTest, FillZeroCoversAbsentKeys) {
    const Dataset data{
        Record{{"a", 1}, {"b", 2}},
        Record{{"a", ""}},
        Record{{"b", 3}, {"extra", nullptr}},
    };
    PreprocessReport report;
    const Dataset out = Preprocessor::handleMissingValues(data, MissingValueMethod::FILL_ZERO, {}, &report);
    EXPECT_EQ(out[1].get("a"), Cell(0));
    EXPECT_EQ(out[1].get("b"), Cell(0));
    EXPECT_EQ(out[2].get("a"), Cell(0));
    EXPECT_EQ(out[2].get("extra"), Cell(0));
    EXPECT_EQ(out[0].get("a"), Cell(1));
    EXPECT_FALSE(report.filledCounts.empty());
}

TEST(PreprocessorTest, FillMethodsLeaveCompleteColumnsUnchanged) {
    const Dataset data{Record{{"x", 1}, {"c", "p"}}, Record{{"x", 2}, {"c", "q"}}};
    for (MissingValueMethod method : {MissingValueMethod::FILL_MEAN, MissingValueMethod::FILL_MEDIAN,
                                      MissingValueMethod::FILL_MODE, MissingValueMethod::FILL_ZERO}) {
        PreprocessReport report;
        const Dataset out = Preprocessor::handleMissingValues(data, method, {"x"}, &report);
        EXPECT_TRUE(out.records() == data.records()) << methodName(method);
        EXPECT_TRUE(report.filledCounts.empty());
    }
}

TEST(PreprocessorTest, DropRows) {
    const Dataset data{
        Record{{"a", 1}, {"b", 2}},
        Record{{"a", nullptr}, {"b", 2}},
        Record{{"a", 3}},
        Record{{"a", 4}, {"b", " "}},
    };
    const Dataset out = Preprocessor::handleMissingValues(data, MissingValueMethod::DROP_ROWS, {});
    ASSERT_EQ(out.rowCount(), 2u);
    EXPECT_EQ(out[0].get("a"), Cell(1));
    EXPECT_EQ(out[1].get("a"), Cell(4));
}

TEST(PreprocessorTest, DropColumns) {
    const Dataset data{
        Record{{"a", 1}, {"b", 2}, {"c", "x"}},
        Record{{"a", 2}, {"b", ""}, {"c", "y"}},
        Record{{"a", 3}, {"c", "z"}, {"d", 1}},
    };
    PreprocessReport report;
    const Dataset out = Preprocessor::handleMissingValues(data, MissingValueMethod::DROP_COLUMNS, {}, &report);
    ASSERT_EQ(out.rowCount(), 3u);
    for (const auto& r : out) EXPECT_EQ(keysOf(r), (std::vector<std::string>{"a", "c"}));
    EXPECT_EQ(report.droppedColumns, (std::vector<std::string>{"b"}));

    EXPECT_TRUE(Preprocessor::handleMissingValues(Dataset{}, MissingValueMethod::DROP_COLUMNS, {}).empty());
}

TEST(PreprocessorTest, OneHotScenario) {
    const Dataset data{Record{{"color", "red"}}, Record{{"color", "blue"}}, Record{{"color", "red"}}};
    PreprocessReport report;
    const Dataset out = Preprocessor::applyCategoricalEncoding(data, EncodingMethod::ONEHOT, {"color"}, &report);
    ASSERT_EQ(out.rowCount(), 3u);
    for (const auto& r : out) {
        EXPECT_EQ(keysOf(r), (std::vector<std::string>{"color_red", "color_blue"}));
        EXPECT_FALSE(r.has("color"));
    }
    EXPECT_EQ(out[0].get("color_red"), Cell(1));
    EXPECT_EQ(out[0].get("color_blue"), Cell(0));
    EXPECT_EQ(out[1].get("color_red"), Cell(0));
    EXPECT_EQ(out[1].get("color_blue"), Cell(1));
    EXPECT_EQ(out[2].get("color_red"), Cell(1));
    EXPECT_EQ(out[2].get("color_blue"), Cell(0));
    EXPECT_EQ(report.droppedColumns, (std::vector<std::string>{"color"}));
    EXPECT_EQ(report.addedColumns, (std::vector<std::string>{"color_red", "color_blue"}));
}

TEST(PreprocessorTest, LabelEncoding) {
    const Dataset data{
        Record{{"id", 1}, {"c", "red"}},
        Record{{"id", 2}, {"c", "blue"}},
        Record{{"id", 3}, {"c", "red"}},
        Record{{"id", 4}, {"c", nullptr}},
    };
    const Dataset out = Preprocessor::applyCategoricalEncoding(data, EncodingMethod::LABEL, {"c", "gone"});
    EXPECT_EQ(out[0].get("c"), Cell(0));
    EXPECT_EQ(out[1].get("c"), Cell(1));
    EXPECT_EQ(out[2].get("c"), Cell(0));
    EXPECT_TRUE(out[3].get("c").isNull());
    EXPECT_EQ(keysOf(out[0]), (std::vector<std::string>{"id", "c"}));
    EXPECT_FALSE(out[0].has("gone"));
}

TEST(PreprocessorTest, OneHotSeveralColumnsAppendsInColumnOrder) {
    const Dataset data{
        Record{{"a", "x"}, {"id", 1}, {"b", "p"}},
        Record{{"b", "q"}, {"id", 2}},
        Record{{"id", 3}, {"a", "y"}, {"b", nullptr}},
    };
    PreprocessReport report;
    const Dataset out = Preprocessor::applyCategoricalEncoding(data, EncodingMethod::ONEHOT, {"a", "b", "a"}, &report);
    for (const auto& r : out) {
        EXPECT_EQ(keysOf(r), (std::vector<std::string>{"id", "a_x", "a_y", "b_p", "b_q"}));
    }
    EXPECT_EQ(out[1].get("a_x"), Cell(0));
    EXPECT_EQ(out[1].get("a_y"), Cell(0));
    EXPECT_EQ(out[1].get("b_q"), Cell(1));
    EXPECT_EQ(out[2].get("a_y"), Cell(1));
    EXPECT_EQ(out[2].get("b_p"), Cell(0));
    EXPECT_EQ(report.droppedColumns, (std::vector<std::string>{"a", "b"}));
    EXPECT_EQ(report.addedColumns, (std::vector<std::string>{"a_x", "a_y", "b_p", "b_q"}));
}

TEST(PreprocessorTest, OneHotNameClashReplacesExistingField) {
    const Dataset data{Record{{"a_x", 5}, {"a", "x"}}, Record{{"a_x", 6}, {"a", "z"}}};
    const Dataset out = Preprocessor::applyCategoricalEncoding(data, EncodingMethod::ONEHOT, {"a"});
    EXPECT_EQ(keysOf(out[0]), (std::vector<std::string>{"a_x", "a_z"}));
    EXPECT_EQ(out[0].get("a_x"), Cell(1));
    EXPECT_EQ(out[1].get("a_x"), Cell(0));
    EXPECT_EQ(out[1].get("a_z"), Cell(1));
}

TEST(PreprocessorTest, WideDatasetIsRewrittenInOnePass) {
    const size_t cols = 150;
    const size_t rows = 400;
    std::vector<Record> records;
    records.reserve(rows);
    for (size_t r = 0; r < rows; ++r) {
        Record record;
        for (size_t c = 0; c < cols; ++c) {
            const std::string name = "c" + std::to_string(c);
            if ((r + c) % 7 == 0) {
                record.set(name, Cell());
            } else {
                record.set(name, Cell(std::string(1, static_cast<char>('a' + (c % 3)))));
            }
        }
        records.push_back(std::move(record));
    }
    const Dataset data(std::move(records));

    PreprocessReport report;
    const Dataset filled = Preprocessor::handleMissingValues(data, MissingValueMethod::FILL_MODE, {}, &report);
    ASSERT_EQ(filled.rowCount(), rows);
    ASSERT_EQ(report.filledCounts.size(), cols);
    for (size_t c = 0; c < cols; ++c) {
        const std::string name = "c" + std::to_string(c);
        EXPECT_EQ(report.filledCounts[c].first, name);
        EXPECT_EQ(filled[(7 - c % 7) % 7].get(name), Cell(std::string(1, static_cast<char>('a' + (c % 3)))));
    }
    for (const auto& r : filled) {
        EXPECT_EQ(keysOf(r), data.columnNames());
        for (const auto& f : r.fields()) EXPECT_FALSE(f.second.isMissing());
    }

    const Dataset encoded = Preprocessor::applyCategoricalEncoding(filled, EncodingMethod::LABEL, filled.columnNames());
    for (const auto& r : encoded) {
        for (const auto& f : r.fields()) EXPECT_EQ(f.second, Cell(0));
    }
}

TEST(PreprocessorTest, MinMaxNormalization) {
    const Dataset data{
        Record{{"x", 2}}, Record{{"x", "6"}}, Record{{"x", nullptr}}, Record{{"x", 4}}, Record{{"x", kInf}},
    };
    PreprocessReport report;
    const Dataset out = Preprocessor::applyNormalization(data, NormalizationMethod::MINMAX, {"x"}, &report);
    EXPECT_EQ(out[0].get("x"), Cell(0));
    EXPECT_EQ(out[1].get("x"), Cell(1));
    EXPECT_TRUE(out[1].get("x").isNumber());
    EXPECT_TRUE(out[2].get("x").isNull());
    EXPECT_EQ(out[3].get("x"), Cell(0.5));
    EXPECT_TRUE(out[4].get("x").isInfinite());

    ASSERT_EQ(report.scaling.size(), 1u);
    EXPECT_EQ(report.scaling[0].first, "x");
    EXPECT_DOUBLE_EQ(report.scaling[0].second.min, 2.0);
    EXPECT_DOUBLE_EQ(report.scaling[0].second.max, 6.0);
}

TEST(PreprocessorTest, StandardNormalization) {
    const Dataset data{Record{{"x", 1}}, Record{{"x", 2}}, Record{{"x", 3}}, Record{{"x", 10}}};
    const Dataset out = Preprocessor::applyNormalization(data, NormalizationMethod::STANDARD, {"x"});
    const std::vector<double> scaled = Statistics::finiteValues(out.columnValues("x"));
    ASSERT_EQ(scaled.size(), 4u);
    const double mean = MathUtils::mean(scaled);
    EXPECT_NEAR(mean, 0.0, 1e-12);
    EXPECT_NEAR(MathUtils::populationStddev(scaled, mean), 1.0, 1e-12);
}

TEST(PreprocessorTest, ZeroVarianceColumnIsLeftUnchanged) {
    const Dataset data{Record{{"k", 3}, {"x", 1}}, Record{{"k", 3}, {"x", 2}}};
    for (NormalizationMethod method : {NormalizationMethod::MINMAX, NormalizationMethod::STANDARD}) {
        PreprocessReport report;
        const Dataset out = Preprocessor::applyNormalization(data, method, {"k", "x"}, &report);
        EXPECT_EQ(out[0].get("k"), Cell(3));
        EXPECT_EQ(out[1].get("k"), Cell(3));
        EXPECT_EQ(report.zeroVarianceColumns, (std::vector<std::string>{"k"}));
        ASSERT_EQ(report.scaling.size(), 1u);
        EXPECT_EQ(report.scaling[0].first, "x");
    }
}

TEST(PreprocessorTest, RunAppliesStepsInOrder) {
    Dataset data;
    const Cell xs[] = {kInf, 1, 2, 3, 4, 5};
    const char* colors[] = {"red", "blue", "red", "red", "blue", "red"};
    for (size_t i = 0; i < 6; ++i) data.addRecord(Record{{"x", xs[i]}, {"color", colors[i]}});

    const AnalysisResult analysis = AnalysisEngine::analyze(data);
    ASSERT_EQ(analysis.numericColumns, (std::vector<std::string>{"x"}));
    ASSERT_EQ(analysis.categoricalColumns, (std::vector<std::string>{"color"}));

    PreprocessOptions options;
    options.handleInfinite = true;
    options.missingValueMethod = MissingValueMethod::FILL_MEAN;
    options.encodingMethod = EncodingMethod::ONEHOT;
    options.normalizationMethod = NormalizationMethod::MINMAX;

    PreprocessReport report;
    const Dataset out = Preprocessor::run(data, analysis, options, &report);
    ASSERT_EQ(out.rowCount(), 6u);
    // inf -> null -> mean(1..5) = 3 -> (3 - 1) / 4
    EXPECT_EQ(out[0].get("x"), Cell(0.5));
    EXPECT_EQ(out[5].get("x"), Cell(1));
    EXPECT_EQ(keysOf(out[0]), (std::vector<std::string>{"x", "color_red", "color_blue"}));

    EXPECT_EQ(report.originalRowCount, 6u);
    EXPECT_EQ(report.finalRowCount, 6u);
    EXPECT_EQ(report.infiniteReplaced, 1u);
    ASSERT_EQ(report.steps.size(), 4u);
    EXPECT_EQ(report.steps[0], "Replaced infinite values with NaN");
    EXPECT_EQ(report.steps[1], "Filled missing values with mean");
    EXPECT_EQ(report.steps[2], "Applied One-Hot Encoding to 1 categorical columns");
    EXPECT_EQ(report.steps[3], "Normalized 1 numeric columns using Min-Max Scaling (0-1 range)");

    // The input is untouched.
    EXPECT_TRUE(data[0].get("x").isInfinite());
    EXPECT_EQ(data[0].get("color"), Cell("red"));
}

TEST(PreprocessorTest, RunWithNoOptionsIsIdentity) {
    const Dataset data{Record{{"x", 1}, {"y", nullptr}}, Record{{"x", 2}, {"y", "a"}}};
    const AnalysisResult analysis = AnalysisEngine::analyze(data);
    PreprocessReport report;
    const Dataset out = Preprocessor::run(data, analysis, PreprocessOptions{}, &report);
    EXPECT_TRUE(out.records() == data.records());
    EXPECT_TRUE(report.steps.empty());
}

TEST(PreprocessorTest, RunDropRowsReportsRowCounts) {
    const Dataset data{Record{{"x", 1}}, Record{{"x", nullptr}}, Record{{"x", 3}}};
    const AnalysisResult analysis = AnalysisEngine::analyze(data);
    PreprocessOptions options;
    options.missingValueMethod = MissingValueMethod::DROP_ROWS;
    PreprocessReport report;
    const Dataset out = Preprocessor::run(data, analysis, options, &report);
    EXPECT_EQ(out.rowCount(), 2u);
    EXPECT_EQ(report.originalRowCount, 3u);
    EXPECT_EQ(report.finalRowCount, 2u);
    EXPECT_EQ(report.steps, (std::vector<std::string>{"Dropped rows with missing values"}));
}

TEST(PreprocessorTest, VerboseRunWarnsAboutZeroVariance) {
    const Dataset data{Record{{"k", 3}}, Record{{"k", 3}}};
    const AnalysisResult analysis = AnalysisEngine::analyze(data);
    PreprocessOptions options;
    options.normalizationMethod = NormalizationMethod::STANDARD;
    options.verbose = true;

    PreprocessReport report;
    testing::internal::CaptureStderr();
    Preprocessor::run(data, analysis, options, &report);
    const std::string err = testing::internal::GetCapturedStderr();
    EXPECT_NE(err.find("[Tabula][Preprocess Warning]"), std::string::npos);
    EXPECT_EQ(report.zeroVarianceColumns, (std::vector<std::string>{"k"}));
}
