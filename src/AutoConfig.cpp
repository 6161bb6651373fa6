#include "AutoConfig.h"
#include "CommonUtils.h"
#include "TabulaExceptions.h"
#include <algorithm>
#include <cmath>
#include <fstream>
#include <limits>
#include <unordered_map>
#include <vector>

namespace {
template <typename T, typename Parser>
T parseNumericStrict(const std::string& value,
                     const std::string& key,
                     const std::string& errorPrefix,
                     Parser parser) {
    try {
        size_t pos = 0;
        T parsed = parser(value, &pos);
        if (pos != value.size()) {
            throw Tabula::ConfigurationException(errorPrefix + key + ": " + value);
        }
        return parsed;
    } catch (const Tabula::TabulaException&) {
        throw;
    } catch (const std::exception& ex) {
        throw Tabula::ConfigurationException(errorPrefix + key + ": " + value + " (" + ex.what() + ")");
    }
}

std::string stripStructuralTokensOutsideQuotes(const std::string& line) {
    std::string out;
    out.reserve(line.size());

    bool inQuotes = false;
    bool escaped = false;
    for (char c : line) {
        if (escaped) {
            out.push_back(c);
            escaped = false;
            continue;
        }
        if (c == '\\') {
            out.push_back(c);
            escaped = true;
            continue;
        }
        if (c == '"') {
            inQuotes = !inQuotes;
            out.push_back(c);
            continue;
        }
        if (!inQuotes && (c == '{' || c == '}')) {
            continue;
        }
        out.push_back(c);
    }

    size_t lastNonSpace = out.find_last_not_of(" \t\r\n");
    if (lastNonSpace != std::string::npos && out[lastNonSpace] == ',') {
        out.erase(lastNonSpace, 1);
    }
    return out;
}

size_t findSeparatorOutsideQuotes(const std::string& line, char sep) {
    bool inQuotes = false;
    bool escaped = false;
    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (escaped) {
            escaped = false;
            continue;
        }
        if (c == '\\') {
            escaped = true;
            continue;
        }
        if (c == '"') {
            inQuotes = !inQuotes;
            continue;
        }
        if (!inQuotes && c == sep) {
            return i;
        }
    }
    return std::string::npos;
}

std::string maybeUnquote(std::string value) {
    value = CommonUtils::trim(value);
    if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

std::string normalizeConfigKey(const std::string& rawKey) {
    std::string key = CommonUtils::toLower(CommonUtils::trim(rawKey));
    std::replace(key.begin(), key.end(), '-', '_');

    // camelCase request-body spellings
    static const std::unordered_map<std::string, std::string> aliases = {
        {"handleinfinite", "handle_infinite"},
        {"missingvaluemethod", "missing_value_method"},
        {"encodingmethod", "encoding_method"},
        {"normalizationmethod", "normalization_method"},
        {"verbose", "verbose_analysis"}
    };
    const auto it = aliases.find(key);
    return it == aliases.end() ? key : it->second;
}

double parseDoubleStrict(const std::string& value, const std::string& key) {
    return parseNumericStrict<double>(
        value,
        key,
        "Invalid number for ",
        [](const std::string& v, size_t* pos) { return std::stod(v, pos); });
}

size_t parseSizeStrict(const std::string& value, const std::string& key) {
    if (!value.empty() && value.front() == '-') {
        throw Tabula::ConfigurationException("Value for " + key + " must be >= 0");
    }
    unsigned long long parsed = parseNumericStrict<unsigned long long>(
        value,
        key,
        "Invalid unsigned integer for ",
        [](const std::string& v, size_t* pos) { return std::stoull(v, pos); });
    if (parsed > static_cast<unsigned long long>(std::numeric_limits<size_t>::max())) {
        throw Tabula::ConfigurationException("Value for " + key + " exceeds size range");
    }
    return static_cast<size_t>(parsed);
}

bool parseBoolStrict(const std::string& value, const std::string& key) {
    std::string v = CommonUtils::toLower(CommonUtils::trim(value));
    if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
    if (v == "0" || v == "false" || v == "no" || v == "off") return false;
    throw Tabula::ConfigurationException("Invalid boolean for " + key + ": " + value);
}

bool isIn(const std::string& value, const std::vector<std::string>& allowed) {
    return std::find(allowed.begin(), allowed.end(), value) != allowed.end();
}
} // namespace

void AutoConfig::set(const std::string& rawKey, const std::string& rawValue) {
    const std::string key = normalizeConfigKey(rawKey);
    const std::string value = CommonUtils::trim(rawValue);

    static const std::unordered_map<std::string, std::string AutoConfig::*> stringFields = {
        {"missing_value_method", &AutoConfig::missingValueMethod},
        {"encoding_method", &AutoConfig::encodingMethod},
        {"normalization_method", &AutoConfig::normalizationMethod}
    };
    static const std::unordered_map<std::string, bool AutoConfig::*> boolFields = {
        {"handle_infinite", &AutoConfig::handleInfinite},
        {"verbose_analysis", &AutoConfig::verboseAnalysis}
    };
    static const std::unordered_map<std::string, double ProfilingTuning::*> tuningDoubleFields = {
        {"numeric_type_ratio", &ProfilingTuning::numericTypeRatio},
        {"datetime_type_ratio", &ProfilingTuning::datetimeTypeRatio},
        {"categorical_unique_ratio", &ProfilingTuning::categoricalUniqueRatio},
        {"outlier_iqr_multiplier", &ProfilingTuning::outlierIqrMultiplier}
    };
    static const std::unordered_map<std::string, size_t ProfilingTuning::*> tuningSizeFields = {
        {"top_values_max_unique", &ProfilingTuning::topValuesMaxUnique},
        {"top_values_limit", &ProfilingTuning::topValuesLimit},
        {"top_duplicates_limit", &ProfilingTuning::topDuplicatesLimit},
        {"duplicate_label_max_chars", &ProfilingTuning::duplicateLabelMaxChars},
        {"histogram_bins", &ProfilingTuning::histogramBins}
    };

    if (auto it = stringFields.find(key); it != stringFields.end()) {
        this->*(it->second) = value;
        return;
    }
    if (auto it = boolFields.find(key); it != boolFields.end()) {
        this->*(it->second) = parseBoolStrict(value, key);
        return;
    }
    if (auto it = tuningDoubleFields.find(key); it != tuningDoubleFields.end()) {
        tuning.*(it->second) = parseDoubleStrict(value, key);
        return;
    }
    if (auto it = tuningSizeFields.find(key); it != tuningSizeFields.end()) {
        tuning.*(it->second) = parseSizeStrict(value, key);
        return;
    }
    throw Tabula::ConfigurationException("Unknown config key: " + rawKey);
}

AutoConfig AutoConfig::fromFile(const std::string& configPath, const AutoConfig& base) {
    std::ifstream in(configPath);
    if (!in) throw Tabula::IOException("Could not open config file: " + configPath);

    AutoConfig config = base;
    std::string line;
    size_t lineNo = 0;
    while (std::getline(in, line)) {
        ++lineNo;
        line = CommonUtils::trim(line);
        if (line.empty() || line[0] == '#') continue;

        // Support loose YAML (key: value) and loose JSON-ish ("key": "value",)
        line = CommonUtils::trim(stripStructuralTokensOutsideQuotes(line));
        if (line.empty()) continue;

        size_t sep = findSeparatorOutsideQuotes(line, ':');
        if (sep == std::string::npos) continue;

        const std::string key = maybeUnquote(line.substr(0, sep));
        const std::string value = maybeUnquote(line.substr(sep + 1));

        try {
            config.set(key, value);
        } catch (const Tabula::TabulaException& ex) {
            throw Tabula::ConfigurationException(
                "Config parse error at line " + std::to_string(lineNo) +
                ": '" + line + "' -> " + ex.what());
        }
    }
    config.validate();

    return config;
}

AutoConfig AutoConfig::fromFile(const std::string& configPath) {
    return fromFile(configPath, AutoConfig{});
}

void AutoConfig::validate() const {
    if (!isIn(missingValueMethod, {"none", "dropRows", "dropColumns", "fillMean", "fillMedian", "fillMode", "fillZero"})) {
        throw Tabula::InvalidOptionException("missing_value_method", missingValueMethod);
    }
    if (!isIn(encodingMethod, {"none", "label", "onehot"})) {
        throw Tabula::InvalidOptionException("encoding_method", encodingMethod);
    }
    if (!isIn(normalizationMethod, {"none", "minmax", "standard"})) {
        throw Tabula::InvalidOptionException("normalization_method", normalizationMethod);
    }

    const auto checkRatio = [](double value, const char* key) {
        if (!(value > 0.0 && value <= 1.0)) {
            throw Tabula::ConfigurationException(std::string(key) + " must be within (0,1]");
        }
    };
    checkRatio(tuning.numericTypeRatio, "numeric_type_ratio");
    checkRatio(tuning.datetimeTypeRatio, "datetime_type_ratio");
    checkRatio(tuning.categoricalUniqueRatio, "categorical_unique_ratio");

    if (!(tuning.outlierIqrMultiplier >= 0.0) || !std::isfinite(tuning.outlierIqrMultiplier)) {
        throw Tabula::ConfigurationException("outlier_iqr_multiplier must be a finite value >= 0");
    }
    if (tuning.histogramBins == 0) {
        throw Tabula::ConfigurationException("histogram_bins must be > 0");
    }
    if (tuning.duplicateLabelMaxChars == 0) {
        throw Tabula::ConfigurationException("duplicate_label_max_chars must be > 0");
    }
}
