#pragma once
#include "AnalysisEngine.h"
#include "Preprocessor.h"
#include <string>
#include <vector>

/**
 * @brief Markdown report builder.
 */
class ReportEngine {
public:
    void addTitle(const std::string& title);
    void addParagraph(const std::string& text);
    void addTable(const std::string& title, const std::vector<std::string>& headers, const std::vector<std::vector<std::string>>& rows);

    const std::string& str() const noexcept { return body_; }

    /**
     * @throws Tabula::IOException when the file cannot be written.
     */
    void save(const std::string& filePath) const;

    /**
     * @brief Profile report: overview, per-column summary, correlations and data
     *        quality, followed by the applied preprocessing steps when given.
     */
    static ReportEngine buildProfileReport(const AnalysisResult& analysis, const PreprocessReport* preprocess = nullptr);

private:
    std::string body_;
};
