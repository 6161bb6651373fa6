#include "CSVUtils.h"
#include "TabulaExceptions.h"

#include <fstream>

namespace CSVUtils {
std::string escapeField(const std::string& value, char delimiter) {
    const bool needsQuotes = value.find(delimiter) != std::string::npos ||
                             value.find_first_of("\"\r\n") != std::string::npos;
    if (!needsQuotes) return value;

    std::string out;
    out.reserve(value.size() + 2);
    out.push_back('"');
    for (char c : value) {
        if (c == '"') out.push_back('"');
        out.push_back(c);
    }
    out.push_back('"');
    return out;
}

void writeDataset(std::ostream& os, const Dataset& data, char delimiter) {
    const std::vector<std::string> columns = data.columnNames();
    for (size_t c = 0; c < columns.size(); ++c) {
        if (c > 0) os << delimiter;
        os << escapeField(columns[c], delimiter);
    }
    if (!columns.empty()) os << "\n";

    for (const auto& record : data) {
        for (size_t c = 0; c < columns.size(); ++c) {
            if (c > 0) os << delimiter;
            const Cell& cell = record.get(columns[c]);
            if (cell.isMissing()) continue;
            os << escapeField(cell.displayString(), delimiter);
        }
        os << "\n";
    }
}

void saveDataset(const std::string& path, const Dataset& data, char delimiter) {
    std::ofstream out(path, std::ios::binary);
    if (!out) throw Tabula::IOException("Could not open output file: " + path);
    writeDataset(out, data, delimiter);
    out.flush();
    if (!out.good()) throw Tabula::IOException("Failed while writing output file: " + path);
}
}
