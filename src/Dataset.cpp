#include "Dataset.h"
#include <algorithm>

namespace {
const Cell kNullCell{};
}

Record::Record(std::initializer_list<Field> fields) {
    fields_.reserve(fields.size());
    for (const auto& f : fields) set(f.first, f.second);
}

Record::Record(std::vector<Field> fields) {
    fields_.reserve(fields.size());
    for (auto& f : fields) set(f.first, std::move(f.second));
}

const Cell& Record::get(const std::string& column) const {
    for (const auto& f : fields_) {
        if (f.first == column) return f.second;
    }
    return kNullCell;
}

bool Record::has(const std::string& column) const {
    return std::any_of(fields_.begin(), fields_.end(), [&](const Field& f) { return f.first == column; });
}

void Record::set(const std::string& column, Cell value) {
    for (auto& f : fields_) {
        if (f.first == column) {
            f.second = std::move(value);
            return;
        }
    }
    fields_.emplace_back(column, std::move(value));
}

bool Record::erase(const std::string& column) {
    auto it = std::find_if(fields_.begin(), fields_.end(), [&](const Field& f) { return f.first == column; });
    if (it == fields_.end()) return false;
    fields_.erase(it);
    return true;
}

Dataset::Dataset(std::initializer_list<Record> records) : records_(records) {}

Dataset::Dataset(std::vector<Record> records) : records_(std::move(records)) {}

std::vector<std::string> Dataset::columnNames() const {
    std::vector<std::string> names;
    if (records_.empty()) return names;
    names.reserve(records_.front().size());
    for (const auto& f : records_.front().fields()) names.push_back(f.first);
    return names;
}

int Dataset::findColumnIndex(const std::string& name) const {
    if (records_.empty()) return -1;
    const auto& fields = records_.front().fields();
    for (size_t i = 0; i < fields.size(); ++i) {
        if (fields[i].first == name) return static_cast<int>(i);
    }
    return -1;
}

std::vector<Cell> Dataset::columnValues(const std::string& column) const {
    std::vector<Cell> values;
    values.reserve(records_.size());
    // Records usually share the first record's key order; try that slot first.
    const int hint = findColumnIndex(column);
    for (const auto& r : records_) {
        const auto& fields = r.fields();
        if (hint >= 0 && static_cast<size_t>(hint) < fields.size() && fields[static_cast<size_t>(hint)].first == column) {
            values.push_back(fields[static_cast<size_t>(hint)].second);
        } else {
            values.push_back(r.get(column));
        }
    }
    return values;
}
