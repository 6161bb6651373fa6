#include "Cell.h"
#include "CommonUtils.h"
#include <charconv>
#include <cmath>
#include <functional>
#include <unordered_map>
#include <unordered_set>

namespace {
std::string formatNumber(double value) {
    if (std::isnan(value)) return "NaN";
    if (std::isinf(value)) return value > 0 ? "Infinity" : "-Infinity";
    if (value == 0.0) return "0";

    char buf[64];
    const double mag = std::abs(value);
    const std::chars_format fmt = (mag >= 1e-6 && mag < 1e21) ? std::chars_format::fixed
                                                             : std::chars_format::scientific;
    auto [end, ec] = std::to_chars(buf, buf + sizeof(buf), value, fmt);
    if (ec != std::errc{}) return CommonUtils::formatFixed(value, 6);
    std::string out(buf, end);
    // "1e-07" -> "1e-7"
    const size_t e = out.find('e');
    if (e != std::string::npos && e + 2 < out.size()) {
        const size_t digits = e + 2;
        const size_t firstNonZero = out.find_first_not_of('0', digits);
        if (firstNonZero != std::string::npos && firstNonZero > digits) out.erase(digits, firstNonZero - digits);
    }
    return out;
}
} // namespace

bool Cell::isMissing() const noexcept {
    switch (kind()) {
        case Kind::Null: return true;
        case Kind::Text: return std::get<std::string>(value_).empty();
        case Kind::Number:
        case Kind::Bool: return false;
    }
    return false;
}

bool Cell::isInfinite() const noexcept {
    return kind() == Kind::Number && std::isinf(std::get<double>(value_));
}

std::optional<double> Cell::asFiniteNumber() const {
    switch (kind()) {
        case Kind::Number: {
            const double v = std::get<double>(value_);
            if (std::isfinite(v)) return v;
            return std::nullopt;
        }
        case Kind::Text:
            return CommonUtils::parseFiniteDouble(std::get<std::string>(value_));
        case Kind::Null:
        case Kind::Bool:
            return std::nullopt;
    }
    return std::nullopt;
}

std::string Cell::displayString() const {
    switch (kind()) {
        case Kind::Null: return "null";
        case Kind::Number: return formatNumber(std::get<double>(value_));
        case Kind::Text: return std::get<std::string>(value_);
        case Kind::Bool: return std::get<bool>(value_) ? "true" : "false";
    }
    return "";
}

size_t Cell::hash() const noexcept {
    const size_t tag = static_cast<size_t>(value_.index()) * 0x9e3779b97f4a7c15ULL;
    switch (kind()) {
        case Kind::Null: return tag;
        case Kind::Number: {
            double v = std::get<double>(value_);
            if (std::isnan(v)) return tag ^ 0x7ff8ULL;
            if (v == 0.0) v = 0.0;
            return tag ^ std::hash<double>{}(v);
        }
        case Kind::Text: return tag ^ std::hash<std::string>{}(std::get<std::string>(value_));
        case Kind::Bool: return tag ^ static_cast<size_t>(std::get<bool>(value_));
    }
    return tag;
}

bool operator==(const Cell& a, const Cell& b) noexcept {
    if (a.kind() != b.kind()) return false;
    switch (a.kind()) {
        case Cell::Kind::Null: return true;
        case Cell::Kind::Number: {
            const double x = std::get<double>(a.value_);
            const double y = std::get<double>(b.value_);
            if (std::isnan(x) && std::isnan(y)) return true;
            return x == y;
        }
        case Cell::Kind::Text: return std::get<std::string>(a.value_) == std::get<std::string>(b.value_);
        case Cell::Kind::Bool: return std::get<bool>(a.value_) == std::get<bool>(b.value_);
    }
    return false;
}

std::vector<std::pair<Cell, size_t>> countInFirstSeenOrder(const std::vector<Cell>& values) {
    std::vector<std::pair<Cell, size_t>> counts;
    std::unordered_map<Cell, size_t, CellHash> slot;
    slot.reserve(values.size());
    for (const Cell& v : values) {
        if (v.isMissing()) continue;
        auto it = slot.find(v);
        if (it == slot.end()) {
            slot.emplace(v, counts.size());
            counts.emplace_back(v, 1);
        } else {
            ++counts[it->second].second;
        }
    }
    return counts;
}

size_t countDistinct(const std::vector<Cell>& values) {
    std::unordered_set<Cell, CellHash> seen;
    seen.reserve(values.size());
    for (const Cell& v : values) {
        if (!v.isMissing()) seen.insert(v);
    }
    return seen.size();
}
