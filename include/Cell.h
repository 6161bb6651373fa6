#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

/**
 * @brief A single dataset value: Null, Number, Text or Bool.
 * @details Constructors are implicit so records can be written as literals,
 *          e.g. Record{{"a", 1}, {"b", "red"}, {"c", nullptr}}.
 */
class Cell {
public:
    enum class Kind { Null, Number, Text, Bool };

    Cell() = default;
    Cell(std::nullptr_t) {}
    Cell(double value) : value_(value) {}
    Cell(int value) : value_(static_cast<double>(value)) {}
    Cell(bool value) : value_(value) {}
    Cell(const char* value) : value_(std::string(value)) {}
    Cell(std::string value) : value_(std::move(value)) {}

    Kind kind() const noexcept { return static_cast<Kind>(value_.index()); }
    bool isNull() const noexcept { return kind() == Kind::Null; }
    bool isNumber() const noexcept { return kind() == Kind::Number; }
    bool isText() const noexcept { return kind() == Kind::Text; }
    bool isBool() const noexcept { return kind() == Kind::Bool; }

    /**
     * @brief Null or empty text. Whitespace-only text is not missing.
     */
    bool isMissing() const noexcept;

    /**
     * @brief Number cell holding +/-infinity. NaN is not infinite.
     */
    bool isInfinite() const noexcept;

    /**
     * @brief Finite numeric reading of the cell.
     * @post Number cells yield their value when finite; Text cells yield the
     *       strictly parsed trimmed content when finite; everything else is nullopt.
     */
    std::optional<double> asFiniteNumber() const;

    /**
     * @brief Text rendering used for labels, one-hot column names and export.
     * @post Null renders as "null"; numbers use shortest round-trip form.
     */
    std::string displayString() const;

    // Accessors; calling the wrong one throws std::bad_variant_access.
    double number() const { return std::get<double>(value_); }
    const std::string& text() const { return std::get<std::string>(value_); }
    bool boolean() const { return std::get<bool>(value_); }

    size_t hash() const noexcept;

    // SameValueZero: NaN == NaN, +0 == -0, different kinds never equal.
    friend bool operator==(const Cell& a, const Cell& b) noexcept;
    friend bool operator!=(const Cell& a, const Cell& b) noexcept { return !(a == b); }

private:
    std::variant<std::monostate, double, std::string, bool> value_;
};

struct CellHash {
    size_t operator()(const Cell& cell) const noexcept { return cell.hash(); }
};

/**
 * @brief Counts non-missing cells keeping the order in which values were first seen.
 */
std::vector<std::pair<Cell, size_t>> countInFirstSeenOrder(const std::vector<Cell>& values);

/**
 * @brief Number of distinct non-missing cells.
 */
size_t countDistinct(const std::vector<Cell>& values);
