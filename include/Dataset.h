#pragma once
#include "Cell.h"
#include <initializer_list>
#include <string>
#include <utility>
#include <vector>

using Field = std::pair<std::string, Cell>;

/**
 * @brief Insertion-ordered mapping from column name to Cell.
 */
class Record {
public:
    Record() = default;
    Record(std::initializer_list<Field> fields);
    explicit Record(std::vector<Field> fields);

    /**
     * @brief Returns the named cell, or a Null cell when the key is absent.
     */
    const Cell& get(const std::string& column) const;
    bool has(const std::string& column) const;

    /**
     * @brief Replaces the field in place, or appends it when absent.
     */
    void set(const std::string& column, Cell value);

    /**
     * @brief Removes the field. Returns false when absent.
     */
    bool erase(const std::string& column);

    // Builder interface: positional replacement and append without a key scan.
    // append() requires that the key is not already present.
    void setValue(size_t index, Cell value) { fields_[index].second = std::move(value); }
    void append(std::string column, Cell value) { fields_.emplace_back(std::move(column), std::move(value)); }

    void reserve(size_t n) { fields_.reserve(n); }
    size_t size() const noexcept { return fields_.size(); }
    const std::vector<Field>& fields() const noexcept { return fields_; }

    friend bool operator==(const Record& a, const Record& b) { return a.fields_ == b.fields_; }

private:
    std::vector<Field> fields_;
};

/**
 * @brief Ordered sequence of records.
 * @details The column set is the key set of the first record. Records are values;
 *          transformations build a new Dataset instead of mutating one.
 */
class Dataset {
public:
    Dataset() = default;
    Dataset(std::initializer_list<Record> records);
    explicit Dataset(std::vector<Record> records);

    size_t rowCount() const noexcept { return records_.size(); }
    size_t colCount() const noexcept { return records_.empty() ? 0 : records_.front().size(); }
    bool empty() const noexcept { return records_.empty(); }

    const std::vector<Record>& records() const noexcept { return records_; }
    const Record& operator[](size_t row) const { return records_[row]; }
    std::vector<Record>::const_iterator begin() const noexcept { return records_.begin(); }
    std::vector<Record>::const_iterator end() const noexcept { return records_.end(); }

    /**
     * @brief Keys of the first record in insertion order; empty for an empty dataset.
     */
    std::vector<std::string> columnNames() const;

    /**
     * @brief Returns index of named column or -1 when absent from the first record.
     */
    int findColumnIndex(const std::string& name) const;

    /**
     * @brief Values of one column across all rows; absent keys read as Null.
     */
    std::vector<Cell> columnValues(const std::string& column) const;

    // Builder interface used while constructing a new dataset.
    void reserve(size_t rows) { records_.reserve(rows); }
    void addRecord(Record record) { records_.push_back(std::move(record)); }

private:
    std::vector<Record> records_;
};
