/**
 * @file record.h
 * @brief Rows with header-name lookup, and whole-file documents.
 */

#ifndef UNICSV_RECORD_H
#define UNICSV_RECORD_H

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace unicsv {

/// A parsed row: one UTF-8 string per field.
using Row = std::vector<std::string>;

/**
 * @brief Header name to column index map.
 *
 * Shared between all records of a reader or document.
 */
class HeaderLookup {
public:
    /// @throws CsvException INVALID_HASHABLE_HEADER if a name repeats.
    explicit HeaderLookup(const std::vector<std::string>& headers);

    /// Column of name, if present.
    std::optional<size_t> find(const std::string& name) const;

    /// @throws std::out_of_range if name is not a header.
    size_t index(const std::string& name) const;

    size_t size() const { return map_.size(); }

private:
    std::unordered_map<std::string, size_t> map_;
};

/**
 * @brief A row together with the lookup of its reader's header.
 */
class Record {
public:
    Record(Row fields, std::shared_ptr<const HeaderLookup> lookup)
        : fields_(std::move(fields)), lookup_(std::move(lookup)) {}

    size_t size() const { return fields_.size(); }
    bool empty() const { return fields_.empty(); }

    const Row& fields() const { return fields_; }
    Row& fields() { return fields_; }

    const std::string& operator[](size_t index) const { return fields_[index]; }

    /// @throws std::out_of_range
    const std::string& at(size_t index) const;

    /// Field of the column named name.
    /// @throws std::out_of_range if there is no header or no such column.
    const std::string& operator[](const std::string& name) const;

    bool contains(const std::string& name) const;

private:
    Row fields_;
    std::shared_ptr<const HeaderLookup> lookup_;
};

/**
 * @brief An entire CSV input held in memory.
 *
 * The header lookup is built on construction, so duplicate header names
 * fail immediately with INVALID_HASHABLE_HEADER.
 */
class Document {
public:
    Document(std::vector<std::string> headers, std::vector<Row> rows);

    const std::vector<std::string>& headers() const { return headers_; }
    const std::vector<Row>& rows() const { return rows_; }

    size_t row_count() const { return rows_.size(); }
    size_t column_count() const;

    /// @throws std::out_of_range
    const Row& row(size_t index) const;

    Record record(size_t index) const;

    /// @throws std::out_of_range
    std::vector<std::string> column(size_t index) const;

    /// @throws std::out_of_range if there is no header or no such column.
    std::vector<std::string> column(const std::string& name) const;

    /// @throws std::out_of_range
    const std::string& field(size_t row, const std::string& column) const;

private:
    std::vector<std::string> headers_;
    std::vector<Row> rows_;
    std::shared_ptr<const HeaderLookup> lookup_;
};

}  // namespace unicsv

#endif  // UNICSV_RECORD_H
