#include "unicsv/record.h"
#include "unicsv/error.h"

#include <stdexcept>
#include <utility>

namespace unicsv {

HeaderLookup::HeaderLookup(const std::vector<std::string>& headers) {
    map_.reserve(headers.size());
    for (size_t i = 0; i < headers.size(); ++i) {
        if (!map_.emplace(headers[i], i).second) {
            throw CsvException(CsvError(ErrorCode::INVALID_HASHABLE_HEADER,
                                        "Duplicate header name: '" + headers[i] + "'",
                                        "Header names must be unique to look fields up by name.",
                                        1, i + 1));
        }
    }
}

std::optional<size_t> HeaderLookup::find(const std::string& name) const {
    auto it = map_.find(name);
    if (it == map_.end()) return std::nullopt;
    return it->second;
}

size_t HeaderLookup::index(const std::string& name) const {
    auto it = map_.find(name);
    if (it == map_.end()) {
        throw std::out_of_range("Column not found: " + name);
    }
    return it->second;
}

const std::string& Record::at(size_t index) const {
    if (index >= fields_.size()) {
        throw std::out_of_range("Field index out of range: " + std::to_string(index));
    }
    return fields_[index];
}

const std::string& Record::operator[](const std::string& name) const {
    if (!lookup_) {
        throw std::out_of_range("Column name lookup requires a header");
    }
    return at(lookup_->index(name));
}

bool Record::contains(const std::string& name) const {
    return lookup_ && lookup_->find(name).has_value();
}

Document::Document(std::vector<std::string> headers, std::vector<Row> rows)
    : headers_(std::move(headers)), rows_(std::move(rows)) {
    if (!headers_.empty()) {
        lookup_ = std::make_shared<const HeaderLookup>(headers_);
    }
}

size_t Document::column_count() const {
    if (!headers_.empty()) return headers_.size();
    return rows_.empty() ? 0 : rows_.front().size();
}

const Row& Document::row(size_t index) const {
    if (index >= rows_.size()) {
        throw std::out_of_range("Row index out of range: " + std::to_string(index));
    }
    return rows_[index];
}

Record Document::record(size_t index) const {
    return Record(row(index), lookup_);
}

std::vector<std::string> Document::column(size_t index) const {
    if (index >= column_count()) {
        throw std::out_of_range("Column index out of range: " + std::to_string(index));
    }
    std::vector<std::string> values;
    values.reserve(rows_.size());
    for (const auto& r : rows_) {
        values.push_back(r[index]);
    }
    return values;
}

std::vector<std::string> Document::column(const std::string& name) const {
    if (!lookup_) {
        throw std::out_of_range("Column name lookup requires a header");
    }
    return column(lookup_->index(name));
}

const std::string& Document::field(size_t row_index, const std::string& column_name) const {
    if (!lookup_) {
        throw std::out_of_range("Column name lookup requires a header");
    }
    const Row& r = row(row_index);
    size_t col = lookup_->index(column_name);
    if (col >= r.size()) {
        throw std::out_of_range("Column not present in row: " + column_name);
    }
    return r[col];
}

}  // namespace unicsv
