#ifndef UNICSV_SCALAR_BUFFER_H
#define UNICSV_SCALAR_BUFFER_H

#include <cstddef>
#include <optional>
#include <string_view>
#include <vector>

namespace unicsv {

// Pushback stack for scalars read ahead while matching delimiters.
// Scalars are stored in reverse so the next one to re-read sits at the back.
class ScalarBuffer {
public:
    ScalarBuffer() { storage_.reserve(8); }

    // Pops the most recently pushed-back scalar, if any.
    std::optional<char32_t> next() {
        if (storage_.empty()) return std::nullopt;
        char32_t c = storage_.back();
        storage_.pop_back();
        return c;
    }

    void push_front(char32_t scalar) { storage_.push_back(scalar); }

    // Pushes back a run of scalars so next() yields them in their original order.
    void push_front(std::u32string_view scalars) {
        storage_.insert(storage_.end(), scalars.rbegin(), scalars.rend());
    }

    void clear() { storage_.clear(); }
    bool empty() const { return storage_.empty(); }
    size_t size() const { return storage_.size(); }

private:
    std::vector<char32_t> storage_;
};

}  // namespace unicsv

#endif  // UNICSV_SCALAR_BUFFER_H
