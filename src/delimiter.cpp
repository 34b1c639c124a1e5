#include "unicsv/delimiter.h"

#include <algorithm>
#include <utility>

namespace unicsv {

DelimiterMatcher::DelimiterMatcher(std::vector<std::u32string> alternatives)
    : alternatives_(std::move(alternatives)) {
    std::stable_sort(alternatives_.begin(), alternatives_.end(),
                     [](const std::u32string& a, const std::u32string& b) {
                         return a.size() < b.size();
                     });
    for (const auto& alt : alternatives_) {
        max_length_ = std::max(max_length_, alt.size());
        for (char32_t c : alt) {
            if (scalars_.find(c) == std::u32string::npos) scalars_.push_back(c);
        }
    }
}

bool DelimiterMatcher::matches(char32_t first, ScalarBuffer& buffer,
                               ScalarDecoder& decoder) const {
    if (max_length_ == 1) {
        for (const auto& alt : alternatives_) {
            if (alt[0] == first) return true;
        }
        return false;
    }

    // Scalars read past `first`, not yet confirmed as part of a delimiter
    std::u32string lookahead;
    bool exhausted = false;

    for (const auto& alt : alternatives_) {
        if (alt.empty() || alt[0] != first) continue;

        while (lookahead.size() + 1 < alt.size() && !exhausted) {
            auto c = buffer.next();
            if (!c) c = decoder.next();
            if (!c) {
                exhausted = true;
                break;
            }
            lookahead.push_back(*c);
        }
        if (lookahead.size() + 1 < alt.size()) {
            // Input ends before this alternative could complete; longer ones can't either
            break;
        }

        if (std::equal(alt.begin() + 1, alt.end(), lookahead.begin())) {
            if (lookahead.size() + 1 > alt.size()) {
                buffer.push_front(std::u32string_view(lookahead).substr(alt.size() - 1));
            }
            return true;
        }
    }

    if (!lookahead.empty()) buffer.push_front(lookahead);
    return false;
}

}  // namespace unicsv
