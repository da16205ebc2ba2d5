#pragma once

#include "types.hpp"
#include <map>
#include <string>
#include <vector>

namespace wordclip {

// Window around [start, end] widened by the padding; start never goes below zero
Clip pad_window(double start, double end, const MatchConfig& config, const std::string& label);

// Finds literal keyword hits in a unit sequence.
// Matching is whole-word and case-insensitive: a unit's text is split on whitespace, each
// piece loses leading/trailing punctuation and is compared to the lower-cased keyword.
// Every hit yields one padded window; overlaps are left for merge_clips().
class KeywordMatcher {
public:
    explicit KeywordMatcher(const std::map<std::string, MatchConfig>& keywords);

    std::vector<Clip> match(const std::vector<TimestampedUnit>& units) const;

    // True if `keyword` occurs as a whole word in `text`
    static bool contains_word(const std::string& text, const std::string& keyword);

    // Units are compared one stripped word at a time, so only a single word with no
    // leading/trailing punctuation can ever match. Others are kept but logged.
    static bool is_matchable(const std::string& keyword);

    size_t keyword_count() const { return keywords_.size(); }

private:
    struct Entry {
        std::string keyword;     // as configured, used for the label
        std::string normalized;  // lower-cased
        MatchConfig config;
    };

    std::vector<Entry> keywords_;
};

} // namespace wordclip
