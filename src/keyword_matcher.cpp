#include "keyword_matcher.hpp"
#include "log.hpp"
#include "text_util.hpp"

namespace wordclip {

Clip pad_window(double start, double end, const MatchConfig& config, const std::string& label) {
    Clip clip;
    const double padded_start = start - static_cast<double>(config.padding_before);
    clip.start = padded_start < 0.0 ? 0.0 : padded_start;
    clip.end = end + static_cast<double>(config.padding_after);
    clip.label = label;
    return clip;
}

KeywordMatcher::KeywordMatcher(const std::map<std::string, MatchConfig>& keywords) {
    for (const auto& kv : keywords) {
        std::string normalized = text::to_lower(text::trim(kv.first));
        if (normalized.empty()) {
            log_warn("Ignoring empty keyword");
            continue;
        }
        if (!is_matchable(kv.first)) {
            log_warn("Keyword '" + kv.first + "' is not a single word without edge punctuation "
                     "and will never match");
        }
        keywords_.push_back({kv.first, normalized, kv.second});
    }
}

bool KeywordMatcher::is_matchable(const std::string& keyword) {
    const auto words = text::split_whitespace(keyword);
    return words.size() == 1 && text::strip_punctuation(words[0]) == words[0] && !words[0].empty();
}

bool KeywordMatcher::contains_word(const std::string& text, const std::string& keyword) {
    const std::string wanted = text::to_lower(keyword);
    for (const auto& word : text::split_whitespace(text)) {
        if (text::normalize_word(word) == wanted) return true;
    }
    return false;
}

std::vector<Clip> KeywordMatcher::match(const std::vector<TimestampedUnit>& units) const {
    std::vector<Clip> windows;

    for (const auto& unit : units) {
        for (const auto& entry : keywords_) {
            if (!contains_word(unit.text, entry.normalized)) continue;

            windows.push_back(pad_window(unit.start, unit.end, entry.config, entry.keyword));
            log_debug("Keyword '" + entry.keyword + "' at " + std::to_string(unit.start) +
                      "s: " + unit.text);
        }
    }

    log_debug("Keyword matching produced " + std::to_string(windows.size()) + " windows");
    return windows;
}

} // namespace wordclip
