#include "transcript_reconstructor.hpp"
#include "log.hpp"
#include "text_util.hpp"
#include <sstream>

namespace wordclip {

namespace {

TimestampedUnit make_unit(double start, double end, const std::string& text) {
    TimestampedUnit unit;
    unit.start = start;
    unit.end = end < start ? start : end;
    unit.text = text;
    return unit;
}

} // namespace

TranscriptReconstructor::TranscriptReconstructor(int special_token_threshold)
    : special_token_threshold_(special_token_threshold) {}

std::vector<TimestampedUnit> TranscriptReconstructor::reconstruct(
    const std::vector<AsrSegment>& segments) const {
    std::vector<TimestampedUnit> units;
    for (size_t i = 0; i < segments.size(); ++i) {
        append_segment(segments[i], i, units);
    }
    log_debug("Reconstructed " + std::to_string(units.size()) + " units from " +
              std::to_string(segments.size()) + " segments");
    return units;
}

bool TranscriptReconstructor::is_skippable(const AsrToken& token) const {
    return token.vocabulary_id >= special_token_threshold_ || text::trim(token.text).empty();
}

void TranscriptReconstructor::append_segment(const AsrSegment& segment, size_t index,
                                             std::vector<TimestampedUnit>& units) const {
    if (!segment.readable) {
        log_warn("Skipping segment " + std::to_string(index) + ": could not read segment data");
        return;
    }

    if (segment.tokens.empty()) {
        if (segment.text.empty()) return;

        if (!units.empty() && units.back().text == segment.text) {
            log_debug("Segment " + std::to_string(index) + ": dropping repeated caption");
            return;
        }

        std::ostringstream msg;
        msg << "Segment " << index << ": " << segment.start << "s -> " << segment.end
            << "s: " << segment.text;
        log_debug(msg.str());
        units.push_back(make_unit(segment.start, segment.end, segment.text));
        return;
    }

    append_words(segment, index, units);
}

void TranscriptReconstructor::append_words(const AsrSegment& segment, size_t index,
                                           std::vector<TimestampedUnit>& units) const {
    const size_t n_tokens = segment.tokens.size();

    std::string current_text;
    bool has_word_start = false;
    double word_start = 0.0;

    for (size_t t = 0; t < n_tokens; ++t) {
        const AsrToken& token = segment.tokens[t];

        if (!token.readable) {
            log_debug("Skipping token " + std::to_string(t) + " in segment " +
                      std::to_string(index) + ": could not read token data");
            continue;
        }
        if (is_skippable(token)) continue;

        if (!has_word_start) {
            word_start = token.approximate_time;
            has_word_start = true;
        }

        current_text += token.text;

        const bool is_last_token = t == n_tokens - 1;
        if (is_last_token || text::ends_with_whitespace(token.text)) {
            std::string word = text::trim(current_text);
            if (!word.empty()) {
                std::ostringstream msg;
                msg << "Adding word: '" << word << "' (" << word_start << " -> "
                    << token.approximate_time << ")";
                log_debug(msg.str());
                units.push_back(make_unit(word_start, token.approximate_time, word));
            }
            has_word_start = false;
            current_text.clear();
        }
    }

    // Last token was skipped, so no boundary fired on the trailing word
    std::string remaining = text::trim(current_text);
    if (!remaining.empty()) {
        const double start = has_word_start ? word_start : segment.start;
        std::ostringstream msg;
        msg << "Adding remaining word: '" << remaining << "' (" << start << " -> "
            << segment.end << ")";
        log_debug(msg.str());
        units.push_back(make_unit(start, segment.end, remaining));
    }
}

} // namespace wordclip
