#pragma once

#include "types.hpp"
#include <vector>

namespace wordclip {

// Whisper's multilingual start-of-transcript id; everything at or above it is a control token
constexpr int DEFAULT_SPECIAL_TOKEN_THRESHOLD = 50258;

// Turns raw ASR segments of one audio source into an ordered sequence of units.
//
// Segments without tokens become one unit each (an exact repeat of the previous unit's
// text is dropped, the engine re-emits unchanged captions across chunk boundaries).
// Segments with tokens are split into words: tokens accumulate until one ends in
// whitespace or the segment's last token is reached.
class TranscriptReconstructor {
public:
    explicit TranscriptReconstructor(int special_token_threshold = DEFAULT_SPECIAL_TOKEN_THRESHOLD);

    std::vector<TimestampedUnit> reconstruct(const std::vector<AsrSegment>& segments) const;

    // Appends the units of one segment to `units` (the source's output so far)
    void append_segment(const AsrSegment& segment, size_t index,
                        std::vector<TimestampedUnit>& units) const;

    // Control tokens and whitespace-only tokens carry no transcript text
    bool is_skippable(const AsrToken& token) const;

    int special_token_threshold() const { return special_token_threshold_; }

private:
    void append_words(const AsrSegment& segment, size_t index,
                      std::vector<TimestampedUnit>& units) const;

    int special_token_threshold_;
};

} // namespace wordclip
