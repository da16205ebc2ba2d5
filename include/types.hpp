#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace wordclip {

// One word (or collapsed segment) of transcript text with its time range in seconds
struct TimestampedUnit {
    double start = 0.0;
    double end = 0.0;
    std::string text;

    bool operator==(const TimestampedUnit& other) const {
        return start == other.start && end == other.end && text == other.text;
    }
    bool operator!=(const TimestampedUnit& other) const { return !(*this == other); }
};

// A clip window. label holds the keyword(s) or moment text(s) that produced it.
struct Clip {
    double start = 0.0;
    double end = 0.0;
    std::string label;

    bool operator==(const Clip& other) const {
        return start == other.start && end == other.end && label == other.label;
    }
    bool operator!=(const Clip& other) const { return !(*this == other); }
};

// Padding in whole seconds around a keyword hit or semantic moment
struct MatchConfig {
    uint32_t padding_before = 30;
    uint32_t padding_after = 30;
};

// Context window size in units (not seconds) for semantic hits
struct NeighborWindow {
    uint32_t before = 5;
    uint32_t after = 5;
};

struct EmbeddingRecord {
    int64_t id = 0;
    double start = 0.0;
    double end = 0.0;
    std::string text;
    std::vector<float> vector;
};

// Raw ASR output, see SpeechRecognizer
struct AsrToken {
    std::string text;
    int vocabulary_id = 0;
    double approximate_time = 0.0;
    bool readable = true;   // false when the engine could not report this token
};

struct AsrSegment {
    std::string text;
    double start = 0.0;
    double end = 0.0;
    std::vector<AsrToken> tokens;
    bool readable = true;   // false when segment text/time/count could not be read
};

// Stable by start; required whenever units from several tracks are combined
void sort_by_start(std::vector<TimestampedUnit>& units);

} // namespace wordclip
