#pragma once

#include "status.hpp"
#include "types.hpp"
#include <vector>

namespace wordclip {

// Speech-to-text engine producing timestamped segments with their tokens
class SpeechRecognizer {
public:
    virtual ~SpeechRecognizer() = default;

    // `audio` is 16 kHz mono float. Implementations must allow concurrent calls
    // from different threads on different buffers.
    virtual Status transcribe(const std::vector<float>& audio, std::vector<AsrSegment>& segments) = 0;

    // Token ids at or above this value are control tokens
    virtual int special_token_threshold() const = 0;
};

} // namespace wordclip
