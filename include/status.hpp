#pragma once

#include <string>
#include <utility>

namespace wordclip {

enum class ErrorCode {
    Ok,
    Validation,         // bad config / input, detected before the pipeline starts
    NotFound,           // missing cache artifact or record id
    DimensionMismatch,  // embedding length disagrees with the index
    CorruptArtifact,    // malformed on-disk content
    ExternalTool,       // whisper / llama / ffmpeg failure
    Io                  // filesystem write or remove failure
};

const char* to_string(ErrorCode code);

struct Status {
    ErrorCode code = ErrorCode::Ok;
    std::string message;

    bool ok() const { return code == ErrorCode::Ok; }

    static Status success() { return Status{}; }
    static Status error(ErrorCode code, std::string message) {
        Status s;
        s.code = code;
        s.message = std::move(message);
        return s;
    }
};

// "NotFound: no transcript for 'talk'"
std::string describe(const Status& status);

} // namespace wordclip
