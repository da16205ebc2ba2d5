#pragma once

#include "status.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace wordclip {

struct CommandResult {
    int exit_code = -1;
    std::string output;     // stdout and stderr interleaved
};

// Single-quotes `arg` for /bin/sh
std::string shell_quote(const std::string& arg);

// Runs argv[0] with the remaining arguments through the shell and captures its output.
// Fails with ExternalTool only if the process could not be started; a non-zero exit
// is reported through result.exit_code.
Status run_command(const std::vector<std::string>& argv, CommandResult& result);

// Audio extraction and clip cutting
class MediaCutter {
public:
    virtual ~MediaCutter() = default;

    // Writes 1-based audio stream `track` of `input` to `output` as 16 kHz mono PCM16 WAV
    virtual Status extract_audio_track(const std::string& input, const std::string& output,
                                       uint32_t track) = 0;

    // Copies [start, end] seconds of `input` to `output` without re-encoding
    virtual Status cut(const std::string& input, const std::string& output,
                       double start, double end) = 0;
};

// ffmpeg found on PATH
class FFmpeg : public MediaCutter {
public:
    static Status check_available();

    Status extract_audio_track(const std::string& input, const std::string& output,
                               uint32_t track) override;
    Status cut(const std::string& input, const std::string& output,
               double start, double end) override;
};

} // namespace wordclip
