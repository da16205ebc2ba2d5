#include "media_tool.hpp"
#include "log.hpp"
#include "text_util.hpp"
#include <array>
#include <cstdio>
#include <iomanip>
#include <memory>
#include <sstream>
#include <sys/wait.h>

namespace wordclip {

namespace {

std::string format_seconds(double seconds) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(3) << seconds;
    return out.str();
}

// Last few lines of tool output, enough to show the actual error
std::string tail(const std::string& output, size_t max_chars = 600) {
    if (output.size() <= max_chars) return output;
    return "..." + output.substr(output.size() - max_chars);
}

Status run_checked(const std::vector<std::string>& argv, const std::string& what,
                   CommandResult& result) {
    Status status = run_command(argv, result);
    if (!status.ok()) return status;
    if (result.exit_code != 0) {
        return Status::error(ErrorCode::ExternalTool,
                             what + " failed (exit " + std::to_string(result.exit_code) +
                                 "): " + tail(text::trim(result.output)));
    }
    return Status::success();
}

} // namespace

std::string shell_quote(const std::string& arg) {
    std::string quoted = "'";
    for (char c : arg) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}

Status run_command(const std::vector<std::string>& argv, CommandResult& result) {
    result = CommandResult{};
    if (argv.empty()) {
        return Status::error(ErrorCode::ExternalTool, "empty command");
    }

    std::string cmd;
    for (const auto& arg : argv) {
        if (!cmd.empty()) cmd += ' ';
        cmd += shell_quote(arg);
    }
    cmd += " 2>&1";
    log_debug("> " + cmd);

    FILE* pipe = popen(cmd.c_str(), "r");
    if (!pipe) {
        return Status::error(ErrorCode::ExternalTool, "failed to start " + argv[0]);
    }

    std::array<char, 4096> buffer;
    while (std::fgets(buffer.data(), static_cast<int>(buffer.size()), pipe)) {
        result.output += buffer.data();
    }

    const int status = pclose(pipe);
    if (status == -1) {
        return Status::error(ErrorCode::ExternalTool, "failed to wait for " + argv[0]);
    }
    result.exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;

    // sh reports a missing binary as 127
    if (result.exit_code == 127) {
        return Status::error(ErrorCode::ExternalTool, argv[0] + " is not installed or not on PATH");
    }
    return Status::success();
}

Status FFmpeg::check_available() {
    CommandResult result;
    Status status = run_checked({"ffmpeg", "-version"}, "ffmpeg -version", result);
    if (!status.ok()) {
        return Status::error(ErrorCode::ExternalTool,
                             "FFmpeg is not installed or not available in PATH (" + status.message + ")");
    }
    return Status::success();
}

Status FFmpeg::extract_audio_track(const std::string& input, const std::string& output,
                                   uint32_t track) {
    if (track == 0) {
        return Status::error(ErrorCode::Validation, "audio tracks are 1-based");
    }

    const std::vector<std::string> argv = {
        "ffmpeg",
        "-i", input,
        "-map", "0:a:" + std::to_string(track - 1),
        "-f", "wav",
        "-acodec", "pcm_s16le",
        "-ar", "16000",
        "-ac", "1",
        "-vn",
        "-y",
        output
    };

    CommandResult result;
    Status status = run_checked(argv, "ffmpeg audio extraction of track " + std::to_string(track), result);
    if (!status.ok()) return status;

    log_debug("Extracted track " + std::to_string(track) + " to " + output);
    return Status::success();
}

Status FFmpeg::cut(const std::string& input, const std::string& output, double start, double end) {
    if (end < start) {
        return Status::error(ErrorCode::Validation, "clip ends before it starts");
    }

    const std::vector<std::string> argv = {
        "ffmpeg",
        "-i", input,
        "-ss", format_seconds(start),
        "-t", format_seconds(end - start),
        "-c:v", "copy",
        "-c:a", "copy",
        output,
        "-y"
    };

    CommandResult result;
    return run_checked(argv, "ffmpeg clip " + output, result);
}

} // namespace wordclip
