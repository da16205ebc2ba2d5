#include "transcriber.hpp"
#include "log.hpp"
#include "transcript_reconstructor.hpp"
#include "whisper.h"
#include <chrono>
#include <cstdio>
#include <memory>

namespace wordclip {

namespace {

// whisper timestamps are in 10 ms ticks
constexpr double SECONDS_PER_TICK = 0.01;

// Keep errors/warnings always; info/debug only if verbose
void whisper_log_cb(ggml_log_level level, const char* text, void*) {
    switch (level) {
    case GGML_LOG_LEVEL_ERROR:
    case GGML_LOG_LEVEL_WARN:
        std::fputs(text, stderr);
        break;
    default:
        if (is_verbose()) std::fputs(text, stderr);
        break;
    }
}

struct StateDeleter {
    void operator()(whisper_state* state) const { whisper_free_state(state); }
};

} // namespace

Transcriber::Transcriber() = default;

Transcriber::~Transcriber() {
    shutdown();
}

Status Transcriber::initialize(const std::string& model_path, int n_threads) {
    if (ctx_) return Status::success();

    n_threads_ = n_threads > 0 ? n_threads : 1;

    whisper_log_set(whisper_log_cb, nullptr);

    struct whisper_context_params cparams = whisper_context_default_params();
#ifdef WORDCLIP_WHISPER_GPU
    cparams.use_gpu = true;
#else
    cparams.use_gpu = false;
#endif

    ctx_ = whisper_init_from_file_with_params(model_path.c_str(), cparams);
    if (!ctx_) {
        return Status::error(ErrorCode::ExternalTool, "failed to load whisper model: " + model_path);
    }

    log_info("Loaded whisper model: " + model_path);
    return Status::success();
}

void Transcriber::shutdown() {
    if (ctx_) {
        whisper_free(ctx_);
        ctx_ = nullptr;
    }
}

int Transcriber::special_token_threshold() const {
    if (!ctx_) return DEFAULT_SPECIAL_TOKEN_THRESHOLD;
    return whisper_token_eot(ctx_);
}

Status Transcriber::transcribe(const std::vector<float>& audio, std::vector<AsrSegment>& segments) {
    segments.clear();

    if (!ctx_) {
        return Status::error(ErrorCode::ExternalTool, "transcriber not initialized");
    }
    if (audio.empty()) {
        return Status::success();
    }

    std::unique_ptr<whisper_state, StateDeleter> state(whisper_init_state(ctx_));
    if (!state) {
        return Status::error(ErrorCode::ExternalTool, "failed to create whisper state");
    }

    auto start_time = std::chrono::steady_clock::now();

    whisper_full_params wparams = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);
    wparams.print_progress   = false;
    wparams.print_special    = false;
    wparams.print_realtime   = false;
    wparams.print_timestamps = false;
    wparams.translate        = false;
    wparams.language         = language_.c_str();
    wparams.n_threads        = n_threads_;
    wparams.greedy.best_of   = 1;

    int ret = whisper_full_with_state(ctx_, state.get(), wparams, audio.data(),
                                      static_cast<int>(audio.size()));
    if (ret != 0) {
        return Status::error(ErrorCode::ExternalTool,
                             "whisper inference failed (ret=" + std::to_string(ret) + ")");
    }

    const int n_segments = whisper_full_n_segments_from_state(state.get());
    segments.reserve(static_cast<size_t>(n_segments));

    for (int i = 0; i < n_segments; ++i) {
        AsrSegment segment;

        const char* segment_text = whisper_full_get_segment_text_from_state(state.get(), i);
        if (!segment_text) {
            segment.readable = false;
            segments.push_back(segment);
            continue;
        }
        segment.text = segment_text;
        segment.start = static_cast<double>(whisper_full_get_segment_t0_from_state(state.get(), i)) * SECONDS_PER_TICK;
        segment.end = static_cast<double>(whisper_full_get_segment_t1_from_state(state.get(), i)) * SECONDS_PER_TICK;

        const int n_tokens = whisper_full_n_tokens_from_state(state.get(), i);
        segment.tokens.reserve(static_cast<size_t>(n_tokens > 0 ? n_tokens : 0));

        for (int t = 0; t < n_tokens; ++t) {
            AsrToken token;
            const char* token_text = whisper_full_get_token_text_from_state(ctx_, state.get(), i, t);
            if (!token_text) {
                token.readable = false;
                segment.tokens.push_back(token);
                continue;
            }
            whisper_token_data data = whisper_full_get_token_data_from_state(state.get(), i, t);
            token.text = token_text;
            token.vocabulary_id = data.id;
            token.approximate_time = segment.start;
            segment.tokens.push_back(token);
        }

        segments.push_back(std::move(segment));
    }

    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);
    log_debug("Transcribed " + std::to_string(audio.size()) + " samples into " +
              std::to_string(n_segments) + " segments in " + std::to_string(duration.count()) + "ms");

    return Status::success();
}

} // namespace wordclip
