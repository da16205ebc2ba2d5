#pragma once

#include "speech_recognizer.hpp"
#include <string>
#include <vector>

// Forward declare whisper types
struct whisper_context;

namespace wordclip {

// whisper.cpp backed recognizer. The model context is shared; every transcribe()
// call runs on its own whisper_state, so tracks can be transcribed in parallel.
//
// Token times: each token is stamped with its segment's start time, not its own
// offset. Word units built from them therefore start and end at the segment start.
class Transcriber : public SpeechRecognizer {
public:
    Transcriber();
    ~Transcriber() override;

    Transcriber(const Transcriber&) = delete;
    Transcriber& operator=(const Transcriber&) = delete;

    // Load a ggml model file
    Status initialize(const std::string& model_path, int n_threads = 4);
    void shutdown();
    bool is_initialized() const { return ctx_ != nullptr; }

    Status transcribe(const std::vector<float>& audio, std::vector<AsrSegment>& segments) override;

    // The model's end-of-text token id
    int special_token_threshold() const override;

    void set_language(const std::string& lang) { language_ = lang; }

private:
    whisper_context* ctx_ = nullptr;
    int n_threads_ = 4;
    std::string language_ = "en";
};

} // namespace wordclip
