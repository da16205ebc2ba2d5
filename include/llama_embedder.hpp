#pragma once

#include "embedder.hpp"
#include <string>
#include <vector>

// Forward declare llama types
struct llama_model;
struct llama_context;

namespace wordclip {

// llama.cpp backed text embedder for GGUF embedding models (bge-m3 by default).
// Output vectors are L2-normalized. Not thread-safe: one context, one caller.
class LlamaEmbedder : public Embedder {
public:
    struct Config {
        std::string model_path;
        int ctx_size = 2048;
        int n_batch = 512;
        int n_threads = 4;
        bool disable_gpu = false;
    };

    LlamaEmbedder();
    ~LlamaEmbedder() override;

    // Disable copy/move (llama context is non-copyable)
    LlamaEmbedder(const LlamaEmbedder&) = delete;
    LlamaEmbedder& operator=(const LlamaEmbedder&) = delete;

    Status initialize(const Config& config);
    void shutdown();
    bool is_initialized() const { return ctx_ != nullptr; }

    Status embed(const std::string& text, std::vector<float>& vector) override;
    Status batch_embed(const std::vector<std::string>& texts,
                       std::vector<std::vector<float>>& vectors) override;

    size_t dimension() const override { return dimension_; }

private:
    Status tokenize(const std::string& text, std::vector<int>& tokens) const;

    Config config_;
    llama_model* model_ = nullptr;
    llama_context* ctx_ = nullptr;
    size_t dimension_ = 0;
};

} // namespace wordclip
