#include "llama_embedder.hpp"
#include "log.hpp"
#include "llama.h"
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <mutex>

namespace wordclip {

namespace {

std::once_flag g_backend_once;

void llama_log_cb(ggml_log_level level, const char* text, void*) {
    if (level == GGML_LOG_LEVEL_ERROR || level == GGML_LOG_LEVEL_WARN || is_verbose()) {
        std::fputs(text, stderr);
    }
}

// False if the vector holds NaN/inf
bool normalize(std::vector<float>& v) {
    double norm = 0.0;
    for (float x : v) norm += static_cast<double>(x) * x;
    norm = std::sqrt(norm);
    if (!std::isfinite(norm)) return false;
    if (norm <= 0.0) return true;
    for (float& x : v) x = static_cast<float>(x / norm);
    return true;
}

} // namespace

LlamaEmbedder::LlamaEmbedder() = default;

LlamaEmbedder::~LlamaEmbedder() {
    shutdown();
}

Status LlamaEmbedder::initialize(const Config& config) {
    if (ctx_) return Status::success();
    config_ = config;

    std::call_once(g_backend_once, [] {
        llama_log_set(llama_log_cb, nullptr);
        llama_backend_init();
    });

    llama_model_params mparams = llama_model_default_params();
    mparams.n_gpu_layers = config_.disable_gpu ? 0 : 99;

    model_ = llama_model_load_from_file(config_.model_path.c_str(), mparams);
    if (!model_) {
        return Status::error(ErrorCode::ExternalTool,
                             "failed to load embedding model: " + config_.model_path);
    }

    llama_context_params cparams = llama_context_default_params();
    cparams.embeddings = true;
    cparams.n_ctx = static_cast<uint32_t>(config_.ctx_size);
    cparams.n_batch = static_cast<uint32_t>(config_.n_batch);
    cparams.n_ubatch = static_cast<uint32_t>(config_.n_batch);
    cparams.n_threads = config_.n_threads;
    cparams.n_threads_batch = config_.n_threads;

    ctx_ = llama_init_from_model(model_, cparams);
    if (!ctx_) {
        llama_model_free(model_);
        model_ = nullptr;
        return Status::error(ErrorCode::ExternalTool, "failed to create embedding context");
    }

    dimension_ = static_cast<size_t>(llama_model_n_embd(model_));
    log_info("Loaded embedding model: " + config_.model_path + " (" +
             std::to_string(dimension_) + " dimensions)");
    return Status::success();
}

void LlamaEmbedder::shutdown() {
    if (ctx_) {
        llama_free(ctx_);
        ctx_ = nullptr;
    }
    if (model_) {
        llama_model_free(model_);
        model_ = nullptr;
    }
}

Status LlamaEmbedder::tokenize(const std::string& text, std::vector<int>& tokens) const {
    const llama_vocab* vocab = llama_model_get_vocab(model_);
    const int32_t len = static_cast<int32_t>(text.size());

    // First call reports the required size as a negative count
    int32_t n = llama_tokenize(vocab, text.c_str(), len, nullptr, 0, true, false);
    if (n < 0) n = -n;

    std::vector<llama_token> buf(static_cast<size_t>(n));
    n = llama_tokenize(vocab, text.c_str(), len, buf.data(), static_cast<int32_t>(buf.size()), true, false);
    if (n < 0) {
        return Status::error(ErrorCode::ExternalTool, "failed to tokenize text for embedding");
    }
    buf.resize(static_cast<size_t>(n));

    const size_t max_tokens = static_cast<size_t>(std::max(1, config_.n_batch));
    if (buf.size() > max_tokens) {
        log_debug("Truncating " + std::to_string(buf.size()) + " tokens to " + std::to_string(max_tokens));
        buf.resize(max_tokens);
    }

    tokens.assign(buf.begin(), buf.end());
    return Status::success();
}

Status LlamaEmbedder::embed(const std::string& text, std::vector<float>& vector) {
    if (!ctx_) {
        return Status::error(ErrorCode::ExternalTool, "embedder not initialized");
    }

    std::vector<int> tokens;
    Status status = tokenize(text, tokens);
    if (!status.ok()) return status;

    vector.assign(dimension_, 0.0f);
    if (tokens.empty()) return Status::success();

    const int32_t n_tokens = static_cast<int32_t>(tokens.size());
    llama_batch batch = llama_batch_init(n_tokens, 0, 1);
    for (int32_t i = 0; i < n_tokens; ++i) {
        batch.token[i] = tokens[static_cast<size_t>(i)];
        batch.pos[i] = i;
        batch.n_seq_id[i] = 1;
        batch.seq_id[i][0] = 0;
        batch.logits[i] = true;
    }
    batch.n_tokens = n_tokens;

    // Each text is its own sequence 0; drop the previous one
    llama_memory_clear(llama_get_memory(ctx_), true);

    int rc = 0;
    if (llama_model_has_encoder(model_) && !llama_model_has_decoder(model_)) {
        rc = llama_encode(ctx_, batch);
    } else {
        rc = llama_decode(ctx_, batch);
    }
    if (rc != 0) {
        llama_batch_free(batch);
        return Status::error(ErrorCode::ExternalTool, "embedding inference failed (rc=" + std::to_string(rc) + ")");
    }

    const float* emb = llama_get_embeddings_seq(ctx_, 0);
    if (!emb) {
        // Model without pooling: use the last token
        emb = llama_get_embeddings_ith(ctx_, n_tokens - 1);
    }
    if (!emb) {
        llama_batch_free(batch);
        return Status::error(ErrorCode::ExternalTool, "embedding model returned no embeddings");
    }

    std::copy(emb, emb + dimension_, vector.begin());
    llama_batch_free(batch);

    if (!normalize(vector)) {
        return Status::error(ErrorCode::ExternalTool, "embedding model returned non-finite values");
    }
    return Status::success();
}

Status LlamaEmbedder::batch_embed(const std::vector<std::string>& texts,
                                  std::vector<std::vector<float>>& vectors) {
    std::vector<std::vector<float>> out;
    out.reserve(texts.size());

    for (const auto& text : texts) {
        std::vector<float> v;
        Status status = embed(text, v);
        if (!status.ok()) return status;
        out.push_back(std::move(v));
    }

    vectors = std::move(out);
    return Status::success();
}

} // namespace wordclip
