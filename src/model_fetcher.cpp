#include "model_fetcher.hpp"
#include "log.hpp"
#include "media_tool.hpp"
#include <map>
#include <system_error>

namespace fs = std::filesystem;

namespace wordclip {

namespace {

const char* WHISPER_BASE_URL = "https://huggingface.co/ggerganov/whisper.cpp/resolve/main/";

// Quantized ggml checkpoints
const std::map<std::string, std::string>& whisper_files() {
    static const std::map<std::string, std::string> files = {
        {"tiny", "ggml-tiny-q8_0.bin"},
        {"tiny.en", "ggml-tiny.en-q8_0.bin"},
        {"base", "ggml-base-q8_0.bin"},
        {"base.en", "ggml-base.en-q8_0.bin"},
        {"small", "ggml-small-q8_0.bin"},
        {"small.en", "ggml-small.en-q8_0.bin"},
        {"medium", "ggml-medium-q5_0.bin"},
        {"medium.en", "ggml-medium.en-q5_0.bin"},
        {"large", "ggml-large-v3-turbo-q8_0.bin"},
        {"large.en", "ggml-large-v3-turbo-q8_0.bin"},
    };
    return files;
}

// bge-m3, 1024-dimensional
const std::map<std::string, std::string>& embedding_urls() {
    static const std::map<std::string, std::string> urls = {
        {"base", "https://huggingface.co/bbvch-ai/bge-m3-GGUF/resolve/main/bge-m3-q4_k_m.gguf"},
    };
    return urls;
}

} // namespace

bool is_known_model(ModelKind kind, const std::string& name) {
    if (kind == ModelKind::Whisper) return whisper_files().count(name) > 0;
    return embedding_urls().count(name) > 0;
}

Status model_url(ModelKind kind, const std::string& name, std::string& url) {
    if (kind == ModelKind::Whisper) {
        auto it = whisper_files().find(name);
        if (it == whisper_files().end()) {
            return Status::error(ErrorCode::Validation, "invalid model name: " + name);
        }
        url = std::string(WHISPER_BASE_URL) + it->second + "?download=true";
        return Status::success();
    }

    auto it = embedding_urls().find(name);
    if (it == embedding_urls().end()) {
        return Status::error(ErrorCode::Validation, "invalid embedding model name: " + name);
    }
    url = it->second;
    return Status::success();
}

Status ensure_model(ModelKind kind, const std::string& name, const fs::path& path) {
    std::error_code ec;
    if (fs::exists(path, ec)) {
        log_debug("Model already exists at " + path.string());
        return Status::success();
    }

    std::string url;
    Status status = model_url(kind, name, url);
    if (!status.ok()) return status;

    fs::create_directories(path.parent_path(), ec);
    if (ec) {
        return Status::error(ErrorCode::Io, "failed to create " + path.parent_path().string());
    }

    const fs::path partial = path.string() + ".part";
    log_info("Downloading " + name + " model...");

    CommandResult result;
    status = run_command({"curl", "-L", "--fail", "--silent", "--show-error", "-o", partial.string(), url},
                         result);
    if (!status.ok()) return status;
    if (result.exit_code != 0) {
        fs::remove(partial, ec);
        return Status::error(ErrorCode::ExternalTool,
                             "failed to download " + url + ": " + result.output);
    }

    fs::rename(partial, path, ec);
    if (ec) {
        return Status::error(ErrorCode::Io, "failed to move downloaded model to " + path.string() +
                                                ": " + ec.message());
    }

    log_info("Successfully downloaded model to " + path.string());
    return Status::success();
}

} // namespace wordclip
