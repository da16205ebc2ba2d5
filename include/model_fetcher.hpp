#pragma once

#include "status.hpp"
#include <filesystem>
#include <string>

namespace wordclip {

enum class ModelKind {
    Whisper,
    Embedding
};

// True if `name` has a known download URL for `kind`
bool is_known_model(ModelKind kind, const std::string& name);

// Download URL for a named model; Validation error for an unknown name
Status model_url(ModelKind kind, const std::string& name, std::string& url);

// Downloads the model to `path` with curl unless it is already there.
// The file is written to `path`.part first and renamed once complete.
Status ensure_model(ModelKind kind, const std::string& name, const std::filesystem::path& path);

} // namespace wordclip
