#include "config.hpp"
#include "log.hpp"
#include "model_fetcher.hpp"
#include "text_util.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <limits>
#include <sstream>

using json = nlohmann::json;

namespace wordclip {

namespace {

// Each reader leaves `out` alone when `key` is absent and fills `error` on a type mismatch
bool read_string(const json& obj, const char* key, std::string& out, std::string& error) {
    if (!obj.contains(key)) return true;
    const json& v = obj.at(key);
    if (!v.is_string()) {
        error = std::string("'") + key + "' must be a string";
        return false;
    }
    out = v.get<std::string>();
    return true;
}

bool read_bool(const json& obj, const char* key, bool& out, std::string& error) {
    if (!obj.contains(key)) return true;
    const json& v = obj.at(key);
    if (!v.is_boolean()) {
        error = std::string("'") + key + "' must be true or false";
        return false;
    }
    out = v.get<bool>();
    return true;
}

bool fits_uint32(const json& v) {
    return v.get<uint64_t>() <= std::numeric_limits<uint32_t>::max();
}

bool read_int(const json& obj, const char* key, int& out, std::string& error) {
    if (!obj.contains(key)) return true;
    const json& v = obj.at(key);
    if (!v.is_number_integer()) {
        error = std::string("'") + key + "' must be an integer";
        return false;
    }
    // Positive literals are stored unsigned and would wrap through int64_t
    const bool in_range = v.is_number_unsigned()
        ? v.get<uint64_t>() <= static_cast<uint64_t>(std::numeric_limits<int>::max())
        : v.get<int64_t>() >= std::numeric_limits<int>::min() &&
              v.get<int64_t>() <= std::numeric_limits<int>::max();
    if (!in_range) {
        error = std::string("'") + key + "' is out of range";
        return false;
    }
    out = v.get<int>();
    return true;
}

bool read_uint(const json& obj, const char* key, uint32_t& out, std::string& error) {
    if (!obj.contains(key)) return true;
    const json& v = obj.at(key);
    if (!v.is_number_unsigned()) {
        error = std::string("'") + key + "' must be a non-negative integer";
        return false;
    }
    if (!fits_uint32(v)) {
        error = std::string("'") + key + "' is out of range";
        return false;
    }
    out = v.get<uint32_t>();
    return true;
}

bool read_section(const json& root, const char* key, const json*& section, std::string& error) {
    section = nullptr;
    if (!root.contains(key)) return true;
    if (!root.at(key).is_object()) {
        error = std::string("'") + key + "' must be an object";
        return false;
    }
    section = &root.at(key);
    return true;
}

bool read_clips(const json& root, std::vector<ClipItem>& clips, std::string& error) {
    if (!root.contains("clips")) return true;
    const json& list = root.at("clips");
    if (!list.is_array()) {
        error = "'clips' must be an array";
        return false;
    }

    std::vector<ClipItem> parsed;
    for (const auto& entry : list) {
        ClipItem item;
        if (entry.is_string()) {
            item.text = entry.get<std::string>();
        } else if (entry.is_object()) {
            if (!entry.contains("text")) {
                error = "every clip needs a 'text'";
                return false;
            }
            if (!read_string(entry, "text", item.text, error)) return false;
            if (!read_uint(entry, "padding_before", item.padding.padding_before, error)) return false;
            if (!read_uint(entry, "padding_after", item.padding.padding_after, error)) return false;
        } else {
            error = "clips must be strings or objects";
            return false;
        }
        parsed.push_back(item);
    }

    clips = parsed;
    return true;
}

bool apply_document(const json& root, Config& config, std::string& error) {
    if (!root.is_object()) {
        error = "top level must be an object";
        return false;
    }

    const json* section = nullptr;

    if (!read_section(root, "model", section, error)) return false;
    if (section) {
        if (!read_string(*section, "whisper", config.whisper_model, error)) return false;
        if (!read_string(*section, "embedding", config.embedding_model, error)) return false;
        if (!read_string(*section, "language", config.language, error)) return false;
        if (!read_int(*section, "threads", config.n_threads, error)) return false;
    }

    if (!read_section(root, "llama", section, error)) return false;
    if (section) {
        if (!read_int(*section, "ctx_size", config.llama.ctx_size, error)) return false;
        if (!read_int(*section, "n_batch", config.llama.n_batch, error)) return false;
        if (!read_int(*section, "n_threads", config.llama.n_threads, error)) return false;
        if (!read_bool(*section, "disable_gpu", config.llama.disable_gpu, error)) return false;
    }

    if (!read_section(root, "tracks", section, error)) return false;
    if (section) {
        if (section->contains("audio_tracks")) {
            const json& tracks = section->at("audio_tracks");
            if (!tracks.is_array()) {
                error = "'audio_tracks' must be an array";
                return false;
            }
            std::vector<uint32_t> parsed;
            for (const auto& t : tracks) {
                if (!t.is_number_unsigned() || !fits_uint32(t)) {
                    error = "'audio_tracks' entries must be non-negative 32-bit integers";
                    return false;
                }
                parsed.push_back(t.get<uint32_t>());
            }
            config.audio_tracks = parsed;
        }
        if (!read_bool(*section, "parallel", config.parallel_tracks, error)) return false;
    }

    std::string mode_name;
    if (!read_string(root, "mode", mode_name, error)) return false;
    if (!mode_name.empty() && !parse_match_mode(mode_name, config.mode)) {
        error = "unknown mode '" + mode_name + "' (expected keyword or semantic)";
        return false;
    }

    if (!read_clips(root, config.clips, error)) return false;

    if (!read_section(root, "neighbors", section, error)) return false;
    if (section) {
        if (!read_uint(*section, "before", config.neighbors.before, error)) return false;
        if (!read_uint(*section, "after", config.neighbors.after, error)) return false;
    }

    if (!read_section(root, "search", section, error)) return false;
    if (section) {
        if (!read_uint(*section, "top_k", config.top_k, error)) return false;
    }

    if (!read_section(root, "output", section, error)) return false;
    if (section) {
        if (!read_string(*section, "directory", config.output_directory, error)) return false;
    }

    if (!read_section(root, "cache", section, error)) return false;
    if (section) {
        if (!read_string(*section, "directory", config.cache_directory, error)) return false;
    }

    return true;
}

} // namespace

const char* to_string(MatchMode mode) {
    switch (mode) {
        case MatchMode::Keyword: return "keyword";
        case MatchMode::Semantic: return "semantic";
    }
    return "keyword";
}

bool parse_match_mode(const std::string& name, MatchMode& mode) {
    const std::string lower = text::to_lower(name);
    if (lower == "keyword") {
        mode = MatchMode::Keyword;
        return true;
    }
    if (lower == "semantic") {
        mode = MatchMode::Semantic;
        return true;
    }
    return false;
}

const std::vector<std::string>& whisper_model_names() {
    static const std::vector<std::string> names = {
        "tiny", "base", "small", "medium", "large",
        "tiny.en", "base.en", "small.en", "medium.en", "large.en"
    };
    return names;
}

bool is_valid_whisper_model(const std::string& name) {
    const auto& names = whisper_model_names();
    return std::find(names.begin(), names.end(), name) != names.end();
}

std::map<std::string, MatchConfig> Config::keyword_map() const {
    std::map<std::string, MatchConfig> keywords;
    for (const auto& item : clips) {
        keywords.emplace(item.text, item.padding);
    }
    return keywords;
}

Status load_config_file(const std::string& path, Config& config) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return Status::error(ErrorCode::Validation, "cannot read config file " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();

    json root;
    try {
        root = json::parse(buffer.str());
    } catch (const json::parse_error& e) {
        return Status::error(ErrorCode::Validation,
                             "failed to parse config file " + path + ": " + e.what());
    }

    Config loaded = config;
    std::string error;
    if (!apply_document(root, loaded, error)) {
        return Status::error(ErrorCode::Validation, "config file " + path + ": " + error);
    }

    config = loaded;
    log_debug("Loaded config from " + path);
    return Status::success();
}

void merge_cli(Config& config, const CliOverrides& cli) {
    config.input_file = cli.input_file;

    if (cli.has_clips) {
        config.clips.clear();
        for (const auto& text : cli.clips) {
            ClipItem item;
            item.text = text;
            config.clips.push_back(item);
        }
    }

    if (cli.has_tracks) config.audio_tracks = cli.audio_tracks;
    if (cli.has_whisper_model) config.whisper_model = cli.whisper_model;
    if (cli.has_embedding_model) config.embedding_model = cli.embedding_model;
    if (cli.has_output) config.output_directory = cli.output_directory;
    if (cli.has_mode) config.mode = cli.mode;
    if (cli.has_before) config.neighbors.before = cli.before;
    if (cli.has_after) config.neighbors.after = cli.after;
    if (cli.has_top_k) config.top_k = cli.top_k;
    if (cli.has_cache_directory) config.cache_directory = cli.cache_directory;
    if (cli.parallel_tracks) config.parallel_tracks = true;
}

Status validate_config(const Config& config) {
    if (config.input_file.empty()) {
        return Status::error(ErrorCode::Validation, "input file not specified");
    }

    std::error_code ec;
    if (!std::filesystem::exists(config.input_file, ec)) {
        return Status::error(ErrorCode::Validation, "input file does not exist: " + config.input_file);
    }

    if (!is_valid_whisper_model(config.whisper_model)) {
        return Status::error(ErrorCode::Validation, "invalid model name: " + config.whisper_model);
    }

    if (config.audio_tracks.empty()) {
        return Status::error(ErrorCode::Validation, "no audio tracks specified");
    }
    for (uint32_t track : config.audio_tracks) {
        if (track == 0) {
            return Status::error(ErrorCode::Validation, "audio tracks are 1-based, got 0");
        }
    }

    if (config.clips.empty()) {
        return Status::error(ErrorCode::Validation,
                             config.mode == MatchMode::Keyword ? "no keywords specified"
                                                               : "no moments specified");
    }
    for (const auto& item : config.clips) {
        if (text::trim(item.text).empty()) {
            return Status::error(ErrorCode::Validation, "empty keyword or moment text");
        }
    }

    if (config.mode == MatchMode::Semantic) {
        if (config.top_k == 0) {
            return Status::error(ErrorCode::Validation, "top-k must be at least 1");
        }
        if (config.embedding_model.empty()) {
            return Status::error(ErrorCode::Validation, "no embedding model specified");
        }
        if (!is_known_model(ModelKind::Embedding, config.embedding_model)) {
            return Status::error(ErrorCode::Validation,
                                 "invalid embedding model name: " + config.embedding_model);
        }
    }

    return Status::success();
}

} // namespace wordclip
