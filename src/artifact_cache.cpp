#include "artifact_cache.hpp"
#include "log.hpp"
#include <nlohmann/json.hpp>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace wordclip {

namespace {

Status write_json(const fs::path& path, const json& document, const std::string& what) {
    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
    if (ec) {
        return Status::error(ErrorCode::Io, "failed to create " + path.parent_path().string() +
                                                ": " + ec.message());
    }

    std::ofstream out(path, std::ios::trunc);
    if (!out.is_open()) {
        return Status::error(ErrorCode::Io, "failed to open " + what + " file " + path.string());
    }
    // Token text can split multi-byte sequences; invalid UTF-8 is replaced, not thrown
    out << document.dump(2, ' ', false, json::error_handler_t::replace);
    out.close();
    if (out.fail()) {
        return Status::error(ErrorCode::Io, "failed to write " + what + " file " + path.string());
    }

    log_debug("Saved " + what + " to " + path.string());
    return Status::success();
}

Status read_json_array(const fs::path& path, const std::string& what, json& document) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return Status::error(ErrorCode::NotFound, "no " + what + " at " + path.string());
    }

    std::ifstream in(path);
    if (!in.is_open()) {
        return Status::error(ErrorCode::Io, "failed to open " + what + " file " + path.string());
    }
    std::stringstream buffer;
    buffer << in.rdbuf();

    try {
        document = json::parse(buffer.str());
    } catch (const json::parse_error& e) {
        return Status::error(ErrorCode::CorruptArtifact,
                             "failed to parse " + what + " file " + path.string() + ": " + e.what());
    }

    if (!document.is_array()) {
        return Status::error(ErrorCode::CorruptArtifact,
                             what + " file " + path.string() + " is not a JSON array");
    }
    return Status::success();
}

Status remove_if_present(const fs::path& path) {
    std::error_code ec;
    fs::remove(path, ec);
    if (ec) {
        return Status::error(ErrorCode::Io, "failed to remove " + path.string() + ": " + ec.message());
    }
    return Status::success();
}

} // namespace

ArtifactCache::ArtifactCache(fs::path root)
    : root_(std::move(root))
    , models_dir_(root_ / "models")
    , audio_dir_(root_ / "audio")
    , transcriptions_dir_(root_ / "transcriptions")
    , clips_dir_(root_ / "clips") {
}

fs::path ArtifactCache::default_root() {
    const char* xdg = std::getenv("XDG_CACHE_HOME");
    if (xdg && *xdg) return fs::path(xdg) / "wordclip";

    const char* home = std::getenv("HOME");
    if (home && *home) return fs::path(home) / ".cache" / "wordclip";

    return fs::path(".cache") / "wordclip";
}

std::string ArtifactCache::input_id_for(const fs::path& input) {
    return input.stem().string();
}

Status ArtifactCache::init() const {
    for (const auto& dir : {models_dir_, audio_dir_, transcriptions_dir_, clips_dir_}) {
        std::error_code ec;
        fs::create_directories(dir, ec);
        if (ec) {
            return Status::error(ErrorCode::Io, "failed to create " + dir.string() + ": " + ec.message());
        }
    }
    log_debug("Cache initialized at " + root_.string());
    return Status::success();
}

fs::path ArtifactCache::model_path(const std::string& model_name) const {
    return models_dir_ / ("whisper-" + model_name + ".bin");
}

fs::path ArtifactCache::embedding_model_path(const std::string& model_name) const {
    return models_dir_ / ("embedding-" + model_name + ".gguf");
}

fs::path ArtifactCache::audio_path(const std::string& input_id, uint32_t track) const {
    return audio_dir_ / (input_id + "_track_" + std::to_string(track) + ".wav");
}

fs::path ArtifactCache::transcript_path(const std::string& input_id) const {
    return transcriptions_dir_ / (input_id + ".json");
}

fs::path ArtifactCache::clips_path(const std::string& input_id) const {
    return clips_dir_ / (input_id + "_clips.json");
}

Status ArtifactCache::save_transcript(const std::string& input_id,
                                      const std::vector<TimestampedUnit>& units) const {
    json document = json::array();
    for (const auto& unit : units) {
        document.push_back(json{{"start", unit.start}, {"end", unit.end}, {"text", unit.text}});
    }
    return write_json(transcript_path(input_id), document, "transcript");
}

Status ArtifactCache::load_transcript(const std::string& input_id,
                                      std::vector<TimestampedUnit>& units) const {
    const fs::path path = transcript_path(input_id);
    json document;
    Status status = read_json_array(path, "transcript", document);
    if (!status.ok()) return status;

    std::vector<TimestampedUnit> loaded;
    loaded.reserve(document.size());
    try {
        for (const auto& item : document) {
            TimestampedUnit unit;
            unit.start = item.at("start").get<double>();
            unit.end = item.at("end").get<double>();
            unit.text = item.at("text").get<std::string>();
            loaded.push_back(std::move(unit));
        }
    } catch (const json::exception& e) {
        return Status::error(ErrorCode::CorruptArtifact,
                             "malformed transcript entry in " + path.string() + ": " + e.what());
    }

    units = std::move(loaded);
    log_debug("Loaded " + std::to_string(units.size()) + " units from " + path.string());
    return Status::success();
}

Status ArtifactCache::save_clips(const std::string& input_id, const std::vector<Clip>& clips) const {
    json document = json::array();
    for (const auto& clip : clips) {
        // "keyword" is the historical field name; it holds the merged label
        document.push_back(json{{"start", clip.start}, {"end", clip.end}, {"keyword", clip.label}});
    }
    return write_json(clips_path(input_id), document, "clips");
}

Status ArtifactCache::load_clips(const std::string& input_id, std::vector<Clip>& clips) const {
    const fs::path path = clips_path(input_id);
    json document;
    Status status = read_json_array(path, "clips", document);
    if (!status.ok()) return status;

    std::vector<Clip> loaded;
    loaded.reserve(document.size());
    try {
        for (const auto& item : document) {
            Clip clip;
            clip.start = item.at("start").get<double>();
            clip.end = item.at("end").get<double>();
            clip.label = item.at("keyword").get<std::string>();
            loaded.push_back(std::move(clip));
        }
    } catch (const json::exception& e) {
        return Status::error(ErrorCode::CorruptArtifact,
                             "malformed clip entry in " + path.string() + ": " + e.what());
    }

    clips = std::move(loaded);
    return Status::success();
}

Status ArtifactCache::cleanup_for(const std::string& input_id) const {
    const std::string audio_prefix = input_id + "_track_";

    std::error_code ec;
    if (fs::is_directory(audio_dir_, ec)) {
        std::vector<fs::path> doomed;
        for (fs::directory_iterator it(audio_dir_, ec), end; !ec && it != end; it.increment(ec)) {
            const std::string name = it->path().filename().string();
            if (name.rfind(audio_prefix, 0) == 0) {
                doomed.push_back(it->path());
            }
        }
        if (ec) {
            return Status::error(ErrorCode::Io, "failed to list " + audio_dir_.string() + ": " + ec.message());
        }
        for (const auto& path : doomed) {
            Status status = remove_if_present(path);
            if (!status.ok()) return status;
        }
    }

    Status status = remove_if_present(transcript_path(input_id));
    if (!status.ok()) return status;

    status = remove_if_present(clips_path(input_id));
    if (!status.ok()) return status;

    log_debug("Removed cached artifacts for '" + input_id + "'");
    return Status::success();
}

Status ArtifactCache::cleanup_all() const {
    std::error_code ec;
    fs::remove_all(root_, ec);
    if (ec) {
        return Status::error(ErrorCode::Io, "failed to remove " + root_.string() + ": " + ec.message());
    }
    log_info("Removed cache directory " + root_.string());
    return Status::success();
}

} // namespace wordclip
