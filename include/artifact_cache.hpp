#pragma once

#include "status.hpp"
#include "types.hpp"
#include <filesystem>
#include <string>
#include <vector>

namespace wordclip {

// On-disk store for per-input artifacts under one cache root:
//
//   models/          whisper-{name}.bin, embedding-{name}.gguf
//   audio/           {id}_track_{n}.wav
//   transcriptions/  {id}.json        [{start, end, text}, ...]
//   clips/           {id}_clips.json  [{start, end, keyword}, ...]
//
// `id` is the input file's stem. Two inputs with the same stem share artifacts.
// Nothing here locks: concurrent runs on the same root and id can race.
class ArtifactCache {
public:
    explicit ArtifactCache(std::filesystem::path root);

    // $XDG_CACHE_HOME/wordclip, else $HOME/.cache/wordclip, else .cache/wordclip
    static std::filesystem::path default_root();

    // File stem of the input media ("/videos/talk.mp4" -> "talk")
    static std::string input_id_for(const std::filesystem::path& input);

    // Creates the four sub-directories
    Status init() const;

    std::filesystem::path model_path(const std::string& model_name) const;
    std::filesystem::path embedding_model_path(const std::string& model_name) const;
    std::filesystem::path audio_path(const std::string& input_id, uint32_t track) const;
    std::filesystem::path transcript_path(const std::string& input_id) const;
    std::filesystem::path clips_path(const std::string& input_id) const;

    Status save_transcript(const std::string& input_id,
                           const std::vector<TimestampedUnit>& units) const;
    // NotFound if nothing was saved for input_id, CorruptArtifact if the file is malformed
    Status load_transcript(const std::string& input_id,
                           std::vector<TimestampedUnit>& units) const;

    Status save_clips(const std::string& input_id, const std::vector<Clip>& clips) const;
    Status load_clips(const std::string& input_id, std::vector<Clip>& clips) const;

    // Removes the input's audio, transcript and clip artifacts. Models stay.
    Status cleanup_for(const std::string& input_id) const;

    // Removes the whole cache root, models included
    Status cleanup_all() const;

    const std::filesystem::path& root() const { return root_; }
    const std::filesystem::path& models_dir() const { return models_dir_; }
    const std::filesystem::path& audio_dir() const { return audio_dir_; }
    const std::filesystem::path& transcriptions_dir() const { return transcriptions_dir_; }
    const std::filesystem::path& clips_dir() const { return clips_dir_; }

private:
    std::filesystem::path root_;
    std::filesystem::path models_dir_;
    std::filesystem::path audio_dir_;
    std::filesystem::path transcriptions_dir_;
    std::filesystem::path clips_dir_;
};

} // namespace wordclip
