#pragma once

#include "status.hpp"
#include "types.hpp"
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace wordclip {

// Exact keyword matching or embedding-based moment search
enum class MatchMode {
    Keyword,
    Semantic
};

const char* to_string(MatchMode mode);
bool parse_match_mode(const std::string& name, MatchMode& mode);

// Whisper model names accepted by --model / model.whisper
bool is_valid_whisper_model(const std::string& name);
const std::vector<std::string>& whisper_model_names();

// A keyword (keyword mode) or moment text (semantic mode) with its clip padding
struct ClipItem {
    std::string text;
    MatchConfig padding;
};

// Embedding model runtime settings
struct LlamaSettings {
    int ctx_size = 2048;
    int n_batch = 512;      // also the longest text embedded in one pass, in tokens
    int n_threads = 4;
    bool disable_gpu = false;
};

struct Config {
    std::string input_file;

    // Models
    std::string whisper_model = "base";
    std::string embedding_model = "base";
    std::string language = "en";
    int n_threads = 4;              // whisper CPU threads
    LlamaSettings llama;

    // Tracks (1-based audio stream indices)
    std::vector<uint32_t> audio_tracks = {1, 2};
    bool parallel_tracks = false;   // transcribe each track on its own thread

    // Matching
    MatchMode mode = MatchMode::Keyword;
    std::vector<ClipItem> clips;
    NeighborWindow neighbors;       // semantic mode context, in units
    uint32_t top_k = 3;             // semantic hits per moment

    std::string output_directory = "output";
    std::string cache_directory;    // empty: ArtifactCache::default_root()

    // Keyword -> padding, first occurrence of a keyword wins
    std::map<std::string, MatchConfig> keyword_map() const;
};

// Values given on the command line. has_* marks an explicitly supplied option.
struct CliOverrides {
    std::string input_file;

    bool has_output = false;
    std::string output_directory;

    bool has_whisper_model = false;
    std::string whisper_model;

    bool has_embedding_model = false;
    std::string embedding_model;

    bool has_tracks = false;
    std::vector<uint32_t> audio_tracks;

    bool has_clips = false;
    std::vector<std::string> clips;

    bool has_mode = false;
    MatchMode mode = MatchMode::Keyword;

    bool has_before = false;
    uint32_t before = 0;
    bool has_after = false;
    uint32_t after = 0;

    bool has_top_k = false;
    uint32_t top_k = 0;

    bool has_cache_directory = false;
    std::string cache_directory;

    bool parallel_tracks = false;
};

// Reads a JSON config file over `config`; keys that are absent keep their current value.
// Unreadable file, malformed JSON or a wrongly typed value is a Validation error.
Status load_config_file(const std::string& path, Config& config);

// Input path always comes from the CLI. A CLI clip list replaces the configured one
// (with default padding); every other option only overrides when it was given.
void merge_cli(Config& config, const CliOverrides& cli);

// Side-effect free checks run before any pipeline stage
Status validate_config(const Config& config);

} // namespace wordclip
