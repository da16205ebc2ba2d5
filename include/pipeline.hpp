#pragma once

#include "artifact_cache.hpp"
#include "config.hpp"
#include "embedder.hpp"
#include "media_tool.hpp"
#include "speech_recognizer.hpp"
#include "status.hpp"
#include "types.hpp"
#include <string>
#include <vector>

namespace wordclip {

struct PipelineResult {
    std::vector<TimestampedUnit> transcript;
    std::vector<Clip> clips;
    std::vector<std::string> clip_files;
    bool transcript_from_cache = false;
};

// One run over one input: extract tracks, transcribe, match, merge, cut.
//
// Every collaborator is borrowed and must outlive the pipeline. The embedder is only
// needed in semantic mode. A failing stage aborts the run; artifacts already saved
// stay in the cache.
class Pipeline {
public:
    Pipeline(const Config& config, const ArtifactCache& cache, SpeechRecognizer& recognizer,
             MediaCutter& cutter, Embedder* embedder = nullptr);

    // Use a cached transcript when one exists instead of transcribing again
    void set_reuse_transcript(bool reuse) { reuse_transcript_ = reuse; }

    Status run(PipelineResult& result);

    // Individual stages
    Status extract_audio(std::vector<std::string>& audio_paths);
    Status transcribe_tracks(const std::vector<std::string>& audio_paths,
                             std::vector<TimestampedUnit>& units);
    Status find_clips(const std::vector<TimestampedUnit>& units, std::vector<Clip>& clips);
    Status create_output_clips(const std::vector<Clip>& clips, std::vector<std::string>& clip_files);

    const std::string& input_id() const { return input_id_; }

private:
    Status transcribe_track(const std::string& audio_path, std::vector<TimestampedUnit>& units);
    Status find_keyword_clips(const std::vector<TimestampedUnit>& units, std::vector<Clip>& candidates);
    Status find_semantic_clips(const std::vector<TimestampedUnit>& units, std::vector<Clip>& candidates);

    const Config& config_;
    const ArtifactCache& cache_;
    SpeechRecognizer& recognizer_;
    MediaCutter& cutter_;
    Embedder* embedder_;
    std::string input_id_;
    bool reuse_transcript_ = false;
};

} // namespace wordclip
