#include "pipeline.hpp"
#include "clip_assembler.hpp"
#include "keyword_matcher.hpp"
#include "log.hpp"
#include "semantic_index.hpp"
#include "transcript_reconstructor.hpp"
#include "wav_reader.hpp"
#include <filesystem>
#include <iterator>
#include <sstream>
#include <thread>

namespace fs = std::filesystem;

namespace wordclip {

namespace {

// whisper expects 16 kHz input; ffmpeg extraction already resamples
constexpr int EXPECTED_SAMPLE_RATE = 16000;

std::string describe_clip(const Clip& clip) {
    std::ostringstream out;
    out << clip.start << "s -> " << clip.end << "s";
    return out.str();
}

} // namespace

Pipeline::Pipeline(const Config& config, const ArtifactCache& cache, SpeechRecognizer& recognizer,
                   MediaCutter& cutter, Embedder* embedder)
    : config_(config)
    , cache_(cache)
    , recognizer_(recognizer)
    , cutter_(cutter)
    , embedder_(embedder)
    , input_id_(ArtifactCache::input_id_for(config.input_file)) {
}

Status Pipeline::run(PipelineResult& result) {
    result = PipelineResult{};
    log_info("Processing video: " + config_.input_file);

    Status status = cache_.init();
    if (!status.ok()) return status;

    bool have_transcript = false;
    if (reuse_transcript_) {
        status = cache_.load_transcript(input_id_, result.transcript);
        if (status.ok()) {
            have_transcript = true;
            result.transcript_from_cache = true;
            log_info("Reusing cached transcript (" + std::to_string(result.transcript.size()) + " units)");
        } else if (status.code == ErrorCode::NotFound) {
            log_debug("No cached transcript, transcribing");
        } else {
            return status;
        }
    }

    if (!have_transcript) {
        log_debug("Step 1: Extracting audio tracks");
        std::vector<std::string> audio_paths;
        status = extract_audio(audio_paths);
        if (!status.ok()) return status;

        log_debug("Step 2: Transcribing audio");
        status = transcribe_tracks(audio_paths, result.transcript);
        if (!status.ok()) return status;
        log_debug("Found " + std::to_string(result.transcript.size()) + " timestamped units");

        status = cache_.save_transcript(input_id_, result.transcript);
        if (!status.ok()) return status;
    }

    log_debug("Step 3: Finding clips");
    status = find_clips(result.transcript, result.clips);
    if (!status.ok()) return status;
    log_debug("Found " + std::to_string(result.clips.size()) + " clips");

    status = cache_.save_clips(input_id_, result.clips);
    if (!status.ok()) return status;

    log_debug("Step 4: Creating output clips");
    status = create_output_clips(result.clips, result.clip_files);
    if (!status.ok()) return status;

    log_info("Successfully created " + std::to_string(result.clip_files.size()) + " clips");
    return Status::success();
}

Status Pipeline::extract_audio(std::vector<std::string>& audio_paths) {
    audio_paths.clear();
    for (uint32_t track : config_.audio_tracks) {
        const std::string output = cache_.audio_path(input_id_, track).string();
        log_debug("Extracting audio track " + std::to_string(track) + " to " + output);

        Status status = cutter_.extract_audio_track(config_.input_file, output, track);
        if (!status.ok()) return status;
        audio_paths.push_back(output);
    }
    return Status::success();
}

Status Pipeline::transcribe_track(const std::string& audio_path, std::vector<TimestampedUnit>& units) {
    std::vector<float> samples;
    int sample_rate = 0;
    Status status = load_wav_mono(audio_path, samples, sample_rate);
    if (!status.ok()) return status;

    if (sample_rate != EXPECTED_SAMPLE_RATE) {
        return Status::error(ErrorCode::ExternalTool,
                             audio_path + " has sample rate " + std::to_string(sample_rate) +
                                 ", expected " + std::to_string(EXPECTED_SAMPLE_RATE));
    }
    log_debug("Loaded " + std::to_string(samples.size()) + " samples from " + audio_path);

    std::vector<AsrSegment> segments;
    status = recognizer_.transcribe(samples, segments);
    if (!status.ok()) return status;

    TranscriptReconstructor reconstructor(recognizer_.special_token_threshold());
    units = reconstructor.reconstruct(segments);
    return Status::success();
}

Status Pipeline::transcribe_tracks(const std::vector<std::string>& audio_paths,
                                   std::vector<TimestampedUnit>& units) {
    const size_t n = audio_paths.size();
    std::vector<std::vector<TimestampedUnit>> per_track(n);
    std::vector<Status> statuses(n);

    if (config_.parallel_tracks && n > 1) {
        std::vector<std::thread> workers;
        workers.reserve(n);
        for (size_t i = 0; i < n; ++i) {
            workers.emplace_back([this, &audio_paths, &per_track, &statuses, i] {
                statuses[i] = transcribe_track(audio_paths[i], per_track[i]);
            });
        }
        for (auto& worker : workers) {
            worker.join();
        }
    } else {
        for (size_t i = 0; i < n; ++i) {
            log_debug("Processing audio file " + std::to_string(i + 1) + " of " + std::to_string(n));
            statuses[i] = transcribe_track(audio_paths[i], per_track[i]);
            if (!statuses[i].ok()) break;
        }
    }

    for (const auto& status : statuses) {
        if (!status.ok()) return status;
    }

    std::vector<TimestampedUnit> combined;
    for (auto& track_units : per_track) {
        combined.insert(combined.end(), std::make_move_iterator(track_units.begin()),
                        std::make_move_iterator(track_units.end()));
    }
    // Tracks interleave in time
    sort_by_start(combined);

    units = std::move(combined);
    return Status::success();
}

Status Pipeline::find_keyword_clips(const std::vector<TimestampedUnit>& units,
                                    std::vector<Clip>& candidates) {
    KeywordMatcher matcher(config_.keyword_map());
    candidates = matcher.match(units);
    return Status::success();
}

Status Pipeline::find_semantic_clips(const std::vector<TimestampedUnit>& units,
                                     std::vector<Clip>& candidates) {
    if (!embedder_) {
        return Status::error(ErrorCode::Validation, "semantic mode needs an embedding model");
    }

    SemanticIndex index(embedder_->dimension());
    Status status = index.populate(units, *embedder_);
    if (!status.ok()) return status;
    log_debug("Indexed " + std::to_string(index.size()) + " units");

    for (const auto& moment : config_.clips) {
        log_debug("Searching for moment: " + moment.text);

        std::vector<EmbeddingRecord> hits;
        status = index.query(moment.text, config_.top_k, *embedder_, hits);
        if (!status.ok()) return status;
        log_debug("Found " + std::to_string(hits.size()) + " results");

        for (const auto& hit : hits) {
            log_debug("Result: " + hit.text);

            std::vector<EmbeddingRecord> window;
            status = index.neighbors(hit.id, config_.neighbors.before, config_.neighbors.after, window);
            if (!status.ok()) return status;

            Clip collapsed = collapse_window(window);
            candidates.push_back(pad_window(collapsed.start, collapsed.end, moment.padding, collapsed.label));
        }
    }

    return Status::success();
}

Status Pipeline::find_clips(const std::vector<TimestampedUnit>& units, std::vector<Clip>& clips) {
    std::vector<Clip> candidates;
    Status status = config_.mode == MatchMode::Semantic ? find_semantic_clips(units, candidates)
                                                        : find_keyword_clips(units, candidates);
    if (!status.ok()) return status;

    clips = merge_clips(std::move(candidates));
    for (const auto& clip : clips) {
        log_debug("Clip " + describe_clip(clip) + ": " + clip.label);
    }
    return Status::success();
}

Status Pipeline::create_output_clips(const std::vector<Clip>& clips, std::vector<std::string>& clip_files) {
    clip_files.clear();

    std::error_code ec;
    fs::create_directories(config_.output_directory, ec);
    if (ec) {
        return Status::error(ErrorCode::Io, "failed to create output directory " +
                                                config_.output_directory + ": " + ec.message());
    }

    const fs::path input(config_.input_file);
    const std::string extension = input.has_extension() ? input.extension().string() : ".mp4";

    for (size_t i = 0; i < clips.size(); ++i) {
        const fs::path output = fs::path(config_.output_directory) /
                                ("clip_" + std::to_string(i + 1) + "_" + input_id_ + extension);

        Status status = cutter_.cut(config_.input_file, output.string(), clips[i].start, clips[i].end);
        if (!status.ok()) return status;

        log_debug("Wrote " + output.string() + " (" + describe_clip(clips[i]) + ")");
        clip_files.push_back(output.string());
    }

    return Status::success();
}

} // namespace wordclip
