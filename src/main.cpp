#include "artifact_cache.hpp"
#include "config.hpp"
#include "llama_embedder.hpp"
#include "log.hpp"
#include "media_tool.hpp"
#include "model_fetcher.hpp"
#include "pipeline.hpp"
#include "transcriber.hpp"
#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <sstream>

namespace {

constexpr int EXIT_VALIDATION = 1;
constexpr int EXIT_PIPELINE = 2;

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " -i FILE -c TEXT [TEXT...] [options]\n"
              << "\nOptions:\n"
              << "  -i, --input FILE          Input video file (required)\n"
              << "  -c, --clips TEXT...       Keywords (keyword mode) or moments (semantic mode)\n"
              << "  -o, --output DIR          Output directory for clips (default: output)\n"
              << "      --config FILE         JSON config file\n"
              << "  -m, --model NAME          Whisper model: tiny, base, small, medium, large\n"
              << "                            and the .en variants (default: base)\n"
              << "      --embedding-model N   Embedding model for semantic mode (default: base)\n"
              << "  -t, --tracks N[,N...]     1-based audio tracks to transcribe (default: 1,2)\n"
              << "      --mode MODE           keyword or semantic (default: keyword)\n"
              << "      --before N            Units of context before a semantic hit (default: 5)\n"
              << "      --after N             Units of context after a semantic hit (default: 5)\n"
              << "      --top-k N             Semantic hits per moment (default: 3)\n"
              << "      --cache-dir DIR       Cache root (default: $XDG_CACHE_HOME/wordclip)\n"
              << "  -j, --parallel            Transcribe tracks in parallel\n"
              << "      --reuse-transcript    Use a cached transcript if there is one\n"
              << "      --no-cleanup          Keep extracted audio and artifacts after the run\n"
              << "      --clean-cache         Remove the whole cache (models included) and exit\n"
              << "  -v, --verbose             Verbose output\n"
              << "  -h, --help                Show this help\n"
              << "\nPrecedence: command line, then config file, then defaults.\n"
              << "Clips given on the command line use 30s padding on both sides.\n"
              << std::endl;
}

bool is_option(const char* arg) {
    return arg[0] == '-' && arg[1] != '\0';
}

bool parse_uint(const char* text, uint32_t& value) {
    if (!text || !*text || *text == '-') return false;
    char* end = nullptr;
    errno = 0;
    unsigned long parsed = std::strtoul(text, &end, 10);
    if (errno != 0 || *end != '\0' || parsed > UINT32_MAX) return false;
    value = static_cast<uint32_t>(parsed);
    return true;
}

// "1,2" or "3"
bool parse_tracks(const char* text, std::vector<uint32_t>& tracks) {
    std::stringstream ss(text);
    std::string item;
    bool any = false;
    while (std::getline(ss, item, ',')) {
        uint32_t track = 0;
        if (!parse_uint(item.c_str(), track)) return false;
        tracks.push_back(track);
        any = true;
    }
    return any;
}

int fail(wordclip::ErrorCode code, const std::string& message) {
    wordclip::log_error(message);
    return code == wordclip::ErrorCode::Validation ? EXIT_VALIDATION : EXIT_PIPELINE;
}

int fail(const wordclip::Status& status) {
    return fail(status.code, wordclip::describe(status));
}

} // namespace

int main(int argc, char* argv[]) {
    wordclip::CliOverrides cli;
    std::string config_path;
    bool reuse_transcript = false;
    bool no_cleanup = false;
    bool clean_cache = false;
    bool verbose = false;

    // Parse arguments
    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        bool has_value = i + 1 < argc;

        if (strcmp(arg, "-h") == 0 || strcmp(arg, "--help") == 0) {
            print_usage(argv[0]);
            return 0;
        }
        else if ((strcmp(arg, "-i") == 0 || strcmp(arg, "--input") == 0) && has_value) {
            cli.input_file = argv[++i];
        }
        else if ((strcmp(arg, "-o") == 0 || strcmp(arg, "--output") == 0) && has_value) {
            cli.has_output = true;
            cli.output_directory = argv[++i];
        }
        else if (strcmp(arg, "--config") == 0 && has_value) {
            config_path = argv[++i];
        }
        else if ((strcmp(arg, "-m") == 0 || strcmp(arg, "--model") == 0) && has_value) {
            cli.has_whisper_model = true;
            cli.whisper_model = argv[++i];
        }
        else if (strcmp(arg, "--embedding-model") == 0 && has_value) {
            cli.has_embedding_model = true;
            cli.embedding_model = argv[++i];
        }
        else if ((strcmp(arg, "-t") == 0 || strcmp(arg, "--tracks") == 0) && has_value) {
            // Repeated -t accumulates
            cli.has_tracks = true;
            if (!parse_tracks(argv[++i], cli.audio_tracks)) {
                std::cerr << "Invalid track list: " << argv[i] << std::endl;
                return EXIT_VALIDATION;
            }
        }
        else if ((strcmp(arg, "-c") == 0 || strcmp(arg, "--clips") == 0) && has_value) {
            cli.has_clips = true;
            while (i + 1 < argc && !is_option(argv[i + 1])) {
                cli.clips.push_back(argv[++i]);
            }
        }
        else if (strcmp(arg, "--mode") == 0 && has_value) {
            cli.has_mode = true;
            if (!wordclip::parse_match_mode(argv[++i], cli.mode)) {
                std::cerr << "Unknown mode: " << argv[i] << std::endl;
                print_usage(argv[0]);
                return EXIT_VALIDATION;
            }
        }
        else if (strcmp(arg, "--before") == 0 && has_value) {
            cli.has_before = true;
            if (!parse_uint(argv[++i], cli.before)) {
                std::cerr << "Invalid --before value: " << argv[i] << std::endl;
                return EXIT_VALIDATION;
            }
        }
        else if (strcmp(arg, "--after") == 0 && has_value) {
            cli.has_after = true;
            if (!parse_uint(argv[++i], cli.after)) {
                std::cerr << "Invalid --after value: " << argv[i] << std::endl;
                return EXIT_VALIDATION;
            }
        }
        else if (strcmp(arg, "--top-k") == 0 && has_value) {
            cli.has_top_k = true;
            if (!parse_uint(argv[++i], cli.top_k)) {
                std::cerr << "Invalid --top-k value: " << argv[i] << std::endl;
                return EXIT_VALIDATION;
            }
        }
        else if (strcmp(arg, "--cache-dir") == 0 && has_value) {
            cli.has_cache_directory = true;
            cli.cache_directory = argv[++i];
        }
        else if (strcmp(arg, "-j") == 0 || strcmp(arg, "--parallel") == 0) {
            cli.parallel_tracks = true;
        }
        else if (strcmp(arg, "--reuse-transcript") == 0) {
            reuse_transcript = true;
        }
        else if (strcmp(arg, "--no-cleanup") == 0) {
            no_cleanup = true;
        }
        else if (strcmp(arg, "--clean-cache") == 0) {
            clean_cache = true;
        }
        else if (strcmp(arg, "-v") == 0 || strcmp(arg, "--verbose") == 0) {
            verbose = true;
        }
        else {
            std::cerr << "Unknown option: " << arg << std::endl;
            print_usage(argv[0]);
            return EXIT_VALIDATION;
        }
    }

    wordclip::set_verbose(verbose);

    wordclip::Config config;
    if (!config_path.empty()) {
        wordclip::Status status = wordclip::load_config_file(config_path, config);
        if (!status.ok()) return fail(status);
    }
    wordclip::merge_cli(config, cli);

    wordclip::ArtifactCache cache(config.cache_directory.empty()
                                      ? wordclip::ArtifactCache::default_root()
                                      : std::filesystem::path(config.cache_directory));

    if (clean_cache) {
        wordclip::Status status = cache.cleanup_all();
        if (!status.ok()) return fail(status);
        wordclip::log_info("Removed cache " + cache.root().string());
        return 0;
    }

    wordclip::Status status = wordclip::validate_config(config);
    if (!status.ok()) {
        wordclip::log_error(wordclip::describe(status));
        print_usage(argv[0]);
        return EXIT_VALIDATION;
    }

    const bool semantic = config.mode == wordclip::MatchMode::Semantic;

    std::cout << "wordclip - Transcript Clip Extractor\n" << std::endl;
    std::cout << "Input: " << config.input_file << std::endl;
    std::cout << "Mode: " << wordclip::to_string(config.mode) << std::endl;
    std::cout << "Model: " << config.whisper_model << std::endl;
    if (semantic) {
        std::cout << "Embedding model: " << config.embedding_model << std::endl;
    }
    std::cout << "Tracks:";
    for (uint32_t track : config.audio_tracks) std::cout << " " << track;
    std::cout << std::endl;
    std::cout << "Output: " << config.output_directory << std::endl;
    std::cout << "Cache: " << cache.root().string() << std::endl;
    std::cout << std::endl;

    status = cache.init();
    if (!status.ok()) return fail(status);

    status = wordclip::FFmpeg::check_available();
    if (!status.ok()) return fail(status);

    const std::string input_id = wordclip::ArtifactCache::input_id_for(config.input_file);

    // A cached transcript makes the whisper model unnecessary
    std::error_code ec;
    const bool need_whisper =
        !(reuse_transcript && std::filesystem::exists(cache.transcript_path(input_id), ec));

    wordclip::Transcriber transcriber;
    if (need_whisper) {
        const auto model_path = cache.model_path(config.whisper_model);
        status = wordclip::ensure_model(wordclip::ModelKind::Whisper, config.whisper_model, model_path);
        if (!status.ok()) return fail(status);

        transcriber.set_language(config.language);
        status = transcriber.initialize(model_path.string(), config.n_threads);
        if (!status.ok()) return fail(status);
    }

    wordclip::LlamaEmbedder embedder;
    if (semantic) {
        const auto model_path = cache.embedding_model_path(config.embedding_model);
        status = wordclip::ensure_model(wordclip::ModelKind::Embedding, config.embedding_model, model_path);
        if (!status.ok()) return fail(status);

        wordclip::LlamaEmbedder::Config embedder_config;
        embedder_config.model_path = model_path.string();
        embedder_config.ctx_size = config.llama.ctx_size;
        embedder_config.n_batch = config.llama.n_batch;
        embedder_config.n_threads = config.llama.n_threads;
        embedder_config.disable_gpu = config.llama.disable_gpu;

        status = embedder.initialize(embedder_config);
        if (!status.ok()) return fail(status);
    }

    wordclip::FFmpeg ffmpeg;
    wordclip::Pipeline pipeline(config, cache, transcriber, ffmpeg, semantic ? &embedder : nullptr);
    pipeline.set_reuse_transcript(reuse_transcript);

    wordclip::PipelineResult result;
    status = pipeline.run(result);
    if (!status.ok()) {
        // Pipeline errors never exit with the validation code
        return fail(wordclip::ErrorCode::ExternalTool, wordclip::describe(status));
    }

    for (size_t i = 0; i < result.clips.size(); ++i) {
        const auto& clip = result.clips[i];
        std::cout << "  [" << clip.start << "s - " << clip.end << "s] " << clip.label << std::endl;
    }

    if (!no_cleanup) {
        status = cache.cleanup_for(input_id);
        if (!status.ok()) {
            wordclip::log_warn("Cleanup failed: " + wordclip::describe(status));
        } else {
            wordclip::log_debug("Removed cached artifacts for " + input_id);
        }
    }

    return 0;
}
