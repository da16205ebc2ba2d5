#include "wav_reader.hpp"
#include <algorithm>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <fstream>

namespace wordclip {

namespace {
struct WavHeader {
    char riff[4];
    uint32_t chunk_size;
    char wave[4];
    char fmt[4];
    uint32_t subchunk1_size;
    uint16_t audio_format;   // 1=PCM, 3=float
    uint16_t num_channels;
    uint32_t sample_rate;
    uint32_t byte_rate;
    uint16_t block_align;
    uint16_t bits_per_sample;
};
} // namespace

Status load_wav_mono(const std::string& path, std::vector<float>& samples, int& sample_rate) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return Status::error(ErrorCode::NotFound, "no audio file at " + path);
    }

    std::ifstream f(path, std::ios::binary);
    if (!f) {
        return Status::error(ErrorCode::Io, "failed to open " + path);
    }

    WavHeader hdr{};
    if (!f.read(reinterpret_cast<char*>(&hdr), sizeof(hdr)) ||
        std::strncmp(hdr.riff, "RIFF", 4) != 0 || std::strncmp(hdr.wave, "WAVE", 4) != 0 ||
        std::strncmp(hdr.fmt, "fmt ", 4) != 0) {
        return Status::error(ErrorCode::CorruptArtifact, path + " is not a WAV file");
    }

    // Skip fmt extension bytes, then any chunks before "data"
    const uint32_t fmt_extra = hdr.subchunk1_size > 16 ? hdr.subchunk1_size - 16 : 0;
    if (fmt_extra) f.seekg(fmt_extra, std::ios::cur);

    char chunk_id[4];
    uint32_t chunk_size = 0;
    bool found_data = false;
    while (f.read(chunk_id, 4)) {
        if (!f.read(reinterpret_cast<char*>(&chunk_size), 4)) break;
        if (std::strncmp(chunk_id, "data", 4) == 0) {
            found_data = true;
            break;
        }
        f.seekg(chunk_size, std::ios::cur);
    }
    if (!found_data) {
        return Status::error(ErrorCode::CorruptArtifact, path + " has no data chunk");
    }

    const uint16_t channels = std::max<uint16_t>(1, hdr.num_channels);
    const size_t bytes_per_sample = hdr.bits_per_sample / 8;
    if (bytes_per_sample == 0) {
        return Status::error(ErrorCode::CorruptArtifact, path + " has zero bits per sample");
    }
    const size_t frame_count = chunk_size / (bytes_per_sample * channels);

    std::vector<float> mono(frame_count);

    if (hdr.audio_format == 1 && hdr.bits_per_sample == 16) {
        std::vector<int16_t> buf(frame_count * channels);
        if (!f.read(reinterpret_cast<char*>(buf.data()), static_cast<std::streamsize>(buf.size() * sizeof(int16_t)))) {
            return Status::error(ErrorCode::CorruptArtifact, path + " is truncated");
        }
        constexpr float scale = 1.0f / 32768.0f;
        for (size_t i = 0; i < frame_count; ++i) {
            int32_t sum = 0;
            for (uint16_t c = 0; c < channels; ++c) {
                sum += buf[i * channels + c];
            }
            mono[i] = static_cast<float>(sum) / static_cast<float>(channels) * scale;
        }
    } else if (hdr.audio_format == 3 && hdr.bits_per_sample == 32) {
        std::vector<float> buf(frame_count * channels);
        if (!f.read(reinterpret_cast<char*>(buf.data()), static_cast<std::streamsize>(buf.size() * sizeof(float)))) {
            return Status::error(ErrorCode::CorruptArtifact, path + " is truncated");
        }
        for (size_t i = 0; i < frame_count; ++i) {
            float sum = 0.0f;
            for (uint16_t c = 0; c < channels; ++c) {
                sum += buf[i * channels + c];
            }
            mono[i] = std::clamp(sum / static_cast<float>(channels), -1.0f, 1.0f);
        }
    } else {
        return Status::error(ErrorCode::CorruptArtifact,
                             path + ": unsupported WAV format " + std::to_string(hdr.audio_format) +
                                 " / " + std::to_string(hdr.bits_per_sample) + " bits");
    }

    samples = std::move(mono);
    sample_rate = static_cast<int>(hdr.sample_rate);
    return Status::success();
}

} // namespace wordclip
