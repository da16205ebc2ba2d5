// Tests for load_wav_mono

#include "wav_reader.hpp"
#include <chrono>
#include <cmath>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <cassert>

using namespace wordclip;
namespace fs = std::filesystem;

static fs::path scratch_dir() {
    static fs::path dir;
    if (dir.empty()) {
        auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        dir = fs::temp_directory_path() / ("wordclip_wav_" + std::to_string(stamp));
        fs::create_directories(dir);
    }
    return dir;
}

template <typename T>
static void put(std::string& out, T value) {
    char bytes[sizeof(T)];
    std::memcpy(bytes, &value, sizeof(T));
    out.append(bytes, sizeof(T));
}

// Little-endian RIFF/WAVE with an optional chunk between fmt and data
static std::string make_wav(uint16_t format, uint16_t channels, uint32_t rate, uint16_t bits,
                            const std::string& data, bool with_list_chunk = false) {
    std::string list;
    if (with_list_chunk) {
        list = "LIST";
        put<uint32_t>(list, 4);
        list += "INFO";
    }

    std::string out = "RIFF";
    put<uint32_t>(out, static_cast<uint32_t>(36 + list.size() + data.size()));
    out += "WAVE";
    out += "fmt ";
    put<uint32_t>(out, 16);
    put<uint16_t>(out, format);
    put<uint16_t>(out, channels);
    put<uint32_t>(out, rate);
    put<uint32_t>(out, rate * channels * (bits / 8));
    put<uint16_t>(out, static_cast<uint16_t>(channels * (bits / 8)));
    put<uint16_t>(out, bits);
    out += list;
    out += "data";
    put<uint32_t>(out, static_cast<uint32_t>(data.size()));
    out += data;
    return out;
}

static std::string write(const std::string& name, const std::string& content) {
    fs::path path = scratch_dir() / name;
    std::ofstream out(path, std::ios::binary);
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
    return path.string();
}

static bool near(float a, float b) {
    return std::fabs(a - b) < 1e-6f;
}

void test_pcm16_mono() {
    std::cout << "Testing 16-bit mono PCM..." << std::endl;

    std::string data;
    put<int16_t>(data, 0);
    put<int16_t>(data, 16384);
    put<int16_t>(data, -32768);
    const std::string path = write("mono16.wav", make_wav(1, 1, 16000, 16, data));

    std::vector<float> samples;
    int rate = 0;
    assert(load_wav_mono(path, samples, rate).ok());
    assert(rate == 16000);
    assert(samples.size() == 3);
    assert(near(samples[0], 0.0f));
    assert(near(samples[1], 0.5f));
    assert(near(samples[2], -1.0f));

    std::cout << "  PASS" << std::endl;
}

void test_pcm16_stereo_downmix() {
    std::cout << "Testing stereo downmix..." << std::endl;

    std::string data;
    put<int16_t>(data, 1000);
    put<int16_t>(data, 3000);
    put<int16_t>(data, -8192);
    put<int16_t>(data, 8192);
    const std::string path = write("stereo16.wav", make_wav(1, 2, 44100, 16, data, true));

    std::vector<float> samples;
    int rate = 0;
    assert(load_wav_mono(path, samples, rate).ok());
    assert(rate == 44100);
    assert(samples.size() == 2);
    assert(near(samples[0], 2000.0f / 32768.0f));
    assert(near(samples[1], 0.0f));

    std::cout << "  PASS" << std::endl;
}

void test_float32() {
    std::cout << "Testing 32-bit float..." << std::endl;

    std::string data;
    put<float>(data, 0.25f);
    put<float>(data, -0.75f);
    put<float>(data, 1.5f);
    const std::string path = write("float32.wav", make_wav(3, 1, 16000, 32, data));

    std::vector<float> samples;
    int rate = 0;
    assert(load_wav_mono(path, samples, rate).ok());
    assert(samples.size() == 3);
    assert(near(samples[0], 0.25f));
    assert(near(samples[1], -0.75f));
    // Clamped into range
    assert(near(samples[2], 1.0f));

    std::cout << "  PASS" << std::endl;
}

void test_errors() {
    std::cout << "Testing error reporting..." << std::endl;

    std::vector<float> samples = {0.5f};
    int rate = 7;

    Status status = load_wav_mono((scratch_dir() / "absent.wav").string(), samples, rate);
    assert(status.code == ErrorCode::NotFound);

    status = load_wav_mono(write("garbage.wav", "this is not a wav file at all, not even close"), samples, rate);
    assert(status.code == ErrorCode::CorruptArtifact);

    std::string data(4, '\0');
    status = load_wav_mono(write("pcm8.wav", make_wav(1, 1, 8000, 8, data)), samples, rate);
    assert(status.code == ErrorCode::CorruptArtifact);

    // Header claims more data than the file holds
    std::string truncated = make_wav(1, 1, 16000, 16, std::string(8, '\0'));
    truncated.resize(truncated.size() - 4);
    status = load_wav_mono(write("truncated.wav", truncated), samples, rate);
    assert(status.code == ErrorCode::CorruptArtifact);

    // Outputs untouched on failure
    assert(samples.size() == 1);
    assert(rate == 7);

    std::cout << "  PASS" << std::endl;
}

int main() {
    std::cout << "\n=== WAV Reader Test Suite ===" << std::endl << std::endl;

    test_pcm16_mono();
    test_pcm16_stereo_downmix();
    test_float32();
    test_errors();

    std::error_code ec;
    fs::remove_all(scratch_dir(), ec);

    std::cout << "\n=== All Tests Passed! ===" << std::endl << std::endl;
    return 0;
}
