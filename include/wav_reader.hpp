#pragma once

#include "status.hpp"
#include <string>
#include <vector>

namespace wordclip {

// Reads a RIFF/WAVE file (PCM16 or float32, any channel count) as mono float in [-1, 1].
// NotFound if the file is missing, CorruptArtifact for a bad header or unsupported format.
Status load_wav_mono(const std::string& path, std::vector<float>& samples, int& sample_rate);

} // namespace wordclip
