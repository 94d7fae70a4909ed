#pragma once

#include <cstdint>
#include <vector>
#include "../core/EngineConfig.hpp"

struct AudioFileSpec {
  BitDepth bitDepth = BitDepth::Float32;
  uint32_t sampleRate = 22050;
  uint32_t channels = 1;
};

// RIFF/WAVE encoding of interleaved float samples. PCM formats clip to [-1, 1].
std::vector<uint8_t> encodeWav(const AudioFileSpec& spec, const std::vector<float>& interleaved);
