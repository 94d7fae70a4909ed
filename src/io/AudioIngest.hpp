#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include "../core/AudioBuffer.hpp"

struct IngestLimits {
  uint64_t maxBytes = 0;          // 0 = unlimited
  double maxDurationSeconds = 0;  // 0 = unlimited
};

// Decodes an uploaded payload (any container/codec FFmpeg understands) into a mono
// buffer at targetSampleRate. Throws InputError for empty, oversize, undecodable
// or over-long payloads.
AudioBuffer decodeAudioPayload(const std::vector<uint8_t>& bytes, uint32_t targetSampleRate,
                               const IngestLimits& limits, const std::string& label = "payload");

std::vector<uint8_t> readFileBytes(const std::string& path);
