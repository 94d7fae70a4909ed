#pragma once

#include <cstdint>
#include <vector>

// Offline, duration-preserving pitch shift through Rubber Band.
// The result is padded or truncated to exactly in.size() samples.
std::vector<float> rubberBandPitchShift(const std::vector<float>& in, uint32_t sampleRate, double semitones);
