#pragma once

#include <cmath>
#include <cstdint>
#include <algorithm>
#include <random>
#include <vector>
#include "core/AudioBuffer.hpp"

namespace testsig {

constexpr uint32_t kRate = 22050;

inline AudioBuffer sine(double hz, double seconds, double amp = 0.5, uint32_t sr = kRate) {
  const size_t n = static_cast<size_t>(seconds * sr);
  std::vector<float> x(n);
  for (size_t i = 0; i < n; ++i) x[i] = static_cast<float>(amp * std::sin(2.0 * M_PI * hz * i / sr));
  return AudioBuffer::mono(std::move(x), sr);
}

// Voice-like tone: fundamental plus decaying harmonics up to ~4 kHz.
inline AudioBuffer harmonic(double f0, double seconds, double amp = 0.5, uint32_t sr = kRate) {
  const size_t n = static_cast<size_t>(seconds * sr);
  std::vector<float> x(n, 0.0f);
  const int harmonics = static_cast<int>(4000.0 / f0);
  double norm = 0.0;
  for (int h = 1; h <= harmonics; ++h) norm += 1.0 / h;
  for (size_t i = 0; i < n; ++i) {
    double s = 0.0;
    for (int h = 1; h <= harmonics; ++h) s += std::sin(2.0 * M_PI * f0 * h * i / sr) / h;
    x[i] = static_cast<float>(amp * s / norm);
  }
  return AudioBuffer::mono(std::move(x), sr);
}

inline AudioBuffer noise(double seconds, double amp = 0.3, uint32_t seed = 1234, uint32_t sr = kRate) {
  const size_t n = static_cast<size_t>(seconds * sr);
  std::mt19937 rng(seed);
  std::uniform_real_distribution<float> dist(-1.0f, 1.0f);
  std::vector<float> x(n);
  for (auto& s : x) s = static_cast<float>(amp * dist(rng));
  return AudioBuffer::mono(std::move(x), sr);
}

inline AudioBuffer silence(double seconds, uint32_t sr = kRate) {
  return AudioBuffer::mono(std::vector<float>(static_cast<size_t>(seconds * sr), 0.0f), sr);
}

inline AudioBuffer stereo(const AudioBuffer& left, const AudioBuffer& right) {
  AudioBuffer b;
  b.sampleRate = left.sampleRate;
  b.channels = 2;
  b.frames = std::min(left.frames, right.frames);
  b.data.resize(static_cast<size_t>(b.frames) * 2);
  for (uint32_t i = 0; i < b.frames; ++i) {
    b.data[2 * i] = left.data[i];
    b.data[2 * i + 1] = right.data[i];
  }
  return b;
}

} // namespace testsig
