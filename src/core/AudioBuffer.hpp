#pragma once

#include <vector>
#include <cstdint>
#include <cmath>
#include <algorithm>

struct AudioBuffer {
  uint32_t sampleRate = 22050;
  uint32_t channels = 0;
  uint32_t frames = 0;
  std::vector<float> data; // interleaved: [f0_c0, f0_c1, ..., f1_c0, ...]

  static AudioBuffer mono(std::vector<float> samples, uint32_t sampleRate) {
    AudioBuffer b;
    b.sampleRate = sampleRate;
    b.channels = 1;
    b.frames = static_cast<uint32_t>(samples.size());
    b.data = std::move(samples);
    return b;
  }

  // Same rate and channel layout, new samples. Used by transforms that return a new buffer.
  AudioBuffer withSamples(std::vector<float> samples) const {
    AudioBuffer b;
    b.sampleRate = sampleRate;
    b.channels = channels;
    b.frames = channels > 0 ? static_cast<uint32_t>(samples.size() / channels) : 0;
    b.data = std::move(samples);
    return b;
  }

  bool empty() const { return frames == 0 || data.empty(); }
  bool isMono() const { return channels == 1; }

  double durationSeconds() const {
    return sampleRate > 0 ? static_cast<double>(frames) / static_cast<double>(sampleRate) : 0.0;
  }

  inline const float* framePtr(uint32_t frameIndex) const {
    return data.data() + static_cast<size_t>(frameIndex) * channels;
  }

  // Average all channels into one.
  AudioBuffer downmix() const {
    if (channels <= 1) return *this;
    std::vector<float> out(frames, 0.0f);
    for (uint32_t i = 0; i < frames; ++i) {
      const float* f = framePtr(i);
      double sum = 0.0;
      for (uint32_t c = 0; c < channels; ++c) sum += f[c];
      out[i] = static_cast<float>(sum / static_cast<double>(channels));
    }
    return mono(std::move(out), sampleRate);
  }

  float peak() const {
    float p = 0.0f;
    for (float s : data) p = std::max(p, std::fabs(s));
    return p;
  }

  double rms() const {
    if (data.empty()) return 0.0;
    long double sumSq = 0.0L;
    for (float s : data) sumSq += static_cast<long double>(s) * s;
    return std::sqrt(static_cast<double>(sumSq / static_cast<long double>(data.size())));
  }
};
