#pragma once

#include <algorithm>
#include <complex>
#include <cstdint>
#include <memory>
#include <nlohmann/json.hpp>
#include "../core/AudioBuffer.hpp"
#include "../dsp/DspBackend.hpp"

// Whole-buffer summary statistics, printed by `voxmorph --info`.
struct AudioInfo {
  double durationSeconds = 0.0;
  uint32_t frames = 0;
  uint32_t sampleRate = 0;
  double rms = 0.0;
  double peak = 0.0;
  double dynamicRange = 0.0;      // max - min sample value
  double dominantFrequency = 0.0; // Hz, strongest bin below Nyquist
  double spectralCentroid = 0.0;  // Hz, over the whole-buffer spectrum
};

inline AudioInfo describeAudio(const AudioBuffer& input, DspBackend& dsp) {
  const AudioBuffer b = input.downmix();
  AudioInfo info;
  info.durationSeconds = b.durationSeconds();
  info.frames = b.frames;
  info.sampleRate = b.sampleRate;
  if (b.empty()) return info;
  info.rms = b.rms();
  info.peak = b.peak();
  const auto mm = std::minmax_element(b.data.begin(), b.data.end());
  info.dynamicRange = double(*mm.second) - double(*mm.first);

  const auto spectrum = dsp.realFft(b.data);
  const size_t n = b.data.size();
  const size_t half = n / 2; // bins [0, n/2)
  double best = -1.0, num = 0.0, den = 0.0;
  for (size_t k = 0; k < half; ++k) {
    const double mag = std::abs(spectrum[k]);
    const double hz = double(k) * b.sampleRate / double(n);
    if (mag > best) { best = mag; info.dominantFrequency = hz; }
    num += hz * mag;
    den += mag;
  }
  info.spectralCentroid = den > 0.0 ? num / den : 0.0;
  return info;
}

inline void to_json(nlohmann::json& j, const AudioInfo& i) {
  j = nlohmann::json{{"duration", i.durationSeconds}, {"samples", i.frames}, {"sampleRate", i.sampleRate},
                     {"rms", i.rms}, {"peak", i.peak}, {"dynamicRange", i.dynamicRange},
                     {"dominantFrequency", i.dominantFrequency}, {"spectralCentroid", i.spectralCentroid}};
}
