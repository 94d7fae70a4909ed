#pragma once

#include <cstdint>
#include <vector>
#include "../core/EngineConfig.hpp"

// YIN fundamental-frequency tracker (de Cheveigne & Kawahara 2002).
// Frames are centre-padded with zeros, so there are 1 + n/hop of them.
class YinPitchTracker {
public:
  YinPitchTracker(uint32_t sampleRate, const AnalysisSpec& spec);

  // F0 per frame in Hz, 0 when unvoiced.
  std::vector<float> track(const std::vector<float>& x) const;

private:
  float analyzeFrame(const float* frame, class RealFft& fft) const;

  uint32_t sampleRate_;
  uint32_t frameSize_;
  uint32_t hopSize_;
  uint32_t window_;  // integration window, frameSize/2
  uint32_t tauMin_;
  uint32_t tauMax_;
  float threshold_;
  float minF0_;
  float maxF0_;
};
