#pragma once

#include <cstdint>
#include <vector>
#include "DspBackend.hpp"

// Slaney-style mel filterbank (area-normalised triangles on the Slaney mel scale),
// spanning 0 Hz to Nyquist.
class MelFilterbank {
public:
  MelFilterbank(uint32_t sampleRate, uint32_t frameSize, uint32_t bands);

  uint32_t bands() const { return bands_; }
  // Applies the filterbank to one frame of power values (frameSize/2+1 bins).
  void apply(const float* power, double* melOut) const;

  static double hzToMel(double hz);
  static double melToHz(double mel);

private:
  uint32_t bands_;
  uint32_t bins_;
  std::vector<float> weights_; // bands x bins
};

// MFCC summary: mel power -> dB (floor 1e-10, 80 dB range) -> DCT-II (ortho),
// averaged over frames. Returns zeros when the spectrogram has no frames.
std::vector<double> computeMeanMfcc(const Spectrogram& s, uint32_t sampleRate,
                                    uint32_t melBands, uint32_t mfccCount);
