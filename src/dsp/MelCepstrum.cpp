#include "MelCepstrum.hpp"
#include "../core/Errors.hpp"
#include <algorithm>
#include <cmath>

namespace {
constexpr double kMelLinearStep = 200.0 / 3.0;
constexpr double kMelBreakHz = 1000.0;
constexpr double kMelBreak = kMelBreakHz / kMelLinearStep; // 15
const double kMelLogStep = std::log(6.4) / 27.0;

constexpr double kPowerFloor = 1e-10;
constexpr double kTopDb = 80.0;
}

double MelFilterbank::hzToMel(double hz) {
  if (hz < kMelBreakHz) return hz / kMelLinearStep;
  return kMelBreak + std::log(hz / kMelBreakHz) / kMelLogStep;
}

double MelFilterbank::melToHz(double mel) {
  if (mel < kMelBreak) return mel * kMelLinearStep;
  return kMelBreakHz * std::exp(kMelLogStep * (mel - kMelBreak));
}

MelFilterbank::MelFilterbank(uint32_t sampleRate, uint32_t frameSize, uint32_t bands)
  : bands_(bands), bins_(frameSize / 2 + 1) {
  if (bands == 0 || frameSize == 0) throw ProcessingError("mel: bands and frame size must be > 0");
  const double nyquist = sampleRate / 2.0;
  const double melMax = hzToMel(nyquist);
  std::vector<double> edges(bands + 2);
  for (uint32_t i = 0; i < bands + 2; ++i) edges[i] = melToHz(melMax * i / (bands + 1));

  weights_.assign(static_cast<size_t>(bands) * bins_, 0.0f);
  for (uint32_t b = 0; b < bands; ++b) {
    const double lo = edges[b], mid = edges[b + 1], hi = edges[b + 2];
    const double enorm = 2.0 / (hi - lo);
    for (uint32_t k = 0; k < bins_; ++k) {
      const double hz = nyquist * k / (bins_ - 1);
      const double rise = (hz - lo) / (mid - lo);
      const double fall = (hi - hz) / (hi - mid);
      const double w = std::max(0.0, std::min(rise, fall));
      weights_[static_cast<size_t>(b) * bins_ + k] = static_cast<float>(w * enorm);
    }
  }
}

void MelFilterbank::apply(const float* power, double* melOut) const {
  for (uint32_t b = 0; b < bands_; ++b) {
    const float* w = weights_.data() + static_cast<size_t>(b) * bins_;
    double acc = 0.0;
    for (uint32_t k = 0; k < bins_; ++k) acc += double(w[k]) * double(power[k]);
    melOut[b] = acc;
  }
}

std::vector<double> computeMeanMfcc(const Spectrogram& s, uint32_t sampleRate,
                                    uint32_t melBands, uint32_t mfccCount) {
  std::vector<double> mean(mfccCount, 0.0);
  if (s.frames == 0) return mean;
  if (mfccCount > melBands) throw ProcessingError("mfcc: more coefficients than mel bands");

  const MelFilterbank fb(sampleRate, s.frameSize, melBands);
  std::vector<float> power(s.bins);
  std::vector<double> db(static_cast<size_t>(s.frames) * melBands);
  double maxDb = -1e300;
  for (uint32_t f = 0; f < s.frames; ++f) {
    const float* m = s.frame(f);
    for (uint32_t k = 0; k < s.bins; ++k) power[k] = m[k] * m[k];
    double* row = db.data() + static_cast<size_t>(f) * melBands;
    fb.apply(power.data(), row);
    for (uint32_t b = 0; b < melBands; ++b) {
      row[b] = 10.0 * std::log10(std::max(kPowerFloor, row[b]));
      maxDb = std::max(maxDb, row[b]);
    }
  }
  // Dynamic range is clipped against the loudest cell of the whole spectrogram.
  const double floorDb = maxDb - kTopDb;
  for (double& v : db) v = std::max(v, floorDb);

  // Orthonormal DCT-II basis.
  std::vector<double> basis(static_cast<size_t>(mfccCount) * melBands);
  for (uint32_t c = 0; c < mfccCount; ++c) {
    const double scale = c == 0 ? std::sqrt(1.0 / melBands) : std::sqrt(2.0 / melBands);
    for (uint32_t b = 0; b < melBands; ++b) {
      basis[static_cast<size_t>(c) * melBands + b] = scale * std::cos(M_PI * c * (2.0 * b + 1.0) / (2.0 * melBands));
    }
  }
  for (uint32_t f = 0; f < s.frames; ++f) {
    const double* row = db.data() + static_cast<size_t>(f) * melBands;
    for (uint32_t c = 0; c < mfccCount; ++c) {
      const double* bc = basis.data() + static_cast<size_t>(c) * melBands;
      double acc = 0.0;
      for (uint32_t b = 0; b < melBands; ++b) acc += bc[b] * row[b];
      mean[c] += acc;
    }
  }
  for (double& v : mean) v /= s.frames;
  return mean;
}
