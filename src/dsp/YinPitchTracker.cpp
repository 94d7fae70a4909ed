#include "YinPitchTracker.hpp"
#include "RealFft.hpp"
#include "../core/Errors.hpp"
#include <algorithm>
#include <cmath>
#include <complex>

namespace {
// Frames whose mean square is below this are treated as silence.
constexpr double kSilenceMeanSquare = 1e-10;
}

YinPitchTracker::YinPitchTracker(uint32_t sampleRate, const AnalysisSpec& spec)
  : sampleRate_(sampleRate),
    frameSize_(spec.pitchFrameSize),
    hopSize_(spec.pitchHopSize),
    window_(spec.pitchFrameSize / 2),
    threshold_(spec.yinThreshold),
    minF0_(spec.f0MinHz),
    maxF0_(spec.f0MaxHz) {
  if (sampleRate_ == 0 || hopSize_ == 0) throw ProcessingError("YIN: invalid sample rate or hop");
  tauMin_ = std::max<uint32_t>(2, static_cast<uint32_t>(std::floor(sampleRate_ / maxF0_)));
  tauMax_ = static_cast<uint32_t>(std::ceil(sampleRate_ / minF0_));
  // Lag plus window must fit in the frame.
  tauMax_ = std::min(tauMax_, frameSize_ - window_ - 1);
  if (tauMin_ + 2 >= tauMax_) throw ProcessingError("YIN: pitch range does not fit the frame size");
}

float YinPitchTracker::analyzeFrame(const float* x, RealFft& fft) const {
  const uint32_t W = window_;
  // Prefix sums of squares give the energy terms of the difference function.
  std::vector<double> cum(frameSize_ + 1, 0.0);
  for (uint32_t i = 0; i < frameSize_; ++i) cum[i + 1] = cum[i] + double(x[i]) * double(x[i]);
  const double e0 = cum[W];
  if (e0 / W < kSilenceMeanSquare) return 0.0f;

  // r(tau) = sum_{j<W} x[j] x[j+tau] via FFT cross-correlation.
  const size_t bins = fft.bins();
  std::vector<std::complex<float>> A(bins), B(bins);
  fft.forward(x, W, A.data());
  fft.forward(x, frameSize_, B.data());
  for (size_t k = 0; k < bins; ++k) B[k] *= std::conj(A[k]);
  std::vector<float> r(fft.size());
  fft.inverse(B.data(), r.data());

  // Cumulative mean normalised difference, d'(0) = 1.
  std::vector<double> dn(tauMax_ + 2, 1.0);
  double running = 0.0;
  for (uint32_t tau = 1; tau <= tauMax_ + 1; ++tau) {
    const double et = cum[tau + W] - cum[tau];
    const double d = std::max(0.0, e0 + et - 2.0 * double(r[tau]));
    running += d;
    dn[tau] = running > 0.0 ? d * tau / running : 1.0;
  }

  uint32_t best = 0;
  for (uint32_t tau = tauMin_; tau <= tauMax_; ++tau) {
    if (dn[tau] < threshold_) {
      while (tau + 1 <= tauMax_ && dn[tau + 1] < dn[tau]) ++tau;
      best = tau;
      break;
    }
  }
  if (best == 0) return 0.0f;

  // Parabolic interpolation around the dip.
  double refined = best;
  const double a = dn[best - 1], b = dn[best], c = dn[best + 1];
  const double denom = a - 2.0 * b + c;
  if (std::fabs(denom) > 1e-12) {
    const double shift = 0.5 * (a - c) / denom;
    if (std::fabs(shift) < 1.0) refined += shift;
  }
  const double f0 = double(sampleRate_) / refined;
  if (f0 < minF0_ || f0 > maxF0_) return 0.0f;
  return static_cast<float>(f0);
}

std::vector<float> YinPitchTracker::track(const std::vector<float>& x) const {
  std::vector<float> f0;
  if (x.empty()) return f0;
  const size_t pad = frameSize_ / 2;
  std::vector<float> padded(x.size() + 2 * pad, 0.0f);
  std::copy(x.begin(), x.end(), padded.begin() + pad);

  const size_t frames = 1 + x.size() / hopSize_;
  f0.reserve(frames);
  RealFft fft(2 * frameSize_);
  for (size_t f = 0; f < frames; ++f) {
    const size_t start = f * hopSize_;
    if (start + frameSize_ > padded.size()) break;
    f0.push_back(analyzeFrame(padded.data() + start, fft));
  }
  return f0;
}
