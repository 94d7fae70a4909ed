#include "SpectralAnalysis.hpp"
#include "RealFft.hpp"
#include "../core/Errors.hpp"
#include <algorithm>
#include <cmath>
#include <complex>

std::vector<float> hannWindow(uint32_t n) {
  std::vector<float> w(n);
  const double twoPi = 2.0 * M_PI;
  for (uint32_t i = 0; i < n; ++i) w[i] = static_cast<float>(0.5 - 0.5 * std::cos(twoPi * i / n));
  return w;
}

Spectrogram computeStftMagnitude(const std::vector<float>& x, uint32_t frameSize, uint32_t hopSize) {
  if (frameSize == 0 || hopSize == 0) throw ProcessingError("STFT: frame and hop must be > 0");
  Spectrogram s;
  s.frameSize = frameSize;
  s.bins = frameSize / 2 + 1;
  if (x.empty()) return s;

  const size_t pad = frameSize / 2;
  // frameSize trailing zeros: the last frame starts at or before x.size() for any frame parity.
  std::vector<float> padded(x.size() + frameSize, 0.0f);
  std::copy(x.begin(), x.end(), padded.begin() + pad);
  s.frames = static_cast<uint32_t>(1 + x.size() / hopSize);
  s.mag.assign(static_cast<size_t>(s.frames) * s.bins, 0.0f);

  const std::vector<float> win = hannWindow(frameSize);
  RealFft fft(frameSize);
  std::vector<float> frame(frameSize);
  std::vector<std::complex<float>> spec(s.bins);
  for (uint32_t f = 0; f < s.frames; ++f) {
    const float* src = padded.data() + static_cast<size_t>(f) * hopSize;
    for (uint32_t i = 0; i < frameSize; ++i) frame[i] = src[i] * win[i];
    fft.forward(frame.data(), frameSize, spec.data());
    float* dst = s.mag.data() + static_cast<size_t>(f) * s.bins;
    for (uint32_t k = 0; k < s.bins; ++k) dst[k] = std::abs(spec[k]);
  }
  return s;
}

SpectralStats computeSpectralStats(const Spectrogram& s, uint32_t sampleRate, float rolloffPercent) {
  SpectralStats out;
  if (s.frames == 0 || s.bins == 0) return out;
  const double binHz = double(sampleRate) / double(s.frameSize);
  double sumCentroid = 0.0, sumRolloff = 0.0, sumBandwidth = 0.0;

  for (uint32_t f = 0; f < s.frames; ++f) {
    const float* m = s.frame(f);
    double total = 0.0;
    for (uint32_t k = 0; k < s.bins; ++k) total += m[k];
    if (!(total > 0.0)) continue;

    double centroid = 0.0;
    for (uint32_t k = 0; k < s.bins; ++k) centroid += (k * binHz) * (m[k] / total);

    double spread = 0.0;
    for (uint32_t k = 0; k < s.bins; ++k) {
      const double dev = k * binHz - centroid;
      spread += (m[k] / total) * dev * dev;
    }

    // Lowest frequency whose cumulative magnitude reaches the threshold.
    const double threshold = rolloffPercent * total;
    double cum = 0.0;
    double rolloff = (s.bins - 1) * binHz;
    for (uint32_t k = 0; k < s.bins; ++k) {
      cum += m[k];
      if (cum >= threshold) { rolloff = k * binHz; break; }
    }

    sumCentroid += centroid;
    sumRolloff += rolloff;
    sumBandwidth += std::sqrt(spread);
  }
  out.centroid = sumCentroid / s.frames;
  out.rolloff = sumRolloff / s.frames;
  out.bandwidth = sumBandwidth / s.frames;
  return out;
}

double meanZeroCrossingRate(const std::vector<float>& x, uint32_t frameSize, uint32_t hopSize) {
  if (x.empty() || frameSize == 0 || hopSize == 0) return 0.0;
  const size_t pad = frameSize / 2;
  const size_t frames = 1 + x.size() / hopSize;
  // Sample i of frame f sits at x[f*hop + i - pad]; outside the signal it is 0.
  auto at = [&](long long idx) -> float {
    return (idx < 0 || idx >= static_cast<long long>(x.size())) ? 0.0f : x[static_cast<size_t>(idx)];
  };
  double sum = 0.0;
  for (size_t f = 0; f < frames; ++f) {
    const long long base = static_cast<long long>(f * hopSize) - static_cast<long long>(pad);
    size_t crossings = 0;
    bool prevNeg = std::signbit(at(base));
    for (uint32_t i = 1; i < frameSize; ++i) {
      const bool neg = std::signbit(at(base + i));
      if (neg != prevNeg) ++crossings;
      prevNeg = neg;
    }
    sum += double(crossings) / double(frameSize);
  }
  return sum / double(frames);
}
