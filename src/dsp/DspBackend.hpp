#pragma once

#include <complex>
#include <cstdint>
#include <memory>
#include <vector>
#include "../core/EngineConfig.hpp"

// Frame-major magnitude spectrogram: mag[frame * bins + bin].
struct Spectrogram {
  uint32_t frameSize = 0;
  uint32_t bins = 0;
  uint32_t frames = 0;
  std::vector<float> mag;

  const float* frame(uint32_t f) const { return mag.data() + static_cast<size_t>(f) * bins; }
};

struct SpectralStats {
  double centroid = 0.0;
  double rolloff = 0.0;
  double bandwidth = 0.0;
};

// DSP primitives used by feature extraction and the signal transforms.
// Implementations must be safe to call concurrently from several job workers.
class DspBackend {
public:
  virtual ~DspBackend() = default;

  // Per-frame F0 in Hz; 0 marks an unvoiced frame.
  virtual std::vector<float> pitchTrack(const std::vector<float>& x, uint32_t sampleRate,
                                        const AnalysisSpec& spec) = 0;

  // Hann-windowed, centre-padded STFT magnitude.
  virtual Spectrogram stftMagnitude(const std::vector<float>& x, uint32_t frameSize, uint32_t hopSize) = 0;

  // Frame-averaged centroid, roll-off and bandwidth of a magnitude spectrogram.
  virtual SpectralStats spectralStats(const Spectrogram& s, uint32_t sampleRate, float rolloffPercent) = 0;

  // Time-averaged MFCCs from the power of a magnitude spectrogram.
  virtual std::vector<double> melCepstrum(const Spectrogram& s, uint32_t sampleRate,
                                          uint32_t melBands, uint32_t mfccCount) = 0;

  // Full-length real FFT (n/2+1 bins) and its inverse (scaled by 1/n).
  virtual std::vector<std::complex<float>> realFft(const std::vector<float>& x) = 0;
  virtual std::vector<float> inverseRealFft(const std::vector<std::complex<float>>& spectrum, size_t n) = 0;

  // Duration-preserving pitch shift; output has exactly x.size() samples.
  virtual std::vector<float> shiftPitch(const std::vector<float>& x, uint32_t sampleRate, double semitones) = 0;
};

std::shared_ptr<DspBackend> makeDefaultDspBackend();
