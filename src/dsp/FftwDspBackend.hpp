#pragma once

#include "DspBackend.hpp"

// DspBackend on FFTW3 (single precision) and Rubber Band.
class FftwDspBackend : public DspBackend {
public:
  std::vector<float> pitchTrack(const std::vector<float>& x, uint32_t sampleRate,
                                const AnalysisSpec& spec) override;
  Spectrogram stftMagnitude(const std::vector<float>& x, uint32_t frameSize, uint32_t hopSize) override;
  SpectralStats spectralStats(const Spectrogram& s, uint32_t sampleRate, float rolloffPercent) override;
  std::vector<double> melCepstrum(const Spectrogram& s, uint32_t sampleRate,
                                  uint32_t melBands, uint32_t mfccCount) override;
  std::vector<std::complex<float>> realFft(const std::vector<float>& x) override;
  std::vector<float> inverseRealFft(const std::vector<std::complex<float>>& spectrum, size_t n) override;
  std::vector<float> shiftPitch(const std::vector<float>& x, uint32_t sampleRate, double semitones) override;
};
