#include "FftwDspBackend.hpp"
#include "MelCepstrum.hpp"
#include "PitchShifter.hpp"
#include "RealFft.hpp"
#include "SpectralAnalysis.hpp"
#include "YinPitchTracker.hpp"
#include "../core/Errors.hpp"

std::vector<float> FftwDspBackend::pitchTrack(const std::vector<float>& x, uint32_t sampleRate,
                                              const AnalysisSpec& spec) {
  return YinPitchTracker(sampleRate, spec).track(x);
}

Spectrogram FftwDspBackend::stftMagnitude(const std::vector<float>& x, uint32_t frameSize, uint32_t hopSize) {
  return computeStftMagnitude(x, frameSize, hopSize);
}

SpectralStats FftwDspBackend::spectralStats(const Spectrogram& s, uint32_t sampleRate, float rolloffPercent) {
  return computeSpectralStats(s, sampleRate, rolloffPercent);
}

std::vector<double> FftwDspBackend::melCepstrum(const Spectrogram& s, uint32_t sampleRate,
                                                uint32_t melBands, uint32_t mfccCount) {
  return computeMeanMfcc(s, sampleRate, melBands, mfccCount);
}

std::vector<std::complex<float>> FftwDspBackend::realFft(const std::vector<float>& x) {
  if (x.empty()) return {};
  RealFft fft(x.size());
  std::vector<std::complex<float>> out(fft.bins());
  fft.forward(x.data(), x.size(), out.data());
  return out;
}

std::vector<float> FftwDspBackend::inverseRealFft(const std::vector<std::complex<float>>& spectrum, size_t n) {
  if (n == 0) return {};
  if (spectrum.size() != n / 2 + 1) throw ProcessingError("inverseRealFft: spectrum size does not match n");
  RealFft fft(n);
  std::vector<float> out(n);
  fft.inverse(spectrum.data(), out.data());
  return out;
}

std::vector<float> FftwDspBackend::shiftPitch(const std::vector<float>& x, uint32_t sampleRate, double semitones) {
  return rubberBandPitchShift(x, sampleRate, semitones);
}

std::shared_ptr<DspBackend> makeDefaultDspBackend() {
  return std::make_shared<FftwDspBackend>();
}
