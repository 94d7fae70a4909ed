#include "SignalTransformer.hpp"
#include "../core/Errors.hpp"
#include <cmath>
#include <complex>

namespace {

constexpr double kSilentRms = 1e-8;

void requireMono(const AudioBuffer& in, const char* op) {
  if (!in.empty() && in.channels != 1) {
    throw ProcessingError(std::string(op) + ": expected mono input, got " + std::to_string(in.channels) + " channels");
  }
}

} // namespace

AudioBuffer SignalTransformer::pitchShift(const AudioBuffer& in, double ratio, double blend) const {
  requireMono(in, "pitchShift");
  if (!(ratio > 0.0)) throw ProcessingError("pitchShift: ratio must be positive");
  const double semitones = 12.0 * std::log2(ratio) * blend;
  if (in.empty() || std::fabs(semitones) < spec_.pitchSkipSemitones) return in;
  return in.withSamples(dsp_->shiftPitch(in.data, in.sampleRate, semitones));
}

AudioBuffer SignalTransformer::bandReweight(const AudioBuffer& in, double factor, double blend,
                                            double lowHz, double highHz) const {
  requireMono(in, "bandReweight");
  const double gain = factor * blend + (1.0 - blend);
  if (in.empty() || gain == 1.0) return in;

  const size_t n = in.data.size();
  const double binHz = double(in.sampleRate) / double(n);
  std::vector<std::complex<float>> spectrum = dsp_->realFft(in.data);
  bool touched = false;
  for (size_t k = 0; k < spectrum.size(); ++k) {
    const double hz = k * binHz;
    if (hz >= lowHz && hz <= highHz) {
      spectrum[k] *= static_cast<float>(gain);
      touched = true;
    }
  }
  if (!touched) return in;
  return in.withSamples(dsp_->inverseRealFft(spectrum, n));
}

AudioBuffer SignalTransformer::energyScale(const AudioBuffer& in, double targetRms, double blend) const {
  requireMono(in, "energyScale");
  const double current = in.rms();
  if (in.empty() || current < kSilentRms) return in;
  const double gain = (targetRms / current) * blend + (1.0 - blend);
  if (gain == 1.0) return in;
  std::vector<float> out(in.data.size());
  for (size_t i = 0; i < out.size(); ++i) out[i] = static_cast<float>(in.data[i] * gain);
  return in.withSamples(std::move(out));
}

AudioBuffer SignalTransformer::normalize(const AudioBuffer& in) const {
  const float peak = in.peak();
  if (!(peak > spec_.normalizePeak)) return in;
  const float scale = spec_.normalizePeak / peak;
  std::vector<float> out(in.data.size());
  for (size_t i = 0; i < out.size(); ++i) out[i] = in.data[i] * scale;
  // Rounding can leave the peak a hair above the limit.
  for (float& s : out) {
    if (s > spec_.normalizePeak) s = spec_.normalizePeak;
    else if (s < -spec_.normalizePeak) s = -spec_.normalizePeak;
  }
  return in.withSamples(std::move(out));
}
