#pragma once

#include <memory>
#include "../core/AudioBuffer.hpp"
#include "../core/EngineConfig.hpp"
#include "../dsp/DspBackend.hpp"

// Deterministic mono transforms. Inputs are never mutated; each call returns a new
// buffer, or a copy of the input when the transform reduces to identity.
// blend in [0,1] mixes the full effect with no effect.
class SignalTransformer {
public:
  SignalTransformer(std::shared_ptr<DspBackend> dsp, const TransferSpec& spec)
    : dsp_(std::move(dsp)), spec_(spec) {}

  // semitones = 12*log2(ratio)*blend; skipped below pitchSkipSemitones.
  AudioBuffer pitchShift(const AudioBuffer& in, double ratio, double blend) const;
  // Scales FFT bins in [lowHz, highHz] by factor*blend + (1-blend).
  AudioBuffer bandReweight(const AudioBuffer& in, double factor, double blend, double lowHz, double highHz) const;
  // Scales toward targetRms; near-silent input is returned unchanged.
  AudioBuffer energyScale(const AudioBuffer& in, double targetRms, double blend) const;
  // Peak limited to normalizePeak.
  AudioBuffer normalize(const AudioBuffer& in) const;

  const TransferSpec& spec() const { return spec_; }

private:
  std::shared_ptr<DspBackend> dsp_;
  TransferSpec spec_;
};
