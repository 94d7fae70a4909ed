#include "CloningEngine.hpp"
#include "../core/Errors.hpp"
#include "../core/LogControls.hpp"
#include <cmath>
#include <cstdio>

CloningEngine::CloningEngine(std::shared_ptr<DspBackend> dsp, const EngineConfig& cfg)
  : extractor_(dsp, cfg.analysis),
    transformer_(dsp, cfg.transfer),
    transfer_(cfg.transfer) {}

CloneResult CloningEngine::clone(const AudioBuffer& reference, const AudioBuffer& target, double similarity,
                                 const ProgressFn& progress) const {
  if (!(similarity >= 0.0 && similarity <= 1.0)) throw InputError("similarity must be in [0,1]");
  auto report = [&](int pct, const char* stage) { if (progress) progress(pct, stage); };

  CloneResult r;
  r.reference = extractor_.extract(reference);
  report(15, "reference analysis");
  r.target = extractor_.extract(target);
  report(30, "target analysis");

  const VoiceProfile& ref = r.reference;
  const VoiceProfile& tgt = r.target;
  AudioBuffer audio = target.downmix();
  const double nyquist = audio.sampleRate / 2.0;

  if (std::fabs(tgt.f0Mean - ref.f0Mean) > transfer_.minF0DiffHz) {
    audio = transformer_.pitchShift(audio, ref.f0Mean / tgt.f0Mean, similarity);
  }
  report(50, "pitch transfer");

  if (std::fabs(tgt.spectralCentroid - ref.spectralCentroid) > transfer_.centroidDiffHz &&
      tgt.spectralCentroid > 0.0 && ref.spectralCentroid > 0.0) {
    audio = transformer_.bandReweight(audio, ref.spectralCentroid / tgt.spectralCentroid, similarity,
                                      transfer_.brightnessCutoffHz, nyquist);
  }
  if (std::fabs(tgt.spectralRolloff - ref.spectralRolloff) > transfer_.rolloffDiffHz &&
      tgt.spectralRolloff > 0.0 && ref.spectralRolloff > 0.0) {
    const double ratio = ref.spectralRolloff / tgt.spectralRolloff;
    audio = transformer_.bandReweight(audio, ratio, similarity, transfer_.rolloffBaseHz * ratio, nyquist);
  }
  report(65, "spectral transfer");

  audio = transformer_.energyScale(audio, ref.rmsEnergy, similarity);
  report(75, "energy transfer");
  audio = transformer_.normalize(audio);
  report(85, "normalize");

  if (gLogEnabled && gProgressLogEnabled) {
    std::fprintf(stderr, "[clone] ref f0=%.1f Hz target f0=%.1f Hz similarity=%.2f\n",
                 ref.f0Mean, tgt.f0Mean, similarity);
  }
  r.audio = std::move(audio);
  return r;
}
