#include "ConversionEngine.hpp"
#include "../core/Errors.hpp"
#include "../core/LogControls.hpp"
#include <cstdio>

ConversionEngine::ConversionEngine(std::shared_ptr<DspBackend> dsp, const EngineConfig& cfg)
  : transformer_(std::move(dsp), cfg.transfer),
    catalog_(cfg.speakers, cfg.defaultSpeaker),
    transfer_(cfg.transfer) {}

AudioBuffer ConversionEngine::convert(const AudioBuffer& input, const std::string& speakerId, double strength,
                                      const ProgressFn& progress) const {
  if (!(strength >= 0.0 && strength <= 1.0)) throw InputError("conversion strength must be in [0,1]");
  auto report = [&](int pct, const char* stage) { if (progress) progress(pct, stage); };

  bool fallback = false;
  const SpeakerPreset& preset = catalog_.resolve(speakerId, &fallback);
  if (fallback && gLogEnabled) {
    std::fprintf(stderr, "[convert] Unknown speaker '%s'; using '%s'\n", speakerId.c_str(), preset.id.c_str());
  }

  AudioBuffer audio = input.downmix();
  const double nyquist = audio.sampleRate / 2.0;

  audio = transformer_.pitchShift(audio, preset.pitchShiftRatio, strength);
  report(35, "pitch");
  audio = transformer_.bandReweight(audio, preset.formantShiftRatio, strength,
                                    transfer_.formantLowHz, transfer_.formantHighHz);
  report(55, "formant");
  audio = transformer_.bandReweight(audio, preset.brightnessFactor, strength,
                                    transfer_.brightnessCutoffHz, nyquist);
  report(75, "brightness");
  audio = transformer_.normalize(audio);
  report(85, "normalize");
  return audio;
}
