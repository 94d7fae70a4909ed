#pragma once

#include <functional>
#include <memory>
#include <string>
#include "../core/AudioBuffer.hpp"
#include "../core/EngineConfig.hpp"
#include "SignalTransformer.hpp"
#include "SpeakerCatalog.hpp"

// Called after each processing stage with the overall job percentage. May throw to abort.
using ProgressFn = std::function<void(int percent, const std::string& stage)>;

// Reshapes an utterance toward a fixed speaker preset:
// pitch -> formant band -> brightness band -> normalize.
class ConversionEngine {
public:
  ConversionEngine(std::shared_ptr<DspBackend> dsp, const EngineConfig& cfg);

  AudioBuffer convert(const AudioBuffer& input, const std::string& speakerId, double strength,
                      const ProgressFn& progress = nullptr) const;

  const SpeakerCatalog& catalog() const { return catalog_; }

private:
  SignalTransformer transformer_;
  SpeakerCatalog catalog_;
  TransferSpec transfer_;
};
