#pragma once

#include <memory>
#include "../core/AudioBuffer.hpp"
#include "../core/EngineConfig.hpp"
#include "../core/VoiceProfile.hpp"
#include "ConversionEngine.hpp"
#include "FeatureExtractor.hpp"
#include "SignalTransformer.hpp"

struct CloneResult {
  AudioBuffer audio;
  VoiceProfile reference;
  VoiceProfile target;
};

// Moves a target utterance toward the measured profile of a reference utterance.
class CloningEngine {
public:
  CloningEngine(std::shared_ptr<DspBackend> dsp, const EngineConfig& cfg);

  CloneResult clone(const AudioBuffer& reference, const AudioBuffer& target, double similarity,
                    const ProgressFn& progress = nullptr) const;

  const FeatureExtractor& extractor() const { return extractor_; }

private:
  FeatureExtractor extractor_;
  SignalTransformer transformer_;
  TransferSpec transfer_;
};
