#pragma once

#include <memory>
#include "../core/AudioBuffer.hpp"
#include "../core/EngineConfig.hpp"
#include "../core/VoiceProfile.hpp"
#include "../dsp/DspBackend.hpp"

// Computes a VoiceProfile from an utterance. Multi-channel input is down-mixed;
// all frequencies use the buffer's own sample rate.
class FeatureExtractor {
public:
  FeatureExtractor(std::shared_ptr<DspBackend> dsp, const AnalysisSpec& spec)
    : dsp_(std::move(dsp)), spec_(spec) {}

  VoiceProfile extract(const AudioBuffer& buffer) const;

private:
  std::shared_ptr<DspBackend> dsp_;
  AnalysisSpec spec_;
};
