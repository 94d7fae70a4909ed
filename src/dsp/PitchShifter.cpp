#include "PitchShifter.hpp"
#include "../core/Errors.hpp"
#include <algorithm>
#include <cmath>
#include <rubberband/RubberBandStretcher.h>

namespace {
constexpr size_t kBlock = 4096;
}

std::vector<float> rubberBandPitchShift(const std::vector<float>& in, uint32_t sampleRate, double semitones) {
  if (in.empty()) return {};
  using RubberBand::RubberBandStretcher;
  const double pitchScale = std::pow(2.0, semitones / 12.0);
  const RubberBandStretcher::Options options =
    RubberBandStretcher::OptionProcessOffline |
    RubberBandStretcher::OptionThreadingNever;
  RubberBandStretcher rb(sampleRate, 1, options, 1.0, pitchScale);
  rb.setExpectedInputDuration(in.size());
  rb.setMaxProcessSize(kBlock);

  // Offline mode needs a full study pass before processing.
  for (size_t pos = 0; pos < in.size(); pos += kBlock) {
    const size_t n = std::min(kBlock, in.size() - pos);
    const float* ptr = in.data() + pos;
    rb.study(&ptr, n, pos + n >= in.size());
  }

  std::vector<float> out;
  out.reserve(in.size() + kBlock);
  std::vector<float> chunk(kBlock);
  auto drain = [&]() {
    int avail;
    while ((avail = rb.available()) > 0) {
      const size_t want = std::min(static_cast<size_t>(avail), chunk.size());
      float* dst = chunk.data();
      const size_t got = rb.retrieve(&dst, want);
      if (got == 0) break;
      out.insert(out.end(), chunk.begin(), chunk.begin() + got);
    }
  };
  for (size_t pos = 0; pos < in.size(); pos += kBlock) {
    const size_t n = std::min(kBlock, in.size() - pos);
    const float* ptr = in.data() + pos;
    rb.process(&ptr, n, pos + n >= in.size());
    drain();
  }
  drain();

  if (out.empty()) throw ProcessingError("pitch shift produced no output");
  out.resize(in.size(), 0.0f);
  return out;
}
