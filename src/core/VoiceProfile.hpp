#pragma once

#include <array>
#include <cmath>
#include <nlohmann/json.hpp>

constexpr size_t kMfccCount = 13;

// Fixed-size acoustic descriptor of one utterance.
struct VoiceProfile {
  double f0Mean = 150.0;   // Hz
  double f0Std = 20.0;
  double f0Median = 150.0;
  double f0Range = 50.0;
  double spectralCentroid = 0.0;  // Hz
  double spectralRolloff = 0.0;   // Hz
  double spectralBandwidth = 0.0; // Hz
  double rmsEnergy = 0.0;         // linear amplitude
  double zeroCrossingRate = 0.0;  // 0..1
  std::array<double, kMfccCount> mfcc{};
  double durationSeconds = 0.0;

  bool allFinite() const {
    const double scalars[] = {f0Mean, f0Std, f0Median, f0Range, spectralCentroid, spectralRolloff,
                              spectralBandwidth, rmsEnergy, zeroCrossingRate, durationSeconds};
    for (double v : scalars) if (!std::isfinite(v)) return false;
    for (double v : mfcc) if (!std::isfinite(v)) return false;
    return true;
  }
};

inline void to_json(nlohmann::json& j, const VoiceProfile& p) {
  j = nlohmann::json{
    {"f0", {{"mean", p.f0Mean}, {"std", p.f0Std}, {"median", p.f0Median}, {"range", p.f0Range}}},
    {"spectralCentroid", p.spectralCentroid},
    {"spectralRolloff", p.spectralRolloff},
    {"spectralBandwidth", p.spectralBandwidth},
    {"rmsEnergy", p.rmsEnergy},
    {"zeroCrossingRate", p.zeroCrossingRate},
    {"mfcc", p.mfcc},
    {"durationSeconds", p.durationSeconds}
  };
}

inline void from_json(const nlohmann::json& j, VoiceProfile& p) {
  if (j.contains("f0")) {
    const auto& f = j.at("f0");
    p.f0Mean = f.value("mean", 150.0);
    p.f0Std = f.value("std", 20.0);
    p.f0Median = f.value("median", 150.0);
    p.f0Range = f.value("range", 50.0);
  }
  p.spectralCentroid = j.value("spectralCentroid", 0.0);
  p.spectralRolloff = j.value("spectralRolloff", 0.0);
  p.spectralBandwidth = j.value("spectralBandwidth", 0.0);
  p.rmsEnergy = j.value("rmsEnergy", 0.0);
  p.zeroCrossingRate = j.value("zeroCrossingRate", 0.0);
  if (j.contains("mfcc")) {
    const auto& m = j.at("mfcc");
    for (size_t i = 0; i < kMfccCount && i < m.size(); ++i) p.mfcc[i] = m.at(i).get<double>();
  }
  p.durationSeconds = j.value("durationSeconds", 0.0);
}
