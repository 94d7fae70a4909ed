#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <cctype>

struct SpeakerPreset {
  std::string id;
  float pitchShiftRatio = 1.0f;
  float formantShiftRatio = 1.0f;
  float brightnessFactor = 1.0f;
  // Catalogue metadata
  std::string name;
  std::string description;
  std::string gender;
  std::string ageRange;
};

struct SpeakerDef {
  const char* id;
  float pitchShiftRatio;
  float formantShiftRatio;
  float brightnessFactor;
  const char* name;
  const char* description;
  const char* gender;
  const char* ageRange;
};

static constexpr SpeakerDef kBuiltinSpeakers[] = {
  {"speaker_001", 0.95f, 1.02f, 1.10f, "Young male", "Young male voice, clear", "male", "20-30"},
  {"speaker_002", 1.08f, 0.98f, 1.20f, "Gentle female", "Soft, warm female voice", "female", "25-35"},
  {"speaker_003", 0.90f, 1.05f, 0.90f, "Mature male", "Middle-aged male voice, steady", "male", "35-45"},
  {"speaker_004", 1.05f, 0.96f, 1.15f, "Professional female", "Professional female voice, clear", "female", "30-40"},
};
static constexpr size_t kBuiltinSpeakerCount = sizeof(kBuiltinSpeakers) / sizeof(kBuiltinSpeakers[0]);
static constexpr const char* kDefaultSpeakerId = "speaker_001";

inline SpeakerPreset toPreset(const SpeakerDef& d) {
  SpeakerPreset p;
  p.id = d.id;
  p.pitchShiftRatio = d.pitchShiftRatio;
  p.formantShiftRatio = d.formantShiftRatio;
  p.brightnessFactor = d.brightnessFactor;
  p.name = d.name;
  p.description = d.description;
  p.gender = d.gender;
  p.ageRange = d.ageRange;
  return p;
}

inline std::vector<SpeakerPreset> builtinSpeakerPresets() {
  std::vector<SpeakerPreset> out;
  out.reserve(kBuiltinSpeakerCount);
  for (const auto& d : kBuiltinSpeakers) out.push_back(toPreset(d));
  return out;
}

// Speaker id lookup is case-insensitive.
inline bool speakerIdEquals(const std::string& a, const std::string& b) {
  if (a.size() != b.size()) return false;
  for (size_t i = 0; i < a.size(); ++i) {
    if (::tolower(static_cast<unsigned char>(a[i])) != ::tolower(static_cast<unsigned char>(b[i]))) return false;
  }
  return true;
}
