#pragma once

#include <string>
#include <vector>
#include "../core/SpeakerPreset.hpp"

// Read-only speaker preset table. Lookup is case-insensitive.
class SpeakerCatalog {
public:
  SpeakerCatalog(std::vector<SpeakerPreset> presets, std::string defaultId);

  const SpeakerPreset* find(const std::string& id) const;
  // Unknown ids fall back to the default preset; usedFallback reports whether that happened.
  const SpeakerPreset& resolve(const std::string& id, bool* usedFallback = nullptr) const;
  const SpeakerPreset& defaultPreset() const { return presets_[defaultIndex_]; }
  const std::vector<SpeakerPreset>& all() const { return presets_; }

private:
  std::vector<SpeakerPreset> presets_;
  size_t defaultIndex_ = 0;
};
