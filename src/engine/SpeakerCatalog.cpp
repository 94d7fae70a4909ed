#include "SpeakerCatalog.hpp"
#include "../core/Errors.hpp"

SpeakerCatalog::SpeakerCatalog(std::vector<SpeakerPreset> presets, std::string defaultId)
  : presets_(std::move(presets)) {
  const SpeakerPreset* d = find(defaultId);
  if (!d) throw ConfigError("default speaker '" + defaultId + "' is not in the catalog");
  defaultIndex_ = static_cast<size_t>(d - presets_.data());
}

const SpeakerPreset* SpeakerCatalog::find(const std::string& id) const {
  for (const auto& p : presets_) {
    if (speakerIdEquals(p.id, id)) return &p;
  }
  return nullptr;
}

const SpeakerPreset& SpeakerCatalog::resolve(const std::string& id, bool* usedFallback) const {
  const SpeakerPreset* p = find(id);
  if (usedFallback) *usedFallback = (p == nullptr);
  return p ? *p : defaultPreset();
}
