#include <cstdio>
#include "../src/core/SpeakerPreset.hpp"
#include "../src/core/EngineConfig.hpp"

static void emitSpeakerTable() {
  std::printf("## Built-in speakers\n\n");
  std::printf("| id | name | gender | age | pitch | formant | brightness | description |\n");
  std::printf("|----|------|--------|-----|------:|--------:|-----------:|-------------|\n");
  for (const auto& d : kBuiltinSpeakers) {
    std::printf("| %s%s | %s | %s | %s | %.2f | %.2f | %.2f | %s |\n",
                d.id, speakerIdEquals(d.id, kDefaultSpeakerId) ? " (default)" : "", d.name, d.gender, d.ageRange,
                d.pitchShiftRatio, d.formantShiftRatio, d.brightnessFactor, d.description);
  }
  std::printf("\n");
}

static void emitTransferTable() {
  const TransferSpec t;
  std::printf("## Transfer constants\n\n");
  std::printf("| key | default |\n");
  std::printf("|-----|--------:|\n");
  std::printf("| pitchSkipSemitones | %.2f |\n", t.pitchSkipSemitones);
  std::printf("| minF0DiffHz | %.1f |\n", t.minF0DiffHz);
  std::printf("| centroidDiffHz | %.1f |\n", t.centroidDiffHz);
  std::printf("| rolloffDiffHz | %.1f |\n", t.rolloffDiffHz);
  std::printf("| rolloffBaseHz | %.1f |\n", t.rolloffBaseHz);
  std::printf("| formantLowHz | %.1f |\n", t.formantLowHz);
  std::printf("| formantHighHz | %.1f |\n", t.formantHighHz);
  std::printf("| brightnessCutoffHz | %.1f |\n", t.brightnessCutoffHz);
  std::printf("| normalizePeak | %.2f |\n", t.normalizePeak);
  std::printf("\n");
}

int main() {
  std::printf("# Speaker Presets\n\n");
  std::printf("Auto-generated from SpeakerPreset.hpp and EngineConfig.hpp. Do not edit by hand.\n\n");
  emitSpeakerTable();
  emitTransferTable();
  return 0;
}
