#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include "SpeakerPreset.hpp"

struct AnalysisSpec {
  uint32_t frameSize = 2048;   // STFT / ZCR frame
  uint32_t hopSize = 512;
  float f0MinHz = 80.0f;
  float f0MaxHz = 400.0f;
  uint32_t pitchFrameSize = 2048;
  uint32_t pitchHopSize = 512;
  float yinThreshold = 0.1f;
  float rolloffPercent = 0.85f;
  uint32_t melBands = 128;
  uint32_t mfccCount = 13;
};

struct TransferSpec {
  float pitchSkipSemitones = 0.1f; // |shift| below this is treated as identity
  float minF0DiffHz = 10.0f;
  float centroidDiffHz = 100.0f;
  float rolloffDiffHz = 200.0f;
  float rolloffBaseHz = 3000.0f;
  float formantLowHz = 300.0f;
  float formantHighHz = 3000.0f;
  float brightnessCutoffHz = 2000.0f;
  float normalizePeak = 0.95f;
};

struct IngestSpec {
  uint64_t maxConvertBytes = 100ull * 1024ull * 1024ull;
  uint64_t maxCloneBytes = 50ull * 1024ull * 1024ull; // per file
  double maxDurationSeconds = 600.0;
};

struct JobsSpec {
  uint32_t workers = 0;          // 0 = hardware concurrency
  double timeoutSeconds = 300.0; // <= 0 disables
};

enum class BitDepth { Pcm16, Pcm24, Float32 };

struct OutputSpec {
  BitDepth bitDepth = BitDepth::Float32;
};

struct EngineConfig {
  std::string description; // optional human-readable description
  int version = 1;
  uint32_t sampleRate = 22050;
  AnalysisSpec analysis;
  TransferSpec transfer;
  IngestSpec ingest;
  JobsSpec jobs;
  OutputSpec output;
  std::string defaultSpeaker = kDefaultSpeakerId;
  std::vector<SpeakerPreset> speakers = builtinSpeakerPresets();
};

// Parse file into EngineConfig using nlohmann/json. Missing keys keep defaults.
EngineConfig loadEngineConfigFromJsonFile(const std::string& path);
EngineConfig parseEngineConfigJson(const std::string& text);

BitDepth parseBitDepth(const std::string& s);
const char* toStr(BitDepth d);

// Resolve a relative path against CWD and VOXMORPH_SEARCH_PATHS; returns file contents.
std::string readFileWithSearchPaths(const std::string& path);
std::string resolvePathWithSearchPaths(const std::string& path);
