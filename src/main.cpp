#include <cmath>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <algorithm>
#include <chrono>
#include <fstream>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/EngineConfig.hpp"
#include "core/Errors.hpp"
#include "core/LogControls.hpp"
#include "core/SchemaValidate.hpp"
#include "core/Sha1.hpp"
#include "dsp/DspBackend.hpp"
#include "engine/AudioInfo.hpp"
#include "engine/FeatureExtractor.hpp"
#include "io/AudioIngest.hpp"
#include "jobs/ArtifactStore.hpp"
#include "jobs/JobManager.hpp"
#include "jobs/JobStore.hpp"

static const char* kSchemaPath = "schemas/voxmorph.schema.json";

static void printUsage(const char* exe) {
  std::fprintf(stderr,
               "Usage: %s [--config path.json] [--workers N] [--timeout-sec S] [--bitdepth 16|24|32f]\n"
               "          (--convert in.wav [--speaker ID] [--strength 0..1]\n"
               "           | --clone-ref ref.wav --clone-target tgt.wav [--similarity 0..1])\n"
               "          [--out out.wav] [--hash] [--json] [--no-progress] [--quiet]\n"
               "\nJobs:\n"
               "  --convert PATH       Convert an utterance toward a speaker preset\n"
               "  --speaker ID         Target speaker (default from config; unknown ids fall back)\n"
               "  --strength S         Conversion strength in [0,1] (default 1.0)\n"
               "  --clone-ref PATH     Reference utterance for cloning\n"
               "  --clone-target PATH  Target utterance for cloning\n"
               "  --similarity S       Cloning similarity in [0,1] (default 0.8)\n"
               "  --out PATH           Write the result WAV here\n"
               "  --hash               Print SHA-1 of the result WAV bytes\n"
               "  --json               Print the final job record as JSON to stdout\n"
               "\nInspection:\n"
               "  --analyze PATH       Print the voice profile of an utterance as JSON\n"
               "  --info PATH          Print duration, levels, dominant frequency and centroid\n"
               "  --list-speakers      Print the speaker catalog\n"
               "  --validate PATH      Validate a config file against %s\n"
               "\nDiagnostics:\n"
               "  --no-progress        Do not print job progress\n"
               "  --quiet              Suppress [tag] log lines\n"
               "  --verbose            Print per-stage job log lines\n",
               exe, kSchemaPath);
}

static std::string formatDuration(double seconds) {
  if (seconds < 0.0) seconds = 0.0;
  const int64_t totalMs = static_cast<int64_t>(seconds * 1000.0 + 0.5);
  const int64_t mins = totalMs / (60 * 1000);
  const int64_t secs = (totalMs % (60 * 1000)) / 1000;
  const int64_t ms = totalMs % 1000;
  char buf[64];
  std::snprintf(buf, sizeof(buf), "%02lld:%02lld.%03lld",
                static_cast<long long>(mins), static_cast<long long>(secs), static_cast<long long>(ms));
  return std::string(buf);
}

static int validateConfigJson(const std::string& path) {
  std::string diag;
  const int rc = validateJsonWithSchema(path, kSchemaPath, diag);
  if (rc == 1) {
    std::fprintf(stderr, "Validate: %s\n", diag.c_str());
    return 1;
  }
  if (rc == 2) {
    std::fprintf(stderr, "Schema:\n%s", diag.c_str());
    return 2;
  }
  try {
    EngineConfig cfg = loadEngineConfigFromJsonFile(path);
    std::fprintf(stderr, "OK: %s (%zu speakers, default %s)\n", path.c_str(), cfg.speakers.size(),
                 cfg.defaultSpeaker.c_str());
  } catch (const ConfigError& e) {
    std::fprintf(stderr, "Config: %s\n", e.what());
    return 2;
  }
  return 0;
}

static void listSpeakers(const EngineConfig& cfg) {
  std::printf("%-12s %-22s %-7s %-7s %7s %8s %10s\n", "id", "name", "gender", "age", "pitch", "formant", "brightness");
  for (const auto& s : cfg.speakers) {
    std::printf("%-12s %-22s %-7s %-7s %7.2f %8.2f %10.2f%s\n", s.id.c_str(), s.name.c_str(), s.gender.c_str(),
                s.ageRange.c_str(), s.pitchShiftRatio, s.formantShiftRatio, s.brightnessFactor,
                speakerIdEquals(s.id, cfg.defaultSpeaker) ? "  (default)" : "");
  }
}

static AudioBuffer loadForInspection(const std::string& path, const EngineConfig& cfg) {
  IngestLimits limits{cfg.ingest.maxConvertBytes, cfg.ingest.maxDurationSeconds};
  return decodeAudioPayload(readFileBytes(path), cfg.sampleRate, limits, path);
}

int main(int argc, char** argv) {
  std::string configPath;
  std::string convertPath;
  std::string cloneRefPath;
  std::string cloneTargetPath;
  std::string analyzePath;
  std::string infoPath;
  std::string validatePath;
  std::string outPath;
  std::string speaker;
  double strength = 1.0;
  double similarity = 0.8;
  int workersOverride = -1;
  double timeoutOverride = -1.0;
  std::string bitDepthOverride;
  bool listSpeakersFlag = false;
  bool printHash = false;
  bool printJson = false;
  bool showProgress = true;

  for (int i = 1; i < argc; ++i) {
    const char* a = argv[i];
    auto need = [&](int remain) {
      if (i + remain >= argc) {
        printUsage(argv[0]);
        std::exit(1);
      }
    };
    if (std::strcmp(a, "--help") == 0 || std::strcmp(a, "-h") == 0) {
      printUsage(argv[0]);
      return 0;
    } else if (std::strcmp(a, "--config") == 0) {
      need(1); configPath = argv[++i];
    } else if (std::strcmp(a, "--convert") == 0) {
      need(1); convertPath = argv[++i];
    } else if (std::strcmp(a, "--speaker") == 0) {
      need(1); speaker = argv[++i];
    } else if (std::strcmp(a, "--strength") == 0) {
      need(1); strength = std::atof(argv[++i]);
    } else if (std::strcmp(a, "--clone-ref") == 0) {
      need(1); cloneRefPath = argv[++i];
    } else if (std::strcmp(a, "--clone-target") == 0) {
      need(1); cloneTargetPath = argv[++i];
    } else if (std::strcmp(a, "--similarity") == 0) {
      need(1); similarity = std::atof(argv[++i]);
    } else if (std::strcmp(a, "--out") == 0) {
      need(1); outPath = argv[++i];
    } else if (std::strcmp(a, "--analyze") == 0) {
      need(1); analyzePath = argv[++i];
    } else if (std::strcmp(a, "--info") == 0) {
      need(1); infoPath = argv[++i];
    } else if (std::strcmp(a, "--validate") == 0) {
      need(1); validatePath = argv[++i];
    } else if (std::strcmp(a, "--workers") == 0) {
      need(1); workersOverride = std::max(0, std::atoi(argv[++i]));
    } else if (std::strcmp(a, "--timeout-sec") == 0) {
      need(1); timeoutOverride = std::atof(argv[++i]);
    } else if (std::strcmp(a, "--bitdepth") == 0) {
      need(1); bitDepthOverride = argv[++i];
    } else if (std::strcmp(a, "--list-speakers") == 0) {
      listSpeakersFlag = true;
    } else if (std::strcmp(a, "--hash") == 0) {
      printHash = true;
    } else if (std::strcmp(a, "--json") == 0) {
      printJson = true;
    } else if (std::strcmp(a, "--no-progress") == 0) {
      showProgress = false;
    } else if (std::strcmp(a, "--quiet") == 0) {
      gLogEnabled = false;
      showProgress = false;
    } else if (std::strcmp(a, "--verbose") == 0) {
      gProgressLogEnabled = true;
    } else {
      std::fprintf(stderr, "Unknown option: %s\n", a);
      printUsage(argv[0]);
      return 1;
    }
  }

  if (gLogEnabled) {
    static const char* kVoxmorphVersion = "0.1.0";
    std::fprintf(stderr, "voxmorph -- version %s starting up (built %s %s)\n", kVoxmorphVersion, __DATE__, __TIME__);
  }
  if (!validatePath.empty()) return validateConfigJson(validatePath);

  EngineConfig cfg;
  if (!configPath.empty()) {
    std::string diag;
    const int rc = validateJsonWithSchema(configPath, kSchemaPath, diag);
    if (rc != 0) {
      std::fprintf(stderr, "[config] %s failed schema validation:\n%s\n", configPath.c_str(), diag.c_str());
      return rc;
    }
  }
  try {
    if (!configPath.empty()) cfg = loadEngineConfigFromJsonFile(configPath);
    if (workersOverride >= 0) cfg.jobs.workers = static_cast<uint32_t>(workersOverride);
    if (timeoutOverride >= 0.0) cfg.jobs.timeoutSeconds = timeoutOverride;
    if (!bitDepthOverride.empty()) cfg.output.bitDepth = parseBitDepth(bitDepthOverride);
  } catch (const std::exception& e) {
    std::fprintf(stderr, "[config] %s\n", e.what());
    return 1;
  }
  if (speaker.empty()) speaker = cfg.defaultSpeaker;

  if (listSpeakersFlag) {
    listSpeakers(cfg);
    return 0;
  }

  std::shared_ptr<DspBackend> dsp = makeDefaultDspBackend();

  if (!analyzePath.empty() || !infoPath.empty()) {
    try {
      if (!analyzePath.empty()) {
        const AudioBuffer b = loadForInspection(analyzePath, cfg);
        const VoiceProfile p = FeatureExtractor(dsp, cfg.analysis).extract(b);
        std::printf("%s\n", nlohmann::json(p).dump(2).c_str());
      }
      if (!infoPath.empty()) {
        const AudioBuffer b = loadForInspection(infoPath, cfg);
        const AudioInfo info = describeAudio(b, *dsp);
        if (printJson) {
          std::printf("%s\n", nlohmann::json(info).dump(2).c_str());
        } else {
          std::printf("Duration:  %s (%u frames @ %u Hz)\n", formatDuration(info.durationSeconds).c_str(),
                      info.frames, info.sampleRate);
          std::printf("Peak:      %.4f\nRMS:       %.4f\nRange:     %.4f\n", info.peak, info.rms, info.dynamicRange);
          std::printf("Dominant:  %.1f Hz\nCentroid:  %.1f Hz\n", info.dominantFrequency, info.spectralCentroid);
        }
      }
    } catch (const std::exception& e) {
      std::fprintf(stderr, "Error: %s\n", e.what());
      return 1;
    }
    return 0;
  }

  const bool doConvert = !convertPath.empty();
  const bool doClone = !cloneRefPath.empty() || !cloneTargetPath.empty();
  if (doConvert == doClone || (doClone && (cloneRefPath.empty() || cloneTargetPath.empty()))) {
    printUsage(argv[0]);
    return 1;
  }

  auto artifacts = std::make_shared<MemoryArtifactStore>();
  JobManager manager(cfg, dsp, std::make_shared<MemoryJobStore>(), artifacts);
  uint64_t sub = 0;
  if (showProgress) {
    sub = manager.events().subscribe([](const JobEvent& ev) {
      std::fprintf(stderr, "[voxmorph] %3.0f%% %-24s\r", ev.progress, ev.message.c_str());
      if (isTerminal(ev.status)) std::fprintf(stderr, "\n");
    });
  }

  const auto t0 = std::chrono::steady_clock::now();
  std::string jobId;
  try {
    if (doConvert) {
      jobId = manager.submitConversion(readFileBytes(convertPath), speaker, strength);
    } else {
      jobId = manager.submitCloning(readFileBytes(cloneRefPath), readFileBytes(cloneTargetPath), similarity);
    }
  } catch (const std::exception& e) {
    std::fprintf(stderr, "Error: %s\n", e.what());
    return 1;
  }
  while (!manager.waitFor(jobId, std::chrono::milliseconds(250))) {}
  if (sub) manager.events().unsubscribe(sub);

  const Job job = manager.status(jobId);
  if (printJson) std::printf("%s\n", nlohmann::json(job).dump(2).c_str());
  if (job.status != JobStatus::Completed) {
    std::fprintf(stderr, "Job %s failed: %s\n", job.id.c_str(), job.error ? job.error->c_str() : "unknown error");
    return 1;
  }

  try {
    const std::vector<uint8_t> wav = artifacts->get(*job.resultRef);
    if (printHash) std::printf("sha1=%s\n", Sha1::hex(wav.data(), wav.size()).c_str());
    if (!outPath.empty()) {
      std::ofstream f(outPath, std::ios::binary | std::ios::trunc);
      if (!f) throw std::runtime_error("Failed to open output file: " + outPath);
      f.write(reinterpret_cast<const char*>(wav.data()), static_cast<std::streamsize>(wav.size()));
      if (!f) throw std::runtime_error("Failed to write output file: " + outPath);
    }
  } catch (const std::exception& e) {
    std::fprintf(stderr, "Error: %s\n", e.what());
    return 1;
  }
  if (gLogEnabled && gSummaryEnabled) {
    const double secs = std::chrono::duration<double>(std::chrono::steady_clock::now() - t0).count();
    std::fprintf(stderr, "[voxmorph] %s done in %s%s%s\n", toStr(job.kind), formatDuration(secs).c_str(),
                 outPath.empty() ? "" : " -> ", outPath.c_str());
  }
  return 0;
}
