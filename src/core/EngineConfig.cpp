#include "EngineConfig.hpp"
#include "Errors.hpp"
#include "LogControls.hpp"
#include <fstream>
#include <sstream>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <nlohmann/json.hpp>

using nlohmann::json;

static std::vector<std::string> searchRoots() {
  // CWD, config/, then env VOXMORPH_SEARCH_PATHS (colon-separated)
  std::vector<std::string> roots;
  roots.emplace_back("");
  roots.emplace_back("config/");
  if (const char* env = std::getenv("VOXMORPH_SEARCH_PATHS")) {
    std::string s(env);
    size_t start = 0; while (start <= s.size()) {
      size_t sep = s.find(':', start);
      std::string tok = (sep == std::string::npos) ? s.substr(start) : s.substr(start, sep - start);
      if (!tok.empty()) {
        if (tok.back() != '/') tok.push_back('/');
        roots.push_back(tok);
      }
      if (sep == std::string::npos) break; else start = sep + 1;
    }
  }
  return roots;
}

std::string resolvePathWithSearchPaths(const std::string& path) {
  std::error_code ec;
  if (std::filesystem::path(path).is_absolute()) return path;
  for (const auto& r : searchRoots()) {
    const std::string candidate = r.empty() ? path : (r + path);
    if (std::filesystem::is_regular_file(candidate, ec)) return candidate;
  }
  return path;
}

std::string readFileWithSearchPaths(const std::string& path) {
  const std::string resolved = resolvePathWithSearchPaths(path);
  std::ifstream f(resolved);
  if (!f) throw std::runtime_error("Failed to open JSON file: " + path);
  std::ostringstream ss; ss << f.rdbuf();
  return ss.str();
}

BitDepth parseBitDepth(const std::string& s) {
  if (s == "16") return BitDepth::Pcm16;
  if (s == "24") return BitDepth::Pcm24;
  if (s == "32f" || s == "float") return BitDepth::Float32;
  throw ConfigError("Unsupported bit depth '" + s + "' (expected 16|24|32f)");
}

const char* toStr(BitDepth d) {
  switch (d) {
    case BitDepth::Pcm16: return "16";
    case BitDepth::Pcm24: return "24";
    case BitDepth::Float32: return "32f";
  }
  return "32f";
}

static void checkSemantics(const EngineConfig& c) {
  const auto& a = c.analysis;
  if (c.sampleRate < 8000) throw ConfigError("sampleRate must be >= 8000");
  if (a.frameSize < 64 || a.hopSize == 0 || a.hopSize > a.frameSize) throw ConfigError("analysis frameSize/hopSize invalid");
  if (a.pitchFrameSize < 64 || a.pitchHopSize == 0) throw ConfigError("analysis pitchFrameSize/pitchHopSize invalid");
  if (a.frameSize % 2 != 0 || a.pitchFrameSize % 2 != 0) throw ConfigError("analysis frameSize and pitchFrameSize must be even");
  if (!(a.f0MinHz > 0.0f) || !(a.f0MaxHz > a.f0MinHz)) throw ConfigError("analysis f0MinHz must be > 0 and < f0MaxHz");
  if (!(a.rolloffPercent > 0.0f && a.rolloffPercent < 1.0f)) throw ConfigError("analysis rolloffPercent must be in (0,1)");
  if (a.mfccCount == 0 || a.mfccCount > a.melBands) throw ConfigError("analysis mfccCount must be in [1, melBands]");
  const auto& t = c.transfer;
  if (!(t.formantLowHz < t.formantHighHz)) throw ConfigError("transfer formantLowHz must be < formantHighHz");
  if (!(t.normalizePeak > 0.0f && t.normalizePeak <= 1.0f)) throw ConfigError("transfer normalizePeak must be in (0,1]");
  if (c.speakers.empty()) throw ConfigError("speakers must not be empty");
  bool haveDefault = false;
  for (const auto& s : c.speakers) {
    if (s.id.empty()) throw ConfigError("speaker requires id");
    if (!(s.pitchShiftRatio > 0.0f) || !(s.formantShiftRatio > 0.0f) || !(s.brightnessFactor > 0.0f)) {
      throw ConfigError("speaker '" + s.id + "' ratios must be positive");
    }
    if (speakerIdEquals(s.id, c.defaultSpeaker)) haveDefault = true;
  }
  if (!haveDefault) throw ConfigError("defaultSpeaker '" + c.defaultSpeaker + "' is not in speakers");
}

EngineConfig parseEngineConfigJson(const std::string& text) {
  json j;
  try {
    j = json::parse(text);
  } catch (const json::parse_error& e) {
    throw ConfigError(std::string("Config parse error: ") + e.what());
  }
  if (j.contains("kind")) {
    const std::string k = j.at("kind").get<std::string>();
    if (k != std::string("voxmorph")) {
      throw ConfigError("JSON kind mismatch: expected 'voxmorph' but got '" + k + "'");
    }
  } else if (gLogEnabled) {
    std::fprintf(stderr, "[config] Warning: config JSON missing 'kind'; assuming voxmorph\n");
  }

  EngineConfig c;
  try {
    if (j.contains("description")) c.description = j.at("description").get<std::string>();
    if (j.contains("version")) c.version = j.at("version").get<int>();
    if (j.contains("sampleRate")) c.sampleRate = j.at("sampleRate").get<uint32_t>();
    c.transfer.normalizePeak = j.value("normalizePeak", c.transfer.normalizePeak);

    if (j.contains("analysis")) {
      const auto& a = j.at("analysis");
      c.analysis.frameSize = a.value("frameSize", c.analysis.frameSize);
      c.analysis.hopSize = a.value("hopSize", c.analysis.hopSize);
      c.analysis.f0MinHz = a.value("f0MinHz", c.analysis.f0MinHz);
      c.analysis.f0MaxHz = a.value("f0MaxHz", c.analysis.f0MaxHz);
      c.analysis.pitchFrameSize = a.value("pitchFrameSize", c.analysis.pitchFrameSize);
      c.analysis.pitchHopSize = a.value("pitchHopSize", c.analysis.pitchHopSize);
      c.analysis.yinThreshold = a.value("yinThreshold", c.analysis.yinThreshold);
      c.analysis.rolloffPercent = a.value("rolloffPercent", c.analysis.rolloffPercent);
      c.analysis.melBands = a.value("melBands", c.analysis.melBands);
      c.analysis.mfccCount = a.value("mfccCount", c.analysis.mfccCount);
    }
    if (j.contains("transfer")) {
      const auto& t = j.at("transfer");
      c.transfer.pitchSkipSemitones = t.value("pitchSkipSemitones", c.transfer.pitchSkipSemitones);
      c.transfer.minF0DiffHz = t.value("minF0DiffHz", c.transfer.minF0DiffHz);
      c.transfer.centroidDiffHz = t.value("centroidDiffHz", c.transfer.centroidDiffHz);
      c.transfer.rolloffDiffHz = t.value("rolloffDiffHz", c.transfer.rolloffDiffHz);
      c.transfer.rolloffBaseHz = t.value("rolloffBaseHz", c.transfer.rolloffBaseHz);
      c.transfer.formantLowHz = t.value("formantLowHz", c.transfer.formantLowHz);
      c.transfer.formantHighHz = t.value("formantHighHz", c.transfer.formantHighHz);
      c.transfer.brightnessCutoffHz = t.value("brightnessCutoffHz", c.transfer.brightnessCutoffHz);
    }
    if (j.contains("ingest")) {
      const auto& in = j.at("ingest");
      c.ingest.maxConvertBytes = in.value("maxConvertBytes", c.ingest.maxConvertBytes);
      c.ingest.maxCloneBytes = in.value("maxCloneBytes", c.ingest.maxCloneBytes);
      c.ingest.maxDurationSeconds = in.value("maxDurationSeconds", c.ingest.maxDurationSeconds);
    }
    if (j.contains("jobs")) {
      const auto& jb = j.at("jobs");
      c.jobs.workers = jb.value("workers", c.jobs.workers);
      c.jobs.timeoutSeconds = jb.value("timeoutSeconds", c.jobs.timeoutSeconds);
    }
    if (j.contains("output")) {
      const auto& o = j.at("output");
      if (o.contains("bitDepth")) c.output.bitDepth = parseBitDepth(o.at("bitDepth").get<std::string>());
    }
    if (j.contains("speakers")) {
      c.speakers.clear();
      for (const auto& s : j.at("speakers")) {
        SpeakerPreset p;
        p.id = s.value("id", "");
        p.pitchShiftRatio = s.value("pitchShiftRatio", 1.0f);
        p.formantShiftRatio = s.value("formantShiftRatio", 1.0f);
        p.brightnessFactor = s.value("brightnessFactor", 1.0f);
        p.name = s.value("name", p.id);
        p.description = s.value("description", "");
        p.gender = s.value("gender", "");
        p.ageRange = s.value("ageRange", "");
        c.speakers.push_back(std::move(p));
      }
    }
    if (j.contains("defaultSpeaker")) c.defaultSpeaker = j.at("defaultSpeaker").get<std::string>();
  } catch (const json::exception& e) {
    throw ConfigError(std::string("Config type error: ") + e.what());
  }

  checkSemantics(c);
  return c;
}

EngineConfig loadEngineConfigFromJsonFile(const std::string& path) {
  std::string text;
  try {
    text = readFileWithSearchPaths(path);
  } catch (const std::runtime_error& e) {
    throw ConfigError(e.what());
  }
  return parseEngineConfigJson(text);
}
