#include <catch2/catch.hpp>
#include <string>
#include "core/EngineConfig.hpp"
#include "core/Errors.hpp"
#include "core/SchemaValidate.hpp"
#include "core/VoiceProfile.hpp"

namespace {
const std::string kSourceDir = VOXMORPH_SOURCE_DIR;
const std::string kSchema = kSourceDir + "/schemas/voxmorph.schema.json";
const std::string kDefaultConfig = kSourceDir + "/config/voxmorph.json";
}

TEST_CASE("empty config keeps built-in defaults", "[config]") {
  const EngineConfig c = parseEngineConfigJson(R"({"kind":"voxmorph"})");
  CHECK(c.sampleRate == 22050);
  CHECK(c.analysis.f0MinHz == Approx(80.0f));
  CHECK(c.analysis.f0MaxHz == Approx(400.0f));
  CHECK(c.transfer.pitchSkipSemitones == Approx(0.1f));
  CHECK(c.transfer.normalizePeak == Approx(0.95f));
  CHECK(c.ingest.maxConvertBytes == 100ull * 1024 * 1024);
  CHECK(c.ingest.maxCloneBytes == 50ull * 1024 * 1024);
  CHECK(c.output.bitDepth == BitDepth::Float32);
  CHECK(c.defaultSpeaker == "speaker_001");
  CHECK(c.speakers.size() == 4);
}

TEST_CASE("config overrides individual keys", "[config]") {
  const EngineConfig c = parseEngineConfigJson(R"({
    "kind": "voxmorph",
    "normalizePeak": 0.8,
    "transfer": { "minF0DiffHz": 25 },
    "jobs": { "workers": 3, "timeoutSeconds": 12.5 },
    "output": { "bitDepth": "24" },
    "defaultSpeaker": "narrator",
    "speakers": [ { "id": "narrator", "pitchShiftRatio": 0.9, "formantShiftRatio": 1.0, "brightnessFactor": 1.1 } ]
  })");
  CHECK(c.transfer.normalizePeak == Approx(0.8f));
  CHECK(c.transfer.minF0DiffHz == Approx(25.0f));
  CHECK(c.transfer.centroidDiffHz == Approx(100.0f));
  CHECK(c.jobs.workers == 3);
  CHECK(c.jobs.timeoutSeconds == Approx(12.5));
  CHECK(c.output.bitDepth == BitDepth::Pcm24);
  REQUIRE(c.speakers.size() == 1);
  CHECK(c.speakers[0].name == "narrator");
}

TEST_CASE("invalid configs raise ConfigError", "[config]") {
  CHECK_THROWS_AS(parseEngineConfigJson("{not json"), ConfigError);
  CHECK_THROWS_AS(parseEngineConfigJson(R"({"kind":"rack"})"), ConfigError);
  CHECK_THROWS_AS(parseEngineConfigJson(R"({"kind":"voxmorph","defaultSpeaker":"ghost"})"), ConfigError);
  CHECK_THROWS_AS(parseEngineConfigJson(R"({"kind":"voxmorph","sampleRate":"fast"})"), ConfigError);
  CHECK_THROWS_AS(parseEngineConfigJson(R"({"kind":"voxmorph","analysis":{"f0MinHz":500}})"), ConfigError);
  CHECK_THROWS_AS(parseEngineConfigJson(R"({"kind":"voxmorph","output":{"bitDepth":"8"}})"), ConfigError);
  CHECK_THROWS_AS(loadEngineConfigFromJsonFile("definitely/missing.json"), ConfigError);
}

TEST_CASE("odd analysis frame sizes are rejected", "[config]") {
  CHECK_THROWS_AS(parseEngineConfigJson(R"({"kind":"voxmorph","analysis":{"frameSize":65,"hopSize":32}})"),
                  ConfigError);
  CHECK_THROWS_AS(parseEngineConfigJson(R"({"kind":"voxmorph","analysis":{"pitchFrameSize":2047}})"), ConfigError);
  std::string diag;
  CHECK(validateJsonTextWithSchema(R"({"kind":"voxmorph","analysis":{"frameSize":65}})", kSchema, diag) == 2);
  CHECK(diag.find("/analysis/frameSize") != std::string::npos);
  CHECK(validateJsonTextWithSchema(R"({"kind":"voxmorph","analysis":{"frameSize":1024}})", kSchema, diag) == 0);
}

TEST_CASE("bit depth names round-trip", "[config]") {
  for (BitDepth d : {BitDepth::Pcm16, BitDepth::Pcm24, BitDepth::Float32}) CHECK(parseBitDepth(toStr(d)) == d);
  CHECK(parseBitDepth("float") == BitDepth::Float32);
}

TEST_CASE("shipped config matches built-in defaults", "[config]") {
  const EngineConfig file = loadEngineConfigFromJsonFile(kDefaultConfig);
  const EngineConfig builtin;
  REQUIRE(file.speakers.size() == builtin.speakers.size());
  for (size_t i = 0; i < builtin.speakers.size(); ++i) {
    CHECK(file.speakers[i].id == builtin.speakers[i].id);
    CHECK(file.speakers[i].pitchShiftRatio == Approx(builtin.speakers[i].pitchShiftRatio));
    CHECK(file.speakers[i].formantShiftRatio == Approx(builtin.speakers[i].formantShiftRatio));
    CHECK(file.speakers[i].brightnessFactor == Approx(builtin.speakers[i].brightnessFactor));
  }
  CHECK(file.transfer.rolloffBaseHz == Approx(builtin.transfer.rolloffBaseHz));
  CHECK(file.analysis.melBands == builtin.analysis.melBands);
}

TEST_CASE("schema accepts the shipped config and flags violations", "[config][schema]") {
  std::string diag;
  CHECK(validateJsonWithSchema(kDefaultConfig, kSchema, diag) == 0);
  CHECK(diag.empty());

  CHECK(validateJsonTextWithSchema(R"({"kind":"voxmorph","sampleRate":"fast"})", kSchema, diag) == 2);
  CHECK(diag.find("/sampleRate") != std::string::npos);
  CHECK(validateJsonTextWithSchema(R"({"speakers":[{"id":"x"}]})", kSchema, diag) == 2);
  CHECK(validateJsonTextWithSchema("{oops", kSchema, diag) == 1);
  CHECK(validateJsonWithSchema("missing.json", kSchema, diag) == 1);
}

TEST_CASE("VoiceProfile JSON uses the nested f0 layout", "[config][json]") {
  VoiceProfile p;
  p.f0Mean = 123.0;
  p.spectralCentroid = 1500.0;
  p.mfcc[3] = -4.5;
  const nlohmann::json j = p;
  CHECK(j.at("f0").at("mean").get<double>() == Approx(123.0));
  CHECK(j.at("mfcc").size() == kMfccCount);
  const VoiceProfile back = j.get<VoiceProfile>();
  CHECK(back.f0Mean == Approx(123.0));
  CHECK(back.mfcc[3] == Approx(-4.5));
  CHECK(back.spectralCentroid == Approx(1500.0));
}
