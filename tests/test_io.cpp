#include <catch2/catch.hpp>
#include <cstring>
#include <filesystem>
#include <limits>
#include "TestSignals.hpp"
#include "core/Errors.hpp"
#include "io/AudioIngest.hpp"
#include "io/WavWriter.hpp"
#include "jobs/ArtifactStore.hpp"

namespace {

uint32_t readLe32(const std::vector<uint8_t>& b, size_t off) {
  return uint32_t(b[off]) | (uint32_t(b[off + 1]) << 8) | (uint32_t(b[off + 2]) << 16) | (uint32_t(b[off + 3]) << 24);
}

uint16_t readLe16(const std::vector<uint8_t>& b, size_t off) {
  return static_cast<uint16_t>(b[off] | (b[off + 1] << 8));
}

std::vector<uint8_t> encode(const AudioBuffer& b, BitDepth depth) {
  AudioFileSpec spec;
  spec.bitDepth = depth;
  spec.sampleRate = b.sampleRate;
  spec.channels = b.channels;
  return encodeWav(spec, b.data);
}

} // namespace

TEST_CASE("encodeWav writes a canonical RIFF header", "[io][wav]") {
  const AudioBuffer b = testsig::sine(440.0, 0.1);
  const auto pcm16 = encode(b, BitDepth::Pcm16);
  REQUIRE(pcm16.size() == 44 + b.frames * 2);
  CHECK(std::memcmp(pcm16.data(), "RIFF", 4) == 0);
  CHECK(std::memcmp(pcm16.data() + 8, "WAVE", 4) == 0);
  CHECK(readLe32(pcm16, 4) == pcm16.size() - 8);
  CHECK(readLe16(pcm16, 20) == 1);
  CHECK(readLe16(pcm16, 22) == 1);
  CHECK(readLe32(pcm16, 24) == 22050);
  CHECK(readLe16(pcm16, 34) == 16);
  CHECK(readLe32(pcm16, 40) == b.frames * 2);

  const auto pcm24 = encode(b, BitDepth::Pcm24);
  CHECK(pcm24.size() == 44 + b.frames * 3);
  const auto f32 = encode(b, BitDepth::Float32);
  CHECK(f32.size() == 44 + b.frames * 4);
  CHECK(readLe16(f32, 20) == 3);
}

TEST_CASE("PCM16 encoding clips out-of-range samples", "[io][wav]") {
  const auto bytes = encode(AudioBuffer::mono({2.0f, -2.0f}, 22050), BitDepth::Pcm16);
  CHECK(static_cast<int16_t>(readLe16(bytes, 44)) == 32767);
  CHECK(static_cast<int16_t>(readLe16(bytes, 46)) == -32767);
}

TEST_CASE("decodeAudioPayload reads back an encoded WAV", "[io][ingest]") {
  const AudioBuffer b = testsig::sine(300.0, 0.5, 0.4);
  const AudioBuffer out = decodeAudioPayload(encode(b, BitDepth::Float32), 22050, IngestLimits{});
  REQUIRE(out.isMono());
  CHECK(out.sampleRate == 22050);
  REQUIRE(out.frames == Approx(b.frames).margin(2));
  for (uint32_t i = 1000; i < 1100; ++i) CHECK(out.data[i] == Approx(b.data[i]).margin(1e-3));
}

TEST_CASE("decodeAudioPayload resamples and down-mixes", "[io][ingest]") {
  const AudioBuffer hi = testsig::sine(500.0, 1.0, 0.4, 44100);
  const AudioBuffer st = testsig::stereo(hi, hi);
  const AudioBuffer out = decodeAudioPayload(encode(st, BitDepth::Pcm24), 22050, IngestLimits{});
  CHECK(out.isMono());
  CHECK(out.sampleRate == 22050);
  CHECK(out.frames == Approx(22050).margin(64));
  CHECK(out.rms() == Approx(hi.rms()).epsilon(0.02));
}

TEST_CASE("decodeAudioPayload rejects bad payloads with InputError", "[io][ingest]") {
  CHECK_THROWS_AS(decodeAudioPayload({}, 22050, IngestLimits{}), InputError);
  const std::vector<uint8_t> garbage(64, 0x5A);
  CHECK_THROWS_AS(decodeAudioPayload(garbage, 22050, IngestLimits{}), InputError);

  const auto wav = encode(testsig::sine(200.0, 2.0), BitDepth::Pcm16);
  IngestLimits tooSmall;
  tooSmall.maxBytes = wav.size() - 1;
  CHECK_THROWS_AS(decodeAudioPayload(wav, 22050, tooSmall), InputError);
  IngestLimits tooShort;
  tooShort.maxDurationSeconds = 1.0;
  CHECK_THROWS_AS(decodeAudioPayload(wav, 22050, tooShort), InputError);
}

TEST_CASE("decodeAudioPayload rejects non-finite float samples", "[io][ingest]") {
  AudioBuffer b = testsig::sine(220.0, 0.25);
  b.data[100] = std::numeric_limits<float>::infinity();
  CHECK_THROWS_AS(decodeAudioPayload(encode(b, BitDepth::Float32), 22050, IngestLimits{}), InputError);
  b.data[100] = std::numeric_limits<float>::quiet_NaN();
  CHECK_THROWS_AS(decodeAudioPayload(encode(b, BitDepth::Float32), 22050, IngestLimits{}), InputError);
}

TEST_CASE("MemoryArtifactStore is content addressed", "[io][artifacts]") {
  MemoryArtifactStore store;
  const std::vector<uint8_t> blob = {1, 2, 3};
  const std::string ref = store.put("job-a", blob);
  CHECK(ref == "mem://7037807198c22a7d2b0807371d763779a84fdfcf");
  CHECK(store.put("job-b", blob) == ref);
  CHECK(store.count() == 1);
  CHECK(store.get(ref) == blob);
  CHECK_THROWS_AS(store.get("mem://missing"), NotFoundError);
}

TEST_CASE("DirectoryArtifactStore writes one file per job", "[io][artifacts]") {
  const auto dir = std::filesystem::temp_directory_path() / "voxmorph_artifacts_test";
  std::filesystem::remove_all(dir);
  DirectoryArtifactStore store(dir.string());
  const std::vector<uint8_t> blob = {9, 8, 7, 6};
  const std::string ref = store.put("job-1", blob);
  CHECK(std::filesystem::exists(ref));
  CHECK(store.get(ref) == blob);
  CHECK_THROWS_AS(store.get((dir / "nope.wav").string()), NotFoundError);
  std::filesystem::remove_all(dir);
}
