#include <catch2/catch.hpp>
#include <regex>
#include <set>
#include <string>
#include "TestSignals.hpp"
#include "core/AudioBuffer.hpp"
#include "core/IdGenerator.hpp"
#include "core/Sha1.hpp"

TEST_CASE("AudioBuffer downmix averages channels", "[core][buffer]") {
  AudioBuffer left = AudioBuffer::mono({1.0f, 0.5f, -1.0f}, 22050);
  AudioBuffer right = AudioBuffer::mono({0.0f, 0.5f, 1.0f}, 22050);
  const AudioBuffer st = testsig::stereo(left, right);
  REQUIRE(st.frames == 3);
  const AudioBuffer m = st.downmix();
  REQUIRE(m.isMono());
  REQUIRE(m.frames == 3);
  CHECK(m.data[0] == Approx(0.5f));
  CHECK(m.data[1] == Approx(0.5f));
  CHECK(m.data[2] == Approx(0.0f));
}

TEST_CASE("AudioBuffer level statistics", "[core][buffer]") {
  const AudioBuffer b = AudioBuffer::mono({0.5f, -0.5f, 0.5f, -0.5f}, 8000);
  CHECK(b.peak() == Approx(0.5f));
  CHECK(b.rms() == Approx(0.5));
  CHECK(b.durationSeconds() == Approx(0.0005));
  CHECK(AudioBuffer{}.rms() == 0.0);
  CHECK(AudioBuffer{}.empty());
}

TEST_CASE("Sha1 matches published test vectors", "[core][sha1]") {
  CHECK(Sha1::hex("abc", 3) == "a9993e364706816aba3e25717850c26c9cd0d89d");
  CHECK(Sha1::hex("", 0) == "da39a3ee5e6b4b0d3255bfef95601890afd80709");
  const std::string two = "abcdbcdecdefdefgefghfghighijhijkijkljklmklmnlmnomnopnopq";
  CHECK(Sha1::hex(two.data(), two.size()) == "84983e441c3bd26ebaae4aa1f95129e5e54670f1");
}

TEST_CASE("Sha1 incremental updates equal one-shot", "[core][sha1]") {
  const std::string text(1000, 'x');
  Sha1 s;
  s.update(text.data(), 10).update(text.data() + 10, 500).update(text.data() + 510, 490);
  CHECK(s.hexDigest() == Sha1::hex(text.data(), text.size()));
}

TEST_CASE("IdGenerator produces unique version-4 UUIDs", "[core][ids]") {
  IdGenerator gen(42);
  const std::regex uuid("^[0-9a-f]{8}-[0-9a-f]{4}-4[0-9a-f]{3}-[89ab][0-9a-f]{3}-[0-9a-f]{12}$");
  std::set<std::string> seen;
  for (int i = 0; i < 1000; ++i) {
    const std::string id = gen.next();
    REQUIRE(std::regex_match(id, uuid));
    seen.insert(id);
  }
  CHECK(seen.size() == 1000);
}
