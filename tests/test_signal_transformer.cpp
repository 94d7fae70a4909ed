#include <catch2/catch.hpp>
#include <algorithm>
#include <cmath>
#include "TestSignals.hpp"
#include "core/Errors.hpp"
#include "engine/AudioInfo.hpp"
#include "engine/SignalTransformer.hpp"

namespace {

SignalTransformer makeTransformer() {
  return SignalTransformer(makeDefaultDspBackend(), TransferSpec{});
}

} // namespace

TEST_CASE("normalize limits the peak to 0.95", "[engine][transform][normalize]") {
  const SignalTransformer t = makeTransformer();
  const AudioBuffer loud = testsig::sine(220.0, 0.5, 1.5);
  const AudioBuffer out = t.normalize(loud);
  CHECK(out.peak() <= 0.95f + 1e-6f);
  CHECK(out.peak() == Approx(0.95f).margin(1e-4));
  CHECK(out.frames == loud.frames);
}

TEST_CASE("normalize leaves quiet input untouched", "[engine][transform][normalize]") {
  const AudioBuffer quiet = testsig::sine(220.0, 0.5, 0.5);
  CHECK(makeTransformer().normalize(quiet).data == quiet.data);
}

TEST_CASE("pitchShift below the skip threshold is identity", "[engine][transform][pitch]") {
  const SignalTransformer t = makeTransformer();
  const AudioBuffer in = testsig::harmonic(150.0, 0.5);
  CHECK(t.pitchShift(in, 1.0, 1.0).data == in.data);
  CHECK(t.pitchShift(in, 1.5, 0.0).data == in.data);
  // 12*log2(1.005) ~ 0.086 semitones
  CHECK(t.pitchShift(in, 1.005, 1.0).data == in.data);
}

TEST_CASE("pitchShift preserves length and moves the dominant frequency", "[engine][transform][pitch]") {
  auto dsp = makeDefaultDspBackend();
  const SignalTransformer t(dsp, TransferSpec{});
  const AudioBuffer in = testsig::sine(200.0, 1.0);
  const double ratio = std::pow(2.0, 2.0 / 12.0);
  const AudioBuffer out = t.pitchShift(in, ratio, 1.0);
  REQUIRE(out.frames == in.frames);
  REQUIRE(out.sampleRate == in.sampleRate);
  CHECK(describeAudio(out, *dsp).dominantFrequency == Approx(200.0 * ratio).margin(12.0));
}

TEST_CASE("pitchShift rejects non-positive ratios", "[engine][transform][pitch]") {
  CHECK_THROWS_AS(makeTransformer().pitchShift(testsig::sine(200.0, 0.2), 0.0, 1.0), ProcessingError);
}

TEST_CASE("bandReweight with unit gain is identity", "[engine][transform][band]") {
  const SignalTransformer t = makeTransformer();
  const AudioBuffer in = testsig::harmonic(150.0, 0.5);
  CHECK(t.bandReweight(in, 1.0, 1.0, 300.0, 3000.0).data == in.data);
  CHECK(t.bandReweight(in, 2.0, 0.0, 300.0, 3000.0).data == in.data);
}

TEST_CASE("bandReweight scales only the selected band", "[engine][transform][band]") {
  const SignalTransformer t = makeTransformer();
  // Integer number of cycles: all energy lands in the 1000 Hz bin.
  const AudioBuffer in = testsig::sine(1000.0, 1.0, 0.25);
  const AudioBuffer boosted = t.bandReweight(in, 2.0, 1.0, 500.0, 1500.0);
  CHECK(boosted.rms() == Approx(2.0 * in.rms()).epsilon(0.01));
  const AudioBuffer outside = t.bandReweight(in, 2.0, 1.0, 2000.0, 11025.0);
  REQUIRE(outside.frames == in.frames);
  float maxDiff = 0.0f;
  for (size_t i = 0; i < in.data.size(); ++i) maxDiff = std::max(maxDiff, std::fabs(outside.data[i] - in.data[i]));
  CHECK(maxDiff < 1e-3f);
  const AudioBuffer halfBlend = t.bandReweight(in, 3.0, 0.5, 500.0, 1500.0);
  CHECK(halfBlend.rms() == Approx(2.0 * in.rms()).epsilon(0.01));
}

TEST_CASE("energyScale moves RMS toward the target", "[engine][transform][energy]") {
  const SignalTransformer t = makeTransformer();
  const AudioBuffer in = testsig::sine(300.0, 0.5, 0.1);
  CHECK(t.energyScale(in, 0.2, 1.0).rms() == Approx(0.2).epsilon(1e-4));
  const double half = in.rms() * 0.5 + 0.2 * 0.5;
  CHECK(t.energyScale(in, 0.2, 0.5).rms() == Approx(half).epsilon(1e-4));
  CHECK(t.energyScale(in, 0.2, 0.0).data == in.data);
}

TEST_CASE("energyScale leaves near-silent input unchanged", "[engine][transform][energy]") {
  const AudioBuffer quiet = testsig::silence(0.2);
  CHECK(makeTransformer().energyScale(quiet, 0.5, 1.0).data == quiet.data);
}

TEST_CASE("Transforms are deterministic and do not mutate input", "[engine][transform]") {
  const SignalTransformer t = makeTransformer();
  const AudioBuffer in = testsig::harmonic(140.0, 0.75);
  const std::vector<float> before = in.data;
  const AudioBuffer a = t.pitchShift(t.bandReweight(in, 1.2, 0.8, 300.0, 3000.0), 1.1, 0.9);
  const AudioBuffer b = t.pitchShift(t.bandReweight(in, 1.2, 0.8, 300.0, 3000.0), 1.1, 0.9);
  CHECK(a.data == b.data);
  CHECK(in.data == before);
}

TEST_CASE("Transforms require mono input", "[engine][transform]") {
  const AudioBuffer st = testsig::stereo(testsig::sine(200.0, 0.2), testsig::sine(300.0, 0.2));
  CHECK_THROWS_AS(makeTransformer().bandReweight(st, 2.0, 1.0, 0.0, 5000.0), ProcessingError);
}
