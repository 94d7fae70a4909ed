#include <catch2/catch.hpp>
#include <cmath>
#include "TestSignals.hpp"
#include "core/EngineConfig.hpp"
#include "dsp/DspBackend.hpp"
#include "dsp/MelCepstrum.hpp"
#include "dsp/SpectralAnalysis.hpp"
#include "engine/FeatureExtractor.hpp"

namespace {

FeatureExtractor makeExtractor() {
  return FeatureExtractor(makeDefaultDspBackend(), AnalysisSpec{});
}

void requireFallbackPitch(const VoiceProfile& p) {
  CHECK(p.f0Mean == 150.0);
  CHECK(p.f0Std == 20.0);
  CHECK(p.f0Median == 150.0);
  CHECK(p.f0Range == 50.0);
}

} // namespace

TEST_CASE("150 Hz sine is tracked near 150 Hz", "[engine][features][pitch]") {
  const VoiceProfile p = makeExtractor().extract(testsig::sine(150.0, 2.0));
  CHECK(p.f0Mean >= 140.0);
  CHECK(p.f0Mean <= 160.0);
  CHECK(p.f0Median == Approx(150.0).margin(3.0));
  CHECK(p.f0Std < 5.0);
  CHECK(p.durationSeconds == Approx(2.0));
  CHECK(p.allFinite());
}

TEST_CASE("Harmonic tone pitch follows the fundamental", "[engine][features][pitch]") {
  const FeatureExtractor fx = makeExtractor();
  CHECK(fx.extract(testsig::harmonic(120.0, 1.5)).f0Mean == Approx(120.0).margin(6.0));
  CHECK(fx.extract(testsig::harmonic(200.0, 1.5)).f0Mean == Approx(200.0).margin(10.0));
}

TEST_CASE("Silence yields exact pitch fallback and finite fields", "[engine][features][edge]") {
  const VoiceProfile p = makeExtractor().extract(testsig::silence(1.0));
  requireFallbackPitch(p);
  CHECK(p.rmsEnergy == 0.0);
  CHECK(p.spectralCentroid == 0.0);
  CHECK(p.spectralRolloff == 0.0);
  CHECK(p.zeroCrossingRate == 0.0);
  CHECK(p.allFinite());
}

TEST_CASE("White noise has no detectable pitch", "[engine][features][edge]") {
  const VoiceProfile p = makeExtractor().extract(testsig::noise(1.0));
  requireFallbackPitch(p);
  CHECK(p.rmsEnergy > 0.1);
  CHECK(p.zeroCrossingRate > 0.3);
  CHECK(p.spectralCentroid > 3000.0);
  CHECK(p.allFinite());
}

TEST_CASE("Empty and very short buffers still give finite profiles", "[engine][features][edge]") {
  const FeatureExtractor fx = makeExtractor();
  const VoiceProfile empty = fx.extract(AudioBuffer::mono({}, testsig::kRate));
  requireFallbackPitch(empty);
  CHECK(empty.durationSeconds == 0.0);
  CHECK(empty.allFinite());

  const VoiceProfile tiny = fx.extract(testsig::sine(200.0, 0.01));
  CHECK(tiny.allFinite());
  CHECK(tiny.durationSeconds == Approx(0.01).margin(1e-4));
}

TEST_CASE("Stereo input is down-mixed before analysis", "[engine][features]") {
  const AudioBuffer st = testsig::stereo(testsig::sine(150.0, 1.0), testsig::sine(150.0, 1.0));
  const VoiceProfile p = makeExtractor().extract(st);
  CHECK(p.f0Mean == Approx(150.0).margin(10.0));
  CHECK(p.durationSeconds == Approx(1.0));
}

TEST_CASE("Spectral centroid and roll-off of a pure tone sit near the tone", "[dsp][spectral]") {
  const VoiceProfile p = makeExtractor().extract(testsig::sine(1000.0, 1.0));
  CHECK(p.spectralCentroid == Approx(1000.0).margin(150.0));
  CHECK(p.spectralRolloff == Approx(1000.0).margin(150.0));
  CHECK(p.spectralBandwidth < 300.0);
}

TEST_CASE("STFT handles odd frame sizes on hop-aligned input", "[dsp][spectral]") {
  std::vector<float> x(64);
  for (size_t i = 0; i < x.size(); ++i) x[i] = static_cast<float>(std::sin(0.3 * i));
  const Spectrogram s = computeStftMagnitude(x, 65, 32);
  CHECK(s.frames == 3);
  CHECK(s.bins == 33);
  REQUIRE(s.mag.size() == 3u * 33u);
  for (float m : s.mag) CHECK(std::isfinite(m));
}

TEST_CASE("Zero-crossing rate of a sine is twice its frequency over the rate", "[dsp][zcr]") {
  const AudioBuffer b = testsig::sine(441.0, 1.0);
  const double zcr = meanZeroCrossingRate(b.data, 2048, 512);
  CHECK(zcr == Approx(2.0 * 441.0 / 22050.0).margin(0.005));
}

TEST_CASE("MFCCs separate tonal and noisy input", "[dsp][mfcc]") {
  const FeatureExtractor fx = makeExtractor();
  const VoiceProfile tone = fx.extract(testsig::harmonic(150.0, 1.0));
  const VoiceProfile hiss = fx.extract(testsig::noise(1.0));
  double dist = 0.0;
  for (size_t i = 1; i < kMfccCount; ++i) dist += std::fabs(tone.mfcc[i] - hiss.mfcc[i]);
  CHECK(dist > 10.0);
}

TEST_CASE("Slaney mel scale is linear below 1 kHz and invertible", "[dsp][mfcc]") {
  CHECK(MelFilterbank::hzToMel(1000.0) == Approx(15.0));
  CHECK(MelFilterbank::hzToMel(200.0) == Approx(3.0));
  for (double hz : {50.0, 700.0, 1000.0, 4000.0, 11025.0}) {
    CHECK(MelFilterbank::melToHz(MelFilterbank::hzToMel(hz)) == Approx(hz));
  }
}

TEST_CASE("Extraction is deterministic", "[engine][features]") {
  const FeatureExtractor fx = makeExtractor();
  const AudioBuffer b = testsig::harmonic(180.0, 1.0);
  const VoiceProfile a = fx.extract(b);
  const VoiceProfile c = fx.extract(b);
  CHECK(a.f0Mean == c.f0Mean);
  CHECK(a.spectralCentroid == c.spectralCentroid);
  CHECK(a.mfcc == c.mfcc);
}
