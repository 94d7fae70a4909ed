#include "FeatureExtractor.hpp"
#include "../dsp/SpectralAnalysis.hpp"
#include <algorithm>
#include <cmath>

namespace {

void fillPitchStats(const std::vector<float>& track, VoiceProfile& p) {
  std::vector<double> voiced;
  voiced.reserve(track.size());
  for (float f : track) if (f > 0.0f) voiced.push_back(f);
  if (voiced.empty()) return; // keep fallback constants

  double sum = 0.0;
  for (double v : voiced) sum += v;
  const double mean = sum / voiced.size();
  double var = 0.0;
  for (double v : voiced) var += (v - mean) * (v - mean);

  std::sort(voiced.begin(), voiced.end());
  const size_t n = voiced.size();
  const double median = (n % 2) ? voiced[n / 2] : 0.5 * (voiced[n / 2 - 1] + voiced[n / 2]);

  p.f0Mean = mean;
  p.f0Std = std::sqrt(var / n);
  p.f0Median = median;
  p.f0Range = voiced.back() - voiced.front();
}

} // namespace

VoiceProfile FeatureExtractor::extract(const AudioBuffer& input) const {
  VoiceProfile p;
  const AudioBuffer buffer = input.downmix();
  p.durationSeconds = buffer.durationSeconds();
  if (buffer.empty()) return p;

  const std::vector<float>& x = buffer.data;
  const uint32_t sr = buffer.sampleRate;

  fillPitchStats(dsp_->pitchTrack(x, sr, spec_), p);

  const Spectrogram s = dsp_->stftMagnitude(x, spec_.frameSize, spec_.hopSize);
  const SpectralStats st = dsp_->spectralStats(s, sr, spec_.rolloffPercent);
  p.spectralCentroid = st.centroid;
  p.spectralRolloff = st.rolloff;
  p.spectralBandwidth = st.bandwidth;

  p.rmsEnergy = buffer.rms();
  p.zeroCrossingRate = meanZeroCrossingRate(x, spec_.frameSize, spec_.hopSize);

  const std::vector<double> mfcc = dsp_->melCepstrum(s, sr, spec_.melBands, spec_.mfccCount);
  for (size_t i = 0; i < p.mfcc.size() && i < mfcc.size(); ++i) p.mfcc[i] = mfcc[i];
  return p;
}
