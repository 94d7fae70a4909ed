#pragma once

#include <cstdint>
#include <vector>
#include "DspBackend.hpp"

// Periodic Hann window of length n.
std::vector<float> hannWindow(uint32_t n);

// Magnitude STFT with zero centre padding; 1 + n/hop frames of frameSize/2+1 bins.
Spectrogram computeStftMagnitude(const std::vector<float>& x, uint32_t frameSize, uint32_t hopSize);

// Per-frame spectral shape averaged over frames. Each frame's magnitudes are
// L1-normalised first; all-zero frames contribute 0 to every statistic.
SpectralStats computeSpectralStats(const Spectrogram& s, uint32_t sampleRate, float rolloffPercent);

// Mean zero-crossing rate over centre-padded frames.
double meanZeroCrossingRate(const std::vector<float>& x, uint32_t frameSize, uint32_t hopSize);
