#include "RealFft.hpp"
#include "../core/Errors.hpp"
#include <cstring>
#include <fftw3.h>

std::mutex& fftwPlannerMutex() {
  static std::mutex m;
  return m;
}

RealFft::RealFft(size_t n) : n_(n) {
  if (n == 0) throw ProcessingError("RealFft: size must be > 0");
  real_ = fftwf_alloc_real(n_);
  fftwf_complex* c = fftwf_alloc_complex(bins());
  complex_ = c;
  if (!real_ || !c) {
    if (real_) fftwf_free(real_);
    if (c) fftwf_free(c);
    throw ProcessingError("RealFft: allocation failed");
  }
  std::lock_guard<std::mutex> lock(fftwPlannerMutex());
  // FFTW_ESTIMATE leaves the arrays untouched and gives reproducible plans.
  fftwf_plan fwd = fftwf_plan_dft_r2c_1d(static_cast<int>(n_), real_, c, FFTW_ESTIMATE);
  fftwf_plan inv = fftwf_plan_dft_c2r_1d(static_cast<int>(n_), c, real_, FFTW_ESTIMATE);
  if (!fwd || !inv) {
    if (fwd) fftwf_destroy_plan(fwd);
    if (inv) fftwf_destroy_plan(inv);
    fftwf_free(real_);
    fftwf_free(c);
    throw ProcessingError("RealFft: FFTW plan creation failed for n=" + std::to_string(n_));
  }
  fwdPlan_ = fwd;
  invPlan_ = inv;
}

RealFft::~RealFft() {
  {
    std::lock_guard<std::mutex> lock(fftwPlannerMutex());
    fftwf_destroy_plan(static_cast<fftwf_plan>(fwdPlan_));
    fftwf_destroy_plan(static_cast<fftwf_plan>(invPlan_));
  }
  fftwf_free(real_);
  fftwf_free(static_cast<fftwf_complex*>(complex_));
}

void RealFft::forward(const float* in, size_t count, std::complex<float>* out) {
  const size_t m = count < n_ ? count : n_;
  if (m > 0) std::memcpy(real_, in, m * sizeof(float));
  if (m < n_) std::memset(real_ + m, 0, (n_ - m) * sizeof(float));
  fftwf_execute(static_cast<fftwf_plan>(fwdPlan_));
  // fftwf_complex is layout-compatible with std::complex<float>
  std::memcpy(out, complex_, bins() * sizeof(std::complex<float>));
}

void RealFft::inverse(const std::complex<float>* in, float* out) {
  std::memcpy(complex_, in, bins() * sizeof(std::complex<float>));
  fftwf_execute(static_cast<fftwf_plan>(invPlan_));
  const float scale = 1.0f / static_cast<float>(n_);
  for (size_t i = 0; i < n_; ++i) out[i] = real_[i] * scale;
}
