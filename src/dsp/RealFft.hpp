#pragma once

#include <complex>
#include <cstddef>
#include <mutex>
#include <vector>

// FFTW plan creation and destruction are not thread-safe; every planner call goes through this lock.
std::mutex& fftwPlannerMutex();

// Single-precision real FFT of a fixed length backed by FFTW.
// One instance per thread; execution needs no lock.
class RealFft {
public:
  explicit RealFft(size_t n);
  ~RealFft();
  RealFft(const RealFft&) = delete;
  RealFft& operator=(const RealFft&) = delete;

  size_t size() const { return n_; }
  size_t bins() const { return n_ / 2 + 1; }

  // Input shorter than size() is zero-padded.
  void forward(const float* in, size_t count, std::complex<float>* out);
  // Unnormalised FFTW inverse scaled by 1/n.
  void inverse(const std::complex<float>* in, float* out);

private:
  size_t n_;
  float* real_ = nullptr;
  void* complex_ = nullptr; // fftwf_complex*
  void* fwdPlan_ = nullptr; // fftwf_plan
  void* invPlan_ = nullptr;
};
