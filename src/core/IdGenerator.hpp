#pragma once

#include <cstdint>
#include <cstdio>
#include <mutex>
#include <random>
#include <string>

// Random 128-bit job ids rendered as RFC 4122 version-4 UUID strings.
// Thread-safe; seed once for reproducible ids in tests.
class IdGenerator {
public:
  IdGenerator() : rng_(std::random_device{}()) {}
  explicit IdGenerator(uint64_t seed) : rng_(seed) {}

  std::string next() {
    uint64_t hi, lo;
    {
      std::lock_guard<std::mutex> lock(m_);
      hi = rng_();
      lo = rng_();
    }
    hi = (hi & 0xFFFFFFFFFFFF0FFFull) | 0x0000000000004000ull; // version 4
    lo = (lo & 0x3FFFFFFFFFFFFFFFull) | 0x8000000000000000ull; // variant 10
    char buf[37];
    std::snprintf(buf, sizeof(buf), "%08x-%04x-%04x-%04x-%012llx",
                  static_cast<unsigned>(hi >> 32),
                  static_cast<unsigned>((hi >> 16) & 0xFFFF),
                  static_cast<unsigned>(hi & 0xFFFF),
                  static_cast<unsigned>(lo >> 48),
                  static_cast<unsigned long long>(lo & 0xFFFFFFFFFFFFull));
    return std::string(buf);
  }

private:
  std::mutex m_;
  std::mt19937_64 rng_;
};
