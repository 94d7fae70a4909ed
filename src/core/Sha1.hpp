#pragma once

#include <algorithm>
#include <cstdint>
#include <cstring>
#include <string>
#include <vector>

// Incremental SHA-1. Used for content-addressed artifact keys and --hash output.
class Sha1 {
public:
  Sha1() { reset(); }

  void reset() {
    state_[0] = 0x67452301u;
    state_[1] = 0xEFCDAB89u;
    state_[2] = 0x98BADCFEu;
    state_[3] = 0x10325476u;
    state_[4] = 0xC3D2E1F0u;
    totalBytes_ = 0;
    pending_ = 0;
  }

  Sha1& update(const void* data, size_t len) {
    const uint8_t* in = static_cast<const uint8_t*>(data);
    totalBytes_ += len;
    while (len > 0) {
      const size_t n = std::min(len, sizeof(block_) - pending_);
      std::memcpy(block_ + pending_, in, n);
      pending_ += n;
      in += n;
      len -= n;
      if (pending_ == sizeof(block_)) {
        compress(block_);
        pending_ = 0;
      }
    }
    return *this;
  }

  Sha1& update(const std::vector<uint8_t>& bytes) { return update(bytes.data(), bytes.size()); }
  Sha1& update(const std::vector<float>& samples) { return update(samples.data(), samples.size() * sizeof(float)); }

  // Finishes the digest; the object must be reset() before reuse.
  std::string hexDigest() {
    const uint64_t bitLen = totalBytes_ * 8ull;
    uint8_t pad[72] = {0x80};
    const size_t padLen = (pending_ < 56) ? (56 - pending_) : (120 - pending_);
    uint8_t lenBytes[8];
    for (int i = 0; i < 8; ++i) lenBytes[i] = static_cast<uint8_t>(bitLen >> (56 - 8 * i));
    update(pad, padLen);
    update(lenBytes, 8);

    static const char* kHex = "0123456789abcdef";
    std::string out;
    out.reserve(40);
    for (uint32_t word : state_) {
      for (int shift = 28; shift >= 0; shift -= 4) out.push_back(kHex[(word >> shift) & 0xF]);
    }
    return out;
  }

  static std::string hex(const void* data, size_t len) {
    Sha1 s;
    s.update(data, len);
    return s.hexDigest();
  }

private:
  static uint32_t rotl(uint32_t x, unsigned n) { return (x << n) | (x >> (32 - n)); }

  void compress(const uint8_t* p) {
    uint32_t w[80];
    for (int i = 0; i < 16; ++i) {
      w[i] = (uint32_t(p[4 * i]) << 24) | (uint32_t(p[4 * i + 1]) << 16) |
             (uint32_t(p[4 * i + 2]) << 8) | uint32_t(p[4 * i + 3]);
    }
    for (int i = 16; i < 80; ++i) w[i] = rotl(w[i - 3] ^ w[i - 8] ^ w[i - 14] ^ w[i - 16], 1);

    uint32_t a = state_[0], b = state_[1], c = state_[2], d = state_[3], e = state_[4];
    for (int i = 0; i < 80; ++i) {
      uint32_t f, k;
      switch (i / 20) {
        case 0: f = (b & c) | (~b & d); k = 0x5A827999u; break;
        case 1: f = b ^ c ^ d; k = 0x6ED9EBA1u; break;
        case 2: f = (b & c) | (b & d) | (c & d); k = 0x8F1BBCDCu; break;
        default: f = b ^ c ^ d; k = 0xCA62C1D6u; break;
      }
      const uint32_t t = rotl(a, 5) + f + e + k + w[i];
      e = d;
      d = c;
      c = rotl(b, 30);
      b = a;
      a = t;
    }
    state_[0] += a; state_[1] += b; state_[2] += c; state_[3] += d; state_[4] += e;
  }

  uint32_t state_[5];
  uint8_t block_[64];
  size_t pending_ = 0;
  uint64_t totalBytes_ = 0;
};
