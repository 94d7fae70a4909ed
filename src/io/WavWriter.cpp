#include "WavWriter.hpp"
#include <algorithm>
#include <cmath>
#include <cstring>
#include <stdexcept>

namespace {

void put16(std::vector<uint8_t>& out, uint16_t v) {
  out.push_back(static_cast<uint8_t>(v & 0xFF));
  out.push_back(static_cast<uint8_t>(v >> 8));
}

void put32(std::vector<uint8_t>& out, uint32_t v) {
  for (int i = 0; i < 4; ++i) out.push_back(static_cast<uint8_t>((v >> (8 * i)) & 0xFF));
}

void putTag(std::vector<uint8_t>& out, const char* tag) { out.insert(out.end(), tag, tag + 4); }

uint16_t bitsPerSample(BitDepth d) {
  switch (d) {
    case BitDepth::Pcm16: return 16;
    case BitDepth::Pcm24: return 24;
    case BitDepth::Float32: return 32;
  }
  return 32;
}

int32_t quantize(float s, int32_t maxInt) {
  const float c = std::max(-1.0f, std::min(1.0f, s));
  return static_cast<int32_t>(std::lrint(static_cast<double>(c) * maxInt));
}

} // namespace

std::vector<uint8_t> encodeWav(const AudioFileSpec& spec, const std::vector<float>& interleaved) {
  if (spec.channels == 0 || spec.sampleRate == 0) throw std::runtime_error("encodeWav: invalid channels or sample rate");
  const uint16_t bits = bitsPerSample(spec.bitDepth);
  const uint16_t bytesPerSample = bits / 8;
  const uint16_t formatTag = spec.bitDepth == BitDepth::Float32 ? 3 : 1; // IEEE float : PCM
  const uint32_t dataBytes = static_cast<uint32_t>(interleaved.size() * bytesPerSample);
  const uint16_t blockAlign = static_cast<uint16_t>(spec.channels * bytesPerSample);

  std::vector<uint8_t> out;
  out.reserve(44 + dataBytes);
  putTag(out, "RIFF");
  put32(out, 36 + dataBytes);
  putTag(out, "WAVE");
  putTag(out, "fmt ");
  put32(out, 16);
  put16(out, formatTag);
  put16(out, static_cast<uint16_t>(spec.channels));
  put32(out, spec.sampleRate);
  put32(out, spec.sampleRate * blockAlign);
  put16(out, blockAlign);
  put16(out, bits);
  putTag(out, "data");
  put32(out, dataBytes);

  for (float s : interleaved) {
    switch (spec.bitDepth) {
      case BitDepth::Pcm16: {
        put16(out, static_cast<uint16_t>(static_cast<int16_t>(quantize(s, 32767))));
        break;
      }
      case BitDepth::Pcm24: {
        const uint32_t v = static_cast<uint32_t>(quantize(s, 8388607));
        out.push_back(static_cast<uint8_t>(v & 0xFF));
        out.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
        out.push_back(static_cast<uint8_t>((v >> 16) & 0xFF));
        break;
      }
      case BitDepth::Float32: {
        uint32_t bitsOut;
        std::memcpy(&bitsOut, &s, sizeof(bitsOut));
        put32(out, bitsOut);
        break;
      }
    }
  }
  return out;
}
