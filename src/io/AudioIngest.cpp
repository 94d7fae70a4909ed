#include "AudioIngest.hpp"
#include "../core/Errors.hpp"
#include "../core/LogControls.hpp"
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <iterator>
#include <mutex>

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/channel_layout.h>
#include <libavutil/mem.h>
#include <libavutil/opt.h>
#include <libswresample/swresample.h>
}

namespace {

struct MemoryReader {
  const uint8_t* data;
  size_t size;
  size_t pos;
};

int readPacket(void* opaque, uint8_t* buf, int bufSize) {
  auto* r = static_cast<MemoryReader*>(opaque);
  const size_t n = std::min(r->size - r->pos, static_cast<size_t>(bufSize));
  if (n == 0) return AVERROR_EOF;
  std::memcpy(buf, r->data + r->pos, n);
  r->pos += n;
  return static_cast<int>(n);
}

int64_t seekPacket(void* opaque, int64_t offset, int whence) {
  auto* r = static_cast<MemoryReader*>(opaque);
  int64_t target;
  switch (whence & ~AVSEEK_FORCE) {
    case AVSEEK_SIZE: return static_cast<int64_t>(r->size);
    case SEEK_SET: target = offset; break;
    case SEEK_CUR: target = static_cast<int64_t>(r->pos) + offset; break;
    case SEEK_END: target = static_cast<int64_t>(r->size) + offset; break;
    default: return -1;
  }
  if (target < 0) return -1;
  r->pos = std::min(static_cast<size_t>(target), r->size);
  return static_cast<int64_t>(r->pos);
}

// Owns every FFmpeg object of one decode.
struct DecodeSession {
  AVIOContext* io = nullptr;
  AVFormatContext* fmt = nullptr;
  AVCodecContext* codec = nullptr;
  SwrContext* swr = nullptr;
  AVFrame* frame = nullptr;
  AVPacket* packet = nullptr;
  AVChannelLayout outLayout{};
  AVChannelLayout inLayout{};

  ~DecodeSession() {
    av_channel_layout_uninit(&outLayout);
    av_channel_layout_uninit(&inLayout);
    if (packet) av_packet_free(&packet);
    if (frame) av_frame_free(&frame);
    if (swr) swr_free(&swr);
    if (codec) avcodec_free_context(&codec);
    if (fmt) avformat_close_input(&fmt);
    if (io) {
      av_freep(&io->buffer);
      avio_context_free(&io);
    }
  }
};

void quietFfmpegOnce() {
  static std::once_flag once;
  std::call_once(once, [] { av_log_set_level(AV_LOG_ERROR); });
}

constexpr size_t kIoBufferSize = 4096;

} // namespace

AudioBuffer decodeAudioPayload(const std::vector<uint8_t>& bytes, uint32_t targetSampleRate,
                               const IngestLimits& limits, const std::string& label) {
  if (bytes.empty()) throw InputError(label + ": empty payload");
  if (limits.maxBytes > 0 && bytes.size() > limits.maxBytes) {
    throw InputError(label + ": payload of " + std::to_string(bytes.size()) + " bytes exceeds limit of " +
                     std::to_string(limits.maxBytes));
  }
  quietFfmpegOnce();

  MemoryReader reader{bytes.data(), bytes.size(), 0};
  DecodeSession s;
  auto* ioBuf = static_cast<unsigned char*>(av_malloc(kIoBufferSize));
  if (!ioBuf) throw ProcessingError("ingest: I/O buffer allocation failed");
  s.io = avio_alloc_context(ioBuf, kIoBufferSize, 0, &reader, readPacket, nullptr, seekPacket);
  if (!s.io) {
    av_free(ioBuf);
    throw ProcessingError("ingest: I/O context allocation failed");
  }
  s.fmt = avformat_alloc_context();
  if (!s.fmt) throw ProcessingError("ingest: format context allocation failed");
  s.fmt->pb = s.io;
  if (avformat_open_input(&s.fmt, nullptr, nullptr, nullptr) < 0) {
    // avformat_open_input frees the context on failure.
    s.fmt = nullptr;
    throw InputError(label + ": unrecognised audio format");
  }
  if (avformat_find_stream_info(s.fmt, nullptr) < 0) throw InputError(label + ": unreadable stream info");

  const AVCodec* decoder = nullptr;
  const int streamIndex = av_find_best_stream(s.fmt, AVMEDIA_TYPE_AUDIO, -1, -1, &decoder, 0);
  if (streamIndex < 0 || !decoder) throw InputError(label + ": no decodable audio stream");

  s.codec = avcodec_alloc_context3(decoder);
  if (!s.codec) throw ProcessingError("ingest: codec context allocation failed");
  if (avcodec_parameters_to_context(s.codec, s.fmt->streams[streamIndex]->codecpar) < 0 ||
      avcodec_open2(s.codec, decoder, nullptr) < 0) {
    throw InputError(label + ": cannot open decoder");
  }
  const int inRate = s.codec->sample_rate;
  if (inRate <= 0) throw InputError(label + ": invalid sample rate");

  av_channel_layout_default(&s.outLayout, 1);
  if (s.codec->ch_layout.nb_channels > 0) {
    av_channel_layout_copy(&s.inLayout, &s.codec->ch_layout);
  } else {
    av_channel_layout_default(&s.inLayout, 1);
  }
  if (swr_alloc_set_opts2(&s.swr, &s.outLayout, AV_SAMPLE_FMT_FLT, static_cast<int>(targetSampleRate),
                          &s.inLayout, s.codec->sample_fmt, inRate, 0, nullptr) < 0) {
    throw InputError(label + ": unsupported sample layout");
  }
  // Mono down-mix is the channel average: rematrix rows are normalised to unit gain.
  if (av_opt_set_double(s.swr, "rematrix_maxval", 1.0, 0) < 0 || swr_init(s.swr) < 0) throw InputError(label + ": unsupported sample layout");

  s.frame = av_frame_alloc();
  s.packet = av_packet_alloc();
  if (!s.frame || !s.packet) throw ProcessingError("ingest: frame allocation failed");

  const size_t maxFrames = limits.maxDurationSeconds > 0
    ? static_cast<size_t>(limits.maxDurationSeconds * targetSampleRate) : 0;
  std::vector<float> samples;

  auto convert = [&](const uint8_t** in, int inCount) {
    const int64_t cap = av_rescale_rnd(swr_get_delay(s.swr, inRate) + inCount, targetSampleRate, inRate, AV_ROUND_UP);
    if (cap <= 0) return;
    const size_t base = samples.size();
    samples.resize(base + static_cast<size_t>(cap));
    uint8_t* out = reinterpret_cast<uint8_t*>(samples.data() + base);
    const int got = swr_convert(s.swr, &out, static_cast<int>(cap), in, inCount);
    if (got < 0) throw InputError(label + ": resampling failed");
    samples.resize(base + static_cast<size_t>(got));
    if (maxFrames > 0 && samples.size() > maxFrames) {
      throw InputError(label + ": audio longer than " + std::to_string(limits.maxDurationSeconds) + " s");
    }
  };
  auto drainDecoder = [&]() {
    for (;;) {
      const int rc = avcodec_receive_frame(s.codec, s.frame);
      if (rc == AVERROR(EAGAIN) || rc == AVERROR_EOF) return;
      if (rc < 0) throw InputError(label + ": decode error");
      convert(const_cast<const uint8_t**>(s.frame->extended_data), s.frame->nb_samples);
      av_frame_unref(s.frame);
    }
  };

  int readRc;
  while ((readRc = av_read_frame(s.fmt, s.packet)) >= 0) {
    if (s.packet->stream_index == streamIndex) {
      const int rc = avcodec_send_packet(s.codec, s.packet);
      av_packet_unref(s.packet);
      if (rc < 0 && rc != AVERROR(EAGAIN)) throw InputError(label + ": corrupt audio data");
      drainDecoder();
    } else {
      av_packet_unref(s.packet);
    }
  }
  if (readRc != AVERROR_EOF && samples.empty()) throw InputError(label + ": read error");
  if (avcodec_send_packet(s.codec, nullptr) >= 0) drainDecoder();
  convert(nullptr, 0); // flush resampler

  if (samples.empty()) throw InputError(label + ": no audio samples decoded");
  // Float codecs pass NaN and Inf through untouched.
  for (float v : samples) {
    if (!std::isfinite(v)) throw InputError(label + ": non-finite sample values");
  }
  if (gLogEnabled && gProgressLogEnabled) {
    std::fprintf(stderr, "[ingest] %s: %d Hz x %d ch -> %zu frames @ %u Hz\n", label.c_str(), inRate,
                 s.inLayout.nb_channels, samples.size(), targetSampleRate);
  }
  return AudioBuffer::mono(std::move(samples), targetSampleRate);
}

std::vector<uint8_t> readFileBytes(const std::string& path) {
  std::ifstream f(path, std::ios::binary);
  if (!f) throw InputError("Failed to open input file: " + path);
  return std::vector<uint8_t>(std::istreambuf_iterator<char>(f), std::istreambuf_iterator<char>());
}
