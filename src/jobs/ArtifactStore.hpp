#pragma once

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <map>
#include <mutex>
#include <string>
#include <vector>
#include "../core/Errors.hpp"
#include "../core/Sha1.hpp"

// Sink for result audio. put() returns an opaque reference that get() accepts.
class ArtifactStore {
public:
  virtual ~ArtifactStore() = default;
  virtual std::string put(const std::string& jobId, const std::vector<uint8_t>& bytes) = 0;
  // Throws NotFoundError for an unknown reference.
  virtual std::vector<uint8_t> get(const std::string& ref) const = 0;
};

// Content-addressed in-memory store: ref = "mem://<sha1 of bytes>".
class MemoryArtifactStore : public ArtifactStore {
public:
  std::string put(const std::string& jobId, const std::vector<uint8_t>& bytes) override {
    (void)jobId;
    const std::string ref = "mem://" + Sha1::hex(bytes.data(), bytes.size());
    std::lock_guard<std::mutex> lock(m_);
    blobs_[ref] = bytes;
    return ref;
  }

  std::vector<uint8_t> get(const std::string& ref) const override {
    std::lock_guard<std::mutex> lock(m_);
    auto it = blobs_.find(ref);
    if (it == blobs_.end()) throw NotFoundError("artifact not found: " + ref);
    return it->second;
  }

  size_t count() const {
    std::lock_guard<std::mutex> lock(m_);
    return blobs_.size();
  }

private:
  mutable std::mutex m_;
  std::map<std::string, std::vector<uint8_t>> blobs_;
};

// Writes <dir>/<jobId>.wav; the reference is the file path.
class DirectoryArtifactStore : public ArtifactStore {
public:
  explicit DirectoryArtifactStore(std::string dir) : dir_(std::move(dir)) {
    std::error_code ec;
    std::filesystem::create_directories(dir_, ec);
    if (ec) throw std::runtime_error("Cannot create artifact directory " + dir_ + ": " + ec.message());
  }

  std::string put(const std::string& jobId, const std::vector<uint8_t>& bytes) override {
    const std::string path = (std::filesystem::path(dir_) / (jobId + ".wav")).string();
    std::ofstream f(path, std::ios::binary | std::ios::trunc);
    if (!f) throw ProcessingError("Failed to open artifact file: " + path);
    f.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    if (!f) throw ProcessingError("Failed to write artifact file: " + path);
    return path;
  }

  std::vector<uint8_t> get(const std::string& ref) const override {
    std::ifstream f(ref, std::ios::binary);
    if (!f) throw NotFoundError("artifact not found: " + ref);
    return std::vector<uint8_t>(std::istreambuf_iterator<char>(f), std::istreambuf_iterator<char>());
  }

private:
  std::string dir_;
};
