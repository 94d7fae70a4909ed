#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "../core/EngineConfig.hpp"
#include "../core/IdGenerator.hpp"
#include "../dsp/DspBackend.hpp"
#include "../engine/CloningEngine.hpp"
#include "../engine/ConversionEngine.hpp"
#include "ArtifactStore.hpp"
#include "Job.hpp"
#include "JobEvents.hpp"
#include "JobStore.hpp"
#include "WorkerPool.hpp"

struct JobRequest {
  JobKind kind = JobKind::Convert;
  std::vector<uint8_t> audio;     // convert input, or clone target
  std::vector<uint8_t> reference; // clone only
  std::string targetSpeaker;      // convert only
  double strength = 1.0;          // convert only
  double similarity = 0.8;        // clone only
};

struct QueueStats {
  size_t queued = 0;
  size_t processing = 0;
  size_t completed = 0;
  size_t failed = 0;
  size_t workers = 0;
};

// Owns job records and runs conversion and cloning jobs on a worker pool.
// submit() never blocks on processing; status() and list() return snapshots.
class JobManager {
public:
  JobManager(const EngineConfig& cfg,
             std::shared_ptr<DspBackend> dsp,
             std::shared_ptr<JobStore> store,
             std::shared_ptr<ArtifactStore> artifacts,
             std::shared_ptr<JobEvents> events = std::make_shared<JobEvents>());
  ~JobManager();

  JobManager(const JobManager&) = delete;
  JobManager& operator=(const JobManager&) = delete;

  // Throws InputError for parameters outside [0,1]; no job is created then.
  std::string submit(JobRequest request);
  std::string submitConversion(std::vector<uint8_t> audio, const std::string& targetSpeaker, double strength);
  std::string submitCloning(std::vector<uint8_t> reference, std::vector<uint8_t> target, double similarity);

  // Throws NotFoundError for unknown ids.
  Job status(const std::string& jobId) const;
  std::vector<Job> list() const;
  QueueStats stats() const;

  // Blocks until the job is Completed or Failed; false on timeout.
  bool waitFor(const std::string& jobId, std::chrono::milliseconds timeout) const;

  JobEvents& events() { return *events_; }
  ArtifactStore& artifacts() { return *artifacts_; }
  const SpeakerCatalog& speakers() const { return conversion_.catalog(); }

private:
  using Deadline = std::chrono::steady_clock::time_point;

  void run(const std::string& jobId, const std::shared_ptr<const JobRequest>& request);
  void runConversion(const std::string& jobId, const JobRequest& request, const Deadline& deadline);
  void runCloning(const std::string& jobId, const JobRequest& request, const Deadline& deadline);
  void milestone(const std::string& jobId, int percent, const std::string& message, const Deadline& deadline);
  void complete(const std::string& jobId, const std::string& resultRef, const VoiceProfile* analysis);
  void fail(const std::string& jobId, const std::string& error);
  void publish(const Job& job);
  std::string storeResult(const std::string& jobId, const AudioBuffer& audio);

  EngineConfig cfg_;
  std::shared_ptr<JobStore> store_;
  std::shared_ptr<ArtifactStore> artifacts_;
  std::shared_ptr<JobEvents> events_;
  ConversionEngine conversion_;
  CloningEngine cloning_;
  IdGenerator ids_;

  mutable std::mutex doneMutex_;
  mutable std::condition_variable doneCv_;

  // Declared last: destroyed first, so workers finish before the members they use go away.
  WorkerPool pool_;
};
