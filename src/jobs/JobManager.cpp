#include "JobManager.hpp"
#include "../core/Errors.hpp"
#include "../core/LogControls.hpp"
#include "../io/AudioIngest.hpp"
#include "../io/WavWriter.hpp"
#include <algorithm>
#include <cstdio>

namespace {

void requireUnitInterval(double v, const char* name) {
  if (!(v >= 0.0 && v <= 1.0)) throw InputError(std::string(name) + " must be in [0,1]");
}

double secondsBetween(JobClock::time_point a, JobClock::time_point b) {
  return std::chrono::duration<double>(b - a).count();
}

} // namespace

JobManager::JobManager(const EngineConfig& cfg,
                       std::shared_ptr<DspBackend> dsp,
                       std::shared_ptr<JobStore> store,
                       std::shared_ptr<ArtifactStore> artifacts,
                       std::shared_ptr<JobEvents> events)
  : cfg_(cfg),
    store_(std::move(store)),
    artifacts_(std::move(artifacts)),
    events_(events ? std::move(events) : std::make_shared<JobEvents>()),
    conversion_(dsp, cfg),
    cloning_(dsp, cfg),
    pool_(cfg.jobs.workers) {
  if (!store_ || !artifacts_) throw std::runtime_error("JobManager requires a job store and an artifact store");
  if (gLogEnabled && gProgressLogEnabled) {
    std::fprintf(stderr, "[jobs] worker pool started with %zu threads\n", pool_.size());
  }
}

JobManager::~JobManager() { pool_.stop(); }

std::string JobManager::submit(JobRequest request) {
  if (request.kind == JobKind::Convert) {
    requireUnitInterval(request.strength, "conversionStrength");
  } else {
    requireUnitInterval(request.similarity, "similarityThreshold");
  }

  Job job;
  job.id = ids_.next();
  job.kind = request.kind;
  job.status = JobStatus::Queued;
  job.progress = 0.0;
  job.message = "queued";
  job.createdAt = JobClock::now();
  if (request.kind == JobKind::Convert) {
    job.params.targetSpeaker = request.targetSpeaker;
    job.params.strength = request.strength;
  } else {
    job.params.similarity = request.similarity;
  }
  store_->insert(job);
  publish(job);

  auto shared = std::make_shared<const JobRequest>(std::move(request));
  const std::string id = job.id;
  pool_.submit([this, id, shared] { run(id, shared); });
  return id;
}

std::string JobManager::submitConversion(std::vector<uint8_t> audio, const std::string& targetSpeaker, double strength) {
  JobRequest r;
  r.kind = JobKind::Convert;
  r.audio = std::move(audio);
  r.targetSpeaker = targetSpeaker;
  r.strength = strength;
  return submit(std::move(r));
}

std::string JobManager::submitCloning(std::vector<uint8_t> reference, std::vector<uint8_t> target, double similarity) {
  JobRequest r;
  r.kind = JobKind::Clone;
  r.reference = std::move(reference);
  r.audio = std::move(target);
  r.similarity = similarity;
  return submit(std::move(r));
}

Job JobManager::status(const std::string& jobId) const {
  std::optional<Job> job = store_->find(jobId);
  if (!job) throw NotFoundError("job not found: " + jobId);
  return *job;
}

std::vector<Job> JobManager::list() const { return store_->list(); }

QueueStats JobManager::stats() const {
  QueueStats s;
  s.workers = pool_.size();
  for (const Job& j : store_->list()) {
    switch (j.status) {
      case JobStatus::Queued: ++s.queued; break;
      case JobStatus::Processing: ++s.processing; break;
      case JobStatus::Completed: ++s.completed; break;
      case JobStatus::Failed: ++s.failed; break;
    }
  }
  return s;
}

bool JobManager::waitFor(const std::string& jobId, std::chrono::milliseconds timeout) const {
  const auto until = std::chrono::steady_clock::now() + timeout;
  std::unique_lock<std::mutex> lock(doneMutex_);
  for (;;) {
    if (isTerminal(status(jobId).status)) return true;
    if (doneCv_.wait_until(lock, until) == std::cv_status::timeout) {
      return isTerminal(status(jobId).status);
    }
  }
}

void JobManager::publish(const Job& job) {
  JobEvent ev;
  ev.jobId = job.id;
  ev.status = job.status;
  ev.progress = job.progress;
  ev.message = job.message;
  events_->publish(ev);
}

void JobManager::milestone(const std::string& jobId, int percent, const std::string& message, const Deadline& deadline) {
  if (cfg_.jobs.timeoutSeconds > 0 && std::chrono::steady_clock::now() > deadline) {
    throw JobTimeoutError("job exceeded timeout of " + std::to_string(cfg_.jobs.timeoutSeconds) + " s during " + message);
  }
  const Job snap = store_->update(jobId, [&](Job& j) {
    j.progress = std::max(j.progress, std::min(static_cast<double>(percent), 100.0));
    j.message = message;
  });
  if (gLogEnabled && gProgressLogEnabled) {
    std::fprintf(stderr, "[jobs] %s %3.0f%% %s\n", jobId.c_str(), snap.progress, message.c_str());
  }
  publish(snap);
}

std::string JobManager::storeResult(const std::string& jobId, const AudioBuffer& audio) {
  AudioFileSpec spec;
  spec.bitDepth = cfg_.output.bitDepth;
  spec.sampleRate = audio.sampleRate;
  spec.channels = 1;
  return artifacts_->put(jobId, encodeWav(spec, audio.data));
}

void JobManager::complete(const std::string& jobId, const std::string& resultRef, const VoiceProfile* analysis) {
  const Job snap = store_->update(jobId, [&](Job& j) {
    j.status = JobStatus::Completed;
    j.progress = 100.0;
    j.message = "completed";
    j.resultRef = resultRef;
    if (analysis) j.analysis = *analysis;
    j.finishedAt = JobClock::now();
  });
  if (gLogEnabled && gSummaryEnabled) {
    const double secs = snap.startedAt ? secondsBetween(*snap.startedAt, *snap.finishedAt) : 0.0;
    std::fprintf(stderr, "[jobs] %s %s completed in %.2f s -> %s\n", toStr(snap.kind), jobId.c_str(), secs,
                 resultRef.c_str());
  }
  publish(snap);
}

void JobManager::fail(const std::string& jobId, const std::string& error) {
  // Progress stays at its last value.
  const Job snap = store_->update(jobId, [&](Job& j) {
    j.status = JobStatus::Failed;
    j.error = error.empty() ? std::string("unknown error") : error;
    j.message = "failed: " + *j.error;
    j.finishedAt = JobClock::now();
  });
  if (gLogEnabled) std::fprintf(stderr, "[jobs] %s %s failed: %s\n", toStr(snap.kind), jobId.c_str(), snap.error->c_str());
  publish(snap);
}

void JobManager::run(const std::string& jobId, const std::shared_ptr<const JobRequest>& request) {
  const Deadline deadline = std::chrono::steady_clock::now() +
    std::chrono::duration_cast<std::chrono::steady_clock::duration>(
      std::chrono::duration<double>(std::max(0.0, cfg_.jobs.timeoutSeconds)));
  try {
    const Job snap = store_->update(jobId, [](Job& j) {
      j.status = JobStatus::Processing;
      j.message = "processing";
      j.startedAt = JobClock::now();
    });
    publish(snap);
    if (request->kind == JobKind::Convert) {
      runConversion(jobId, *request, deadline);
    } else {
      runCloning(jobId, *request, deadline);
    }
  } catch (const std::exception& e) {
    fail(jobId, e.what());
  }
  {
    std::lock_guard<std::mutex> lock(doneMutex_);
  }
  doneCv_.notify_all();
}

void JobManager::runConversion(const std::string& jobId, const JobRequest& request, const Deadline& deadline) {
  milestone(jobId, 5, "decoding audio", deadline);
  IngestLimits limits{cfg_.ingest.maxConvertBytes, cfg_.ingest.maxDurationSeconds};
  const AudioBuffer input = decodeAudioPayload(request.audio, cfg_.sampleRate, limits, "audio");
  milestone(jobId, 20, "audio decoded", deadline);

  const AudioBuffer out = conversion_.convert(input, request.targetSpeaker, request.strength,
    [&](int pct, const std::string& stage) { milestone(jobId, pct, stage, deadline); });

  milestone(jobId, 95, "storing result", deadline);
  complete(jobId, storeResult(jobId, out), nullptr);
}

void JobManager::runCloning(const std::string& jobId, const JobRequest& request, const Deadline& deadline) {
  milestone(jobId, 5, "decoding audio", deadline);
  IngestLimits limits{cfg_.ingest.maxCloneBytes, cfg_.ingest.maxDurationSeconds};
  const AudioBuffer reference = decodeAudioPayload(request.reference, cfg_.sampleRate, limits, "reference");
  const AudioBuffer target = decodeAudioPayload(request.audio, cfg_.sampleRate, limits, "target");

  const CloneResult result = cloning_.clone(reference, target, request.similarity,
    [&](int pct, const std::string& stage) { milestone(jobId, pct, stage, deadline); });

  milestone(jobId, 95, "storing result", deadline);
  complete(jobId, storeResult(jobId, result.audio), &result.reference);
}
