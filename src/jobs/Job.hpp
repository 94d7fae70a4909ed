#pragma once

#include <chrono>
#include <cstdio>
#include <ctime>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "../core/VoiceProfile.hpp"

enum class JobKind { Convert, Clone };
enum class JobStatus { Queued, Processing, Completed, Failed };

inline const char* toStr(JobKind k) {
  switch (k) {
    case JobKind::Convert: return "convert";
    case JobKind::Clone: return "clone";
  }
  return "convert";
}

inline const char* toStr(JobStatus s) {
  switch (s) {
    case JobStatus::Queued: return "queued";
    case JobStatus::Processing: return "processing";
    case JobStatus::Completed: return "completed";
    case JobStatus::Failed: return "failed";
  }
  return "queued";
}

inline bool isTerminal(JobStatus s) { return s == JobStatus::Completed || s == JobStatus::Failed; }

using JobClock = std::chrono::system_clock;

// Request parameters kept on the record for display.
struct JobParams {
  std::string targetSpeaker; // convert
  double strength = 0.0;     // convert
  double similarity = 0.0;   // clone
};

struct Job {
  std::string id;
  JobKind kind = JobKind::Convert;
  JobStatus status = JobStatus::Queued;
  double progress = 0.0; // 0..100
  std::string message;
  std::optional<std::string> resultRef;   // Completed only
  std::optional<std::string> error;       // Failed only
  std::optional<VoiceProfile> analysis;   // clone only
  JobClock::time_point createdAt{};
  std::optional<JobClock::time_point> startedAt;
  std::optional<JobClock::time_point> finishedAt;
  JobParams params;
};

inline std::string formatTimestamp(JobClock::time_point tp) {
  const std::time_t t = JobClock::to_time_t(tp);
  std::tm tm{};
  gmtime_r(&t, &tm);
  const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count() % 1000;
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ", tm.tm_year + 1900, tm.tm_mon + 1,
                tm.tm_mday, tm.tm_hour, tm.tm_min, tm.tm_sec, static_cast<int>(ms));
  return buf;
}

inline void to_json(nlohmann::json& j, const Job& job) {
  j = nlohmann::json{
    {"jobId", job.id},
    {"kind", toStr(job.kind)},
    {"status", toStr(job.status)},
    {"progress", job.progress},
    {"message", job.message},
    {"createdAt", formatTimestamp(job.createdAt)}
  };
  if (job.kind == JobKind::Convert) {
    j["params"] = {{"targetSpeaker", job.params.targetSpeaker}, {"conversionStrength", job.params.strength}};
  } else {
    j["params"] = {{"similarityThreshold", job.params.similarity}};
  }
  if (job.startedAt) j["startedAt"] = formatTimestamp(*job.startedAt);
  if (job.finishedAt) j["finishedAt"] = formatTimestamp(*job.finishedAt);
  if (job.resultRef) j["resultRef"] = *job.resultRef;
  if (job.error) j["error"] = *job.error;
  if (job.analysis) j["analysis"] = *job.analysis;
}
