#pragma once

#include <cstdint>
#include <cstdio>
#include <exception>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>
#include "../core/LogControls.hpp"
#include "Job.hpp"

struct JobEvent {
  std::string jobId;
  JobStatus status = JobStatus::Queued;
  double progress = 0.0;
  std::string message;
};

// Publish/subscribe hub for job state changes. Listeners run on the publishing
// thread (a worker, or the submitter for Queued) with no lock held.
class JobEvents {
public:
  using Listener = std::function<void(const JobEvent&)>;

  uint64_t subscribe(Listener fn) {
    std::lock_guard<std::mutex> lock(m_);
    const uint64_t id = nextId_++;
    listeners_.emplace(id, std::move(fn));
    return id;
  }

  void unsubscribe(uint64_t id) {
    std::lock_guard<std::mutex> lock(m_);
    listeners_.erase(id);
  }

  void publish(const JobEvent& ev) const {
    std::vector<Listener> snapshot;
    {
      std::lock_guard<std::mutex> lock(m_);
      snapshot.reserve(listeners_.size());
      for (const auto& kv : listeners_) snapshot.push_back(kv.second);
    }
    for (const auto& fn : snapshot) {
      try {
        fn(ev);
      } catch (const std::exception& e) {
        // Listener failures are logged, never propagated.
        if (gLogEnabled) std::fprintf(stderr, "[jobs] listener error for %s: %s\n", ev.jobId.c_str(), e.what());
      } catch (...) {
        if (gLogEnabled) std::fprintf(stderr, "[jobs] listener error for %s: unknown exception\n", ev.jobId.c_str());
      }
    }
  }

private:
  mutable std::mutex m_;
  uint64_t nextId_ = 1;
  std::map<uint64_t, Listener> listeners_;
};
