#pragma once

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "../core/Errors.hpp"
#include "Job.hpp"

// Job table. Each record is written under its own lock; readers get snapshots.
class JobStore {
public:
  virtual ~JobStore() = default;
  virtual void insert(const Job& job) = 0;
  virtual std::optional<Job> find(const std::string& id) const = 0;
  // Runs mutator on the record under its exclusive lock and returns the updated snapshot.
  // Throws NotFoundError for an unknown id.
  virtual Job update(const std::string& id, const std::function<void(Job&)>& mutator) = 0;
  // Snapshots in creation order.
  virtual std::vector<Job> list() const = 0;
};

class MemoryJobStore : public JobStore {
public:
  void insert(const Job& job) override {
    auto e = std::make_shared<Entry>();
    e->job = job;
    std::lock_guard<std::mutex> lock(tableMutex_);
    if (!table_.emplace(job.id, e).second) throw std::runtime_error("duplicate job id: " + job.id);
    order_.push_back(e);
  }

  std::optional<Job> find(const std::string& id) const override {
    std::shared_ptr<Entry> e = lookup(id);
    if (!e) return std::nullopt;
    std::lock_guard<std::mutex> lock(e->m);
    return e->job;
  }

  Job update(const std::string& id, const std::function<void(Job&)>& mutator) override {
    std::shared_ptr<Entry> e = lookup(id);
    if (!e) throw NotFoundError("job not found: " + id);
    std::lock_guard<std::mutex> lock(e->m);
    mutator(e->job);
    return e->job;
  }

  std::vector<Job> list() const override {
    std::vector<std::shared_ptr<Entry>> entries;
    {
      std::lock_guard<std::mutex> lock(tableMutex_);
      entries = order_;
    }
    std::vector<Job> out;
    out.reserve(entries.size());
    for (const auto& e : entries) {
      std::lock_guard<std::mutex> lock(e->m);
      out.push_back(e->job);
    }
    return out;
  }

private:
  struct Entry {
    std::mutex m;
    Job job;
  };

  std::shared_ptr<Entry> lookup(const std::string& id) const {
    std::lock_guard<std::mutex> lock(tableMutex_);
    auto it = table_.find(id);
    return it == table_.end() ? nullptr : it->second;
  }

  mutable std::mutex tableMutex_;
  std::map<std::string, std::shared_ptr<Entry>> table_;
  std::vector<std::shared_ptr<Entry>> order_;
};
