#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "download_types.hpp"
#include "transport_backend.hpp"

// Coordinator-private bookkeeping kept next to each public record.
struct RegistryEntry {
  using SteadyClock = std::chrono::steady_clock;

  DownloadRecord record;
  TransportBackend* backend = nullptr;
  // What the transfer writes: url and directory, or the swarm info-hash.
  std::string target;
  uint64_t sequence = 0;
  // Bumped by every command; samples started under an older revision are dropped.
  uint64_t revision = 0;
  bool sample_in_flight = false;
  bool complete_emitted = false;
  bool history_written = false;
  bool released = false;
  SteadyClock::time_point last_good_sample{};
  // Until then a sample contradicting the last pause/resume is ignored.
  SteadyClock::time_point settle_until{};
};

// The only store of download records. The lock is held just for the
// callback passed in; callers must not make backend calls from inside it.
class DownloadRegistry {
public:
  using RivalCheck = std::function<void(const std::vector<RegistryEntry*>& rivals)>;

  // Inserts the record after admit has seen every entry with the same
  // target, under one lock. admit may throw to refuse the record.
  void insert(DownloadRecord record,
              TransportBackend* backend,
              std::string target,
              const RivalCheck& admit = nullptr);

  bool contains(const std::string& id) const;
  std::size_t size() const;

  // Runs fn on the entry under the lock; false when id is unknown.
  bool update(const std::string& id, const std::function<void(RegistryEntry&)>& fn);
  void for_each(const std::function<void(RegistryEntry&)>& fn);
  // update() that also hands fn the other entries sharing the target.
  bool update_with_rivals(const std::string& id,
                          const std::function<void(RegistryEntry&, const std::vector<RegistryEntry*>&)>& fn);

  std::optional<DownloadRecord> snapshot(const std::string& id) const;
  // Submission order.
  std::vector<DownloadRecord> snapshot_all() const;

  // Removes entries matching pred and returns them.
  std::vector<RegistryEntry> extract_if(const std::function<bool(const RegistryEntry&)>& pred);

private:
  std::vector<RegistryEntry*> rivals_locked(const std::string& target, const std::string& except_id);

  mutable std::mutex mutex_;
  std::map<std::string, RegistryEntry> entries_;
  uint64_t next_sequence_ = 1;
};
