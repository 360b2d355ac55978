#include "download_registry.hpp"

#include <algorithm>
#include <utility>

std::vector<RegistryEntry*> DownloadRegistry::rivals_locked(const std::string& target, const std::string& except_id) {
  std::vector<RegistryEntry*> rivals;
  if(target.empty()) return rivals;
  for(auto& [id, entry] : entries_) {
    if(id != except_id && entry.target == target) rivals.push_back(&entry);
  }
  return rivals;
}

void DownloadRegistry::insert(DownloadRecord record,
                              TransportBackend* backend,
                              std::string target,
                              const RivalCheck& admit) {
  std::lock_guard<std::mutex> lock(mutex_);
  if(admit) admit(rivals_locked(target, record.id));
  RegistryEntry entry;
  entry.backend = backend;
  entry.target = std::move(target);
  entry.sequence = next_sequence_++;
  entry.last_good_sample = RegistryEntry::SteadyClock::now();
  std::string id = record.id;
  entry.record = std::move(record);
  entries_[id] = std::move(entry);
}

bool DownloadRegistry::contains(const std::string& id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.count(id) > 0;
}

std::size_t DownloadRegistry::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.size();
}

bool DownloadRegistry::update(const std::string& id, const std::function<void(RegistryEntry&)>& fn) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = entries_.find(id);
  if(it == entries_.end()) return false;
  fn(it->second);
  return true;
}

bool DownloadRegistry::update_with_rivals(
    const std::string& id,
    const std::function<void(RegistryEntry&, const std::vector<RegistryEntry*>&)>& fn) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = entries_.find(id);
  if(it == entries_.end()) return false;
  fn(it->second, rivals_locked(it->second.target, id));
  return true;
}

void DownloadRegistry::for_each(const std::function<void(RegistryEntry&)>& fn) {
  std::lock_guard<std::mutex> lock(mutex_);
  for(auto& [id, entry] : entries_) {
    fn(entry);
  }
}

std::optional<DownloadRecord> DownloadRegistry::snapshot(const std::string& id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = entries_.find(id);
  if(it == entries_.end()) return std::nullopt;
  return it->second.record;
}

std::vector<DownloadRecord> DownloadRegistry::snapshot_all() const {
  std::vector<std::pair<uint64_t, DownloadRecord>> ordered;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    ordered.reserve(entries_.size());
    for(const auto& [id, entry] : entries_) {
      ordered.emplace_back(entry.sequence, entry.record);
    }
  }
  std::sort(ordered.begin(), ordered.end(),
            [](const auto& a, const auto& b){ return a.first < b.first; });
  std::vector<DownloadRecord> records;
  records.reserve(ordered.size());
  for(auto& item : ordered) {
    records.push_back(std::move(item.second));
  }
  return records;
}

std::vector<RegistryEntry> DownloadRegistry::extract_if(const std::function<bool(const RegistryEntry&)>& pred) {
  std::vector<RegistryEntry> removed;
  std::lock_guard<std::mutex> lock(mutex_);
  for(auto it = entries_.begin(); it != entries_.end();) {
    if(pred(it->second)) {
      removed.push_back(std::move(it->second));
      it = entries_.erase(it);
    } else {
      ++it;
    }
  }
  return removed;
}
