#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "download_types.hpp"
#include "log.hpp"

// Immutable summary of a download that reached a terminal status.
struct HistoryRecord {
  std::string id;
  std::string url;
  std::string destination;
  TransportKind kind = TransportKind::Http;
  DownloadStatus status = DownloadStatus::Completed;
  uint64_t downloaded = 0;
  uint64_t total = 0;
  double duration_seconds = 0.0;
  uint64_t average_speed = 0;
  std::string error;
  std::string file_name;
  std::string finished_at;
};

HistoryRecord make_history_record(const DownloadRecord& record);

void to_json(nlohmann::json& j, const HistoryRecord& record);

class HistorySink {
public:
  virtual ~HistorySink() = default;
  virtual void append(const HistoryRecord& record) = 0;
};

// One JSON object per line. Write failures are logged, never thrown.
class JsonlHistorySink : public HistorySink {
public:
  JsonlHistorySink(std::filesystem::path path, std::shared_ptr<Logger> logger = nullptr);

  void append(const HistoryRecord& record) override;

  // Newest last; at most `limit` entries (0 = all). Malformed lines are skipped.
  std::vector<nlohmann::json> read(std::size_t limit = 0) const;

  const std::filesystem::path& path() const { return path_; }

private:
  std::filesystem::path path_;
  std::shared_ptr<Logger> logger_;
  mutable std::mutex mutex_;
};
