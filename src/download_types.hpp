#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

enum class TransportKind { Http, Peer };

enum class DownloadStatus {
  Pending,
  Active,
  Paused,
  Seeding,
  Cancelling,
  Completed,
  Error,
  Cancelled
};

// What happens to partially downloaded data on cancel.
enum class CleanupPolicy {
  Persist, // keep partial files so the transfer can be resumed later
  Temp     // delete partial files
};

struct DownloadRequest {
  std::string url;
  std::string destination;
  std::optional<std::string> filename;
  std::map<std::string, std::string> headers;
  bool auto_extract = false;
  CleanupPolicy cleanup = CleanupPolicy::Persist;
};

// Facts a backend reports about one transfer at one point in time.
struct ProgressSample {
  DownloadStatus status = DownloadStatus::Active;
  uint64_t downloaded = 0;
  uint64_t total = 0; // 0 = unknown
  uint64_t download_speed = 0;
  uint64_t upload_speed = 0;
  uint32_t peers = 0;
  uint32_t seeds = 0;
  std::string file_name;
  std::string error;
};

struct DownloadRecord {
  using Clock = std::chrono::system_clock;

  std::string id;
  TransportKind kind = TransportKind::Http;
  DownloadRequest request;
  DownloadStatus status = DownloadStatus::Pending;
  uint64_t downloaded = 0;
  uint64_t total = 0;
  uint64_t download_speed = 0;
  uint64_t upload_speed = 0;
  uint32_t peers = 0;
  uint32_t seeds = 0;
  std::optional<uint64_t> eta_seconds;
  std::string file_name;
  std::string error;
  bool retryable = false;
  std::string handle;
  Clock::time_point created_at{};
  Clock::time_point updated_at{};
  std::optional<Clock::time_point> finished_at;

  double progress() const;
};

const char* to_string(TransportKind kind);
const char* to_string(DownloadStatus status);
const char* to_string(CleanupPolicy policy);
std::optional<CleanupPolicy> cleanup_policy_from_string(const std::string& value);

bool is_terminal(DownloadStatus status);

// Completed, or seeding with every byte present.
bool is_file_ready(const DownloadRecord& record);

// downloaded / total clamped to [0, 1]; 0 while total is unknown.
double progress_ratio(uint64_t downloaded, uint64_t total);

std::optional<uint64_t> estimate_eta(uint64_t downloaded, uint64_t total, uint64_t speed);

std::string format_timestamp(DownloadRecord::Clock::time_point tp);

void to_json(nlohmann::json& j, const DownloadRequest& request);
void to_json(nlohmann::json& j, const DownloadRecord& record);
