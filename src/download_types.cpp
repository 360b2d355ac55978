#include "download_types.hpp"

#include <algorithm>
#include <ctime>
#include <iomanip>
#include <sstream>

const char* to_string(TransportKind kind) {
  switch(kind) {
    case TransportKind::Http: return "http";
    case TransportKind::Peer: return "peer";
  }
  return "unknown";
}

const char* to_string(DownloadStatus status) {
  switch(status) {
    case DownloadStatus::Pending: return "pending";
    case DownloadStatus::Active: return "active";
    case DownloadStatus::Paused: return "paused";
    case DownloadStatus::Seeding: return "seeding";
    case DownloadStatus::Cancelling: return "cancelling";
    case DownloadStatus::Completed: return "completed";
    case DownloadStatus::Error: return "error";
    case DownloadStatus::Cancelled: return "cancelled";
  }
  return "unknown";
}

const char* to_string(CleanupPolicy policy) {
  return policy == CleanupPolicy::Temp ? "temp" : "persist";
}

std::optional<CleanupPolicy> cleanup_policy_from_string(const std::string& value) {
  if(value == "persist") return CleanupPolicy::Persist;
  if(value == "temp") return CleanupPolicy::Temp;
  return std::nullopt;
}

bool is_terminal(DownloadStatus status) {
  return status == DownloadStatus::Completed ||
         status == DownloadStatus::Error ||
         status == DownloadStatus::Cancelled;
}

bool is_file_ready(const DownloadRecord& record) {
  if(record.status == DownloadStatus::Completed) return true;
  return record.status == DownloadStatus::Seeding &&
         record.total > 0 &&
         record.downloaded == record.total;
}

double progress_ratio(uint64_t downloaded, uint64_t total) {
  if(total == 0) return 0.0;
  double ratio = static_cast<double>(downloaded) / static_cast<double>(total);
  return std::clamp(ratio, 0.0, 1.0);
}

std::optional<uint64_t> estimate_eta(uint64_t downloaded, uint64_t total, uint64_t speed) {
  if(speed == 0 || total == 0 || downloaded >= total) return std::nullopt;
  return (total - downloaded) / speed;
}

double DownloadRecord::progress() const {
  return progress_ratio(downloaded, total);
}

std::string format_timestamp(DownloadRecord::Clock::time_point tp) {
  std::time_t t = DownloadRecord::Clock::to_time_t(tp);
  std::tm tm{};
  gmtime_r(&t, &tm);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
  return oss.str();
}

void to_json(nlohmann::json& j, const DownloadRequest& request) {
  j = nlohmann::json{
    {"url", request.url},
    {"destination", request.destination},
    {"headers", request.headers},
    {"auto_extract", request.auto_extract},
    {"cleanup", to_string(request.cleanup)}
  };
  j["filename"] = request.filename ? nlohmann::json(*request.filename) : nlohmann::json(nullptr);
}

void to_json(nlohmann::json& j, const DownloadRecord& record) {
  j = nlohmann::json{
    {"id", record.id},
    {"kind", to_string(record.kind)},
    {"url", record.request.url},
    {"destination", record.request.destination},
    {"status", to_string(record.status)},
    {"downloaded", record.downloaded},
    {"total", record.total},
    {"progress", record.progress()},
    {"download_speed", record.download_speed},
    {"upload_speed", record.upload_speed},
    {"file_name", record.file_name},
    {"created_at", format_timestamp(record.created_at)},
    {"updated_at", format_timestamp(record.updated_at)}
  };
  if(record.kind == TransportKind::Peer) {
    j["peers"] = record.peers;
    j["seeds"] = record.seeds;
  }
  j["eta"] = record.eta_seconds ? nlohmann::json(*record.eta_seconds) : nlohmann::json(nullptr);
  if(!record.error.empty()) {
    j["error"] = record.error;
    j["retryable"] = record.retryable;
  }
}
