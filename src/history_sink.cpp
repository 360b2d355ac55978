#include "history_sink.hpp"

#include <chrono>
#include <fstream>
#include <utility>

HistoryRecord make_history_record(const DownloadRecord& record) {
  HistoryRecord history;
  history.id = record.id;
  history.url = record.request.url;
  history.destination = record.request.destination;
  history.kind = record.kind;
  history.status = record.status;
  history.downloaded = record.downloaded;
  history.total = record.total;
  history.error = record.error;
  history.file_name = record.file_name;

  auto finished = record.finished_at.value_or(record.updated_at);
  history.finished_at = format_timestamp(finished);
  if(finished > record.created_at) {
    history.duration_seconds =
      std::chrono::duration<double>(finished - record.created_at).count();
  }
  if(history.duration_seconds > 0.0) {
    history.average_speed = static_cast<uint64_t>(
      static_cast<double>(record.downloaded) / history.duration_seconds);
  }
  return history;
}

void to_json(nlohmann::json& j, const HistoryRecord& record) {
  j = nlohmann::json{
    {"id", record.id},
    {"url", record.url},
    {"destination", record.destination},
    {"kind", to_string(record.kind)},
    {"status", to_string(record.status)},
    {"downloaded", record.downloaded},
    {"total", record.total},
    {"duration_seconds", record.duration_seconds},
    {"average_speed", record.average_speed},
    {"error", record.error},
    {"file_name", record.file_name},
    {"timestamp", record.finished_at}
  };
}

JsonlHistorySink::JsonlHistorySink(std::filesystem::path path, std::shared_ptr<Logger> logger)
  : path_(std::move(path)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("history")) {}

void JsonlHistorySink::append(const HistoryRecord& record) {
  std::string line = nlohmann::json(record).dump();
  std::lock_guard<std::mutex> lock(mutex_);
  std::error_code ec;
  if(path_.has_parent_path()) {
    std::filesystem::create_directories(path_.parent_path(), ec);
  }
  std::ofstream out(path_, std::ios::app);
  if(!out) {
    logger_->error("cannot open history file {}", path_.string());
    return;
  }
  out << line << '\n';
  if(!out) {
    logger_->error("failed writing history entry for {}", record.id);
  }
}

std::vector<nlohmann::json> JsonlHistorySink::read(std::size_t limit) const {
  std::vector<nlohmann::json> entries;
  std::lock_guard<std::mutex> lock(mutex_);
  std::ifstream in(path_);
  if(!in) return entries;
  std::string line;
  while(std::getline(in, line)) {
    if(line.empty()) continue;
    auto doc = nlohmann::json::parse(line, nullptr, false);
    if(doc.is_discarded()) {
      logger_->warn("skipping malformed history line");
      continue;
    }
    entries.push_back(std::move(doc));
  }
  if(limit > 0 && entries.size() > limit) {
    entries.erase(entries.begin(), entries.end() - static_cast<std::ptrdiff_t>(limit));
  }
  return entries;
}
