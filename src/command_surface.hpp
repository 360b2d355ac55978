#pragma once

#include <nlohmann/json.hpp>

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "download_types.hpp"
#include "log.hpp"

class DownloadCoordinator;
class JsonlHistorySink;

// Line-oriented front end. Every command answers with one JSON object:
//   {"ok":true,"value":...} or {"ok":false,"error":"<Kind>: <text>"}
class CommandSurface {
public:
  struct Options {
    CleanupPolicy default_cleanup = CleanupPolicy::Persist;
    std::shared_ptr<JsonlHistorySink> history;
    std::function<nlohmann::json()> status;
  };

  CommandSurface(DownloadCoordinator& coordinator,
                 Options options,
                 std::shared_ptr<Logger> logger = nullptr);

  std::string execute(const std::string& line);
  nlohmann::json execute_json(const std::string& line);

  bool quit_requested() const { return quit_requested_; }

  // Whitespace separated; double quotes group, backslash escapes inside quotes.
  static std::vector<std::string> tokenize(const std::string& line);
  static std::string help_text();

private:
  nlohmann::json run(const std::vector<std::string>& args);
  nlohmann::json submit(const std::vector<std::string>& args);
  const std::string& require_id(const std::vector<std::string>& args) const;

  DownloadCoordinator& coordinator_;
  Options options_;
  std::shared_ptr<Logger> logger_;
  bool quit_requested_ = false;
};
