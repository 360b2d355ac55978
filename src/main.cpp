#include <cpptrace/cpptrace.hpp>
#include <nlohmann/json.hpp>

#include <readline/history.h>
#include <readline/readline.h>
#include <unistd.h>

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "command_line_parser.hpp"
#include "download_coordinator.hpp"
#include "download_engine.hpp"
#include "errors.hpp"
#include "progress_publisher.hpp"
#include "settings_manager.hpp"
#include "log.hpp"

namespace {

std::optional<std::string> read_command_line(bool interactive) {
  if(!interactive) {
    std::string line;
    if(!std::getline(std::cin, line)) return std::nullopt;
    return line;
  }
  char* raw = readline("haul> ");
  if(!raw) return std::nullopt;
  std::string line(raw);
  if(!line.empty()) add_history(line.c_str());
  free(raw);
  return line;
}

} // namespace

int main(int argc, char** argv){
  try {
    DownloadEngine::Options options;
    options.workspace_root = std::filesystem::current_path();

    auto settings = std::make_shared<SettingsManager>();
    settings->set_settings_path(options.workspace_root / ".config" / "settings.json");
    settings->load();
    settings->apply_environment();

    CommandLineParser parser((argc > 0 && argv && argv[0]) ? argv[0] : "haul");
    std::vector<std::string> queued;
    try {
      queued = parser.parse(argc, argv, *settings);
    } catch(const std::invalid_argument& e) {
      console_err("{}", e.what());
      parser.usage();
      return 2;
    }
    if(settings->help_requested()) {
      parser.usage();
      return 0;
    }

    DownloadEngine engine(settings, options);
    auto logger = engine.logger();
    if(settings->save_requested()) {
      if(!settings->save()) {
        logger->error("Unable to persist settings to {}", settings->settings_path().string());
      }
    }

    engine.start();

    const bool verbose = settings->get<bool>("verbose");
    engine.publisher().subscribe_complete([logger](const std::string& id, const std::string& file_name){
      nlohmann::json event = {{"event", "complete"}, {"id", id}, {"file_name", file_name}};
      logger->reply("{}", event.dump());
    });
    if(verbose) {
      engine.publisher().subscribe_progress([logger](const DownloadRecord& record){
        nlohmann::json event = {{"event", "progress"}, {"record", record}};
        logger->reply("{}", event.dump());
      });
    }

    for(const auto& url : queued) {
      DownloadRequest request;
      request.url = url;
      try {
        auto id = engine.coordinator().submit(std::move(request));
        nlohmann::json reply = {{"ok", true}, {"value", engine.coordinator().get(id)}};
        logger->reply("{}", reply.dump());
      } catch(const DownloadError& e) {
        logger->error("Unable to queue {}: {}", url, e.describe());
      }
    }

    logger->reply("haul ready; type 'help' for commands");
    const bool interactive = isatty(STDIN_FILENO);
    while(auto next = read_command_line(interactive)) {
      const std::string& line = *next;
      if(line.empty()) continue;
      auto reply = engine.execute_command(line);
      logger->reply("{}", reply);
      auto trimmed = SettingsManager::trim_copy(line);
      if(trimmed == "quit" || trimmed == "exit") break;
    }

    engine.stop();
    return 0;
  } catch(std::exception& e) {
    init(false);
    Logger logger("haul-main");
    logger.error("Exception: {}", e.what());
    cpptrace::generate_trace().print();
    return 1;
  }
}
