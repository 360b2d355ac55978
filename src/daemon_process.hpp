#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <sys/types.h>

// Owns the external daemon process. Implementations must be safe to call
// terminate()/kill() on when nothing is running.
class DaemonLauncher {
public:
  virtual ~DaemonLauncher() = default;

  // Throws StartupError when the process cannot be created.
  virtual void launch(const std::filesystem::path& binary,
                      const std::vector<std::string>& args) = 0;
  virtual bool running() = 0;
  // Polite stop request (SIGTERM for a real process).
  virtual void terminate() = 0;
  // Forced stop; returns once the process is gone.
  virtual void kill() = 0;
};

class PosixDaemonLauncher : public DaemonLauncher {
public:
  PosixDaemonLauncher() = default;
  ~PosixDaemonLauncher() override;

  PosixDaemonLauncher(const PosixDaemonLauncher&) = delete;
  PosixDaemonLauncher& operator=(const PosixDaemonLauncher&) = delete;

  void launch(const std::filesystem::path& binary,
              const std::vector<std::string>& args) override;
  bool running() override;
  void terminate() override;
  void kill() override;

  pid_t pid() const { return pid_; }

private:
  pid_t pid_ = -1;
};

struct DaemonSearchPaths {
  std::filesystem::path explicit_path;   // from configuration, wins when it exists
  std::filesystem::path resource_dir;    // bundled with the application
  std::vector<std::filesystem::path> install_dirs{"/usr/local/bin", "/usr/bin", "/opt/aria2"};
  std::filesystem::path working_dir = std::filesystem::current_path();
  std::string binary_name = "aria2c";
  bool search_system_path = true;
};

// Walks explicit path, resource dir (and its binaries/), install dirs,
// working dir (and its binaries/), then $PATH. Returns the first executable.
std::optional<std::filesystem::path> locate_daemon_binary(const DaemonSearchPaths& paths);
