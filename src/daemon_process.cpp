#include "daemon_process.hpp"

#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <sstream>

#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

#include "errors.hpp"

namespace fs = std::filesystem;

namespace {

bool is_executable_file(const fs::path& candidate) {
  if(candidate.empty()) return false;
  std::error_code ec;
  if(!fs::is_regular_file(candidate, ec)) return false;
  return ::access(candidate.c_str(), X_OK) == 0;
}

} // namespace

PosixDaemonLauncher::~PosixDaemonLauncher() {
  if(pid_ > 0) {
    kill();
  }
}

void PosixDaemonLauncher::launch(const fs::path& binary, const std::vector<std::string>& args) {
  if(running()) {
    throw StartupError("daemon already running with pid " + std::to_string(pid_));
  }

  std::vector<std::string> argv_storage;
  argv_storage.reserve(args.size() + 1);
  argv_storage.push_back(binary.string());
  argv_storage.insert(argv_storage.end(), args.begin(), args.end());

  std::vector<char*> argv_ptrs;
  argv_ptrs.reserve(argv_storage.size() + 1);
  for(auto& value : argv_storage) {
    argv_ptrs.push_back(value.data());
  }
  argv_ptrs.push_back(nullptr);

  pid_t child = ::fork();
  if(child < 0) {
    throw StartupError(std::string("fork failed: ") + std::strerror(errno));
  }
  if(child == 0) {
    // Own process group so terminal signals aimed at us don't hit the daemon.
    ::setpgid(0, 0);
    const int dev_null = ::open("/dev/null", O_RDWR);
    if(dev_null >= 0) {
      ::dup2(dev_null, STDIN_FILENO);
      ::dup2(dev_null, STDOUT_FILENO);
      ::dup2(dev_null, STDERR_FILENO);
      if(dev_null > STDERR_FILENO) {
        ::close(dev_null);
      }
    }
    ::execv(argv_storage.front().c_str(), argv_ptrs.data());
    _exit(127);
  }
  pid_ = child;
}

bool PosixDaemonLauncher::running() {
  if(pid_ <= 0) return false;
  int status = 0;
  pid_t result = ::waitpid(pid_, &status, WNOHANG);
  if(result == 0) return true;
  // exited (or was never ours to wait on)
  pid_ = -1;
  return false;
}

void PosixDaemonLauncher::terminate() {
  if(pid_ > 0) {
    ::kill(pid_, SIGTERM);
  }
}

void PosixDaemonLauncher::kill() {
  if(pid_ <= 0) return;
  ::kill(pid_, SIGKILL);
  int status = 0;
  while(::waitpid(pid_, &status, 0) < 0 && errno == EINTR) {
  }
  pid_ = -1;
}

std::optional<fs::path> locate_daemon_binary(const DaemonSearchPaths& paths) {
  std::vector<fs::path> candidates;
  if(!paths.explicit_path.empty()) {
    candidates.push_back(paths.explicit_path);
  }
  if(!paths.resource_dir.empty()) {
    candidates.push_back(paths.resource_dir / paths.binary_name);
    candidates.push_back(paths.resource_dir / "binaries" / paths.binary_name);
  }
  for(const auto& dir : paths.install_dirs) {
    candidates.push_back(dir / paths.binary_name);
  }
  if(!paths.working_dir.empty()) {
    candidates.push_back(paths.working_dir / paths.binary_name);
    candidates.push_back(paths.working_dir / "binaries" / paths.binary_name);
  }
  if(paths.search_system_path) {
    if(const char* env_path = std::getenv("PATH")) {
      std::istringstream entries(env_path);
      std::string entry;
      while(std::getline(entries, entry, ':')) {
        if(entry.empty()) continue;
        candidates.push_back(fs::path(entry) / paths.binary_name);
      }
    }
  }

  for(const auto& candidate : candidates) {
    if(is_executable_file(candidate)) {
      return candidate;
    }
  }
  return std::nullopt;
}
