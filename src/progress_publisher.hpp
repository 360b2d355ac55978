#pragma once

#include <asio.hpp>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>

#include "download_coordinator.hpp"
#include "log.hpp"

// Drives the coordinator's sampling on a fixed period and fans the
// resulting events out to subscribers. Delivery is at most once per tick;
// a throwing subscriber is logged and skipped.
class ProgressPublisher {
public:
  using ProgressHandler = std::function<void(const DownloadRecord&)>;
  using CompleteHandler = std::function<void(const std::string& id, const std::string& file_name)>;
  using SubscriptionId = std::size_t;

  ProgressPublisher(asio::io_context& io,
                    DownloadCoordinator& coordinator,
                    std::chrono::milliseconds interval,
                    std::shared_ptr<Logger> logger = nullptr);
  ~ProgressPublisher();

  void start();
  void stop();

  SubscriptionId subscribe_progress(ProgressHandler handler);
  SubscriptionId subscribe_complete(CompleteHandler handler);
  void unsubscribe(SubscriptionId id);

  uint64_t tick_count() const { return ticks_.load(); }
  std::chrono::milliseconds interval() const { return interval_; }

private:
  void schedule();
  void publish_progress(const DownloadRecord& record);
  void publish_complete(const std::string& id, const std::string& file_name);

  asio::io_context& io_;
  DownloadCoordinator& coordinator_;
  std::chrono::milliseconds interval_;
  std::shared_ptr<Logger> logger_;
  asio::steady_timer timer_;
  std::atomic<bool> running_{false};
  std::atomic<uint64_t> ticks_{0};

  std::mutex subscribers_mutex_;
  std::map<SubscriptionId, ProgressHandler> progress_subscribers_;
  std::map<SubscriptionId, CompleteHandler> complete_subscribers_;
  SubscriptionId next_subscription_ = 1;
};
