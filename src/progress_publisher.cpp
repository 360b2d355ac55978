#include "progress_publisher.hpp"

#include <utility>
#include <vector>

ProgressPublisher::ProgressPublisher(asio::io_context& io,
                                     DownloadCoordinator& coordinator,
                                     std::chrono::milliseconds interval,
                                     std::shared_ptr<Logger> logger)
  : io_(io),
    coordinator_(coordinator),
    interval_(interval.count() > 0 ? interval : std::chrono::milliseconds(1000)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("progress")),
    timer_(io) {
  coordinator_.set_event_callbacks(
    [this](const DownloadRecord& record){ publish_progress(record); },
    [this](const std::string& id, const std::string& file_name){ publish_complete(id, file_name); });
}

ProgressPublisher::~ProgressPublisher() {
  running_ = false;
  coordinator_.set_event_callbacks(nullptr, nullptr);
}

void ProgressPublisher::start() {
  if(running_.exchange(true)) return;
  asio::post(io_, [this](){ schedule(); });
}

void ProgressPublisher::stop() {
  if(!running_.exchange(false)) return;
  asio::post(io_, [this](){
    std::error_code ignored;
    timer_.cancel(ignored);
  });
}

void ProgressPublisher::schedule() {
  if(!running_) return;
  timer_.expires_after(interval_);
  timer_.async_wait([this](const std::error_code& ec){
    if(ec || !running_) return;
    ++ticks_;
    try {
      coordinator_.tick();
    } catch(const std::exception& e) {
      logger_->error("sampling round failed: {}", e.what());
    }
    schedule();
  });
}

ProgressPublisher::SubscriptionId ProgressPublisher::subscribe_progress(ProgressHandler handler) {
  std::lock_guard<std::mutex> lock(subscribers_mutex_);
  auto id = next_subscription_++;
  progress_subscribers_[id] = std::move(handler);
  return id;
}

ProgressPublisher::SubscriptionId ProgressPublisher::subscribe_complete(CompleteHandler handler) {
  std::lock_guard<std::mutex> lock(subscribers_mutex_);
  auto id = next_subscription_++;
  complete_subscribers_[id] = std::move(handler);
  return id;
}

void ProgressPublisher::unsubscribe(SubscriptionId id) {
  std::lock_guard<std::mutex> lock(subscribers_mutex_);
  progress_subscribers_.erase(id);
  complete_subscribers_.erase(id);
}

void ProgressPublisher::publish_progress(const DownloadRecord& record) {
  std::vector<ProgressHandler> handlers;
  {
    std::lock_guard<std::mutex> lock(subscribers_mutex_);
    for(const auto& [id, handler] : progress_subscribers_) handlers.push_back(handler);
  }
  for(auto& handler : handlers) {
    try {
      handler(record);
    } catch(const std::exception& e) {
      logger_->warn("progress subscriber threw: {}", e.what());
    }
  }
}

void ProgressPublisher::publish_complete(const std::string& id, const std::string& file_name) {
  std::vector<CompleteHandler> handlers;
  {
    std::lock_guard<std::mutex> lock(subscribers_mutex_);
    for(const auto& [sub, handler] : complete_subscribers_) handlers.push_back(handler);
  }
  logger_->info("download {} ready ({})", id, file_name);
  for(auto& handler : handlers) {
    try {
      handler(id, file_name);
    } catch(const std::exception& e) {
      logger_->warn("complete subscriber threw: {}", e.what());
    }
  }
}
