#pragma once

#include <asio.hpp>
#include <libtorrent/session.hpp>
#include <libtorrent/torrent_handle.hpp>
#include <libtorrent/torrent_status.hpp>

#include <cstdint>
#include <map>
#include <memory>
#include <string>

#include "log.hpp"
#include "transport_backend.hpp"

// Swarm transfers in an in-process libtorrent session, one torrent per
// download. The handle is the lowercase hex info-hash.
class PeerBackend : public TransportBackend {
public:
  struct Options {
    uint16_t listen_port = 6881;
    int max_connections = 200;
    bool enable_dht = true;
    bool enable_lsd = true;
    int download_rate_limit = 0; // bytes/s, 0 = unlimited
    int upload_rate_limit = 1024;
    bool seed_after_download = true;
  };

  PeerBackend(asio::io_context& io, Options options, std::shared_ptr<Logger> logger = nullptr);
  ~PeerBackend() override;

  PeerBackend(const PeerBackend&) = delete;
  PeerBackend& operator=(const PeerBackend&) = delete;

  TransportKind kind() const override { return TransportKind::Peer; }
  // Nothing is known about the payload until metadata arrives.
  DownloadStatus status_after_start() const override { return DownloadStatus::Pending; }

  void start(const DownloadRequest& request, StartHandler done) override;
  void pause(const std::string& handle, StatusHandler done) override;
  void resume(const std::string& handle, const DownloadRequest& request, StartHandler done) override;
  void cancel(const std::string& handle,
              const DownloadRequest& request,
              CleanupPolicy policy,
              StatusHandler done) override;
  void sample(const std::string& handle, SampleHandler done) override;
  void reattach(const std::string& handle, const DownloadRequest& request, StartHandler done) override;
  void release(const std::string& handle, StatusHandler done) override;

  std::size_t torrent_count() const { return torrents_.size(); }

  ProgressSample map_status(const lt::torrent_status& status, lt::torrent_handle& handle) const;

private:
  lt::torrent_handle* find(const std::string& handle);
  void drain_alerts();

  template<typename Handler, typename... Args>
  void complete(Handler handler, Args... args) {
    asio::post(io_, [handler = std::move(handler), args...](){
      if(handler) handler(args...);
    });
  }

  asio::io_context& io_;
  Options options_;
  std::shared_ptr<Logger> logger_;
  std::unique_ptr<lt::session> session_;
  std::map<std::string, lt::torrent_handle> torrents_;
};
