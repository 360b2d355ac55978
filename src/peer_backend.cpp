#include "peer_backend.hpp"

#include <libtorrent/add_torrent_params.hpp>
#include <libtorrent/alert_types.hpp>
#include <libtorrent/error_code.hpp>
#include <libtorrent/magnet_uri.hpp>
#include <libtorrent/session_params.hpp>
#include <libtorrent/settings_pack.hpp>
#include <libtorrent/torrent_flags.hpp>

#include <algorithm>
#include <filesystem>
#include <vector>

#include "errors.hpp"
#include "magnet_uri.hpp"

namespace {

lt::settings_pack make_settings(const PeerBackend::Options& options) {
  lt::settings_pack pack;
  pack.set_str(lt::settings_pack::user_agent, "haul/1.0");
  pack.set_str(lt::settings_pack::listen_interfaces,
               "0.0.0.0:" + std::to_string(options.listen_port));
  pack.set_bool(lt::settings_pack::enable_dht, options.enable_dht);
  pack.set_bool(lt::settings_pack::enable_lsd, options.enable_lsd);
  pack.set_bool(lt::settings_pack::enable_upnp, false);
  pack.set_bool(lt::settings_pack::enable_natpmp, false);
  pack.set_int(lt::settings_pack::connections_limit, options.max_connections);
  pack.set_int(lt::settings_pack::download_rate_limit, options.download_rate_limit);
  pack.set_int(lt::settings_pack::upload_rate_limit, options.upload_rate_limit);
  pack.set_int(lt::settings_pack::alert_mask,
               lt::alert_category::error | lt::alert_category::status);
  return pack;
}

} // namespace

PeerBackend::PeerBackend(asio::io_context& io, Options options, std::shared_ptr<Logger> logger)
  : io_(io),
    options_(options),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("peer")) {
  lt::session_params params(make_settings(options_));
  session_ = std::make_unique<lt::session>(std::move(params));
  logger_->info("swarm session listening on port {} (dht={}, lsd={})",
                options_.listen_port, options_.enable_dht, options_.enable_lsd);
}

PeerBackend::~PeerBackend() {
  // Torrents are dropped without touching files; the session aborts on destruction.
  torrents_.clear();
  session_.reset();
}

lt::torrent_handle* PeerBackend::find(const std::string& handle) {
  auto it = torrents_.find(handle);
  if(it == torrents_.end() || !it->second.is_valid()) return nullptr;
  return &it->second;
}

void PeerBackend::drain_alerts() {
  std::vector<lt::alert*> alerts;
  session_->pop_alerts(&alerts);
  for(auto* alert : alerts) {
    if(alert->category() & lt::alert_category::error) {
      logger_->warn("{}", alert->message());
    } else {
      logger_->debug("{}", alert->message());
    }
  }
}

void PeerBackend::start(const DownloadRequest& request, StartHandler done) {
  MagnetLink link;
  try {
    link = parse_magnet(request.url);
  } catch(const DownloadError& e) {
    complete(std::move(done), OpStatus::from(e), std::string());
    return;
  }

  // An info-hash in the session belongs to another record; resume and
  // reattach look it up before calling here.
  if(find(link.info_hash)) {
    complete(std::move(done),
             OpStatus::failure(ErrorKind::InvalidState,
                               "torrent " + link.info_hash + " already belongs to another download"),
             std::string());
    return;
  }

  lt::error_code ec;
  lt::add_torrent_params params = lt::parse_magnet_uri(link.uri, ec);
  if(ec) {
    complete(std::move(done),
             OpStatus::failure(ErrorKind::InvalidMagnet, "magnet rejected: " + ec.message()),
             std::string());
    return;
  }

  std::error_code fs_ec;
  std::filesystem::create_directories(request.destination, fs_ec);
  params.save_path = request.destination;
  params.flags &= ~lt::torrent_flags::auto_managed;
  params.flags &= ~lt::torrent_flags::paused;

  lt::torrent_handle handle = session_->add_torrent(std::move(params), ec);
  if(ec) {
    complete(std::move(done),
             OpStatus::failure(ErrorKind::Transfer, "add torrent failed: " + ec.message()),
             std::string());
    return;
  }
  torrents_[link.info_hash] = handle;
  logger_->info("added torrent {} ({})",
                link.info_hash,
                link.display_name.empty() ? std::string("no name yet") : link.display_name);
  complete(std::move(done), OpStatus::success(), link.info_hash);
}

void PeerBackend::pause(const std::string& handle, StatusHandler done) {
  auto* torrent = find(handle);
  if(!torrent) {
    complete(std::move(done), OpStatus::failure(ErrorKind::Transfer, "torrent " + handle + " not in session"));
    return;
  }
  torrent->unset_flags(lt::torrent_flags::auto_managed);
  torrent->pause();
  complete(std::move(done), OpStatus::success());
}

void PeerBackend::resume(const std::string& handle, const DownloadRequest& request, StartHandler done) {
  auto* torrent = find(handle);
  if(!torrent) {
    start(request, std::move(done));
    return;
  }
  torrent->unset_flags(lt::torrent_flags::auto_managed);
  torrent->resume();
  complete(std::move(done), OpStatus::success(), handle);
}

void PeerBackend::cancel(const std::string& handle,
                         const DownloadRequest&,
                         CleanupPolicy policy,
                         StatusHandler done) {
  auto* torrent = find(handle);
  if(torrent) {
    if(policy == CleanupPolicy::Temp) {
      session_->remove_torrent(*torrent, lt::session_handle::delete_files);
    } else {
      session_->remove_torrent(*torrent);
    }
    logger_->info("removed torrent {} ({})", handle, to_string(policy));
  }
  torrents_.erase(handle);
  complete(std::move(done), OpStatus::success());
}

ProgressSample PeerBackend::map_status(const lt::torrent_status& status, lt::torrent_handle& handle) const {
  ProgressSample sample;
  sample.peers = static_cast<uint32_t>(status.num_peers);
  sample.seeds = static_cast<uint32_t>(status.num_seeds);
  sample.download_speed = static_cast<uint64_t>(std::max(0, status.download_payload_rate));
  sample.upload_speed = static_cast<uint64_t>(std::max(0, status.upload_payload_rate));
  sample.file_name = status.name;

  if(status.errc) {
    sample.status = DownloadStatus::Error;
    sample.error = status.errc.message();
    return sample;
  }

  const bool paused = static_cast<bool>(status.flags & lt::torrent_flags::paused);
  const bool have_metadata = status.has_metadata &&
    status.state != lt::torrent_status::downloading_metadata &&
    status.state != lt::torrent_status::checking_files &&
    status.state != lt::torrent_status::checking_resume_data;

  if(have_metadata) {
    sample.total = static_cast<uint64_t>(std::max<int64_t>(0, status.total_wanted));
    sample.downloaded = static_cast<uint64_t>(std::max<int64_t>(0, status.total_wanted_done));
    if(sample.total > 0 && sample.downloaded > sample.total) {
      sample.downloaded = sample.total;
    }
  }

  if(have_metadata && status.state == lt::torrent_status::finished) {
    sample.status = DownloadStatus::Completed;
  } else if(have_metadata && status.state == lt::torrent_status::seeding) {
    if(options_.seed_after_download) {
      sample.status = DownloadStatus::Seeding;
    } else {
      if(!paused) handle.pause();
      sample.status = DownloadStatus::Completed;
    }
  } else if(paused) {
    sample.status = DownloadStatus::Paused;
  } else if(!have_metadata) {
    // total stays unknown until the swarm hands over metadata
    sample.status = DownloadStatus::Pending;
  } else {
    sample.status = DownloadStatus::Active;
  }
  return sample;
}

void PeerBackend::sample(const std::string& handle, SampleHandler done) {
  drain_alerts();
  auto* torrent = find(handle);
  if(!torrent) {
    complete(std::move(done),
             OpStatus::failure(ErrorKind::Transfer, "torrent " + handle + " not in session"),
             ProgressSample{});
    return;
  }
  lt::torrent_status status = torrent->status();
  complete(std::move(done), OpStatus::success(), map_status(status, *torrent));
}

void PeerBackend::reattach(const std::string& handle, const DownloadRequest& request, StartHandler done) {
  if(find(handle)) {
    complete(std::move(done), OpStatus::success(), handle);
    return;
  }
  start(request, std::move(done));
}

void PeerBackend::release(const std::string& handle, StatusHandler done) {
  if(auto* torrent = find(handle)) {
    session_->remove_torrent(*torrent);
    logger_->info("released torrent {}, files kept", handle);
  }
  torrents_.erase(handle);
  complete(std::move(done), OpStatus::success());
}
