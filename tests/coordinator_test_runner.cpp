#include "download_coordinator.hpp"
#include "errors.hpp"
#include "fake_backend.hpp"
#include "progress_publisher.hpp"
#include "test_runner_utils.hpp"

#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

using haul::test::FakeBackend;
using haul::test::IoThread;
using haul::test::MemoryHistory;
using haul::test::TestCase;
using haul::test::TestContext;
using haul::test::throws;
using haul::test::wait_for_condition;
using namespace std::chrono_literals;

namespace {

const std::string kMagnet = "magnet:?xt=urn:btih:c12fe1c06bba254a9dc9f519b335aa7c1367a88a&dn=sample";

struct CoordinatorRig {
  IoThread io;
  FakeBackend http{io.io(), TransportKind::Http};
  FakeBackend peer{io.io(), TransportKind::Peer};
  std::shared_ptr<MemoryHistory> history = std::make_shared<MemoryHistory>();
  std::shared_ptr<Logger> logger = std::make_shared<Logger>("coordinator");
  std::unique_ptr<DownloadCoordinator> coordinator;
  std::unique_ptr<ProgressPublisher> publisher;

  std::mutex events_mutex;
  std::map<std::string, std::vector<DownloadRecord>> progress;
  std::map<std::string, int> completes;
  std::atomic<bool> bytes_went_backwards{false};
  std::atomic<bool> ratio_out_of_range{false};

  explicit CoordinatorRig(TestContext& ctx) {
    ctx.logs.attach(logger);
    DownloadCoordinator::Options options;
    options.sample_interval = 50ms;
    options.completed_grace = 100ms;
    options.default_destination = "downloads";
    coordinator = std::make_unique<DownloadCoordinator>(io.io(), options, &http, &peer, history, logger);
    publisher = std::make_unique<ProgressPublisher>(io.io(), *coordinator, options.sample_interval, logger);
    publisher->subscribe_progress([this](const DownloadRecord& record){
      std::lock_guard<std::mutex> lock(events_mutex);
      auto& seen = progress[record.id];
      if(!seen.empty() && record.downloaded < seen.back().downloaded) bytes_went_backwards = true;
      if(record.progress() < 0.0 || record.progress() > 1.0) ratio_out_of_range = true;
      seen.push_back(record);
    });
    publisher->subscribe_complete([this](const std::string& id, const std::string&){
      std::lock_guard<std::mutex> lock(events_mutex);
      completes[id]++;
    });
    publisher->start();
  }

  ~CoordinatorRig() {
    publisher->stop();
    io.stop();
    publisher.reset();
    coordinator.reset();
  }

  std::string submit(const std::string& url, CleanupPolicy cleanup = CleanupPolicy::Persist) {
    DownloadRequest request;
    request.url = url;
    request.cleanup = cleanup;
    return coordinator->submit(request);
  }

  DownloadRecord get(const std::string& id) {
    return coordinator->get(id);
  }

  bool wait_status(const std::string& id, DownloadStatus status, std::chrono::milliseconds timeout = 5s) {
    return wait_for_condition([&]{ return get(id).status == status; }, timeout);
  }

  bool wait_bytes_above(const std::string& id, uint64_t floor, std::chrono::milliseconds timeout = 5s) {
    return wait_for_condition([&]{ return get(id).downloaded > floor; }, timeout);
  }

  int complete_events(const std::string& id) {
    std::lock_guard<std::mutex> lock(events_mutex);
    return completes[id];
  }

  std::size_t progress_events(const std::string& id) {
    std::lock_guard<std::mutex> lock(events_mutex);
    return progress[id].size();
  }

  bool saw_status(const std::string& id, DownloadStatus status) {
    std::lock_guard<std::mutex> lock(events_mutex);
    for(const auto& record : progress[id]) {
      if(record.status == status) return true;
    }
    return false;
  }

  bool wait_event(const std::string& id, DownloadStatus status, std::chrono::milliseconds timeout = 2s) {
    return wait_for_condition([&]{ return saw_status(id, status); }, timeout);
  }

  std::optional<DownloadRecord> last_event(const std::string& id) {
    std::lock_guard<std::mutex> lock(events_mutex);
    auto& seen = progress[id];
    if(seen.empty()) return std::nullopt;
    return seen.back();
  }
};

bool test_http_download_runs_to_completion(TestContext& ctx) {
  CoordinatorRig rig(ctx);
  auto id = rig.submit("http://example.com/file.bin");
  auto record = rig.get(id);
  HAUL_CHECK(record.id == id);
  HAUL_CHECK(record.kind == TransportKind::Http);
  HAUL_CHECK(record.status == DownloadStatus::Pending || record.status == DownloadStatus::Active);
  HAUL_CHECK(record.request.destination == "downloads");

  HAUL_CHECK(rig.wait_status(id, DownloadStatus::Completed));
  record = rig.get(id);
  HAUL_CHECK(record.downloaded == record.total);
  HAUL_CHECK(record.total == rig.http.total_bytes);
  HAUL_CHECK(record.download_speed == 0);
  HAUL_CHECK(!record.eta_seconds);
  HAUL_CHECK(record.finished_at.has_value());
  HAUL_CHECK(record.file_name == "payload.bin");

  HAUL_CHECK(wait_for_condition([&]{ return rig.complete_events(id) == 1; }, 2s));
  HAUL_CHECK(rig.progress_events(id) > 0);
  HAUL_CHECK(!rig.bytes_went_backwards);
  HAUL_CHECK(!rig.ratio_out_of_range);

  auto entries = rig.history->records();
  HAUL_CHECK(entries.size() == 1);
  HAUL_CHECK(entries[0].status == DownloadStatus::Completed);
  HAUL_CHECK(entries[0].downloaded == rig.http.total_bytes);

  // Released from the backend once the grace period is over.
  HAUL_CHECK(wait_for_condition([&]{ return rig.http.count("release") == 1; }, 2s));
  std::this_thread::sleep_for(200ms);
  HAUL_CHECK(rig.complete_events(id) == 1);
  HAUL_CHECK(rig.history->count_for(id) == 1);
  HAUL_CHECK(rig.get(id).status == DownloadStatus::Completed);
  return true;
}

bool test_pause_resume_keeps_bytes(TestContext& ctx) {
  CoordinatorRig rig(ctx);
  rig.http.total_bytes = 10000000;
  auto id = rig.submit("http://example.com/large.bin");
  HAUL_CHECK(rig.wait_bytes_above(id, 0));

  rig.coordinator->pause(id);
  HAUL_CHECK(rig.get(id).status == DownloadStatus::Paused);
  HAUL_CHECK(rig.get(id).download_speed == 0);
  std::this_thread::sleep_for(200ms);
  auto frozen = rig.get(id).downloaded;
  HAUL_CHECK(frozen > 0);
  std::this_thread::sleep_for(300ms);
  HAUL_CHECK(rig.get(id).status == DownloadStatus::Paused);
  HAUL_CHECK(rig.get(id).downloaded == frozen);

  rig.coordinator->resume(id);
  HAUL_CHECK(rig.get(id).status == DownloadStatus::Active);
  HAUL_CHECK(rig.wait_bytes_above(id, frozen));
  HAUL_CHECK(!rig.bytes_went_backwards);
  return true;
}

bool test_concurrent_downloads_pause_independently(TestContext& ctx) {
  CoordinatorRig rig(ctx);
  rig.http.total_bytes = 10000000;
  std::vector<std::string> ids = {
    rig.submit("http://example.com/one.bin"),
    rig.submit("http://mirror.example.org/two.bin"),
    rig.submit("https://example.net/three.bin")
  };
  for(const auto& id : ids) {
    HAUL_CHECK(rig.wait_bytes_above(id, 0));
  }

  rig.coordinator->pause(ids[1]);
  std::this_thread::sleep_for(200ms);
  auto paused_bytes = rig.get(ids[1]).downloaded;
  auto first = rig.get(ids[0]).downloaded;
  auto third = rig.get(ids[2]).downloaded;
  std::this_thread::sleep_for(300ms);

  HAUL_CHECK(rig.get(ids[1]).downloaded == paused_bytes);
  HAUL_CHECK(rig.get(ids[1]).status == DownloadStatus::Paused);
  HAUL_CHECK(rig.get(ids[0]).downloaded > first);
  HAUL_CHECK(rig.get(ids[2]).downloaded > third);

  auto listed = rig.coordinator->list();
  HAUL_CHECK(listed.size() == 3);
  HAUL_CHECK(listed[0].id == ids[0]);
  HAUL_CHECK(listed[2].id == ids[2]);
  return true;
}

bool test_cancel_is_terminal(TestContext& ctx) {
  CoordinatorRig rig(ctx);
  rig.http.total_bytes = 10000000;
  auto id = rig.submit("http://example.com/doomed.bin", CleanupPolicy::Temp);
  HAUL_CHECK(rig.wait_bytes_above(id, 0));

  rig.coordinator->cancel(id);
  auto status = rig.get(id).status;
  HAUL_CHECK(status == DownloadStatus::Cancelling || status == DownloadStatus::Cancelled);
  HAUL_CHECK(rig.wait_status(id, DownloadStatus::Cancelled));
  HAUL_CHECK(rig.http.count("cancel_temp") == 1);
  HAUL_CHECK(rig.http.task_count() == 0);

  auto bytes = rig.get(id).downloaded;
  std::this_thread::sleep_for(200ms);
  HAUL_CHECK(rig.get(id).status == DownloadStatus::Cancelled);
  HAUL_CHECK(rig.get(id).downloaded == bytes);

  HAUL_CHECK(throws<InvalidStateError>([&]{ rig.coordinator->pause(id); }));
  HAUL_CHECK(throws<InvalidStateError>([&]{ rig.coordinator->resume(id); }));
  HAUL_CHECK(throws<InvalidStateError>([&]{ rig.coordinator->cancel(id); }));
  HAUL_CHECK(rig.history->count_for(id) == 1);
  HAUL_CHECK(rig.history->records()[0].status == DownloadStatus::Cancelled);

  // Subscribers see the cancellation, and it is the last word.
  HAUL_CHECK(rig.wait_event(id, DownloadStatus::Cancelled));
  HAUL_CHECK(rig.saw_status(id, DownloadStatus::Cancelling));
  auto last = rig.last_event(id);
  HAUL_CHECK(last && last->status == DownloadStatus::Cancelled);
  HAUL_CHECK(last->download_speed == 0);
  HAUL_CHECK(last->finished_at.has_value());
  HAUL_CHECK(!rig.bytes_went_backwards);
  return true;
}

bool test_cancel_before_start_leaves_nothing(TestContext& ctx) {
  CoordinatorRig rig(ctx);
  for(int i = 0; i < 10; ++i) {
    auto id = rig.submit("http://example.com/race-" + std::to_string(i));
    rig.coordinator->cancel(id);
    HAUL_CHECK(rig.wait_status(id, DownloadStatus::Cancelled));
  }
  HAUL_CHECK(wait_for_condition([&]{ return rig.http.task_count() == 0; }, 2s));
  for(const auto& record : rig.coordinator->list()) {
    HAUL_CHECK(record.status == DownloadStatus::Cancelled);
  }
  return true;
}

bool test_illegal_commands_are_rejected(TestContext& ctx) {
  CoordinatorRig rig(ctx);
  rig.http.total_bytes = 10000000;
  auto id = rig.submit("http://example.com/x.bin");
  HAUL_CHECK(rig.wait_status(id, DownloadStatus::Active));

  HAUL_CHECK(throws<InvalidStateError>([&]{ rig.coordinator->resume(id); }));
  HAUL_CHECK(throws<InvalidStateError>([&]{ rig.coordinator->retry(id); }));
  HAUL_CHECK(throws<InvalidStateError>([&]{ rig.coordinator->stop_seeding(id); }));
  HAUL_CHECK(throws<InvalidStateError>([&]{ rig.coordinator->clear(id); }));
  rig.coordinator->pause(id);
  HAUL_CHECK(throws<InvalidStateError>([&]{ rig.coordinator->pause(id); }));

  try {
    rig.coordinator->pause(id);
  } catch(const InvalidStateError& e) {
    HAUL_CHECK(std::string(e.what()) == "cannot pause download " + id + " while paused");
  }

  HAUL_CHECK(throws<NotFoundError>([&]{ rig.coordinator->get("nope"); }));
  HAUL_CHECK(throws<NotFoundError>([&]{ rig.coordinator->pause("nope"); }));
  HAUL_CHECK(throws<NotFoundError>([&]{ rig.coordinator->cancel("nope"); }));
  HAUL_CHECK(throws<NotFoundError>([&]{ rig.coordinator->clear("nope"); }));
  return true;
}

bool test_rejected_urls_create_no_record(TestContext& ctx) {
  CoordinatorRig rig(ctx);
  HAUL_CHECK(throws<UnsupportedSchemeError>([&]{ rig.submit("ftp://example.com/file"); }));
  HAUL_CHECK(throws<UnsupportedSchemeError>([&]{ rig.submit("not a url"); }));
  HAUL_CHECK(throws<InvalidMagnetError>([&]{ rig.submit("magnet:?dn=no-hash"); }));
  HAUL_CHECK(rig.coordinator->list().empty());
  HAUL_CHECK(rig.http.count("start") == 0);
  HAUL_CHECK(rig.peer.count("start") == 0);
  return true;
}

bool test_start_failure_becomes_error(TestContext& ctx) {
  CoordinatorRig rig(ctx);
  auto id = rig.submit("http://example.com/refuse/me.bin");
  HAUL_CHECK(rig.wait_status(id, DownloadStatus::Error));
  auto record = rig.get(id);
  HAUL_CHECK(record.error == "TransferError: server refused the request");
  HAUL_CHECK(!record.retryable);
  HAUL_CHECK(rig.history->count_for(id) == 1);

  auto broken = rig.submit("http://example.com/broken.bin");
  HAUL_CHECK(rig.wait_status(broken, DownloadStatus::Error));
  HAUL_CHECK(rig.get(broken).error == "TransferError: connection reset by peer");
  HAUL_CHECK(rig.get(broken).downloaded > 0);
  HAUL_CHECK(rig.complete_events(broken) == 0);
  return true;
}

bool test_retry_after_transient_failure(TestContext& ctx) {
  CoordinatorRig rig(ctx);
  rig.http.set_unreachable(true);
  auto id = rig.submit("http://example.com/later.bin");
  HAUL_CHECK(rig.wait_status(id, DownloadStatus::Error));
  HAUL_CHECK(rig.get(id).retryable);

  rig.http.set_unreachable(false);
  rig.coordinator->retry(id);
  auto status = rig.get(id).status;
  HAUL_CHECK(status == DownloadStatus::Pending || status == DownloadStatus::Active);
  HAUL_CHECK(rig.get(id).error.empty());
  HAUL_CHECK(rig.wait_status(id, DownloadStatus::Completed));
  HAUL_CHECK(rig.history->count_for(id) == 2);
  HAUL_CHECK(wait_for_condition([&]{ return rig.complete_events(id) == 1; }, 2s));
  return true;
}

bool test_silent_transport_never_reports_active(TestContext& ctx) {
  CoordinatorRig rig(ctx);
  rig.http.total_bytes = 10000000;
  auto id = rig.submit("http://example.com/quiet.bin");
  HAUL_CHECK(rig.wait_bytes_above(id, 0));

  rig.http.set_unreachable(true);
  HAUL_CHECK(rig.wait_status(id, DownloadStatus::Pending, 2s));
  HAUL_CHECK(rig.get(id).download_speed == 0);
  // Nothing fresh arrives, so it must not flip back while silent.
  for(int i = 0; i < 10; ++i) {
    HAUL_CHECK(rig.get(id).status == DownloadStatus::Pending);
    std::this_thread::sleep_for(30ms);
  }

  auto before = rig.get(id).downloaded;
  rig.http.set_unreachable(false);
  HAUL_CHECK(rig.wait_status(id, DownloadStatus::Active, 2s));
  HAUL_CHECK(rig.wait_bytes_above(id, before));
  return true;
}

bool test_lost_transport_fails_its_records(TestContext& ctx) {
  CoordinatorRig rig(ctx);
  rig.http.total_bytes = 10000000;
  rig.peer.total_bytes = 10000000;
  auto a = rig.submit("http://example.com/a.bin");
  auto b = rig.submit("http://example.com/b.bin");
  auto swarm = rig.submit(kMagnet);
  HAUL_CHECK(rig.wait_bytes_above(a, 0));
  HAUL_CHECK(rig.wait_bytes_above(b, 0));
  rig.coordinator->pause(b);

  rig.http.set_unreachable(true);
  rig.http.emit_health(BackendHealth::Lost);
  HAUL_CHECK(rig.wait_status(a, DownloadStatus::Error));
  HAUL_CHECK(rig.wait_status(b, DownloadStatus::Error));
  HAUL_CHECK(rig.get(a).retryable);
  HAUL_CHECK(rig.get(a).error.rfind("StartupError: ", 0) == 0);
  HAUL_CHECK(rig.history->count_for(a) == 1);

  auto peer_status = rig.get(swarm).status;
  HAUL_CHECK(peer_status != DownloadStatus::Error);

  HAUL_CHECK(rig.wait_event(a, DownloadStatus::Error));
  HAUL_CHECK(rig.wait_event(b, DownloadStatus::Error));
  auto last = rig.last_event(b);
  HAUL_CHECK(last && last->status == DownloadStatus::Error);
  HAUL_CHECK(last->retryable);
  HAUL_CHECK(last->error == rig.get(b).error);
  HAUL_CHECK(!rig.saw_status(swarm, DownloadStatus::Error));
  return true;
}

bool test_recovered_transport_reattaches(TestContext& ctx) {
  CoordinatorRig rig(ctx);
  rig.http.total_bytes = 10000000;
  auto running = rig.submit("http://example.com/running.bin");
  auto paused = rig.submit("http://example.com/paused.bin");
  HAUL_CHECK(rig.wait_bytes_above(running, 0));
  HAUL_CHECK(rig.wait_bytes_above(paused, 0));
  rig.coordinator->pause(paused);
  HAUL_CHECK(wait_for_condition([&]{ return rig.http.is_paused(rig.get(paused).handle); }, 2s));

  auto old_running = rig.get(running).handle;
  auto old_paused = rig.get(paused).handle;
  auto bytes_before = rig.get(running).downloaded;
  rig.http.set_forget_on_reattach(true);
  rig.http.emit_health(BackendHealth::Recovered);

  HAUL_CHECK(wait_for_condition([&]{
    return rig.get(running).handle != old_running && rig.get(paused).handle != old_paused;
  }, 2s));
  HAUL_CHECK(rig.http.count("reattach") == 2);
  auto new_paused = rig.get(paused).handle;
  HAUL_CHECK(wait_for_condition([&]{ return rig.http.is_paused(new_paused); }, 2s));
  HAUL_CHECK(rig.get(paused).status == DownloadStatus::Paused);
  HAUL_CHECK(rig.wait_bytes_above(running, bytes_before));
  HAUL_CHECK(!rig.bytes_went_backwards);
  return true;
}

bool test_unrecoverable_reattach_is_error(TestContext& ctx) {
  CoordinatorRig rig(ctx);
  rig.http.total_bytes = 10000000;
  auto id = rig.submit("http://example.com/vanishing.bin");
  HAUL_CHECK(rig.wait_bytes_above(id, 0));
  rig.http.set_fail_reattach(true);
  rig.http.emit_health(BackendHealth::Recovered);
  HAUL_CHECK(rig.wait_status(id, DownloadStatus::Error));
  HAUL_CHECK(rig.get(id).error == "TransferError: task vanished");
  return true;
}

bool test_swarm_download_seeds_until_stopped(TestContext& ctx) {
  CoordinatorRig rig(ctx);
  auto id = rig.submit(kMagnet);
  auto record = rig.get(id);
  HAUL_CHECK(record.kind == TransportKind::Peer);
  HAUL_CHECK(record.status == DownloadStatus::Pending);
  HAUL_CHECK(wait_for_condition([&]{ return !rig.get(id).handle.empty(); }, 2s));
  HAUL_CHECK(rig.get(id).status == DownloadStatus::Pending);
  HAUL_CHECK(rig.get(id).total == 0);
  HAUL_CHECK(rig.get(id).progress() == 0.0);

  HAUL_CHECK(rig.wait_status(id, DownloadStatus::Seeding));
  record = rig.get(id);
  HAUL_CHECK(record.downloaded == record.total);
  HAUL_CHECK(record.peers == 3);
  HAUL_CHECK(wait_for_condition([&]{ return rig.complete_events(id) == 1; }, 2s));
  HAUL_CHECK(rig.history->count_for(id) == 0);
  HAUL_CHECK(throws<InvalidStateError>([&]{ rig.coordinator->cancel(id); }));
  HAUL_CHECK(throws<InvalidStateError>([&]{ rig.coordinator->pause(id); }));

  std::this_thread::sleep_for(200ms);
  HAUL_CHECK(rig.get(id).status == DownloadStatus::Seeding);
  HAUL_CHECK(rig.complete_events(id) == 1);

  rig.coordinator->stop_seeding(id);
  HAUL_CHECK(rig.get(id).status == DownloadStatus::Completed);
  HAUL_CHECK(wait_for_condition([&]{ return rig.peer.count("release") == 1; }, 2s));
  HAUL_CHECK(rig.history->count_for(id) == 1);
  std::this_thread::sleep_for(200ms);
  HAUL_CHECK(rig.peer.count("release") == 1);
  HAUL_CHECK(rig.complete_events(id) == 1);
  return true;
}

bool test_swarm_pause_while_waiting_for_metadata(TestContext& ctx) {
  CoordinatorRig rig(ctx);
  rig.peer.metadata_samples = 1000;
  auto id = rig.submit(kMagnet);
  HAUL_CHECK(wait_for_condition([&]{ return !rig.get(id).handle.empty(); }, 2s));
  rig.coordinator->pause(id);
  HAUL_CHECK(rig.get(id).status == DownloadStatus::Paused);
  std::this_thread::sleep_for(300ms);
  HAUL_CHECK(rig.get(id).status == DownloadStatus::Paused);
  rig.coordinator->resume(id);
  std::this_thread::sleep_for(300ms);
  HAUL_CHECK(rig.get(id).status == DownloadStatus::Pending);
  return true;
}

bool test_clear_and_clear_finished(TestContext& ctx) {
  CoordinatorRig rig(ctx);
  rig.http.total_bytes = 10000;
  auto done = rig.submit("http://example.com/small.bin");
  auto failed = rig.submit("http://example.com/refuse.bin");
  HAUL_CHECK(rig.wait_status(done, DownloadStatus::Completed));
  HAUL_CHECK(rig.wait_status(failed, DownloadStatus::Error));

  rig.http.total_bytes = 10000000;
  auto active = rig.submit("http://example.com/ongoing.bin");
  HAUL_CHECK(rig.wait_status(active, DownloadStatus::Active));

  rig.coordinator->clear(done);
  HAUL_CHECK(throws<NotFoundError>([&]{ rig.get(done); }));
  HAUL_CHECK(rig.coordinator->clear_finished() == 1);
  HAUL_CHECK(throws<NotFoundError>([&]{ rig.get(failed); }));
  HAUL_CHECK(rig.coordinator->list().size() == 1);
  HAUL_CHECK(rig.coordinator->clear_finished() == 0);
  return true;
}

bool test_refused_pause_reverts(TestContext& ctx) {
  CoordinatorRig rig(ctx);
  rig.http.total_bytes = 10000000;
  auto id = rig.submit("http://example.com/stubborn.bin");
  HAUL_CHECK(rig.wait_status(id, DownloadStatus::Active));
  rig.http.set_refuse_pause(true);

  std::atomic<bool> answered{false};
  std::atomic<bool> ok{true};
  rig.coordinator->pause(id, [&](const OpStatus& status){
    ok = status.ok();
    answered = true;
  });
  HAUL_CHECK(wait_for_condition([&]{ return answered.load(); }, 2s));
  HAUL_CHECK(!ok);
  HAUL_CHECK(rig.get(id).status == DownloadStatus::Active);
  return true;
}

bool test_publisher_isolates_subscribers(TestContext& ctx) {
  CoordinatorRig rig(ctx);
  std::atomic<int> survivors{0};
  auto thrower = rig.publisher->subscribe_progress([](const DownloadRecord&){
    throw std::runtime_error("subscriber blew up");
  });
  auto counter = rig.publisher->subscribe_progress([&](const DownloadRecord&){ survivors++; });

  auto id = rig.submit("http://example.com/observed.bin");
  HAUL_CHECK(rig.wait_status(id, DownloadStatus::Completed));
  HAUL_CHECK(survivors > 0);
  HAUL_CHECK(ctx.logs.wait_for_substring("subscriber blew up", 1s));
  HAUL_CHECK(rig.publisher->tick_count() > 0);

  rig.publisher->unsubscribe(thrower);
  rig.publisher->unsubscribe(counter);
  int seen = survivors;
  auto other = rig.submit("http://example.com/unobserved.bin");
  HAUL_CHECK(rig.wait_status(other, DownloadStatus::Completed));
  HAUL_CHECK(survivors == seen);
  return true;
}

bool test_same_target_is_not_shared(TestContext& ctx) {
  CoordinatorRig rig(ctx);
  rig.http.total_bytes = 10000000;
  const std::string url = "http://example.com/shared.iso";
  auto first = rig.submit(url);
  HAUL_CHECK(rig.wait_bytes_above(first, 0));

  HAUL_CHECK(throws<InvalidStateError>([&]{ rig.submit(url); }));
  DownloadRequest trailing;
  trailing.url = url;
  trailing.destination = "downloads/";
  HAUL_CHECK(throws<InvalidStateError>([&]{ rig.coordinator->submit(trailing); }));
  HAUL_CHECK(rig.coordinator->list().size() == 1);
  HAUL_CHECK(rig.http.count("start") == 1);

  // Another directory or another url is a transfer of its own.
  DownloadRequest elsewhere;
  elsewhere.url = url;
  elsewhere.destination = "downloads/other";
  auto second = rig.coordinator->submit(elsewhere);
  auto third = rig.submit(url + "?mirror=2");
  HAUL_CHECK(rig.wait_bytes_above(second, 0));
  HAUL_CHECK(rig.wait_bytes_above(third, 0));
  auto first_handle = rig.get(first).handle;
  HAUL_CHECK(rig.get(second).handle != first_handle);
  HAUL_CHECK(rig.get(third).handle != first_handle);
  HAUL_CHECK(rig.http.task_count() == 3);

  rig.coordinator->pause(first);
  HAUL_CHECK(wait_for_condition([&]{ return rig.http.is_paused(first_handle); }, 2s));
  std::this_thread::sleep_for(200ms);
  auto held = rig.get(first).downloaded;
  auto moving = rig.get(second).downloaded;
  std::this_thread::sleep_for(300ms);
  HAUL_CHECK(rig.get(first).downloaded == held);
  HAUL_CHECK(rig.get(second).downloaded > moving);
  HAUL_CHECK(rig.get(second).status == DownloadStatus::Active);

  // Once the first is gone its target is free again, with a new task.
  rig.coordinator->cancel(first);
  HAUL_CHECK(rig.wait_status(first, DownloadStatus::Cancelled));
  auto again = rig.submit(url);
  HAUL_CHECK(rig.wait_bytes_above(again, 0));
  HAUL_CHECK(rig.get(again).handle != first_handle);
  HAUL_CHECK(rig.get(first).status == DownloadStatus::Cancelled);
  HAUL_CHECK(rig.history->count_for(first) == 1);
  return true;
}

bool test_finished_target_gets_a_fresh_task(TestContext& ctx) {
  CoordinatorRig rig(ctx);
  rig.http.total_bytes = 10000;
  const std::string url = "http://example.com/again.bin";
  auto first = rig.submit(url);
  HAUL_CHECK(rig.wait_status(first, DownloadStatus::Completed));
  auto first_handle = rig.get(first).handle;

  auto second = rig.submit(url);
  HAUL_CHECK(second != first);
  HAUL_CHECK(rig.wait_status(second, DownloadStatus::Completed));
  HAUL_CHECK(rig.get(second).handle != first_handle);
  HAUL_CHECK(rig.http.count("start") == 2);

  // Each finished task is released exactly once.
  HAUL_CHECK(wait_for_condition([&]{ return rig.http.count("release") == 2; }, 2s));
  HAUL_CHECK(!rig.http.has_task(first_handle));
  std::this_thread::sleep_for(200ms);
  HAUL_CHECK(rig.http.count("release") == 2);
  HAUL_CHECK(rig.get(first).status == DownloadStatus::Completed);
  HAUL_CHECK(rig.history->count_for(first) == 1);
  HAUL_CHECK(rig.history->count_for(second) == 1);
  HAUL_CHECK(wait_for_condition([&]{ return rig.complete_events(second) == 1; }, 2s));
  HAUL_CHECK(rig.complete_events(first) == 1);
  return true;
}

bool test_same_swarm_is_not_shared(TestContext& ctx) {
  CoordinatorRig rig(ctx);
  auto id = rig.submit(kMagnet);
  HAUL_CHECK(throws<InvalidStateError>([&]{
    rig.submit("magnet:?xt=urn:btih:c12fe1c06bba254a9dc9f519b335aa7c1367a88a&dn=renamed");
  }));
  HAUL_CHECK(rig.wait_status(id, DownloadStatus::Seeding));
  HAUL_CHECK(throws<InvalidStateError>([&]{ rig.submit(kMagnet); }));
  HAUL_CHECK(rig.coordinator->list().size() == 1);
  HAUL_CHECK(rig.peer.count("start") == 1);

  rig.coordinator->stop_seeding(id);
  auto again = rig.submit(kMagnet);
  HAUL_CHECK(wait_for_condition([&]{ return !rig.get(again).handle.empty(); }, 2s));
  HAUL_CHECK(rig.get(again).handle != rig.get(id).handle);
  HAUL_CHECK(rig.get(id).status == DownloadStatus::Completed);
  HAUL_CHECK(rig.peer.count("start") == 2);
  return true;
}

bool test_coordinator_changes_reach_subscribers(TestContext& ctx) {
  CoordinatorRig rig(ctx);
  rig.http.total_bytes = 10000000;

  // Cancelled before any sample could report it.
  auto early = rig.submit("http://example.com/early.bin");
  rig.coordinator->cancel(early);
  HAUL_CHECK(rig.wait_event(early, DownloadStatus::Cancelled));

  // A silent transport downgrades to Pending, then losing it is an error.
  auto quiet = rig.submit("http://example.com/quiet.bin");
  HAUL_CHECK(rig.wait_bytes_above(quiet, 0));
  HAUL_CHECK(rig.wait_event(quiet, DownloadStatus::Active));
  rig.http.set_unreachable(true);
  HAUL_CHECK(rig.wait_status(quiet, DownloadStatus::Pending, 2s));
  HAUL_CHECK(rig.wait_event(quiet, DownloadStatus::Pending));
  rig.http.emit_health(BackendHealth::Lost);
  HAUL_CHECK(rig.wait_event(quiet, DownloadStatus::Error));
  auto failed = rig.last_event(quiet);
  HAUL_CHECK(failed && failed->error.rfind("StartupError: ", 0) == 0);

  // Retry is announced before the backend answers.
  rig.http.set_unreachable(false);
  std::size_t before_retry = rig.progress_events(quiet);
  rig.coordinator->retry(quiet);
  HAUL_CHECK(wait_for_condition([&]{ return rig.progress_events(quiet) > before_retry; }, 2s));
  HAUL_CHECK(rig.wait_status(quiet, DownloadStatus::Active));

  // Reattach failure.
  rig.http.set_fail_reattach(true);
  rig.http.emit_health(BackendHealth::Recovered);
  HAUL_CHECK(wait_for_condition([&]{
    auto last = rig.last_event(quiet);
    return last && last->status == DownloadStatus::Error && last->error == "TransferError: task vanished";
  }, 2s));

  // Seeding stopped by command.
  auto swarm = rig.submit(kMagnet);
  HAUL_CHECK(rig.wait_status(swarm, DownloadStatus::Seeding));
  rig.coordinator->stop_seeding(swarm);
  HAUL_CHECK(rig.wait_event(swarm, DownloadStatus::Completed));
  auto stopped = rig.last_event(swarm);
  HAUL_CHECK(stopped && stopped->status == DownloadStatus::Completed);
  HAUL_CHECK(stopped->upload_speed == 0);
  HAUL_CHECK(!rig.ratio_out_of_range);
  return true;
}

bool test_cancel_of_failed_download_keeps_error(TestContext& ctx) {
  CoordinatorRig rig(ctx);
  auto id = rig.submit("http://example.com/broken.bin", CleanupPolicy::Temp);
  HAUL_CHECK(rig.wait_status(id, DownloadStatus::Error));
  auto error = rig.get(id).error;
  HAUL_CHECK(rig.http.task_count() == 1);

  rig.coordinator->cancel(id);
  HAUL_CHECK(wait_for_condition([&]{ return rig.http.count("cancel") == 1; }, 2s));
  HAUL_CHECK(rig.http.count("cancel_temp") == 1);
  HAUL_CHECK(rig.http.task_count() == 0);
  std::this_thread::sleep_for(200ms);
  HAUL_CHECK(rig.get(id).status == DownloadStatus::Error);
  HAUL_CHECK(rig.get(id).error == error);
  HAUL_CHECK(!rig.saw_status(id, DownloadStatus::Cancelled));
  HAUL_CHECK(rig.history->count_for(id) == 1);
  HAUL_CHECK(rig.history->records()[0].status == DownloadStatus::Error);

  // The task is already gone; a second cancel has nothing to discard.
  rig.coordinator->cancel(id);
  std::this_thread::sleep_for(100ms);
  HAUL_CHECK(rig.http.count("cancel") == 1);
  HAUL_CHECK(rig.get(id).status == DownloadStatus::Error);
  return true;
}

} // namespace

int main(int argc, char** argv) {
  std::vector<TestCase> tests = {
    {"http_download_runs_to_completion", test_http_download_runs_to_completion},
    {"pause_resume_keeps_bytes", test_pause_resume_keeps_bytes},
    {"concurrent_downloads_pause_independently", test_concurrent_downloads_pause_independently},
    {"cancel_is_terminal", test_cancel_is_terminal},
    {"cancel_before_start_leaves_nothing", test_cancel_before_start_leaves_nothing},
    {"illegal_commands_are_rejected", test_illegal_commands_are_rejected},
    {"rejected_urls_create_no_record", test_rejected_urls_create_no_record},
    {"start_failure_becomes_error", test_start_failure_becomes_error},
    {"retry_after_transient_failure", test_retry_after_transient_failure},
    {"silent_transport_never_reports_active", test_silent_transport_never_reports_active},
    {"lost_transport_fails_its_records", test_lost_transport_fails_its_records},
    {"recovered_transport_reattaches", test_recovered_transport_reattaches},
    {"unrecoverable_reattach_is_error", test_unrecoverable_reattach_is_error},
    {"swarm_download_seeds_until_stopped", test_swarm_download_seeds_until_stopped},
    {"swarm_pause_while_waiting_for_metadata", test_swarm_pause_while_waiting_for_metadata},
    {"clear_and_clear_finished", test_clear_and_clear_finished},
    {"refused_pause_reverts", test_refused_pause_reverts},
    {"publisher_isolates_subscribers", test_publisher_isolates_subscribers},
    {"same_target_is_not_shared", test_same_target_is_not_shared},
    {"finished_target_gets_a_fresh_task", test_finished_target_gets_a_fresh_task},
    {"same_swarm_is_not_shared", test_same_swarm_is_not_shared},
    {"coordinator_changes_reach_subscribers", test_coordinator_changes_reach_subscribers},
    {"cancel_of_failed_download_keeps_error", test_cancel_of_failed_download_keeps_error}
  };
  return haul::test::run_tests("coordinator", argc, argv, tests);
}
