#include "server_io.h"

#include <thread>
#include <chrono>

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <gymjudge/utils.h>
#include <gymjudge/errors.h>
#include <gymjudge/delivery.h>

std::string kListenHost = "0.0.0.0";
int kPort = 8080;
int kWsPort = 8081;
long kRetentionSec = 300;

namespace {

const char kStreamPrefix[] = "/ws/solutions/";
constexpr std::chrono::seconds kStreamPingInterval(10);
constexpr std::chrono::seconds kJanitorInterval(10);

void Reply(httplib::Response& res, int status, const nlohmann::json& body) {
  res.status = status;
  res.set_content(body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace),
                  "application/json");
}

void ReplyError(httplib::Response& res, int status, const std::string& error) {
  Reply(res, status, {{"status", "error"}, {"error", error}});
}

void Submit(SandboxManager& manager, const httplib::Request& req, httplib::Response& res) {
  try {
    auto spec = ParseExecutionSpec(nlohmann::json::parse(req.body));
    manager.Start(spec);
    Reply(res, 202, {{"status", "accepted"}, {"submission_id", spec.submission_id}});
  } catch (nlohmann::json::exception& e) {
    ReplyError(res, 400, std::string("malformed JSON: ") + e.what());
  } catch (ConflictError& e) {
    ReplyError(res, 409, e.what());
  } catch (ValidationError& e) {
    ReplyError(res, 400, e.what());
  } catch (SandboxError& e) {
    ReplyError(res, 503, e.what());
  } catch (std::exception& e) {
    spdlog::error("Submit failed: {}", e.what());
    ReplyError(res, 500, e.what());
  }
}

} // namespace

void RegisterRoutes(httplib::Server& server, SandboxManager& manager, SubmissionTracker& tracker) {
  server.Get("/health", [](const httplib::Request&, httplib::Response& res) {
    Reply(res, 200, {{"status", "healthy"}});
  });
  server.Post("/solutions", [&manager](const httplib::Request& req, httplib::Response& res) {
    Submit(manager, req, res);
  });
  server.Get(R"(/solutions/([^/]+))", [&tracker](const httplib::Request& req, httplib::Response& res) {
    std::string id = req.matches[1];
    auto snapshot = tracker.Get(id);
    if (!snapshot) {
      Reply(res, 404, SnapshotJSON(ExecutionOutcome::NotFound(id)));
      return;
    }
    Reply(res, 200, SnapshotJSON(*snapshot));
  });
  server.Delete(R"(/solutions/([^/]+))", [&manager](const httplib::Request& req, httplib::Response& res) {
    std::string id = req.matches[1];
    Reply(res, 200, SnapshotJSON(manager.Stop(id)));
  });
}

StreamServer::~StreamServer() {
  Stop();
  std::unique_lock lck(mtx_);
  cv_.wait(lck, [this]{ return streams_ == 0; });
}

void StreamServer::OnOpen(Handle hdl, const std::string& resource) {
  std::string prefix = kStreamPrefix;
  if (resource.compare(0, prefix.size(), prefix) != 0 || resource.size() == prefix.size()) {
    spdlog::info("Rejected stream request {}", resource);
    Close(hdl);
    return;
  }
  std::string id = httplib::detail::decode_url(resource.substr(prefix.size()), false);
  {
    std::lock_guard lck(mtx_);
    streams_++;
  }
  std::thread([this, hdl, id]() {
    spdlog::debug("Stream of {} opened", id);
    auto last_ping = std::chrono::steady_clock::now();
    int sent = WatchSubmission(tracker_, id, [&](const ExecutionOutcome& snapshot) {
      return Send(hdl, SnapshotJSON(snapshot).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
    }, kWatchInterval, [&]() {
      if (!IsOpen(hdl)) return false;
      // a vanished peer never sends a close frame
      if (auto now = std::chrono::steady_clock::now(); now - last_ping >= kStreamPingInterval) {
        last_ping = now;
        return Ping(hdl);
      }
      return true;
    });
    Close(hdl);
    spdlog::debug("Stream of {} closed after {} snapshots", id, sent);
    std::lock_guard lck(mtx_);
    streams_--;
    cv_.notify_all();
  }).detach();
}

void StreamWorkLoop(SubmissionTracker& tracker) {
  StreamServer server(tracker);
  if (!server.Listen(kListenHost, kWsPort)) return;
  spdlog::info("Streaming on {}:{}", kListenHost, kWsPort);
  server.Run();
}

void JanitorWorkLoop(SubmissionTracker& tracker) {
  while (true) {
    std::this_thread::sleep_for(kJanitorInterval);
    size_t evicted = tracker.EvictExpired(std::chrono::seconds(kRetentionSec));
    if (evicted) spdlog::info("Evicted {} expired submissions, {} tracked", evicted, tracker.Size());
  }
}

bool ServerWorkLoop(SandboxManager& manager, SubmissionTracker& tracker) {
  // main thread: HTTP
  // thread 2: websocket stream (plus one thread per subscriber)
  // thread 3: janitor
  std::thread(StreamWorkLoop, std::ref(tracker)).detach();
  std::thread(JanitorWorkLoop, std::ref(tracker)).detach();
  httplib::Server server;
  RegisterRoutes(server, manager, tracker);
  spdlog::info("Listening on {}:{}", kListenHost, kPort);
  if (!server.listen(kListenHost.c_str(), kPort)) {
    spdlog::error("Cannot listen on {}:{}", kListenHost, kPort);
    return false;
  }
  return true;
}
