#ifndef SERVER_IO_H_
#define SERVER_IO_H_

#include <mutex>
#include <string>
#include <condition_variable>
#include <httplib.h>
#include <gymjudge/sandbox.h>
#include <gymjudge/tracker.h>

#include "websocket.h"

extern std::string kListenHost;
extern int kPort;
extern int kWsPort;
// seconds a terminal record is kept
extern long kRetentionSec;

// HTTP surface: health, submit, snapshot and cancel
void RegisterRoutes(httplib::Server& server, SandboxManager& manager, SubmissionTracker& tracker);

// Serves /ws/solutions/{id}: one watch thread per connection, closed after the
//  terminal (or not-found) snapshot
class StreamServer : public WsServer {
  SubmissionTracker& tracker_;
  std::mutex mtx_;
  std::condition_variable cv_;
  int streams_ = 0;
 public:
  explicit StreamServer(SubmissionTracker& tracker) : tracker_(tracker) {}
  // Stops accepting and waits for the watch threads
  ~StreamServer();

  void OnOpen(Handle hdl, const std::string& resource) override;
};

// Websocket stream at /ws/solutions/{id}; every connection is served by its own thread.
// Returns only if the server cannot listen.
void StreamWorkLoop(SubmissionTracker& tracker);

// Evicts expired terminal records. It will not return.
void JanitorWorkLoop(SubmissionTracker& tracker);

// Serves HTTP on the calling thread; returns false if it cannot listen
bool ServerWorkLoop(SandboxManager& manager, SubmissionTracker& tracker);

#endif  // SERVER_IO_H_
