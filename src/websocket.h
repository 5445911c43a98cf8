#ifndef WEBSOCKET_H_
#define WEBSOCKET_H_

#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include <websocketpp/config/asio_no_tls.hpp>
#include <websocketpp/config/asio_no_tls_client.hpp>
#include <websocketpp/client.hpp>
#include <websocketpp/server.hpp>

// Plain-text websocket client running its own asio thread
class WsClient {
 public:
  using Client = websocketpp::client<websocketpp::config::asio_client>;
  using Handle = websocketpp::connection_hdl;

 private:
  Client client_;
  std::unique_ptr<std::thread> thr_;
  std::string url_;
  Handle hdl_;
  std::atomic_bool connected_;

  void OnOpen_(Handle hdl);
  void OnClose_(Handle);

 public:
  explicit WsClient(const std::string& url);
  virtual ~WsClient();

  bool IsConnected() const { return connected_; }

  // Called from the asio thread; must not block.
  // Subclasses must call Shutdown() in their destructor, so no callback reaches a destroyed subclass
  virtual void OnOpen() {}
  virtual void OnFail() {}
  virtual void OnClose() {}
  virtual void OnMessage(const std::string&) {}

  // Starts connecting; false if the url is invalid
  bool Connect();
  bool Close();
  // Stops the asio thread; idempotent
  void Shutdown();
};

constexpr long kPongTimeoutMs = 5000;

// Plain-text websocket server; every connection is handed to OnOpen with its request path
class WsServer {
 public:
  using Server = websocketpp::server<websocketpp::config::asio>;
  using Handle = websocketpp::connection_hdl;
 private:
  Server server_;
 public:
  WsServer();
  virtual ~WsServer() = default;

  // Called from the asio thread; must not block
  virtual void OnOpen(Handle hdl, const std::string& resource) = 0;

  bool Listen(const std::string& host, int port);
  // Blocks until Stop()
  void Run();
  void Stop();
  // Thread-safe
  bool Send(Handle hdl, const std::string& str);
  bool Close(Handle hdl);
  bool IsOpen(Handle hdl);
  // A ping left unanswered for kPongTimeoutMs closes the connection
  bool Ping(Handle hdl);
};

#endif // WEBSOCKET_H_
