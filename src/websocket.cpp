#include "websocket.h"

#include <spdlog/spdlog.h>

WsClient::WsClient(const std::string& url) : url_(url), connected_(false) {
  client_.clear_access_channels(websocketpp::log::alevel::all);
  client_.clear_error_channels(websocketpp::log::elevel::all);
  client_.init_asio();
  client_.start_perpetual();
  thr_ = std::make_unique<std::thread>([this]() { client_.run(); });
}

WsClient::~WsClient() {
  Shutdown();
}

void WsClient::OnOpen_(Handle hdl) {
  hdl_ = hdl;
  connected_ = true;
  OnOpen();
}

void WsClient::OnClose_(Handle) {
  connected_ = false;
  OnClose();
}

bool WsClient::Connect() {
  websocketpp::lib::error_code ec;
  Client::connection_ptr conn = client_.get_connection(url_, ec);
  if (ec) {
    spdlog::info("Invalid websocket url {}: {}", url_, ec.message());
    return false;
  }
  conn->set_open_handler([this](Handle hdl) { OnOpen_(hdl); });
  conn->set_fail_handler([this](Handle) { OnFail(); });
  conn->set_close_handler([this](Handle hdl) { OnClose_(hdl); });
  conn->set_message_handler([this](Handle, Client::message_ptr msg) {
    OnMessage(msg->get_payload());
  });
  client_.connect(conn);
  return true;
}

bool WsClient::Close() {
  if (!connected_) return false;
  websocketpp::lib::error_code ec;
  client_.close(hdl_, websocketpp::close::status::normal, "", ec);
  return !ec;
}

void WsClient::Shutdown() {
  if (!thr_) return;
  client_.stop_perpetual();
  if (connected_) {
    websocketpp::lib::error_code ec;
    client_.close(hdl_, websocketpp::close::status::going_away, "", ec);
  }
  thr_->join();
  thr_.reset();
}

WsServer::WsServer() {
  server_.clear_access_channels(websocketpp::log::alevel::all);
  server_.clear_error_channels(websocketpp::log::elevel::all);
  server_.init_asio();
  server_.set_reuse_addr(true);
  server_.set_pong_timeout(kPongTimeoutMs);
  server_.set_pong_timeout_handler([this](Handle hdl, std::string) {
    spdlog::info("Websocket peer stopped answering pings");
    websocketpp::lib::error_code ec;
    server_.close(hdl, websocketpp::close::status::going_away, "", ec);
  });
  server_.set_open_handler([this](Handle hdl) {
    websocketpp::lib::error_code ec;
    auto conn = server_.get_con_from_hdl(hdl, ec);
    if (ec) return;
    OnOpen(hdl, conn->get_resource());
  });
}

bool WsServer::Listen(const std::string& host, int port) {
  websocketpp::lib::error_code ec;
  server_.listen(host, std::to_string(port), ec);
  if (!ec) server_.start_accept(ec);
  if (ec) {
    spdlog::error("Websocket server cannot listen on {}:{}: {}", host, port, ec.message());
    return false;
  }
  return true;
}

void WsServer::Run() {
  server_.run();
}

void WsServer::Stop() {
  websocketpp::lib::error_code ec;
  server_.stop_listening(ec);
  server_.stop();
}

bool WsServer::Send(Handle hdl, const std::string& str) {
  websocketpp::lib::error_code ec;
  server_.send(hdl, str, websocketpp::frame::opcode::text, ec);
  return !ec;
}

bool WsServer::Close(Handle hdl) {
  websocketpp::lib::error_code ec;
  server_.close(hdl, websocketpp::close::status::normal, "", ec);
  return !ec;
}

bool WsServer::IsOpen(Handle hdl) {
  websocketpp::lib::error_code ec;
  auto conn = server_.get_con_from_hdl(hdl, ec);
  return !ec && conn->get_state() == websocketpp::session::state::open;
}

bool WsServer::Ping(Handle hdl) {
  websocketpp::lib::error_code ec;
  server_.ping(hdl, "", ec);
  return !ec;
}
