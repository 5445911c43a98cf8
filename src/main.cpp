#include <fcntl.h>
#include <unistd.h>
#include <fstream>
#include <iostream>
#include <filesystem>

#include <tortellini.hh>
#include <spdlog/spdlog.h>
#include <argparse/argparse.hpp>
#include <gymjudge/paths.h>
#include <gymjudge/logger.h>
#include <gymjudge/sandbox.h>
#include <gymjudge/tracker.h>
#include <gymjudge/cjail_backend.h>
#include "server_io.h"

namespace {

bool to_lock = true;
int max_parallel = 4;

bool ParseConfig(const fs::path& conf_path) {
  std::ifstream fin(conf_path);
  if (!fin) return false;
  tortellini::ini ini;
  fin >> ini;
  std::string box_root = ini[""]["box_root"] | "";
  if (box_root.size()) kBoxRoot = box_root;
  kListenHost = ini[""]["listen_host"] | kListenHost;
  kPort = ini[""]["port"] | kPort;
  kWsPort = ini[""]["ws_port"] | kWsPort;
  max_parallel = ini[""]["max_parallel"] | max_parallel;
  kRetentionSec = ini[""]["retention_sec"] | kRetentionSec;
  kMaxLogKiB = ini[""]["max_log_kib"] | kMaxLogKiB;
  kKillGraceMs = ini[""]["kill_grace_ms"] | kKillGraceMs;
  return true;
}

void ParseArgs(int argc, char** argv) {
  int verbosity = 0;
  argparse::ArgumentParser parser(argc ? argv[0] : "gymjudge-runner");
  parser.add_argument("-c", "--config")
    .required().default_value(std::string("/etc/gymjudge-runner.conf"))
    .help("Path of configuration file");
  parser.add_argument("-v", "--verbose")
    .action([&](const auto &) { ++verbosity; })
    .append().default_value(false).implicit_value(true).nargs(0)
    .help("Verbose level");
  parser.add_argument("-p", "--parallel")
    .scan<'d', int>()
    .help("Number of sandboxes running at once");
  parser.add_argument("--port")
    .scan<'d', int>()
    .help("HTTP port");
  parser.add_argument("--ws-port")
    .scan<'d', int>()
    .help("Websocket stream port");
  parser.add_argument("--no-lock")
    .default_value(false)
    .implicit_value(true)
    .help("Not check for other running instances");

  try {
    parser.parse_args(argc, argv);
  } catch (const std::runtime_error& err) {
    std::cerr << err.what() << std::endl;
    std::cerr << parser;
    exit(1);
  }

  switch (verbosity) {
    case 0: spdlog::set_level(spdlog::level::warn); break;
    case 1: spdlog::set_level(spdlog::level::info); break;
    default: spdlog::set_level(spdlog::level::debug); break;
  }
  fs::path config_file = parser.get<std::string>("--config");
  if (!ParseConfig(config_file)) {
    spdlog::error("Failed to parse configuration file {}", std::string(config_file));
    exit(1);
  }
  if (auto val = parser.present<int>("--parallel")) max_parallel = val.value();
  if (auto val = parser.present<int>("--port")) kPort = val.value();
  if (auto val = parser.present<int>("--ws-port")) kWsPort = val.value();
  to_lock = parser["--no-lock"] == false;
}

bool LockFile() {
  fs::path lock_file = kBoxRoot / "lock";
  int fd = open(lock_file.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
  if (fd < 0) return false;
  struct flock lock{};
  lock.l_type = F_WRLCK;
  lock.l_whence = SEEK_SET;
  lock.l_start = lock.l_len = 0;
  if (fcntl(fd, F_SETLK, &lock) < 0) return false;
  return true;
}

} // namespace

int main(int argc, char** argv) {
  spdlog::set_pattern("[%t] %+");
  InitLogger();
  if (geteuid() != 0) {
    spdlog::error("Must be run as root.");
    return 1;
  }
  ParseArgs(argc, argv);
  std::error_code ec;
  fs::create_directories(kBoxRoot, ec);
  if (ec) {
    spdlog::error("Cannot create box root {}: {}", kBoxRoot.c_str(), ec.message());
    return 1;
  }
  if (to_lock && !LockFile()) {
    spdlog::error("Another runner instance is running.");
    return 1;
  }
  SubmissionTracker tracker;
  CJailBackend backend;
  SandboxManager manager(tracker, backend, max_parallel);
  return ServerWorkLoop(manager, tracker) ? 0 : 1;
}
