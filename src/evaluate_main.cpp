#include <fstream>
#include <iostream>
#include <sstream>
#include <filesystem>

#include <tortellini.hh>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <argparse/argparse.hpp>
#include <gymjudge/judge.h>
#include <gymjudge/utils.h>
#include <gymjudge/errors.h>
#include <gymjudge/logger.h>
#include "database.h"
#include "runner_client.h"

namespace fs = std::filesystem;

namespace {

std::string runner_url = "http://localhost:8080";
std::string ws_url = "ws://localhost:8081";
std::string task_specs_dir = "/etc/gymjudge/tasks";
std::string database = "";
long grace_sec = 5;
long poll_initial_ms = 500;
double poll_multiplier = 1.5;
long poll_cap_ms = 2000;

bool ParseConfig(const fs::path& conf_path) {
  std::ifstream fin(conf_path);
  if (!fin) return false;
  tortellini::ini ini;
  fin >> ini;
  runner_url = ini[""]["runner_url"] | runner_url;
  ws_url = ini[""]["ws_url"] | ws_url;
  task_specs_dir = ini[""]["task_specs_dir"] | task_specs_dir;
  database = ini[""]["database"] | database;
  grace_sec = ini[""]["grace_sec"] | grace_sec;
  poll_initial_ms = ini[""]["poll_initial_ms"] | poll_initial_ms;
  poll_multiplier = ini[""]["poll_multiplier"] | poll_multiplier;
  poll_cap_ms = ini[""]["poll_cap_ms"] | poll_cap_ms;
  return true;
}

struct Arguments {
  std::string episode_id;
  std::string task_id;
  fs::path code_file;
};

Arguments ParseArgs(int argc, char** argv) {
  int verbosity = 0;
  argparse::ArgumentParser parser(argc ? argv[0] : "gymjudge-evaluate");
  parser.add_argument("task")
    .help("Task id");
  parser.add_argument("code")
    .help("Path of the code artifact");
  parser.add_argument("-e", "--episode")
    .required()
    .help("Episode id; also used as the submission id");
  parser.add_argument("-c", "--config")
    .required().default_value(std::string("/etc/gymjudge-evaluate.conf"))
    .help("Path of configuration file");
  parser.add_argument("-v", "--verbose")
    .action([&](const auto &) { ++verbosity; })
    .append().default_value(false).implicit_value(true).nargs(0)
    .help("Verbose level");
  parser.add_argument("--runner")
    .help("Runner base URL");
  parser.add_argument("--no-stream")
    .default_value(false)
    .implicit_value(true)
    .help("Poll instead of subscribing to the stream");

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
  if (auto val = parser.present("--runner")) runner_url = val.value();
  if (parser["--no-stream"] == true) ws_url.clear();
  return {parser.get<std::string>("--episode"), parser.get<std::string>("task"),
          parser.get<std::string>("code")};
}

} // namespace

int main(int argc, char** argv) {
  spdlog::set_pattern("[%t] %+");
  InitLogger();
  Arguments args = ParseArgs(argc, argv);

  std::ifstream fin(args.code_file, std::ios::binary);
  if (!fin) {
    spdlog::error("Cannot read {}", args.code_file.c_str());
    return 1;
  }
  std::stringstream code;
  code << fin.rdbuf();

  TaskSpecRegistry registry;
  registry.LoadDirectory(task_specs_dir);

  using std::chrono::milliseconds;
  BackoffPolicy poll(milliseconds(poll_initial_ms), poll_multiplier, milliseconds(poll_cap_ms),
                     std::chrono::seconds(grace_sec));
  HttpRunnerClient client(runner_url, ws_url, poll);
  client.Health();
  JudgeOrchestrator orchestrator(client, poll, std::chrono::seconds(grace_sec));

  std::unique_ptr<SqliteEpisodeStore> store;
  if (!database.empty()) store = std::make_unique<SqliteEpisodeStore>(database);
  JudgeService service(registry, orchestrator, store.get());
  try {
    JudgeResult result = service.Evaluate(args.episode_id, args.task_id, code.str());
    std::cout << JudgeResultJSON(result).dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
  } catch (ValidationError& e) {
    spdlog::error("Rejected: {}", e.what());
    return 2;
  }
}
