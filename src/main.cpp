#include <signal.h>
#include <unistd.h>
#include <thread>
#include <sstream>
#include <fstream>
#include <iostream>
#include <filesystem>

#include <tortellini.hh>
#include <spdlog/spdlog.h>
#include <argparse/argparse.hpp>
#include <execbox/logger.h>
#include <execbox/paths.h>
#include <execbox/service.h>
#include "execbox/utils.h"
#include "server_io.h"

namespace {

std::vector<std::string> SplitList(const std::string& str, char delim) {
  std::vector<std::string> ret;
  std::stringstream ss(str);
  for (std::string item; std::getline(ss, item, delim);) {
    if (item.size()) ret.push_back(item);
  }
  return ret;
}

bool ParseConfig(const fs::path& conf_path) {
  std::ifstream fin(conf_path);
  if (!fin) return false;
  tortellini::ini ini;
  fin >> ini;
  std::string work_root = ini[""]["work_root"] | "";
  std::string interpreter = ini[""]["interpreter"] | "";
  std::string host = ini[""]["host"] | "";
  std::string scrub_env = ini[""]["scrub_env"] | "";
  if (work_root.size()) kWorkRoot = work_root;
  if (interpreter.size()) kInterpreter = SplitList(interpreter, ' ');
  if (host.size()) kListenHost = host;
  if (scrub_env.size()) kScrubEnv = SplitList(scrub_env, ',');
  kListenPort = ini[""]["port"] | kListenPort;
  kServerThreads = ini[""]["threads"] | kServerThreads;
  kDefaultTimeoutMs = ini[""]["default_timeout_ms"] | kDefaultTimeoutMs;
  kMaxTimeoutMs = ini[""]["max_timeout_ms"] | kMaxTimeoutMs;
  kMaxOutputBytes = ini[""]["max_output_bytes"] | kMaxOutputBytes;
  return true;
}

void ParseArgs(int argc, char** argv) {
  int verbosity = 0;
  argparse::ArgumentParser parser(argc ? argv[0] : "execbox-server");
  parser.add_argument("-c", "--config")
    .default_value(std::string("/etc/execbox.conf"))
    .help("Path of configuration file");
  parser.add_argument("-v", "--verbose")
    .action([&](const auto &) { ++verbosity; })
    .append().default_value(false).implicit_value(true).nargs(0)
    .help("Verbose level");
  parser.add_argument("-p", "--port")
    .scan<'d', int>()
    .help("Port to listen on");
  parser.add_argument("--host")
    .help("Address to listen on");
  parser.add_argument("--work-root")
    .help("Directory holding session and transient working directories");

  try {
    parser.parse_args(argc, argv);
  } catch (const std::runtime_error& err) {
    std::cerr << err.what() << std::endl;
    std::cerr << parser;
    exit(1);
  }

  InitLogger(verbosity);
  fs::path config_file = parser.get<std::string>("--config");
  if (!ParseConfig(config_file)) {
    // the default location is optional
    if (parser.is_used("--config")) {
      spdlog::error("Failed to parse configuration file {}", config_file.c_str());
      exit(1);
    }
    spdlog::info("No configuration file at {}, using defaults", config_file.c_str());
  }
  if (auto val = parser.present<int>("--port")) kListenPort = val.value();
  if (auto val = parser.present("--host")) kListenHost = val.value();
  if (auto val = parser.present("--work-root")) kWorkRoot = val.value();
}

} // namespace

int main(int argc, char** argv) {
  ParseArgs(argc, argv);
  if (geteuid() == 0) {
    spdlog::warn("Running as root; executed code has root privileges.");
  }
  if (!CreateDirs(kWorkRoot, kPerm700)) {
    spdlog::error("Cannot create work root {}", kWorkRoot.c_str());
    return 1;
  }

  // handled by the waiter thread; every other thread inherits the mask
  sigset_t set;
  sigemptyset(&set);
  sigaddset(&set, SIGINT);
  sigaddset(&set, SIGTERM);
  pthread_sigmask(SIG_BLOCK, &set, nullptr);
  std::thread([set]() {
    int sig = 0;
    sigwait(&set, &sig);
    spdlog::warn("Received signal {}, shutting down", sig);
    StopServer();
  }).detach();

  SecurityAnalyzer analyzer;
  InMemorySessionStore store;
  ProcessExecutor executor;
  ExecutionService service(analyzer, store, executor);
  bool ok = ServerWorkLoop(service);
  store.Clear();
  return ok ? 0 : 1;
}
