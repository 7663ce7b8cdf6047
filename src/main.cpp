#include <signal.h>
#include <iostream>
#include <filesystem>

#include <spdlog/spdlog.h>
#include <argparse/argparse.hpp>
#include "judgebox/config.h"
#include "judgebox/database.h"
#include "judgebox/judge.h"
#include "judgebox/logger.h"
#include "judgebox/probe.h"
#include "judgebox/queue.h"
#include "judgebox/runner.h"
#include "judgebox/runner_service.h"
#include "judgebox/scoring.h"
#include "judgebox/utils.h"
#include "judgebox/worker.h"

namespace {

JudgeWorker* worker = nullptr;

void ParseArgs(int argc, char** argv) {
  int verbosity = 0;
  argparse::ArgumentParser parser(argc ? argv[0] : "judgebox-worker");
  parser.add_argument("-c", "--config")
    .required().default_value(std::string("/etc/judgebox.conf"))
    .help("Path of configuration file");
  parser.add_argument("-v", "--verbose")
    .action([&](const auto &) { ++verbosity; })
    .append().default_value(false).implicit_value(true).nargs(0)
    .help("Verbose level");
  parser.add_argument("-m", "--mode")
    .help("Execution mode: local, container or auto");

  try {
    parser.parse_args(argc, argv);
  } catch (const std::runtime_error& err) {
    std::cerr << err.what() << std::endl;
    std::cerr << parser;
    exit(1);
  }

  SetVerbosity(verbosity);
  fs::path config_file = parser.get<std::string>("--config");
  if (fs::exists(config_file) && !LoadConfig(config_file)) {
    spdlog::error("Failed to parse configuration file {}", std::string(config_file));
    exit(1);
  }
  if (!LoadEnvironment()) exit(1);
  if (auto mode = parser.present("--mode")) {
    auto parsed = ParseExecutionMode(*mode);
    if (!parsed) {
      spdlog::error("Invalid execution mode {}", *mode);
      exit(1);
    }
    kExecutionMode = *parsed;
  }
}

void HandleStop(int) {
  if (worker) worker->Stop();
}

} // namespace

int main(int argc, char** argv) {
  InitLogger();
  ParseArgs(argc, argv);
  if (!kJudgeEnabled) {
    spdlog::error("Judging is disabled in the configuration.");
    return 1;
  }
  if (kQueuePath.has_parent_path() && !CreateDirs(kQueuePath.parent_path())) return 1;
  spdlog::info("Execution mode {}, work root {}", ExecutionModeName(kExecutionMode), kWorkRoot.c_str());

  ProcessRunner process_runner;
  ContainerRunner container_runner(process_runner, kContainerCpus);
  SystemProbe probe(process_runner);
  RunnerService runner(probe, process_runner, container_runner, kExecutionMode, kWorkRoot);
  Database db(kDatabasePath);
  // other workers may share the queue file; jobs of dead workers come back when their lease runs out
  SqliteWorkQueue queue(kQueuePath);
  JudgeService judge(db, runner, kJudgeEnabled);
  DefaultScoringEngine scoring(db);
  JudgeWorker judge_worker(db, queue, judge, scoring);

  worker = &judge_worker;
  struct sigaction act{};
  act.sa_handler = HandleStop;
  sigaction(SIGINT, &act, nullptr);
  sigaction(SIGTERM, &act, nullptr);
  judge_worker.WorkLoop();
}
