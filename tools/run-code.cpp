#include <fstream>
#include <sstream>
#include <iostream>

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <argparse/argparse.hpp>
#include "judgebox/config.h"
#include "judgebox/errors.h"
#include "judgebox/execution.h"
#include "judgebox/logger.h"
#include "judgebox/probe.h"
#include "judgebox/runner.h"
#include "judgebox/runner_service.h"

namespace {

bool ReadAll(const std::string& path, std::string& out) {
  std::stringstream ss;
  if (path == "-") {
    ss << std::cin.rdbuf();
  } else {
    std::ifstream fin(path, std::ios::binary);
    if (!fin) return false;
    ss << fin.rdbuf();
  }
  out = ss.str();
  return true;
}

void PrintError(const char* kind, const std::string& msg) {
  std::cout << nlohmann::json{{"error", kind}, {"message", msg}}.dump() << std::endl;
}

} // namespace

int main(int argc, char** argv) {
  InitLogger();
  int verbosity = 0;
  argparse::ArgumentParser parser(argc ? argv[0] : "judgebox-run");
  parser.add_argument("source")
    .help("Source file, or - for standard input");
  parser.add_argument("-l", "--language")
    .required()
    .help("Language of the source (javascript, python, java, cpp, go, csharp or an alias)");
  parser.add_argument("-i", "--input")
    .help("File given to the program as stdin");
  parser.add_argument("-t", "--timeout")
    .scan<'d', long>()
    .help("Time limit in milliseconds");
  parser.add_argument("-M", "--memory")
    .scan<'d', long>()
    .help("Memory limit in MiB (container backend only)");
  parser.add_argument("--max-output")
    .scan<'d', long>()
    .help("Maximum bytes of stdout + stderr returned");
  parser.add_argument("-c", "--config")
    .default_value(std::string("/etc/judgebox.conf"))
    .help("Path of configuration file");
  parser.add_argument("-v", "--verbose")
    .action([&](const auto &) { ++verbosity; })
    .append().default_value(false).implicit_value(true).nargs(0)
    .help("Verbose level");

  try {
    parser.parse_args(argc, argv);
  } catch (const std::runtime_error& err) {
    std::cerr << err.what() << std::endl;
    std::cerr << parser;
    return 1;
  }
  SetVerbosity(verbosity);
  fs::path config_file = parser.get<std::string>("--config");
  if (fs::exists(config_file) && !LoadConfig(config_file)) {
    spdlog::error("Failed to parse configuration file {}", std::string(config_file));
    return 1;
  }
  if (!LoadEnvironment()) return 1;

  ExecuteCodeInput input;
  input.language = parser.get<std::string>("--language");
  if (!ReadAll(parser.get<std::string>("source"), input.code)) {
    spdlog::error("Cannot read {}", parser.get<std::string>("source"));
    return 1;
  }
  if (auto path = parser.present("--input")) {
    std::string data;
    if (!ReadAll(*path, data)) {
      spdlog::error("Cannot read {}", *path);
      return 1;
    }
    input.stdin_data = std::move(data);
  }
  input.limits.timeout_ms = parser.present<long>("--timeout");
  input.limits.memory_mb = parser.present<long>("--memory");
  input.limits.max_output_bytes = parser.present<long>("--max-output");

  ProcessRunner process_runner;
  ContainerRunner container_runner(process_runner, kContainerCpus);
  SystemProbe probe(process_runner);
  RunnerService runner(probe, process_runner, container_runner, kExecutionMode, kWorkRoot);
  HttpRemoteExecutor remote(kRemoteBaseUrl, kRemoteAccessToken, kRemoteApiKey, kRemoteTimeoutMs);
  ExecutionService service(runner, remote);

  try {
    ExecuteCodeResult res = service.RunCode(input);
    // never log the source itself
    spdlog::info("Execution: language={} provider={} exit_code={} runtime={}ms error_class={}",
                 input.language, ProviderName(res.provider), res.exit_code, res.runtime_ms,
                 res.error_class ? ErrorClassName(*res.error_class) : "none");
    std::cout << res.ToJson().dump() << std::endl;
  } catch (const ValidationError& err) {
    PrintError("validation", err.what());
    return 2;
  } catch (const InfrastructureError& err) {
    spdlog::warn("Execution failed: language={} error={}", input.language, err.what());
    PrintError("infrastructure", err.what());
    return 3;
  }
  return 0;
}
