#include <fstream>
#include <sstream>
#include <iostream>

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <argparse/argparse.hpp>
#include "judgebox/config.h"
#include "judgebox/database.h"
#include "judgebox/dispatcher.h"
#include "judgebox/errors.h"
#include "judgebox/logger.h"
#include "judgebox/queue.h"

namespace {

using nlohmann::json;

json SubmissionJson(const Submission& sub) {
  json ret = {
    {"id", sub.id},
    {"challenge_id", sub.challenge_id},
    {"user_id", sub.user_id},
    {"language", LanguageName(sub.language)},
    {"status", SubmissionStatusName(sub.status)},
    {"judge_status", JudgeStatusName(sub.judge_status)},
    {"judge_error", sub.judge_error ? json(*sub.judge_error) : json(nullptr)},
    {"judge_run_id", sub.judge_run_id ? json(*sub.judge_run_id) : json(nullptr)},
  };
  if (sub.score) ret["score"] = *sub.score;
  if (sub.trust_score) ret["trust_score"] = *sub.trust_score;
  if (sub.trust_level) ret["trust_level"] = *sub.trust_level;
  return ret;
}

json RunJson(const Run& run) {
  json ret = {
    {"id", run.id},
    {"submission_id", run.submission_id},
    {"language", LanguageName(run.language)},
    {"status", RunStatusName(run.status)},
    {"score_correctness", run.score_correctness},
    {"score_efficiency", run.score_efficiency},
    {"score_style", run.score_style},
    {"test_passed", run.test_passed},
    {"test_total", run.test_total},
    {"runtime_ms", run.runtime_ms},
    {"memory_mb", run.memory_mb},
    {"error_message", run.error_message ? json(*run.error_message) : json(nullptr)},
    {"started_at", run.started_at},
    {"finished_at", run.finished_at ? json(*run.finished_at) : json(nullptr)},
  };
  if (run.tests.size()) {
    json tests = json::array();
    for (auto& i : run.tests) {
      tests.push_back({
        {"test_case_id", i.test_case_id},
        {"status", TestStatusName(i.status)},
        {"runtime_ms", i.runtime_ms},
        {"output", i.output},
        {"error", i.error ? json(*i.error) : json(nullptr)},
        {"points_awarded", i.points_awarded},
      });
    }
    ret["tests"] = std::move(tests);
  }
  return ret;
}

std::string ReadFile(const std::string& path) {
  std::ifstream fin(path, std::ios::binary);
  if (!fin) throw ValidationError("Cannot read " + path);
  std::stringstream ss;
  ss << fin.rdbuf();
  return ss.str();
}

std::unique_ptr<WorkQueue> OpenQueue() {
  if (!kJudgeEnabled) return std::make_unique<DisabledWorkQueue>();
  return std::make_unique<SqliteWorkQueue>(kQueuePath);
}

} // namespace

int main(int argc, char** argv) {
  InitLogger();
  int verbosity = 0;
  argparse::ArgumentParser parser(argc ? argv[0] : "judgebox-admin");
  parser.add_argument("-c", "--config")
    .default_value(std::string("/etc/judgebox.conf"))
    .help("Path of configuration file");
  parser.add_argument("-v", "--verbose")
    .action([&](const auto &) { ++verbosity; })
    .append().default_value(false).implicit_value(true).nargs(0)
    .help("Verbose level");

  argparse::ArgumentParser submit_cmd("submit");
  submit_cmd.add_description("Create a submission and queue it for judging");
  submit_cmd.add_argument("challenge");
  submit_cmd.add_argument("user");
  submit_cmd.add_argument("language");
  submit_cmd.add_argument("source");
  submit_cmd.add_argument("--session");

  argparse::ArgumentParser retry_cmd("retry");
  retry_cmd.add_description("Re-queue the judge of a submission");
  retry_cmd.add_argument("submission");

  argparse::ArgumentParser retry_run_cmd("retry-run");
  retry_run_cmd.add_description("Re-queue the judge of the submission a run belongs to");
  retry_run_cmd.add_argument("run").scan<'d', int64_t>();

  argparse::ArgumentParser show_cmd("show");
  show_cmd.add_description("Show a submission and its run history");
  show_cmd.add_argument("submission");

  argparse::ArgumentParser run_cmd("run");
  run_cmd.add_description("Show a run with its test results");
  run_cmd.add_argument("run").scan<'d', int64_t>();

  argparse::ArgumentParser counts_cmd("counts");
  counts_cmd.add_description("Show judge queue counts");

  argparse::ArgumentParser add_test_cmd("add-test");
  add_test_cmd.add_description("Add or replace a test case of a challenge");
  add_test_cmd.add_argument("challenge");
  add_test_cmd.add_argument("id");
  add_test_cmd.add_argument("input").help("File holding the input");
  add_test_cmd.add_argument("output").help("File holding the expected output");
  add_test_cmd.add_argument("--timeout").scan<'d', long>().default_value(5000L);
  add_test_cmd.add_argument("--memory").scan<'d', long>().default_value(256L);
  add_test_cmd.add_argument("--points").scan<'d', int>().default_value(1);
  add_test_cmd.add_argument("--order").scan<'d', int>().default_value(0);

  argparse::ArgumentParser baseline_cmd("set-baseline");
  baseline_cmd.add_description("Set the reference runtime of a challenge for a language");
  baseline_cmd.add_argument("challenge");
  baseline_cmd.add_argument("language");
  baseline_cmd.add_argument("runtime").scan<'d', long>();

  for (auto cmd : {&submit_cmd, &retry_cmd, &retry_run_cmd, &show_cmd, &run_cmd, &counts_cmd,
                   &add_test_cmd, &baseline_cmd}) {
    parser.add_subparser(*cmd);
  }

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

  Database db(kDatabasePath);
  try {
    if (parser.is_subcommand_used(submit_cmd)) {
      auto queue = OpenQueue();
      Dispatcher dispatcher(db, *queue, kEnqueueTimeoutMs);
      NewSubmission req;
      req.challenge_id = submit_cmd.get<std::string>("challenge");
      req.user_id = submit_cmd.get<std::string>("user");
      req.language = submit_cmd.get<std::string>("language");
      req.code = ReadFile(submit_cmd.get<std::string>("source"));
      req.session_id = submit_cmd.present("--session");
      std::cout << SubmissionJson(dispatcher.Submit(req)).dump(2) << std::endl;
    } else if (parser.is_subcommand_used(retry_cmd)) {
      auto queue = OpenQueue();
      Dispatcher dispatcher(db, *queue, kEnqueueTimeoutMs);
      std::cout << SubmissionJson(dispatcher.RetrySubmission(retry_cmd.get<std::string>("submission"))).dump(2)
                << std::endl;
    } else if (parser.is_subcommand_used(retry_run_cmd)) {
      auto queue = OpenQueue();
      Dispatcher dispatcher(db, *queue, kEnqueueTimeoutMs);
      std::cout << SubmissionJson(dispatcher.RetryRun(retry_run_cmd.get<int64_t>("run"))).dump(2) << std::endl;
    } else if (parser.is_subcommand_used(show_cmd)) {
      std::string id = show_cmd.get<std::string>("submission");
      auto sub = db.GetSubmission(id);
      if (!sub) throw ValidationError("Submission " + id + " not found");
      json out = SubmissionJson(*sub);
      out["runs"] = json::array();
      for (auto& i : db.ListRuns(id)) out["runs"].push_back(RunJson(i));
      std::cout << out.dump(2) << std::endl;
    } else if (parser.is_subcommand_used(run_cmd)) {
      int64_t id = run_cmd.get<int64_t>("run");
      auto run = db.GetRunDetails(id);
      if (!run) throw ValidationError("Run " + std::to_string(id) + " not found");
      std::cout << RunJson(*run).dump(2) << std::endl;
    } else if (parser.is_subcommand_used(counts_cmd)) {
      JobCounts counts = OpenQueue()->Counts();
      std::cout << json{{"waiting", counts.waiting}, {"active", counts.active},
                        {"delayed", counts.delayed}, {"failed", counts.failed}}.dump(2) << std::endl;
    } else if (parser.is_subcommand_used(add_test_cmd)) {
      TestCase test{add_test_cmd.get<std::string>("id"),
                    ReadFile(add_test_cmd.get<std::string>("input")),
                    ReadFile(add_test_cmd.get<std::string>("output")),
                    add_test_cmd.get<long>("--timeout"), add_test_cmd.get<long>("--memory"),
                    add_test_cmd.get<int>("--points"), add_test_cmd.get<int>("--order")};
      db.UpsertTestCase(add_test_cmd.get<std::string>("challenge"), test);
    } else if (parser.is_subcommand_used(baseline_cmd)) {
      db.UpsertBaseline({baseline_cmd.get<std::string>("challenge"),
                         NormalizeLanguage(baseline_cmd.get<std::string>("language")),
                         baseline_cmd.get<long>("runtime")});
    } else {
      std::cerr << parser;
      return 1;
    }
  } catch (const JudgeboxError& err) {
    spdlog::error("{}", err.what());
    return 2;
  }
  return 0;
}
