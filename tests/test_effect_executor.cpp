#include "effect_executor.hpp"
#include "errors.hpp"
#include "util/shell.hpp"
#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <filesystem>
#include <future>
#include <mutex>
#include <string>
#include <thread>
#include <variant>
#include <vector>

using namespace prdeck;
using namespace std::chrono_literals;

namespace {

const Repository kRepo{"acme", "widgets", "main"};

class MockGitHubApi : public GitHubApi {
public:
  std::vector<std::string> calls;
  std::string approval_message;
  bool fail_list = false;
  bool fail_rerun = false;
  PullRequestStatus status;

  std::vector<PullRequest> list_pull_requests(const Repository &repo) override {
    calls.push_back("list " + repo.key());
    if (fail_list) {
      throw GitHubError(FailureKind::NotFound, "Not Found");
    }
    PullRequest pr;
    pr.number = 1;
    pr.title = "feat: one";
    return {pr};
  }
  PullRequestStatus pull_request_status(const Repository &, int number) override {
    calls.push_back("status " + std::to_string(number));
    return status;
  }
  void merge(const Repository &, int number) override {
    calls.push_back("merge " + std::to_string(number));
    throw HttpStatusError(409, "Head branch was modified");
  }
  void rebase(const Repository &, int number) override {
    calls.push_back("rebase " + std::to_string(number));
  }
  void rerun_failed_jobs(const Repository &, int number) override {
    calls.push_back("rerun " + std::to_string(number));
    if (fail_rerun) {
      throw GitHubError(FailureKind::NotFound, "No failed jobs found to rerun");
    }
  }
  void approve(const Repository &, int number,
               const std::string &message) override {
    calls.push_back("approve " + std::to_string(number));
    approval_message = message;
  }
  BuildLogs fetch_build_logs(const Repository &, const PullRequest &pr) override {
    calls.push_back("logs " + std::to_string(pr.number));
    throw TransientNetworkError("connection reset");
  }
};

/// Executor wired to a pool and timer queue that are never started, so every
/// job runs inline and timers fire only through run_due().
struct Harness {
  MockGitHubApi api;
  WorkerPool pool{1, 0};
  TimerQueue timers;
  std::vector<Action> dispatched;
  std::vector<std::string> commands;
  EffectExecutor executor{api,
                          pool,
                          timers,
                          [this](Action a) { dispatched.push_back(std::move(a)); },
                          nullptr,
                          nullptr,
                          [this](const std::string &cmd) { commands.push_back(cmd); }};
};

} // namespace

TEST_CASE("shell quoting") {
  CHECK(shell_quote("plain") == "'plain'");
  CHECK(shell_quote("it's") == "'it'\\''s'");
}

TEST_CASE("fetch results become actions") {
  Harness h;
  h.executor.execute(effects::FetchPullRequests{kRepo});
  REQUIRE(h.dispatched.size() == 1);
  auto *loaded = std::get_if<actions::PullRequestsLoaded>(&h.dispatched[0]);
  REQUIRE(loaded);
  CHECK(loaded->repo_key == kRepo.key());
  CHECK(loaded->prs.size() == 1);

  h.api.fail_list = true;
  h.executor.execute(effects::FetchPullRequests{kRepo});
  REQUIRE(h.dispatched.size() == 2);
  auto *failed = std::get_if<actions::PullRequestsLoadFailed>(&h.dispatched[1]);
  REQUIRE(failed);
  CHECK(failed->failure.kind == FailureKind::NotFound);
}

TEST_CASE("log fetch failures are classified") {
  Harness h;
  PullRequest pr;
  pr.number = 3;
  h.executor.execute(effects::FetchBuildLogs{kRepo, pr});
  REQUIRE(h.dispatched.size() == 1);
  auto *failed = std::get_if<actions::BuildLogsLoadFailed>(&h.dispatched[0]);
  REQUIRE(failed);
  CHECK(failed->number == 3);
  CHECK(failed->failure.kind == FailureKind::Network);
  CHECK(failed->failure.message == "connection reset");
}

TEST_CASE("user operations report success and failure") {
  Harness h;
  h.executor.execute(effects::RunPrOperation{kRepo, 4, PrOperation::Approve, "LGTM"});
  CHECK(h.api.approval_message == "LGTM");
  REQUIRE(h.dispatched.size() == 1);
  CHECK(std::holds_alternative<actions::PrOperationSucceeded>(h.dispatched[0]));

  h.executor.execute(effects::RunPrOperation{kRepo, 4, PrOperation::Merge, ""});
  REQUIRE(h.dispatched.size() == 2);
  auto *failed = std::get_if<actions::PrOperationFailed>(&h.dispatched[1]);
  REQUIRE(failed);
  CHECK(failed->op == PrOperation::Merge);
  CHECK(failed->failure.kind == FailureKind::Conflict);
}

TEST_CASE("browser and IDE operations run commands") {
  Harness h;
  h.executor.execute(effects::RunPrOperation{
      kRepo, 4, PrOperation::OpenInBrowser, "https://github.com/acme/widgets/pull/4"});
  h.executor.execute(
      effects::RunPrOperation{kRepo, 4, PrOperation::OpenInIde, "code ~/src/widgets"});
  REQUIRE(h.commands.size() == 2);
  CHECK(h.commands[0] == "xdg-open 'https://github.com/acme/widgets/pull/4'");
  CHECK(h.commands[1] == "code ~/src/widgets");
  CHECK(h.api.calls.empty());
}

TEST_CASE("commands fail without a runner") {
  MockGitHubApi api;
  WorkerPool pool(1, 0);
  TimerQueue timers;
  std::vector<Action> dispatched;
  EffectExecutor executor(api, pool, timers,
                          [&](Action a) { dispatched.push_back(std::move(a)); });
  executor.execute(effects::RunPrOperation{kRepo, 1, PrOperation::OpenInIde, "vim"});
  REQUIRE(dispatched.size() == 1);
  auto *failed = std::get_if<actions::PrOperationFailed>(&dispatched[0]);
  REQUIRE(failed);
  CHECK(failed->failure.kind == FailureKind::Other);
}

TEST_CASE("merge bot effects carry their run id") {
  Harness h;
  h.api.status.mergeable = MergeableStatus::Ready;
  h.executor.execute(effects::CheckMergeStatus{5, kRepo, 2});
  h.executor.execute(effects::MergeBotRebase{5, kRepo, 2});
  h.executor.execute(effects::MergeBotMerge{5, kRepo, 2});
  h.api.fail_rerun = true;
  h.executor.execute(effects::MergeBotRerun{5, kRepo, 2});
  REQUIRE(h.dispatched.size() == 4);

  auto *checked = std::get_if<actions::MergeBotStatusChecked>(&h.dispatched[0]);
  REQUIRE(checked);
  CHECK(checked->run_id == 5);
  CHECK(checked->status.mergeable == MergeableStatus::Ready);
  CHECK(std::holds_alternative<actions::MergeBotRebased>(h.dispatched[1]));
  auto *merge_failed = std::get_if<actions::MergeBotMergeFailed>(&h.dispatched[2]);
  REQUIRE(merge_failed);
  CHECK(merge_failed->run_id == 5);
  auto *rerun = std::get_if<actions::MergeBotRerunRequested>(&h.dispatched[3]);
  REQUIRE(rerun);
  REQUIRE(rerun->failure);
  CHECK(rerun->failure->kind == FailureKind::NotFound);
}

TEST_CASE("timers dispatch their follow-up action") {
  Harness h;
  h.executor.execute(effects::StartTimer{Subsystem::MergeBot, 100ms,
                                         actions::MergeBotPoll{1, 7}});
  CHECK(h.timers.pending() == 1);
  CHECK(h.dispatched.empty());
  h.timers.run_due(TimerQueue::Clock::now() + 1s);
  REQUIRE(h.dispatched.size() == 1);
  auto *poll = std::get_if<actions::MergeBotPoll>(&h.dispatched[0]);
  REQUIRE(poll);
  CHECK(poll->number == 7);
}

TEST_CASE("cancelling a subsystem drops its timers only") {
  Harness h;
  h.executor.execute(effects::StartTimer{Subsystem::MergeBot, 100ms,
                                         actions::MergeBotPoll{1, 7}});
  h.executor.execute(
      effects::StartTimer{Subsystem::Ui, 100ms, actions::DismissStatus{}});
  const auto before = h.executor.epoch(Subsystem::MergeBot);
  h.executor.execute(effects::CancelSubsystem{Subsystem::MergeBot});
  CHECK(h.executor.epoch(Subsystem::MergeBot) == before + 1);
  CHECK(h.timers.pending() == 1);
  h.timers.run_due(TimerQueue::Clock::now() + 1s);
  REQUIRE(h.dispatched.size() == 1);
  CHECK(std::holds_alternative<actions::DismissStatus>(h.dispatched[0]));
}

namespace {

/// Blocks list_pull_requests until released.
class GatedGitHubApi : public MockGitHubApi {
public:
  std::promise<void> entered;
  std::shared_future<void> release;

  std::vector<PullRequest> list_pull_requests(const Repository &repo) override {
    entered.set_value();
    release.wait();
    return MockGitHubApi::list_pull_requests(repo);
  }
};

} // namespace

TEST_CASE("results of a cancelled subsystem are dropped") {
  GatedGitHubApi api;
  std::promise<void> gate;
  api.release = gate.get_future().share();
  WorkerPool pool(1, 0);
  pool.start();
  TimerQueue timers;
  std::mutex mutex;
  std::vector<Action> dispatched;
  EffectExecutor executor(api, pool, timers, [&](Action a) {
    std::lock_guard<std::mutex> lock(mutex);
    dispatched.push_back(std::move(a));
  });

  executor.execute(effects::FetchPullRequests{kRepo});
  api.entered.get_future().wait();
  executor.execute(effects::CancelSubsystem{Subsystem::Repositories});
  gate.set_value();
  auto deadline = std::chrono::steady_clock::now() + 2s;
  while (pool.outstanding_jobs() > 0 && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(5ms);
  }
  pool.stop();
  std::lock_guard<std::mutex> lock(mutex);
  CHECK(dispatched.empty());
}

TEST_CASE("session and history effects use their stores") {
  namespace fs = std::filesystem;
  const fs::path dir = fs::temp_directory_path() / "prdeck_executor_test";
  fs::remove_all(dir);
  const std::string session_path = (dir / "session.json").string();
  const std::string db_path = (dir / "history.db").string();
  fs::create_directories(dir);

  MockGitHubApi api;
  WorkerPool pool(1, 0);
  TimerQueue timers;
  MergeHistory history(db_path);
  SessionStore sessions(session_path);
  std::vector<Action> dispatched;
  EffectExecutor executor(api, pool, timers,
                          [&](Action a) { dispatched.push_back(std::move(a)); },
                          &history, &sessions);

  SessionState session;
  session.repositories = {kRepo};
  session.theme = ThemeKind::Light;
  executor.execute(effects::SaveSession{session});
  CHECK(sessions.load() == session);

  MergeOutcome outcome;
  outcome.repo_key = kRepo.key();
  outcome.number = 12;
  outcome.title = "feat: merged";
  outcome.merged = true;
  outcome.attempts = 1;
  executor.execute(effects::RecordMergeOutcome{outcome});
  auto rows = history.entries();
  REQUIRE(rows.size() == 1);
  CHECK(rows[0].number == 12);
  CHECK(rows[0].merged);
  CHECK(dispatched.empty());

  fs::remove_all(dir);
}

TEST_CASE("cancelling waits for a result that is being delivered") {
  MockGitHubApi api;
  WorkerPool pool(1, 0);
  pool.start();
  TimerQueue timers;
  std::promise<void> in_dispatch;
  std::promise<void> gate;
  std::shared_future<void> release = gate.get_future().share();
  std::mutex mutex;
  std::vector<Action> dispatched;
  EffectExecutor executor(api, pool, timers, [&](Action a) {
    in_dispatch.set_value();
    release.wait();
    std::lock_guard<std::mutex> lock(mutex);
    dispatched.push_back(std::move(a));
  });

  executor.execute(effects::FetchPullRequests{kRepo});
  in_dispatch.get_future().wait();
  auto cancelled = std::async(std::launch::async, [&] {
    executor.execute(effects::CancelSubsystem{Subsystem::Repositories});
  });
  CHECK(cancelled.wait_for(50ms) == std::future_status::timeout);
  gate.set_value();
  cancelled.get();
  {
    std::lock_guard<std::mutex> lock(mutex);
    CHECK(dispatched.size() == 1);
  }
  pool.stop();
}
