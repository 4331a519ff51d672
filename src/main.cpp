#include "app.hpp"
#include "effect_executor.hpp"
#include "github_client.hpp"
#include "history.hpp"
#include "key_map.hpp"
#include "log.hpp"
#include "session_store.hpp"
#include "store.hpp"
#include "timer_queue.hpp"
#include "tui.hpp"
#include "worker_pool.hpp"

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <memory>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <string>
#include <utility>

namespace {
std::shared_ptr<spdlog::logger> main_log() {
  static auto logger = [] {
    prdeck::ensure_default_logger();
    return prdeck::category_logger("main");
  }();
  return logger;
}

/// Run @p command in the background, detached from the terminal UI.
void run_detached(const std::string &command) {
  main_log()->info("Running '{}'", command);
  const std::string line = "(" + command + ") >/dev/null 2>&1 &";
  int rc = std::system(line.c_str());
  if (rc != 0) {
    throw std::runtime_error("Command failed with status " +
                             std::to_string(rc));
  }
}
} // namespace

/**
 * Program entry point wiring the store, effect executor and terminal UI.
 *
 * @param argc Number of CLI arguments received from the OS.
 * @param argv Null-terminated array containing the raw CLI arguments.
 * @return Process exit code.
 */
int main(int argc, char **argv) {
  using namespace prdeck;
  App app;
  int ret = app.run(argc, argv);
  if (ret != 0 || app.should_exit()) {
    return ret;
  }
  const auto &cfg = app.config();

  std::unique_ptr<SessionStore> session_store;
  SessionState session;
  bool restored = false;
  if (!cfg.session_file().empty()) {
    session_store = std::make_unique<SessionStore>(cfg.session_file());
    std::error_code ec;
    restored = std::filesystem::exists(cfg.session_file(), ec);
    session = session_store->load();
  }
  if (!restored) {
    session.theme = parse_theme_kind(cfg.theme());
  }
  session = merge_configured_repositories(std::move(session),
                                          configured_repositories(cfg));

  std::unique_ptr<MergeHistory> history;
  if (!cfg.history_db().empty()) {
    try {
      history = std::make_unique<MergeHistory>(cfg.history_db());
    } catch (const std::runtime_error &e) {
      main_log()->warn("Merge history disabled: {}", e.what());
    }
  }

  if (cfg.api_keys().empty()) {
    main_log()->warn("No GitHub token configured; requests are "
                     "unauthenticated and heavily rate limited");
  }
  auto http = std::make_unique<CurlHttpClient>(
      static_cast<long>(cfg.http_timeout()) * 1000L, cfg.http_proxy(),
      cfg.https_proxy());
  GitHubClient client(cfg.api_keys(), std::move(http), cfg.api_base(),
                      cfg.http_retries(), 0, cfg.merge_method(), cfg.dry_run());

  KeyMap keys;
  keys.set_hotkeys_enabled(cfg.hotkeys_enabled());
  keys.configure(cfg.hotkey_bindings());
  AppSettings settings = settings_from_config(cfg);
  settings.palette_commands = keys.palette_commands();

  WorkerPool pool(cfg.workers(), cfg.max_request_rate());
  TimerQueue timers;
  Store store(make_initial_state(settings));
  EffectExecutor executor(
      client, pool, timers,
      [&store](Action action) { store.dispatch(std::move(action)); },
      history.get(), session_store.get(), run_detached, cfg.browser_command());
  store.set_effect_handler(
      [&executor](const Effect &effect) { executor.execute(effect); });

  Tui tui(store, std::move(keys), static_cast<std::size_t>(cfg.log_limit()));

  pool.start();
  timers.start();
  store.start();
  store.dispatch(actions::Bootstrap{session});
  timers.schedule_every(std::chrono::seconds(1), [&store] {
    store.dispatch(actions::ClockTick{Clock::now()});
  });

  int exit_code = 0;
  try {
    tui.init();
    if (tui.initialized()) {
      tui.run();
    } else {
      main_log()->error("prdeck needs an interactive terminal");
      exit_code = 1;
    }
  } catch (const std::runtime_error &e) {
    main_log()->error("Terminal UI failed: {}", e.what());
    exit_code = 1;
  }
  tui.cleanup();

  store.set_effect_handler({});
  store.stop();
  timers.stop();
  pool.stop();
  if (session_store) {
    try {
      session_store->save(capture_session(*store.current_state()));
    } catch (const std::runtime_error &e) {
      main_log()->error("Saving session failed: {}", e.what());
    }
  }
  main_log()->info("prdeck exiting");
  spdlog::shutdown();
  return exit_code;
}
