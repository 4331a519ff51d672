#include "log.hpp"
#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <cstdio>
#include <fstream>
#include <iterator>
#include <spdlog/spdlog.h>
#include <string>
#include <thread>

namespace {

std::string read_file(const char *path) {
  std::ifstream f(path);
  return std::string((std::istreambuf_iterator<char>(f)),
                     std::istreambuf_iterator<char>());
}

/// Loggers are asynchronous; wait until @p needle reaches the file.
std::string wait_for(const char *path, const std::string &needle) {
  std::string content;
  for (int i = 0; i < 200; ++i) {
    spdlog::apply_all(
        [](const std::shared_ptr<spdlog::logger> &l) { l->flush(); });
    content = read_file(path);
    if (content.find(needle) != std::string::npos) {
      break;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  return content;
}

bool ring_contains(const std::string &needle) {
  for (int i = 0; i < 200; ++i) {
    for (const auto &line : prdeck::recent_log_lines()) {
      if (line.find(needle) != std::string::npos) {
        return true;
      }
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  return false;
}

} // namespace

TEST_CASE("test log") {
  const char *path = "prdeck_test.log";
  std::remove(path);
  prdeck::init_logger(spdlog::level::info, "", path, 0, false, false);
  auto logger = prdeck::category_logger("test");
  logger->debug("debug message");
  logger->info("info message");
  std::string content = wait_for(path, "info message");
  REQUIRE(content.find("info message") != std::string::npos);
  REQUIRE(content.find("debug message") == std::string::npos);

  prdeck::init_logger(spdlog::level::info, "", "", 0, false, false);
  std::remove(path);
}

TEST_CASE("category overrides change one logger only") {
  const char *path = "prdeck_category.log";
  std::remove(path);
  prdeck::init_logger(spdlog::level::info, "", path, 0, false, false);
  prdeck::configure_log_categories({{"chatty", spdlog::level::debug}});
  prdeck::category_logger("quiet")->debug("quiet detail");
  prdeck::category_logger("chatty")->debug("chatty detail");
  std::string content = wait_for(path, "chatty detail");
  CHECK(content.find("chatty detail") != std::string::npos);
  CHECK(content.find("quiet detail") == std::string::npos);
  CHECK(prdeck::category_logger("chatty") == prdeck::category_logger("chatty"));

  prdeck::init_logger(spdlog::level::info, "", "", 0, false, false);
  std::remove(path);
}

TEST_CASE("debug console keeps recent lines") {
  prdeck::set_log_buffer_capacity(3);
  prdeck::init_logger(spdlog::level::info, "", "", 0, false, false);
  auto logger = prdeck::category_logger("console");
  for (int i = 0; i < 5; ++i) {
    logger->info("console line {}", i);
  }
  REQUIRE(ring_contains("console line 4"));
  auto lines = prdeck::recent_log_lines();
  CHECK(lines.size() <= 3);
  CHECK(prdeck::recent_log_lines(1).size() == 1);
  CHECK(lines.back().find("console line 4") != std::string::npos);

  prdeck::set_log_buffer_capacity(500);
  prdeck::init_logger(spdlog::level::info, "", "", 0, false, false);
}
