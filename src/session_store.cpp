/**
 * @file session_store.cpp
 * @brief JSON persistence of the dashboard session.
 */
#include "session_store.hpp"
#include "log.hpp"

#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <sstream>
#include <stdexcept>

namespace prdeck {

namespace {
std::shared_ptr<spdlog::logger> session_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("session");
  }();
  return logger;
}
} // namespace

bool operator==(const SessionState &a, const SessionState &b) {
  return a.repositories == b.repositories && a.selected_tab == b.selected_tab &&
         a.filter == b.filter && a.selected_prs == b.selected_prs &&
         a.show_timestamps == b.show_timestamps && a.theme == b.theme;
}

std::string session_to_json(const SessionState &session) {
  using nlohmann::json;
  json doc = json::object();
  json repos = json::array();
  for (const auto &repo : session.repositories) {
    repos.push_back(
        {{"org", repo.org}, {"repo", repo.repo}, {"branch", repo.branch}});
  }
  doc["repositories"] = repos;
  doc["selected_tab"] = session.selected_tab;
  doc["filter"] = to_string(session.filter);
  json selected = json::object();
  for (const auto &kv : session.selected_prs) {
    selected[kv.first] = kv.second;
  }
  doc["selected_prs"] = selected;
  doc["show_timestamps"] = session.show_timestamps;
  doc["theme"] = to_string(session.theme);
  return doc.dump(2);
}

SessionState session_from_json(const std::string &text) {
  using nlohmann::json;
  SessionState session;
  try {
    json doc = json::parse(text);
    if (!doc.is_object()) {
      throw std::runtime_error("session root must be an object");
    }
    if (doc.contains("repositories")) {
      for (const auto &item : doc.at("repositories")) {
        Repository repo;
        repo.org = item.at("org").get<std::string>();
        repo.repo = item.at("repo").get<std::string>();
        repo.branch = item.value("branch", std::string("main"));
        session.repositories.push_back(std::move(repo));
      }
    }
    session.selected_tab = doc.value("selected_tab", std::size_t{0});
    session.filter = parse_filter(doc.value("filter", std::string("all")));
    if (doc.contains("selected_prs")) {
      for (const auto &kv : doc.at("selected_prs").items()) {
        session.selected_prs[kv.key()] = kv.value().get<std::vector<int>>();
      }
    }
    session.show_timestamps = doc.value("show_timestamps", false);
    session.theme = parse_theme_kind(doc.value("theme", std::string("dark")));
  } catch (const json::exception &e) {
    throw std::runtime_error(std::string("Invalid session: ") + e.what());
  }
  return session;
}

SessionStore::SessionStore(std::string path) : path_(std::move(path)) {}

SessionState SessionStore::load() const {
  if (path_.empty()) {
    return {};
  }
  std::ifstream in(path_);
  if (!in) {
    session_log()->debug("No session at {}", path_);
    return {};
  }
  std::stringstream buffer;
  buffer << in.rdbuf();
  try {
    auto session = session_from_json(buffer.str());
    session_log()->info("Restored session with {} repositories from {}",
                        session.repositories.size(), path_);
    return session;
  } catch (const std::runtime_error &e) {
    session_log()->warn("Ignoring session file {}: {}", path_, e.what());
    return {};
  }
}

void SessionStore::save(const SessionState &session) const {
  if (path_.empty()) {
    return;
  }
  namespace fs = std::filesystem;
  const fs::path target(path_);
  if (target.has_parent_path()) {
    std::error_code ec;
    fs::create_directories(target.parent_path(), ec);
    if (ec) {
      throw std::runtime_error("Failed to create " +
                               target.parent_path().string() + ": " +
                               ec.message());
    }
  }
  const fs::path tmp = target.string() + ".tmp";
  {
    std::ofstream out(tmp, std::ios::trunc);
    if (!out) {
      throw std::runtime_error("Failed to write session file " + tmp.string());
    }
    out << session_to_json(session);
  }
  std::error_code ec;
  fs::rename(tmp, target, ec);
  if (ec) {
    throw std::runtime_error("Failed to replace session file " + path_ + ": " +
                             ec.message());
  }
  session_log()->debug("Saved session to {}", path_);
}

} // namespace prdeck
