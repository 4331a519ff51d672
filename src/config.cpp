#include "config.hpp"
#include "log.hpp"
#include "util/duration.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <iterator>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <toml++/toml.h>
#include <yaml-cpp/yaml.h>

namespace prdeck {

namespace {

std::shared_ptr<spdlog::logger> config_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("config");
  }();
  return logger;
}

std::string to_lower_copy(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return value;
}

/**
 * Convert a YAML node into a structurally equivalent JSON object.
 *
 * Scalars become booleans or numbers when they parse as such and strings
 * otherwise. Sequences and maps are converted recursively.
 *
 * @param node YAML node to transform.
 * @return JSON value mirroring the YAML content.
 */
nlohmann::json yaml_to_json(const YAML::Node &node) {
  using nlohmann::json;
  switch (node.Type()) {
  case YAML::NodeType::Null:
    return nullptr;
  case YAML::NodeType::Scalar: {
    const std::string s = node.Scalar();
    if (s == "true" || s == "True" || s == "TRUE")
      return true;
    if (s == "false" || s == "False" || s == "FALSE")
      return false;
    try {
      size_t idx = 0;
      long long i = std::stoll(s, &idx, 10);
      if (idx == s.size())
        return i;
    } catch (const std::logic_error &) {
      // Not an integer.
    }
    try {
      size_t idx = 0;
      double d = std::stod(s, &idx);
      if (idx == s.size())
        return d;
    } catch (const std::logic_error &) {
      // Not a number.
    }
    return s;
  }
  case YAML::NodeType::Sequence: {
    json arr = json::array();
    auto &array = arr.get_ref<json::array_t &>();
    array.reserve(node.size());
    std::transform(node.begin(), node.end(), std::back_inserter(array),
                   [](const YAML::Node &item) { return yaml_to_json(item); });
    return arr;
  }
  case YAML::NodeType::Map: {
    json obj = json::object();
    for (const auto &kv : node) {
      obj[kv.first.as<std::string>()] = yaml_to_json(kv.second);
    }
    return obj;
  }
  default:
    return nullptr;
  }
}

/**
 * Translate a TOML node to a JSON representation.
 *
 * @param node TOML node read from a parsed document.
 * @return JSON value containing the equivalent data.
 */
nlohmann::json toml_to_json(const toml::node &node) {
  using nlohmann::json;
  if (const auto *table = node.as_table()) {
    json obj = json::object();
    for (const auto &kv : *table) {
      obj[std::string(kv.first.str())] = toml_to_json(kv.second);
    }
    return obj;
  }

  if (const auto *array = node.as_array()) {
    json arr = json::array();
    arr.get_ref<json::array_t &>().reserve(array->size());
    for (const auto &item : *array) {
      arr.push_back(toml_to_json(item));
    }
    return arr;
  }

  if (const auto *value = node.as_boolean())
    return value->get();
  if (const auto *value = node.as_integer())
    return value->get();
  if (const auto *value = node.as_floating_point())
    return value->get();
  if (const auto *value = node.as_string())
    return value->get();

  auto stringify_temporal = [](const auto &temporal) {
    std::ostringstream oss;
    oss << temporal;
    return oss.str();
  };

  if (const auto *value = node.as_date())
    return stringify_temporal(value->get());
  if (const auto *value = node.as_time())
    return stringify_temporal(value->get());
  if (const auto *value = node.as_date_time())
    return stringify_temporal(value->get());

  return nullptr;
}

/**
 * Merge recognised configuration sections into the root object so grouped
 * configuration files expose the same flat keys as flat ones.
 *
 * Keys of the `merge_bot` section gain a `merge_bot_` prefix unless they
 * already carry it, so `merge_bot: {concurrency: 3}` sets
 * `merge_bot_concurrency`. `ci_poll_interval` keeps its name.
 */
nlohmann::json normalize_config_sections(const nlohmann::json &source) {
  nlohmann::json normalized = source;
  auto merge_section = [&normalized](std::string_view name,
                                     std::string_view prefix) {
    auto it = normalized.find(std::string{name});
    if (it == normalized.end() || !it->is_object()) {
      return;
    }
    const nlohmann::json section = *it;
    for (const auto &[key, value] : section.items()) {
      std::string flat = key;
      if (!prefix.empty() && key.rfind(prefix, 0) != 0 &&
          key != "ci_poll_interval") {
        flat = std::string{prefix} + key;
      }
      normalized[flat] = value;
    }
  };

  for (std::string_view section :
       {"core", "github", "logging", "ui", "storage", "network"}) {
    merge_section(section, "");
  }
  merge_section("merge_bot", "merge_bot_");

  return normalized;
}

/// Read a duration given as seconds or as a string such as "15s" or "2m".
std::chrono::seconds duration_value(const nlohmann::json &value,
                                    std::string_view key) {
  if (value.is_number_integer()) {
    return std::chrono::seconds(value.get<long long>());
  }
  if (value.is_string()) {
    return parse_duration(value.get<std::string>());
  }
  throw std::runtime_error("Invalid duration for " + std::string{key});
}

/// Join a string or an array of strings into a comma separated list.
std::string binding_list(const nlohmann::json &value) {
  if (value.is_string()) {
    return value.get<std::string>();
  }
  std::string merged;
  for (const auto &item : value) {
    if (!item.is_string()) {
      continue;
    }
    if (!merged.empty()) {
      merged.push_back(',');
    }
    merged += item.get<std::string>();
  }
  return merged;
}

} // namespace

void Config::load_json(const nlohmann::json &j) {
  nlohmann::json cfg = normalize_config_sections(j);

  if (cfg.contains("verbose")) {
    set_verbose(cfg["verbose"].get<bool>());
  }
  if (cfg.contains("log_level")) {
    set_log_level(cfg["log_level"].get<std::string>());
  }
  if (cfg.contains("log_pattern")) {
    set_log_pattern(cfg["log_pattern"].get<std::string>());
  }
  if (cfg.contains("log_file")) {
    set_log_file(cfg["log_file"].get<std::string>());
  }
  if (cfg.contains("log_limit")) {
    set_log_limit(cfg["log_limit"].get<int>());
  }
  if (cfg.contains("log_rotate")) {
    set_log_rotate(cfg["log_rotate"].get<int>());
  }
  if (cfg.contains("log_compress")) {
    set_log_compress(cfg["log_compress"].get<bool>());
  }
  if (cfg.contains("log_categories")) {
    std::unordered_map<std::string, std::string> categories;
    const auto &value = cfg["log_categories"];
    auto assign_category = [&categories](std::string name, std::string level) {
      if (name.empty()) {
        return;
      }
      if (level.empty()) {
        level = "debug";
      }
      categories[std::move(name)] = std::move(level);
    };
    if (value.is_object()) {
      for (const auto &[key, v] : value.items()) {
        if (v.is_string()) {
          assign_category(key, v.get<std::string>());
        } else if (v.is_null()) {
          assign_category(key, "debug");
        } else {
          config_log()->warn("Unsupported value for log category '{}'; "
                             "expected string or null",
                             key);
        }
      }
    } else if (value.is_array()) {
      for (const auto &item : value) {
        if (!item.is_string()) {
          continue;
        }
        std::string raw = item.get<std::string>();
        auto pos = raw.find('=');
        assign_category(pos == std::string::npos ? raw : raw.substr(0, pos),
                        pos == std::string::npos ? std::string{"debug"}
                                                 : raw.substr(pos + 1));
      }
    }
    set_log_categories(std::move(categories));
  }
  if (cfg.contains("api_base")) {
    set_api_base(cfg["api_base"].get<std::string>());
  }
  if (cfg.contains("web_base")) {
    set_web_base(cfg["web_base"].get<std::string>());
  }
  if (cfg.contains("api_keys")) {
    set_api_keys(cfg["api_keys"].get<std::vector<std::string>>());
  }
  if (cfg.contains("http_timeout")) {
    set_http_timeout(cfg["http_timeout"].get<int>());
  }
  if (cfg.contains("http_retries")) {
    set_http_retries(cfg["http_retries"].get<int>());
  }
  if (cfg.contains("http_proxy")) {
    set_http_proxy(cfg["http_proxy"].get<std::string>());
  }
  if (cfg.contains("https_proxy")) {
    set_https_proxy(cfg["https_proxy"].get<std::string>());
  }
  if (cfg.contains("max_request_rate")) {
    set_max_request_rate(cfg["max_request_rate"].get<int>());
  }
  if (cfg.contains("workers")) {
    set_workers(cfg["workers"].get<int>());
  }
  if (cfg.contains("repositories")) {
    const auto &repos = cfg["repositories"];
    if (repos.is_array()) {
      set_repositories(repos.get<std::vector<std::string>>());
    } else {
      config_log()->warn("Ignoring 'repositories'; expected a list");
    }
  }
  if (cfg.contains("merge_bot_concurrency")) {
    set_merge_bot_concurrency(cfg["merge_bot_concurrency"].get<int>());
  }
  if (cfg.contains("merge_bot_retry_budget")) {
    set_merge_bot_retry_budget(cfg["merge_bot_retry_budget"].get<int>());
  }
  if (cfg.contains("merge_bot_backoff")) {
    set_merge_bot_backoff(
        duration_value(cfg["merge_bot_backoff"], "merge_bot_backoff"));
  }
  if (cfg.contains("ci_poll_interval")) {
    set_ci_poll_interval(
        duration_value(cfg["ci_poll_interval"], "ci_poll_interval"));
  }
  if (cfg.contains("merge_method")) {
    std::string method = to_lower_copy(cfg["merge_method"].get<std::string>());
    if (method == "merge" || method == "squash" || method == "rebase") {
      set_merge_method(method);
    } else {
      config_log()->warn("Unknown merge_method '{}'; keeping '{}'", method,
                         merge_method_);
    }
  }
  if (cfg.contains("dry_run")) {
    set_dry_run(cfg["dry_run"].get<bool>());
  }
  if (cfg.contains("viewport_height")) {
    set_viewport_height(cfg["viewport_height"].get<int>());
  }
  if (cfg.contains("theme")) {
    std::string theme = to_lower_copy(cfg["theme"].get<std::string>());
    if (theme == "dark" || theme == "light") {
      set_theme(theme);
    } else {
      config_log()->warn("Unknown theme '{}'; using '{}'", theme, theme_);
    }
  }
  if (cfg.contains("hotkeys_enabled")) {
    set_hotkeys_enabled(cfg["hotkeys_enabled"].get<bool>());
  }
  if (cfg.contains("hotkeys")) {
    const auto &hot = cfg["hotkeys"];
    if (hot.is_boolean()) {
      set_hotkeys_enabled(hot.get<bool>());
    } else if (hot.is_object()) {
      if (hot.contains("enabled") && hot["enabled"].is_boolean()) {
        set_hotkeys_enabled(hot["enabled"].get<bool>());
      }
      if (hot.contains("bindings") && hot["bindings"].is_object()) {
        for (const auto &[action, value] : hot["bindings"].items()) {
          if (value.is_string() || value.is_array()) {
            set_hotkey_binding(action, binding_list(value));
          } else if (value.is_boolean()) {
            set_hotkey_binding(action, value.get<bool>() ? "default" : "none");
          } else if (value.is_null()) {
            set_hotkey_binding(action, "");
          }
        }
      }
    }
  }
  if (cfg.contains("session_file")) {
    set_session_file(cfg["session_file"].get<std::string>());
  }
  if (cfg.contains("history_db")) {
    set_history_db(cfg["history_db"].get<std::string>());
  }
  if (cfg.contains("ide_command")) {
    set_ide_command(cfg["ide_command"].get<std::string>());
  }
  if (cfg.contains("browser_command")) {
    set_browser_command(cfg["browser_command"].get<std::string>());
  }
  if (cfg.contains("approval_message")) {
    set_approval_message(cfg["approval_message"].get<std::string>());
  }
}

/**
 * Construct a configuration object from a JSON representation.
 *
 * @param j JSON document with configuration values.
 * @return Populated configuration instance.
 * @throws nlohmann::json::exception When value conversions fail.
 */
Config Config::from_json(const nlohmann::json &j) {
  Config cfg;
  cfg.load_json(j);
  return cfg;
}

/**
 * Load configuration from a file on disk.
 *
 * The file type is inferred from the extension and may be YAML, JSON, or
 * TOML. Errors during parsing are logged and rethrown.
 *
 * @param path Filesystem location of the configuration file.
 * @return Fully populated configuration object.
 * @throws std::runtime_error When the file cannot be opened, parsed, or when
 *         the extension is unsupported.
 */
Config Config::from_file(const std::string &path) {
  ensure_default_logger();
  config_log()->debug("Loading config from {}", path);
  auto pos = path.find_last_of('.');
  if (pos == std::string::npos) {
    config_log()->error("Unknown config file extension for {}", path);
    throw std::runtime_error("Unknown config file extension");
  }
  std::string ext = path.substr(pos + 1);
  std::string ext_lower = to_lower_copy(ext);
  config_log()->debug("Detected config file type: {}", ext_lower);
  nlohmann::json j;
  try {
    if (ext_lower == "yaml" || ext_lower == "yml") {
      YAML::Node node = YAML::LoadFile(path);
      j = yaml_to_json(node);
    } else if (ext_lower == "json") {
      std::ifstream f(path);
      if (!f) {
        config_log()->error("Failed to open config file {}", path);
        throw std::runtime_error("Failed to open config file");
      }
      f >> j;
    } else if (ext_lower == "toml" || ext_lower == "tml") {
      toml::table tbl = toml::parse_file(path);
      j = toml_to_json(tbl);
    } else {
      config_log()->error("Unsupported config format: {}", ext);
      throw std::runtime_error("Unsupported config format");
    }
  } catch (const std::exception &e) {
    config_log()->error("Failed to load config {}: {}", path, e.what());
    throw;
  }
  Config cfg;
  try {
    cfg.load_json(j);
  } catch (const nlohmann::json::exception &e) {
    config_log()->error("Invalid value in config {}: {}", path, e.what());
    throw std::runtime_error(std::string("Invalid config value: ") + e.what());
  }
  config_log()->info("Config loaded successfully from {}", path);
  return cfg;
}

} // namespace prdeck
