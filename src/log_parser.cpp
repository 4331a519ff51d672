#include "log_parser.hpp"
#include "log.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace prdeck {

namespace {

std::shared_ptr<spdlog::logger> parser_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("log_parser");
  }();
  return logger;
}

constexpr const char *kDefaultStepName = "Set up job";

std::string trim(const std::string &s) {
  auto begin = std::find_if_not(s.begin(), s.end(), [](unsigned char c) {
    return std::isspace(c);
  });
  auto end = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) {
               return std::isspace(c);
             }).base();
  return begin < end ? std::string(begin, end) : std::string();
}

std::string to_lower_copy(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

LogCommand command_from_name(const std::string &name) {
  const std::string lower = to_lower_copy(name);
  if (lower == "group")
    return LogCommand::Group;
  if (lower == "endgroup")
    return LogCommand::EndGroup;
  if (lower == "error")
    return LogCommand::Error;
  if (lower == "warning")
    return LogCommand::Warning;
  if (lower == "notice")
    return LogCommand::Notice;
  if (lower == "debug")
    return LogCommand::Debug;
  return LogCommand::None;
}

bool is_command_name_char(char c) {
  return std::isalpha(static_cast<unsigned char>(c)) || c == '-';
}

/// Length of the command name starting at @p pos, or 0 when there is none.
std::size_t command_name_length(const std::string &text, std::size_t pos) {
  std::size_t end = pos;
  while (end < text.size() && is_command_name_char(text[end])) {
    ++end;
  }
  return end - pos;
}

/// Match `##[cmd]message` or `::cmd params::message`. Unknown command names
/// leave the line untouched. Scans linearly so very long lines are safe.
bool parse_workflow_command(const std::string &text, LogCommand &command,
                            std::string &message) {
  const std::string trimmed = trim(text);
  if (trimmed.compare(0, 3, "##[") == 0) {
    const std::size_t len = command_name_length(trimmed, 3);
    if (len == 0 || 3 + len >= trimmed.size() || trimmed[3 + len] != ']') {
      return false;
    }
    LogCommand cmd = command_from_name(trimmed.substr(3, len));
    if (cmd == LogCommand::None) {
      return false;
    }
    command = cmd;
    message = trim(trimmed.substr(3 + len + 1));
    return true;
  }
  if (trimmed.compare(0, 2, "::") == 0) {
    const std::size_t len = command_name_length(trimmed, 2);
    if (len == 0) {
      return false;
    }
    std::size_t pos = 2 + len;
    if (pos < trimmed.size() &&
        std::isspace(static_cast<unsigned char>(trimmed[pos]))) {
      // Parameters run up to the first colon, which must open the `::`.
      const std::size_t colon = trimmed.find(':', pos);
      if (colon == std::string::npos || colon == pos + 1) {
        return false;
      }
      pos = colon;
    }
    if (trimmed.compare(pos, 2, "::") != 0) {
      return false;
    }
    LogCommand cmd = command_from_name(trimmed.substr(2, len));
    if (cmd == LogCommand::None) {
      return false;
    }
    command = cmd;
    message = trimmed.substr(pos + 2);
    return true;
  }
  return false;
}

void flush_step(std::vector<StepNode> &steps, std::string &name,
                std::vector<LogLine> &lines, bool force) {
  if (!force && lines.empty()) {
    return;
  }
  steps.emplace_back(name, std::move(lines));
  lines.clear();
}

} // namespace

std::pair<std::optional<std::string>, std::string>
extract_timestamp(const std::string &line) {
  if (line.size() >= 20 && line[4] == '-' && line[7] == '-' &&
      line[10] == 'T' && line[13] == ':' && line[16] == ':' &&
      (line[19] == '.' || line[19] == 'Z')) {
    auto pos = line.find('Z', 19);
    if (pos != std::string::npos && pos < 30) {
      if (pos + 1 == line.size()) {
        return {line.substr(0, pos + 1), std::string()};
      }
      if (line[pos + 1] == ' ') {
        return {line.substr(0, pos + 1), line.substr(pos + 2)};
      }
    }
  }
  return {std::nullopt, line};
}

std::string strip_ansi(const std::string &text) {
  std::string out;
  out.reserve(text.size());
  std::size_t i = 0;
  while (i < text.size()) {
    if (text[i] != '\x1b') {
      out.push_back(text[i++]);
      continue;
    }
    ++i;
    if (i >= text.size()) {
      break;
    }
    if (text[i] == '[') {
      // CSI: parameters then a final byte in 0x40..0x7e
      ++i;
      while (i < text.size() &&
             !(text[i] >= 0x40 && text[i] <= 0x7e)) {
        ++i;
      }
      ++i;
    } else if (text[i] == ']') {
      // OSC: terminated by BEL or ESC backslash
      ++i;
      while (i < text.size()) {
        if (text[i] == '\a') {
          ++i;
          break;
        }
        if (text[i] == '\x1b' && i + 1 < text.size() && text[i + 1] == '\\') {
          i += 2;
          break;
        }
        ++i;
      }
    } else {
      ++i;
    }
  }
  return out;
}

LogLine parse_log_line(const std::string &raw_line) {
  LogLine line;
  std::string content = raw_line;
  if (!content.empty() && content.back() == '\r') {
    content.pop_back();
  }
  auto [timestamp, rest] = extract_timestamp(content);
  line.timestamp = std::move(timestamp);
  line.raw = rest;

  std::string plain = strip_ansi(rest);
  static const std::string kCommandMarker = "[command]";
  if (plain.rfind(kCommandMarker, 0) == 0) {
    line.is_command = true;
    plain = plain.substr(kCommandMarker.size());
  }

  LogCommand command = LogCommand::None;
  std::string message;
  if (!line.is_command && parse_workflow_command(plain, command, message)) {
    line.command = command;
    line.display = message;
    line.is_error = command == LogCommand::Error;
  } else {
    line.display = plain;
    line.is_error =
        to_lower_copy(plain).find("error:") != std::string::npos;
  }
  return line;
}

bool is_metadata_line(const LogLine &line) {
  switch (line.command) {
  case LogCommand::Group:
    return true;
  case LogCommand::EndGroup:
  case LogCommand::Debug:
    return line.display.empty();
  default:
    return false;
  }
}

JobNode parse_job_log(const std::string &job_name, const std::string &content) {
  std::vector<StepNode> steps;
  std::string step_name = kDefaultStepName;
  std::vector<LogLine> step_lines;
  bool in_named_step = false;

  std::istringstream input(content);
  std::string raw;
  while (std::getline(input, raw)) {
    LogLine line = parse_log_line(raw);
    if (line.command == LogCommand::Group) {
      flush_step(steps, step_name, step_lines, in_named_step);
      step_name = line.display.empty() ? std::string(kDefaultStepName)
                                       : line.display;
      in_named_step = true;
      continue;
    }
    if (is_metadata_line(line)) {
      continue;
    }
    step_lines.push_back(std::move(line));
  }
  flush_step(steps, step_name, step_lines, in_named_step);

  std::stable_sort(steps.begin(), steps.end(),
                   [](const StepNode &a, const StepNode &b) {
                     return a.name() < b.name();
                   });
  JobNode job(job_name, std::move(steps));
  parser_log()->debug("Parsed job '{}' into {} step(s), {} error(s)", job_name,
                      job.steps().size(), job.error_count());
  return job;
}

WorkflowNode build_workflow(const std::string &name, std::vector<JobNode> jobs) {
  std::vector<JobNode> kept;
  kept.reserve(jobs.size());
  for (auto &job : jobs) {
    bool has_lines = std::any_of(
        job.steps().begin(), job.steps().end(),
        [](const StepNode &s) { return !s.lines().empty(); });
    if (!has_lines && job.name().find("/system") != std::string::npos) {
      parser_log()->debug("Skipping empty system job '{}'", job.name());
      continue;
    }
    kept.push_back(std::move(job));
  }
  std::stable_sort(kept.begin(), kept.end(),
                   [](const JobNode &a, const JobNode &b) {
                     return a.name() < b.name();
                   });
  return WorkflowNode(name, std::move(kept));
}

LogTree build_log_tree(std::vector<WorkflowNode> workflows) {
  std::stable_sort(workflows.begin(), workflows.end(),
                   [](const WorkflowNode &a, const WorkflowNode &b) {
                     if (a.has_failures() != b.has_failures()) {
                       return a.has_failures();
                     }
                     return a.name() < b.name();
                   });
  return LogTree(std::move(workflows));
}

std::string clean_job_name(const std::string &file_name) {
  std::string name = file_name;
  const std::string ext = ".txt";
  if (name.size() >= ext.size() &&
      name.compare(name.size() - ext.size(), ext.size(), ext) == 0) {
    name.erase(name.size() - ext.size());
  }
  auto underscore = name.find('_');
  if (underscore != std::string::npos && underscore > 0 &&
      std::all_of(name.begin(), name.begin() + underscore,
                  [](unsigned char c) { return std::isdigit(c); })) {
    name = name.substr(underscore + 1);
  }
  return name;
}

} // namespace prdeck
