#include "command_palette.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

namespace prdeck {

namespace {

constexpr int kMatchScore = 16;
constexpr int kConsecutiveBonus = 16;
constexpr int kWordStartBonus = 8;
constexpr int kMaxGapPenalty = 8;

char lower(char ch) {
  return static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
}

bool is_word_start(const std::string &text, std::size_t pos) {
  return pos == 0 ||
         !std::isalnum(static_cast<unsigned char>(text[pos - 1]));
}

/// Score of the leftmost match of @p needle that begins at @p start.
std::optional<int> score_from(const std::string &text,
                              const std::string &needle, std::size_t start) {
  int score = 0;
  std::size_t pos = start;
  std::size_t prev = std::string::npos;
  for (char ch : needle) {
    while (pos < text.size() && lower(text[pos]) != ch) {
      ++pos;
    }
    if (pos == text.size()) {
      return std::nullopt;
    }
    score += kMatchScore;
    if (prev != std::string::npos) {
      const std::size_t gap = pos - prev - 1;
      if (gap == 0) {
        score += kConsecutiveBonus;
      } else {
        score -= static_cast<int>(std::min<std::size_t>(gap, kMaxGapPenalty));
      }
    }
    if (is_word_start(text, pos)) {
      score += kWordStartBonus;
    }
    prev = pos++;
  }
  // Matches in the title beat matches further along.
  score -= static_cast<int>(std::min<std::size_t>(start, 20) / 4);
  return score;
}

} // namespace

PaletteContext palette_context(const AppState &state) {
  PaletteContext ctx;
  ctx.log_panel_open = state.log_panel.open;
  if (const auto *data = current_repository(state.repositories)) {
    ctx.has_pull_requests =
        !visible_pull_requests(*data, state.repositories.filter).empty();
  }
  return ctx;
}

bool palette_command_available(const PaletteCommand &command,
                               const PaletteContext &ctx) {
  switch (command.scope) {
  case KeyScope::Table:
    if (ctx.log_panel_open) {
      return false;
    }
    break;
  case KeyScope::LogPanel:
    if (!ctx.log_panel_open) {
      return false;
    }
    break;
  case KeyScope::Global:
    break;
  }
  return !command.needs_pull_requests || ctx.has_pull_requests;
}

std::optional<int> fuzzy_score(const std::string &text,
                               const std::string &query) {
  std::string needle;
  for (char ch : query) {
    if (!std::isspace(static_cast<unsigned char>(ch))) {
      needle.push_back(lower(ch));
    }
  }
  if (needle.empty()) {
    return 0;
  }
  std::optional<int> best;
  for (std::size_t start = 0; start < text.size(); ++start) {
    if (lower(text[start]) != needle.front()) {
      continue;
    }
    auto score = score_from(text, needle, start);
    if (!score) {
      // No later start can match either.
      break;
    }
    if (!best || *score > *best) {
      best = score;
    }
  }
  return best;
}

std::string searchable_text(const PaletteCommand &command) {
  return command.title + " " + command.category + " " + command.name;
}

std::vector<std::size_t>
filter_palette_commands(const std::vector<PaletteCommand> &commands,
                        const std::string &query, const PaletteContext &ctx) {
  std::vector<std::pair<std::size_t, int>> scored;
  for (std::size_t i = 0; i < commands.size(); ++i) {
    if (!palette_command_available(commands[i], ctx)) {
      continue;
    }
    if (auto score = fuzzy_score(searchable_text(commands[i]), query)) {
      scored.emplace_back(i, *score);
    }
  }
  std::stable_sort(scored.begin(), scored.end(),
                   [](const auto &a, const auto &b) {
                     return a.second > b.second;
                   });
  std::vector<std::size_t> out;
  out.reserve(scored.size());
  for (const auto &entry : scored) {
    out.push_back(entry.first);
  }
  return out;
}

const PaletteCommand *selected_palette_command(const AppState &state) {
  const auto &palette = state.palette;
  if (!palette.open || palette.matches.empty()) {
    return nullptr;
  }
  const std::size_t selected =
      std::min(palette.selected, palette.matches.size() - 1);
  const std::size_t index = palette.matches[selected];
  const auto &commands = state.settings.palette_commands;
  return index < commands.size() ? &commands[index] : nullptr;
}

} // namespace prdeck
