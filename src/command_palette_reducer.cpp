#include "command_palette.hpp"
#include "reducer.hpp"
#include "util/overloaded.hpp"

namespace prdeck {

namespace {

/// Drop the last UTF-8 code point of @p text.
void pop_code_point(std::string &text) {
  while (!text.empty()) {
    const auto byte = static_cast<unsigned char>(text.back());
    text.pop_back();
    if ((byte & 0xC0) != 0x80) {
      break;
    }
  }
}

} // namespace

CommandPaletteState reduce_command_palette(const AppState &prev,
                                           const Action &action,
                                           const Theme &theme,
                                           std::vector<Effect> &effects) {
  (void)effects;
  CommandPaletteState next = prev.palette;
  bool changed = false;
  bool refilter = false;

  std::visit(
      overloaded{
          [&](const actions::OpenCommandPalette &) {
            if (next.open) {
              return;
            }
            next.open = true;
            next.query.clear();
            refilter = true;
          },
          [&](const actions::CloseCommandPalette &) {
            if (!next.open) {
              return;
            }
            CommandPaletteState closed;
            closed.viewport_height = next.viewport_height;
            next = std::move(closed);
            changed = true;
          },
          [&](const actions::CommandPaletteExecute &) {
            if (!next.open) {
              return;
            }
            CommandPaletteState closed;
            closed.viewport_height = next.viewport_height;
            next = std::move(closed);
            changed = true;
          },
          [&](const actions::CommandPaletteInput &a) {
            if (!next.open || a.text.empty()) {
              return;
            }
            next.query += a.text;
            refilter = true;
          },
          [&](const actions::CommandPaletteBackspace &) {
            if (!next.open || next.query.empty()) {
              return;
            }
            pop_code_point(next.query);
            refilter = true;
          },
          [&](const actions::CommandPaletteNext &) {
            if (!next.open || next.selected + 1 >= next.matches.size()) {
              return;
            }
            ++next.selected;
            changed = true;
          },
          [&](const actions::CommandPalettePrevious &) {
            if (!next.open || next.selected == 0) {
              return;
            }
            --next.selected;
            changed = true;
          },
          [&](const actions::ToggleTheme &) { changed = next.open; },
          [](const auto &) {},
      },
      action);

  if (refilter) {
    next.matches = filter_palette_commands(prev.settings.palette_commands,
                                           next.query, palette_context(prev));
    next.selected = 0;
    changed = true;
  }
  if (changed) {
    next.view = recompute_command_palette(next, prev.settings.palette_commands,
                                          theme);
  }
  return next;
}

} // namespace prdeck
