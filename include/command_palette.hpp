/**
 * @file command_palette.hpp
 * @brief Fuzzy search over the commands of the key map.
 */

#ifndef PRDECK_COMMAND_PALETTE_HPP
#define PRDECK_COMMAND_PALETTE_HPP

#include "key_map.hpp"
#include "state.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace prdeck {

/// Facts about the current screen that decide which commands can run.
struct PaletteContext {
  bool log_panel_open{false};
  bool has_pull_requests{false};
};

PaletteContext palette_context(const AppState &state);

/**
 * Whether @p command can run in @p ctx.
 *
 * Table commands need the table in front, log viewer commands need the log
 * panel and pull request commands need a visible pull request.
 */
bool palette_command_available(const PaletteCommand &command,
                               const PaletteContext &ctx);

/**
 * Score @p query as a fuzzy match against @p text.
 *
 * Matching is a case-insensitive subsequence search. Consecutive characters
 * and characters at the start of a word score higher, skipped characters
 * cost. Whitespace in the query is ignored.
 *
 * @return `std::nullopt` when @p query does not match, 0 for a blank query.
 */
std::optional<int> fuzzy_score(const std::string &text,
                               const std::string &query);

/// Text a palette query is matched against: title, category and name.
std::string searchable_text(const PaletteCommand &command);

/**
 * Indices of the commands available in @p ctx that match @p query.
 *
 * Best matches come first and equal scores keep list order. A blank query
 * lists every available command in list order.
 */
std::vector<std::size_t>
filter_palette_commands(const std::vector<PaletteCommand> &commands,
                        const std::string &query, const PaletteContext &ctx);

/// Command under the palette selection, or null when nothing is selected.
const PaletteCommand *selected_palette_command(const AppState &state);

} // namespace prdeck

#endif // PRDECK_COMMAND_PALETTE_HPP
