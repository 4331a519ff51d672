/**
 * @file reducer.hpp
 * @brief Pure state transitions.
 */

#ifndef PRDECK_REDUCER_HPP
#define PRDECK_REDUCER_HPP

#include "action.hpp"
#include "effect.hpp"
#include "state.hpp"
#include "theme.hpp"

#include <vector>

namespace prdeck {

/// New state plus the effects to run.
struct Reduction {
  AppState state;
  std::vector<Effect> effects;
};

/**
 * Apply one action to the whole state.
 *
 * Never throws and performs no I/O. Slices an action does not concern are
 * returned unchanged, including their cached view models.
 *
 * CommandPaletteExecute closes the palette and then reduces the action of
 * the selected command; the effects of both steps are returned in order.
 */
Reduction reduce(const AppState &state, const Action &action);

/// UI chrome: theme, overlays, status line, clock, quit.
UiState reduce_ui(const AppState &prev, const Action &action,
                  std::vector<Effect> &effects);

/// Repositories, pull request lists, selection and user operations.
RepositoriesState reduce_repositories(const AppState &prev,
                                      const Action &action, const Theme &theme,
                                      std::vector<Effect> &effects);

/// Build log panel: loading, navigation, expansion and error jumps.
LogPanelState reduce_log_panel(const AppState &prev, const Action &action,
                               const Theme &theme,
                               std::vector<Effect> &effects);

/// Command palette: open, query, selection. Running the selection is chained
/// by reduce().
CommandPaletteState reduce_command_palette(const AppState &prev,
                                           const Action &action,
                                           const Theme &theme,
                                           std::vector<Effect> &effects);

} // namespace prdeck

#endif // PRDECK_REDUCER_HPP
