/**
 * @file view_model.hpp
 * @brief Display-ready projections of state slices.
 *
 * View models are immutable values rebuilt wholesale by the reducers. Slices
 * hold them as `std::shared_ptr<const T>`; a null pointer means there is no
 * data to show.
 */

#ifndef PRDECK_VIEW_MODEL_HPP
#define PRDECK_VIEW_MODEL_HPP

#include "log_tree.hpp"
#include "theme.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace prdeck {

struct LogPanelState;
struct RepositoriesState;
struct MergeBotState;
struct CommandPaletteState;
struct PaletteCommand;

/// Visual emphasis of a row.
enum class RowStyle { Normal, Error, Success, Selected };

/// Kind of log tree node a row represents.
enum class NodeType { Workflow, Job, Step, LogLine };

struct PrHeaderViewModel {
  std::string number_text; ///< "#123"
  std::string title;
  std::string author_text; ///< "by octocat"
  Color number_color{Color::Default};
  Color title_color{Color::Default};
  Color author_color{Color::Default};
};

struct TreeRowViewModel {
  std::string text;
  std::size_t indent_level{0};
  bool is_cursor{false};
  RowStyle style{RowStyle::Normal};
  Color fg{Color::Default};
  Color bg{Color::Default};
  LogPath path;
  NodeType node_type{NodeType::Workflow};
};

/// Build log tree projection. Only rows inside the viewport are built.
struct LogPanelViewModel {
  PrHeaderViewModel header;
  std::vector<TreeRowViewModel> rows;
  std::size_t scroll_offset{0};
  std::size_t viewport_height{0};
  std::size_t total_rows{0};
  std::string summary; ///< e.g. "3 errors in 2 workflows"
};

struct RepositoryTabViewModel {
  std::string label;
  bool active{false};
  bool loading{false};
  bool failed{false};
};

struct PrRowViewModel {
  int number{0};
  std::string text;
  std::string status_label;
  bool selected{false};
  bool is_cursor{false};
  Color status_color{Color::Default};
  Color fg{Color::Default};
  Color bg{Color::Default};
};

/// Repository tabs plus the pull request table of the current repository.
struct PrTableViewModel {
  std::vector<RepositoryTabViewModel> tabs;
  std::vector<PrRowViewModel> rows;
  std::size_t scroll_offset{0};
  std::size_t total_rows{0};
  std::string filter_label;
  std::string empty_message; ///< Shown when no row is visible
  std::size_t selected_count{0};
};

struct MergeQueueRowViewModel {
  int number{0};
  std::string text;
  std::string state_label;
  std::string attempts; ///< "1/3"
  std::string countdown; ///< "retry in 25s", empty when none
  std::string last_error;
  Color color{Color::Default};
};

struct MergeBotViewModel {
  bool running{false};
  std::string summary;
  std::vector<MergeQueueRowViewModel> rows;
  std::vector<std::string> failures;
};

struct CommandPaletteRowViewModel {
  std::string indicator; ///< "> " on the selected row, two spaces otherwise
  std::string shortcut;  ///< Bound keys padded to a fixed column
  std::string title;
  std::string category; ///< "[Log Viewer]", right-aligned across rows
  bool is_selected{false};
  Color fg{Color::Default};
  Color bg{Color::Default};
  Color shortcut_color{Color::Default};
  Color category_color{Color::Default};
};

/// Command palette overlay. Only rows inside the window are built.
struct CommandPaletteViewModel {
  std::string input_text; ///< "> query"
  std::vector<CommandPaletteRowViewModel> rows;
  std::size_t scroll_offset{0};
  std::size_t total_commands{0}; ///< Commands matching the query
  std::string selected_command;  ///< Key map name of the selected command
  std::string empty_message;     ///< Shown when nothing matches
};

/**
 * Build the log panel view model.
 *
 * @return Null when no log tree is loaded.
 */
std::shared_ptr<const LogPanelViewModel>
recompute_log_panel(const LogPanelState &panel, const Theme &theme);

/**
 * Build the pull request table view model.
 *
 * @return Null when no repository is configured.
 */
std::shared_ptr<const PrTableViewModel>
recompute_pr_table(const RepositoriesState &repos, const Theme &theme);

/**
 * Build the merge bot view model.
 *
 * @return Null when the bot has never been started or everything was
 *         dismissed.
 */
std::shared_ptr<const MergeBotViewModel>
recompute_merge_bot(const MergeBotState &bot, const Theme &theme);

/**
 * Build the command palette view model.
 *
 * @param commands Every palette command; the palette state indexes into it.
 * @return Null when the palette is closed.
 */
std::shared_ptr<const CommandPaletteViewModel>
recompute_command_palette(const CommandPaletteState &palette,
                          const std::vector<PaletteCommand> &commands,
                          const Theme &theme);

/**
 * First row of a window of @p height rows over @p total rows that keeps
 * @p selected near the middle.
 */
std::size_t palette_window_start(std::size_t selected, std::size_t total,
                                 std::size_t height);

} // namespace prdeck

#endif // PRDECK_VIEW_MODEL_HPP
