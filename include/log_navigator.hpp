/**
 * @file log_navigator.hpp
 * @brief Visibility, expansion and error traversal over a LogTree.
 *
 * All functions are pure: they read the tree and an expansion set and return
 * new values. Invalid paths are treated as no-ops.
 */

#ifndef PRDECK_LOG_NAVIGATOR_HPP
#define PRDECK_LOG_NAVIGATOR_HPP

#include "log_tree.hpp"

#include <optional>
#include <set>
#include <vector>

namespace prdeck {

/// Set of expanded node paths.
using ExpansionSet = std::set<LogPath>;

/// Direction of a traversal.
enum class Direction { Forward, Backward };

/**
 * Depth-first pre-order list of visible paths.
 *
 * Workflows are always visible. The children of a node are listed only when
 * the node's path is in @p expanded.
 *
 * @param tree Log tree to walk.
 * @param expanded Expanded node paths.
 * @return Visible paths in display order.
 */
std::vector<LogPath> flatten_visible(const LogTree &tree,
                                     const ExpansionSet &expanded);

/**
 * Flip the expansion of @p path.
 *
 * @return Updated set. Unchanged when the node has no children or the path
 *         is not part of the tree.
 */
ExpansionSet toggle(const LogTree &tree, const ExpansionSet &expanded,
                    const LogPath &path);

/// Add every ancestor of @p path (excluding the root) to the set.
ExpansionSet expand_ancestors(const ExpansionSet &expanded, const LogPath &path);

/// Expansion used when logs are first shown: every workflow plus every
/// failing job and step.
ExpansionSet default_expansion(const LogTree &tree);

/**
 * Find the next error line from @p cursor.
 *
 * Scans the remaining lines of the current step, then sibling steps of the
 * current job, then sibling jobs of the current workflow, then sibling
 * workflows. A failing sibling is entered at its first error line when going
 * forward and its last error line when going backward. Moving forward from a
 * workflow, job or step first searches inside that node.
 *
 * @param tree Log tree.
 * @param cursor Current cursor path (empty for the root).
 * @param direction Scan direction.
 * @return Path of the error line, or `std::nullopt` when no further error
 *         exists in that direction or the cursor is not in the tree.
 */
std::optional<LogPath> find_next_error(const LogTree &tree,
                                       const LogPath &cursor,
                                       Direction direction);

} // namespace prdeck

#endif // PRDECK_LOG_NAVIGATOR_HPP
