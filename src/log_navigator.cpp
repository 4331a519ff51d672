#include "log_navigator.hpp"

namespace prdeck {

namespace {

constexpr std::size_t kLineDepth = 4;

void append_visible(const LogTree &tree, const ExpansionSet &expanded,
                    LogPath &path, std::vector<LogPath> &out) {
  const std::size_t count = tree.child_count(path);
  for (std::size_t i = 0; i < count; ++i) {
    path.push_back(i);
    out.push_back(path);
    if (expanded.count(path) > 0) {
      append_visible(tree, expanded, path, out);
    }
    path.pop_back();
  }
}

/// First (forward) or last (backward) error line inside the subtree at
/// @p path, including @p path itself when it is a line.
std::optional<LogPath> edge_error(const LogTree &tree, const LogPath &path,
                                  Direction direction) {
  if (path.size() >= kLineDepth) {
    return tree.is_failing(path) ? std::optional<LogPath>(path) : std::nullopt;
  }
  const std::size_t count = tree.child_count(path);
  LogPath child = path;
  child.push_back(0);
  for (std::size_t n = 0; n < count; ++n) {
    child.back() = direction == Direction::Forward ? n : count - 1 - n;
    if (!tree.is_failing(child)) {
      continue;
    }
    if (auto found = edge_error(tree, child, direction)) {
      return found;
    }
  }
  return std::nullopt;
}

} // namespace

std::vector<LogPath> flatten_visible(const LogTree &tree,
                                     const ExpansionSet &expanded) {
  std::vector<LogPath> out;
  LogPath path;
  append_visible(tree, expanded, path, out);
  return out;
}

ExpansionSet toggle(const LogTree &tree, const ExpansionSet &expanded,
                    const LogPath &path) {
  if (path.empty() || !tree.contains(path) || tree.child_count(path) == 0) {
    return expanded;
  }
  ExpansionSet next = expanded;
  auto it = next.find(path);
  if (it != next.end()) {
    next.erase(it);
  } else {
    next.insert(path);
  }
  return next;
}

ExpansionSet expand_ancestors(const ExpansionSet &expanded,
                              const LogPath &path) {
  ExpansionSet next = expanded;
  for (std::size_t len = 1; len < path.size(); ++len) {
    next.insert(LogPath(path.begin(), path.begin() + len));
  }
  return next;
}

ExpansionSet default_expansion(const LogTree &tree) {
  ExpansionSet expanded;
  const auto &workflows = tree.workflows();
  for (std::size_t w = 0; w < workflows.size(); ++w) {
    expanded.insert({w});
    const auto &jobs = workflows[w].jobs();
    for (std::size_t j = 0; j < jobs.size(); ++j) {
      if (!jobs[j].has_failures()) {
        continue;
      }
      expanded.insert({w, j});
      const auto &steps = jobs[j].steps();
      for (std::size_t s = 0; s < steps.size(); ++s) {
        if (steps[s].has_failures()) {
          expanded.insert({w, j, s});
        }
      }
    }
  }
  return expanded;
}

std::optional<LogPath> find_next_error(const LogTree &tree,
                                       const LogPath &cursor,
                                       Direction direction) {
  if (cursor.size() > kLineDepth || !tree.contains(cursor)) {
    return std::nullopt;
  }
  if (direction == Direction::Forward && cursor.size() < kLineDepth) {
    if (auto inside = edge_error(tree, cursor, direction)) {
      return inside;
    }
  }
  // Walk up one level at a time, scanning siblings past the cursor's
  // ancestor at that level.
  for (std::size_t level = cursor.size(); level > 0; --level) {
    LogPath parent(cursor.begin(), cursor.begin() + (level - 1));
    const std::size_t count = tree.child_count(parent);
    const std::size_t index = cursor[level - 1];
    LogPath sibling = parent;
    sibling.push_back(index);
    if (direction == Direction::Forward) {
      for (std::size_t i = index + 1; i < count; ++i) {
        sibling.back() = i;
        if (tree.is_failing(sibling)) {
          if (auto found = edge_error(tree, sibling, direction)) {
            return found;
          }
        }
      }
    } else {
      for (std::size_t i = index; i > 0; --i) {
        sibling.back() = i - 1;
        if (tree.is_failing(sibling)) {
          if (auto found = edge_error(tree, sibling, direction)) {
            return found;
          }
        }
      }
    }
  }
  return std::nullopt;
}

} // namespace prdeck
