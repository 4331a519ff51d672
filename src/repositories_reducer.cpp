#include "reducer.hpp"
#include "util/overloaded.hpp"
#include "util/shell.hpp"

#include <algorithm>
#include <utility>

namespace prdeck {

namespace {

std::optional<std::size_t> index_of(const RepositoriesState &repos,
                                    const std::string &key) {
  for (std::size_t i = 0; i < repos.repos.size(); ++i) {
    if (repos.repos[i].repo.key() == key) {
      return i;
    }
  }
  return std::nullopt;
}

void follow_cursor(RepositoryData &data, std::size_t viewport) {
  if (viewport == 0) {
    viewport = 1;
  }
  if (data.cursor < data.scroll) {
    data.scroll = data.cursor;
  } else if (data.cursor >= data.scroll + viewport) {
    data.scroll = data.cursor - viewport + 1;
  }
}

void clamp_cursor(RepositoryData &data, PrFilter filter, std::size_t viewport) {
  const std::size_t count = visible_pull_requests(data, filter).size();
  if (count == 0) {
    data.cursor = 0;
    data.scroll = 0;
    return;
  }
  data.cursor = std::min(data.cursor, count - 1);
  data.scroll = std::min(data.scroll, data.cursor);
  follow_cursor(data, viewport);
}

void start_fetch(RepositoryData &data, std::vector<Effect> &effects) {
  data.load = LoadState::Loading;
  effects.emplace_back(effects::FetchPullRequests{data.repo});
}

std::string pull_request_url(const std::string &web_base, const Repository &repo,
                             int number) {
  std::string base = web_base;
  while (!base.empty() && base.back() == '/') {
    base.pop_back();
  }
  return base + "/" + repo.org + "/" + repo.repo + "/pull/" +
         std::to_string(number);
}

/// Substitute `{org}`, `{repo}`, `{branch}` and `{number}` in a command.
/// Names are shell-quoted.
std::string expand_command(std::string command, const Repository &repo,
                           int number) {
  const std::pair<const char *, std::string> vars[] = {
      {"{org}", shell_quote(repo.org)},
      {"{repo}", shell_quote(repo.repo)},
      {"{branch}", shell_quote(repo.branch)},
      {"{number}", std::to_string(number)}};
  for (const auto &var : vars) {
    const std::string token = var.first;
    for (auto pos = command.find(token); pos != std::string::npos;
         pos = command.find(token, pos + var.second.size())) {
      command.replace(pos, token.size(), var.second);
    }
  }
  return command;
}

/// Pull requests an operation applies to: the selection, or the row under
/// the cursor when nothing is selected.
std::vector<int> operation_targets(const RepositoryData &data, PrFilter filter) {
  if (!data.selected.empty()) {
    std::vector<int> out;
    for (const auto &pr : data.prs) {
      if (data.selected.count(pr.number)) {
        out.push_back(pr.number);
      }
    }
    return out;
  }
  const auto visible = visible_pull_requests(data, filter);
  if (data.cursor < visible.size()) {
    return {visible[data.cursor]->number};
  }
  return {};
}

} // namespace

RepositoriesState reduce_repositories(const AppState &prev,
                                      const Action &action, const Theme &theme,
                                      std::vector<Effect> &effects) {
  RepositoriesState next = prev.repositories;
  bool changed = false;
  bool save = false;
  ThemeKind session_theme = prev.ui.theme;
  bool session_timestamps = prev.log_panel.show_timestamps;

  auto current = [&]() -> RepositoryData * {
    if (next.current >= next.repos.size()) {
      return nullptr;
    }
    return &next.repos[next.current];
  };

  std::visit(
      overloaded{
          [&](const actions::Bootstrap &a) {
            if (!a.session.repositories.empty()) {
              next.repos.clear();
              for (const auto &repo : a.session.repositories) {
                if (index_of(next, repo.key())) {
                  continue;
                }
                RepositoryData data;
                data.repo = repo;
                next.repos.push_back(std::move(data));
              }
            }
            for (auto &data : next.repos) {
              auto it = a.session.selected_prs.find(data.repo.key());
              if (it != a.session.selected_prs.end()) {
                data.selected = std::set<int>(it->second.begin(), it->second.end());
              }
              start_fetch(data, effects);
            }
            next.filter = a.session.filter;
            next.current = next.repos.empty()
                               ? 0
                               : std::min(a.session.selected_tab,
                                          next.repos.size() - 1);
            changed = true;
          },
          [&](const actions::ToggleTheme &) {
            session_theme = toggled(prev.ui.theme);
            changed = save = true;
          },
          [&](const actions::ToggleTimestamps &) {
            session_timestamps = !prev.log_panel.show_timestamps;
            save = true;
          },
          [&](const actions::ResizeViewport &a) {
            if (a.table_rows == next.viewport_height) {
              return;
            }
            next.viewport_height = a.table_rows;
            for (auto &data : next.repos) {
              clamp_cursor(data, next.filter, next.viewport_height);
            }
            changed = true;
          },
          [&](const actions::AddRepository &a) {
            if (auto existing = index_of(next, a.repo.key())) {
              next.current = *existing;
            } else {
              RepositoryData data;
              data.repo = a.repo;
              start_fetch(data, effects);
              next.repos.push_back(std::move(data));
              next.current = next.repos.size() - 1;
            }
            changed = save = true;
          },
          [&](const actions::RemoveCurrentRepository &) {
            if (next.current >= next.repos.size()) {
              return;
            }
            next.repos.erase(next.repos.begin() +
                             static_cast<std::ptrdiff_t>(next.current));
            if (next.current >= next.repos.size() && next.current > 0) {
              next.current = next.repos.size() - 1;
            }
            if (next.repos.empty()) {
              next.current = 0;
            }
            changed = save = true;
          },
          [&](const actions::SelectRepository &a) {
            if (a.index < next.repos.size() && a.index != next.current) {
              next.current = a.index;
              changed = save = true;
            }
          },
          [&](const actions::NextRepository &) {
            if (next.repos.size() > 1) {
              next.current = (next.current + 1) % next.repos.size();
              changed = save = true;
            }
          },
          [&](const actions::PreviousRepository &) {
            if (next.repos.size() > 1) {
              next.current = next.current == 0 ? next.repos.size() - 1
                                               : next.current - 1;
              changed = save = true;
            }
          },
          [&](const actions::RefreshCurrentRepository &) {
            if (auto *data = current()) {
              start_fetch(*data, effects);
              changed = true;
            }
          },
          [&](const actions::RefreshRepository &a) {
            if (auto idx = index_of(next, a.repo_key)) {
              start_fetch(next.repos[*idx], effects);
              changed = true;
            }
          },
          [&](const actions::PullRequestsLoaded &a) {
            auto idx = index_of(next, a.repo_key);
            if (!idx) {
              return;
            }
            auto &data = next.repos[*idx];
            data.prs = a.prs;
            std::set<int> still_open;
            for (const auto &pr : data.prs) {
              if (data.selected.count(pr.number)) {
                still_open.insert(pr.number);
              }
            }
            save = still_open != data.selected;
            data.selected = std::move(still_open);
            data.load = LoadState::Loaded;
            data.error.reset();
            clamp_cursor(data, next.filter, next.viewport_height);
            changed = true;
          },
          [&](const actions::PullRequestsLoadFailed &a) {
            auto idx = index_of(next, a.repo_key);
            if (!idx) {
              return;
            }
            auto &data = next.repos[*idx];
            data.load = LoadState::Failed;
            data.error = a.failure;
            changed = true;
          },
          [&](const actions::PrCursorUp &) {
            auto *data = current();
            if (!data || data->cursor == 0) {
              return;
            }
            --data->cursor;
            follow_cursor(*data, next.viewport_height);
            changed = true;
          },
          [&](const actions::PrCursorDown &) {
            auto *data = current();
            if (!data) {
              return;
            }
            const std::size_t count =
                visible_pull_requests(*data, next.filter).size();
            if (data->cursor + 1 >= count) {
              return;
            }
            ++data->cursor;
            follow_cursor(*data, next.viewport_height);
            changed = true;
          },
          [&](const actions::TogglePrSelection &) {
            auto *data = current();
            if (!data) {
              return;
            }
            const auto visible = visible_pull_requests(*data, next.filter);
            if (data->cursor >= visible.size()) {
              return;
            }
            const int number = visible[data->cursor]->number;
            if (!data->selected.erase(number)) {
              data->selected.insert(number);
            }
            changed = save = true;
          },
          [&](const actions::SelectAllPrs &) {
            auto *data = current();
            if (!data) {
              return;
            }
            for (const auto *pr : visible_pull_requests(*data, next.filter)) {
              data->selected.insert(pr->number);
            }
            changed = save = true;
          },
          [&](const actions::ClearPrSelection &) {
            auto *data = current();
            if (!data || data->selected.empty()) {
              return;
            }
            data->selected.clear();
            changed = save = true;
          },
          [&](const actions::CycleFilter &) {
            next.filter = next_filter(next.filter);
            for (auto &data : next.repos) {
              data.cursor = 0;
              data.scroll = 0;
            }
            changed = save = true;
          },
          [&](const actions::RunPrOperation &a) {
            auto *data = current();
            if (!data) {
              return;
            }
            if (a.op == PrOperation::OpenInIde &&
                prev.settings.ide_command.empty()) {
              return;
            }
            for (int number : operation_targets(*data, next.filter)) {
              effects::RunPrOperation effect{data->repo, number, a.op, {}};
              switch (a.op) {
              case PrOperation::Approve:
                effect.argument = prev.settings.approval_message;
                break;
              case PrOperation::OpenInBrowser:
                effect.argument =
                    pull_request_url(prev.settings.web_base, data->repo, number);
                break;
              case PrOperation::OpenInIde:
                effect.argument = expand_command(prev.settings.ide_command,
                                                 data->repo, number);
                break;
              default:
                break;
              }
              for (auto &pr : data->prs) {
                if (pr.number != number) {
                  continue;
                }
                if (a.op == PrOperation::Merge) {
                  pr.mergeable = MergeableStatus::Merging;
                  changed = true;
                } else if (a.op == PrOperation::Rebase) {
                  pr.mergeable = MergeableStatus::Rebasing;
                  changed = true;
                }
              }
              effects.emplace_back(std::move(effect));
            }
          },
          [&](const actions::PrOperationSucceeded &a) {
            if (a.op != PrOperation::Merge && a.op != PrOperation::Rebase) {
              return;
            }
            if (auto idx = index_of(next, a.repo_key)) {
              start_fetch(next.repos[*idx], effects);
              changed = true;
            }
          },
          [&](const actions::PrOperationFailed &a) {
            if (a.op != PrOperation::Merge && a.op != PrOperation::Rebase) {
              return;
            }
            // Restore the real status of the pull request.
            if (auto idx = index_of(next, a.repo_key)) {
              start_fetch(next.repos[*idx], effects);
              changed = true;
            }
          },
          [](const auto &) {},
      },
      action);

  if (save) {
    effects.emplace_back(effects::SaveSession{capture_session(
        next, session_timestamps, session_theme)});
  }
  if (changed) {
    next.view = recompute_pr_table(next, theme);
  }
  return next;
}

} // namespace prdeck
