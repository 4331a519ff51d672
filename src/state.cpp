#include "state.hpp"

namespace prdeck {

AppState make_initial_state(const AppSettings &settings) {
  AppState state;
  state.settings = settings;
  state.repositories.viewport_height = settings.viewport_height;
  state.log_panel.viewport_height = settings.viewport_height;
  state.merge_bot.settings = settings.merge_bot;
  return state;
}

const RepositoryData *current_repository(const RepositoriesState &repos) {
  if (repos.current >= repos.repos.size()) {
    return nullptr;
  }
  return &repos.repos[repos.current];
}

std::vector<const PullRequest *> visible_pull_requests(const RepositoryData &data,
                                                       PrFilter filter) {
  std::vector<const PullRequest *> out;
  for (const auto &pr : data.prs) {
    if (matches_filter(pr, filter)) {
      out.push_back(&pr);
    }
  }
  return out;
}

SessionState capture_session(const RepositoriesState &repos,
                             bool show_timestamps, ThemeKind theme) {
  SessionState session;
  for (const auto &data : repos.repos) {
    session.repositories.push_back(data.repo);
    if (!data.selected.empty()) {
      session.selected_prs[data.repo.key()] =
          std::vector<int>(data.selected.begin(), data.selected.end());
    }
  }
  session.selected_tab = repos.current;
  session.filter = repos.filter;
  session.show_timestamps = show_timestamps;
  session.theme = theme;
  return session;
}

SessionState capture_session(const AppState &state) {
  return capture_session(state.repositories, state.log_panel.show_timestamps,
                         state.ui.theme);
}

} // namespace prdeck
