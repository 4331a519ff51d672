#include "effect.hpp"
#include "util/overloaded.hpp"

#include <sstream>

namespace prdeck {

namespace {

std::string target(const Repository &repo, int number) {
  return repo.key() + "#" + std::to_string(number);
}

} // namespace

const char *to_string(Subsystem subsystem) {
  switch (subsystem) {
  case Subsystem::Repositories:
    return "repositories";
  case Subsystem::Logs:
    return "logs";
  case Subsystem::MergeBot:
    return "merge_bot";
  case Subsystem::Ui:
    return "ui";
  }
  return "ui";
}

Subsystem subsystem_of(const Effect &effect) {
  return std::visit(
      overloaded{
          [](const effects::FetchPullRequests &) { return Subsystem::Repositories; },
          [](const effects::FetchBuildLogs &) { return Subsystem::Logs; },
          [](const effects::RunPrOperation &) { return Subsystem::Repositories; },
          [](const effects::CheckMergeStatus &) { return Subsystem::MergeBot; },
          [](const effects::MergeBotRebase &) { return Subsystem::MergeBot; },
          [](const effects::MergeBotMerge &) { return Subsystem::MergeBot; },
          [](const effects::MergeBotRerun &) { return Subsystem::MergeBot; },
          [](const effects::StartTimer &e) { return e.subsystem; },
          [](const effects::CancelSubsystem &e) { return e.subsystem; },
          [](const effects::SaveSession &) { return Subsystem::Ui; },
          [](const effects::RecordMergeOutcome &) { return Subsystem::MergeBot; },
      },
      effect);
}

std::string describe(const Effect &effect) {
  std::ostringstream oss;
  std::visit(
      overloaded{
          [&](const effects::FetchPullRequests &e) {
            oss << "fetch_pull_requests " << e.repo.key();
          },
          [&](const effects::FetchBuildLogs &e) {
            oss << "fetch_build_logs " << target(e.repo, e.pr.number);
          },
          [&](const effects::RunPrOperation &e) {
            oss << "pr_operation " << to_string(e.op) << ' '
                << target(e.repo, e.number);
            if (!e.argument.empty()) {
              oss << " arg=" << e.argument;
            }
          },
          [&](const effects::CheckMergeStatus &e) {
            oss << "merge_bot.check " << target(e.repo, e.number)
                << " run=" << e.run_id;
          },
          [&](const effects::MergeBotRebase &e) {
            oss << "merge_bot.rebase " << target(e.repo, e.number)
                << " run=" << e.run_id;
          },
          [&](const effects::MergeBotMerge &e) {
            oss << "merge_bot.merge " << target(e.repo, e.number)
                << " run=" << e.run_id;
          },
          [&](const effects::MergeBotRerun &e) {
            oss << "merge_bot.rerun " << target(e.repo, e.number)
                << " run=" << e.run_id;
          },
          [&](const effects::StartTimer &e) {
            oss << "timer " << to_string(e.subsystem) << ' '
                << e.delay.count() << "ms -> " << action_name(e.follow_up);
          },
          [&](const effects::CancelSubsystem &e) {
            oss << "cancel " << to_string(e.subsystem);
          },
          [&](const effects::SaveSession &e) {
            oss << "save_session repos=" << e.session.repositories.size()
                << " tab=" << e.session.selected_tab;
          },
          [&](const effects::RecordMergeOutcome &e) {
            oss << "record_outcome " << e.outcome.repo_key << '#'
                << e.outcome.number << ' '
                << (e.outcome.merged ? "merged" : "failed")
                << " attempts=" << e.outcome.attempts;
          },
      },
      effect);
  return oss.str();
}

std::vector<std::string> describe(const std::vector<Effect> &effects) {
  std::vector<std::string> out;
  out.reserve(effects.size());
  for (const auto &e : effects) {
    out.push_back(describe(e));
  }
  return out;
}

} // namespace prdeck
