#include "internal/dedup/plan.hpp"

#include <algorithm>
#include <array>
#include <stdexcept>

#include "internal/util/errors.hpp"

namespace roster::dedup {
namespace {

constexpr std::array<PassInfo, kPassCount> kPasses = {{
    {"delete", "junk removal"},
    {"merge", "exact normalized"},
    {"merge", "single-word evidence"},
    {"delete", "single-word cleanup"},
    {"mixed", "key figure variants"},
    {"merge", "middle-initial"},
    {"merge", "OCR/nickname"},
}};

} // namespace

void DeduplicationAction::TransitionTo(ActionStatus next) {
  if (!roster::model::CanTransition(status, next)) {
    throw util::InvalidState("action " + std::to_string(id) + ": cannot move from " +
                             std::string(roster::model::ToString(status)) + " to " +
                             std::string(roster::model::ToString(next)));
  }
  status = next;
}

std::size_t DeduplicationPlan::CountWithStatus(ActionStatus s) const {
  return static_cast<std::size_t>(
      std::count_if(actions.begin(), actions.end(), [s](const DeduplicationAction& a) { return a.status == s; }));
}

const PassInfo& PassInfoFor(int pass) {
  if (pass < 0 || pass >= kPassCount) {
    throw std::out_of_range("no deduplication pass " + std::to_string(pass));
  }
  return kPasses[static_cast<std::size_t>(pass)];
}

void Summarize(DeduplicationPlan& plan) {
  plan.by_pass.clear();
  for (const auto& action : plan.actions) {
    auto [it, inserted] = plan.by_pass.try_emplace(action.pass);
    if (inserted) {
      const auto& info = PassInfoFor(action.pass);
      it->second.type  = std::string(info.type);
      it->second.label = std::string(info.label);
    }
    ++it->second.count;
  }
}

} // namespace roster::dedup
