#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/db/model/person_record.hpp"
#include "internal/model/action_state.hpp"
#include "internal/util/time.hpp"

namespace roster::dedup {

using db::model::PersonId;
using roster::model::ActionStatus;
using roster::model::ActionType;

inline constexpr int kPassCount = 7;

struct PersonRef {
  PersonId    id = 0;
  std::string name;
};

/*
  One proposed change.

  delete: targets
  merge:  canonical + duplicates

  Created by dry-run, mutated only through TransitionTo by the plan
  executor, never removed from a plan.
*/
struct DeduplicationAction {
  std::int64_t id   = 0;
  int          pass = 0;
  ActionType   type = ActionType::kDelete;
  std::string  reason;

  std::vector<PersonRef>   targets;
  std::optional<PersonRef> canonical;
  std::vector<PersonRef>   duplicates;

  std::string  evidence;
  ActionStatus status = ActionStatus::kPending;

  // Throws util::InvalidState on a move the engine may not make.
  void TransitionTo(ActionStatus next);
};

struct PassSummary {
  std::int64_t count = 0;
  std::string  type;
  std::string  label;
};

struct DeduplicationPlan {
  util::TimePoint created_at;
  std::int64_t    person_count_before = 0;

  // keyed by pass number; only passes with actions appear
  std::map<int, PassSummary> by_pass;

  std::vector<DeduplicationAction> actions;

  std::size_t TotalActions() const {
    return actions.size();
  }

  std::size_t CountWithStatus(ActionStatus status) const;
};

struct PassInfo {
  std::string_view type;
  std::string_view label;
};

// Throws std::out_of_range for a pass outside [0, kPassCount).
const PassInfo& PassInfoFor(int pass);

// Rebuilds plan.by_pass from plan.actions.
void Summarize(DeduplicationPlan& plan);

} // namespace roster::dedup
