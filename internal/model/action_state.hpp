#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace roster::model {

enum class ActionType : std::uint8_t {
  kDelete = 0,
  kMerge  = 1,
};

enum class ActionStatus : std::uint8_t {
  kPending  = 0,
  kRejected = 1, // set by human review only
  kExecuted = 2,
  kSkipped  = 3,
};

constexpr bool IsTerminal(ActionStatus status) {
  return status == ActionStatus::kExecuted || status == ActionStatus::kSkipped;
}

/*
  Transitions the engine itself may perform.

  pending -> executed | skipped

  rejected is owned by reviewers: the engine never moves an action
  into or out of it.
*/
constexpr bool CanTransition(ActionStatus from, ActionStatus to) {
  if (from == to) {
    return true;
  }
  if (from != ActionStatus::kPending) {
    return false;
  }
  return to == ActionStatus::kExecuted || to == ActionStatus::kSkipped;
}

constexpr std::string_view ToString(ActionType type) {
  return type == ActionType::kMerge ? "merge" : "delete";
}

constexpr std::string_view ToString(ActionStatus status) {
  switch (status) {
    case ActionStatus::kRejected:
      return "rejected";
    case ActionStatus::kExecuted:
      return "executed";
    case ActionStatus::kSkipped:
      return "skipped";
    case ActionStatus::kPending:
      break;
  }
  return "pending";
}

constexpr std::optional<ActionType> ActionTypeFromString(std::string_view text) {
  if (text == "delete") return ActionType::kDelete;
  if (text == "merge") return ActionType::kMerge;
  return std::nullopt;
}

constexpr std::optional<ActionStatus> ActionStatusFromString(std::string_view text) {
  if (text == "pending") return ActionStatus::kPending;
  if (text == "rejected") return ActionStatus::kRejected;
  if (text == "executed") return ActionStatus::kExecuted;
  if (text == "skipped") return ActionStatus::kSkipped;
  return std::nullopt;
}

} // namespace roster::model
