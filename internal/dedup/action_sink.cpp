#include "internal/dedup/action_sink.hpp"

#include "internal/observability/logging.hpp"

namespace roster::dedup {
namespace {

PersonRef Ref(const PersonRecord& p) {
  return PersonRef{p.id, p.name};
}

std::vector<PersonId> Ids(const std::vector<const PersonRecord*>& persons) {
  std::vector<PersonId> ids;
  ids.reserve(persons.size());
  for (const auto* p : persons) ids.push_back(p->id);
  return ids;
}

} // namespace

// ------------------------------------------------------------------
// PlanSink
// ------------------------------------------------------------------

PlanSink::PlanSink(std::vector<DeduplicationAction>& actions) : actions_(actions) {
  for (const auto& a : actions_) {
    if (a.id >= next_id_) next_id_ = a.id + 1;
  }
}

std::vector<PersonId> PlanSink::Delete(int pass, std::string_view reason,
                                       const std::vector<const PersonRecord*>& targets) {
  for (const auto* target : targets) {
    DeduplicationAction action;
    action.id     = next_id_++;
    action.pass   = pass;
    action.type   = ActionType::kDelete;
    action.reason = std::string(reason);
    action.targets.push_back(Ref(*target));
    actions_.push_back(std::move(action));
  }
  return Ids(targets);
}

std::vector<PersonId> PlanSink::Merge(int pass, std::string_view reason, const PersonRecord& canonical,
                                      const std::vector<const PersonRecord*>& duplicates,
                                      const std::vector<std::string>& /*all_names*/, std::string evidence) {
  if (duplicates.empty()) return {};

  DeduplicationAction action;
  action.id        = next_id_++;
  action.pass      = pass;
  action.type      = ActionType::kMerge;
  action.reason    = std::string(reason);
  action.canonical = Ref(canonical);
  for (const auto* d : duplicates) action.duplicates.push_back(Ref(*d));
  action.evidence = std::move(evidence);
  actions_.push_back(std::move(action));
  return Ids(duplicates);
}

// ------------------------------------------------------------------
// ApplySink
// ------------------------------------------------------------------

ApplySink::ApplySink(std::shared_ptr<db::Repository> repository, std::size_t delete_chunk_size)
    : merger_(repository), cascade_(std::move(repository), delete_chunk_size) {
}

std::vector<PersonId> ApplySink::Delete(int pass, std::string_view reason,
                                        const std::vector<const PersonRecord*>& targets) {
  if (targets.empty()) return {};

  auto result = cascade_.Delete(Ids(targets));
  if (!result.failed.empty()) {
    ROSTER_LOG_WARN("some persons could not be deleted",
                    {observability::IntField("pass", pass), observability::StringField("reason", reason),
                     observability::IntField("failed", static_cast<std::int64_t>(result.failed.size()))});
  }
  return std::move(result.deleted);
}

std::vector<PersonId> ApplySink::Merge(int pass, std::string_view reason, const PersonRecord& canonical,
                                       const std::vector<const PersonRecord*>& duplicates,
                                       const std::vector<std::string>& all_names, std::string /*evidence*/) {
  if (duplicates.empty()) return {};

  try {
    merger_.Merge(canonical.id, Ids(duplicates), all_names);
    return Ids(duplicates);
  } catch (const std::exception& e) {
    ROSTER_LOG_WARN("merge failed, group skipped",
                    {observability::IntField("pass", pass), observability::StringField("reason", reason),
                     observability::StringField("canonical", canonical.name), observability::StringField("error", e.what())});
    return {};
  }
}

} // namespace roster::dedup
