#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/dedup/cascade_delete.hpp"
#include "internal/dedup/merge_executor.hpp"
#include "internal/dedup/plan.hpp"

namespace roster::dedup {

using db::model::PersonRecord;

/*
  ActionSink

  Where the passes send their decisions. Both calls return the ids
  that left the roster, which the pipeline then drops from its
  snapshot.

    PlanSink   records pending actions (dry-run)
    ApplySink  mutates the store immediately (apply)
*/
class ActionSink {
 public:
  virtual ~ActionSink() = default;

  virtual std::vector<PersonId> Delete(int pass, std::string_view reason,
                                       const std::vector<const PersonRecord*>& targets) = 0;

  virtual std::vector<PersonId> Merge(int pass, std::string_view reason, const PersonRecord& canonical,
                                      const std::vector<const PersonRecord*>& duplicates,
                                      const std::vector<std::string>& all_names, std::string evidence) = 0;

  virtual bool DryRun() const = 0;
};

// One pending action per deleted person, one per merge group.
class PlanSink final : public ActionSink {
 public:
  explicit PlanSink(std::vector<DeduplicationAction>& actions);

  std::vector<PersonId> Delete(int pass, std::string_view reason,
                               const std::vector<const PersonRecord*>& targets) override;

  std::vector<PersonId> Merge(int pass, std::string_view reason, const PersonRecord& canonical,
                              const std::vector<const PersonRecord*>& duplicates,
                              const std::vector<std::string>& all_names, std::string evidence) override;

  bool DryRun() const override {
    return true;
  }

 private:
  std::vector<DeduplicationAction>& actions_;
  std::int64_t                      next_id_ = 1;
};

// Failures are logged and reported as "nothing removed"; never fatal.
class ApplySink final : public ActionSink {
 public:
  ApplySink(std::shared_ptr<db::Repository> repository, std::size_t delete_chunk_size);

  std::vector<PersonId> Delete(int pass, std::string_view reason,
                               const std::vector<const PersonRecord*>& targets) override;

  std::vector<PersonId> Merge(int pass, std::string_view reason, const PersonRecord& canonical,
                              const std::vector<const PersonRecord*>& duplicates,
                              const std::vector<std::string>& all_names, std::string evidence) override;

  bool DryRun() const override {
    return false;
  }

 private:
  MergeExecutor merger_;
  CascadeDelete cascade_;
};

} // namespace roster::dedup
