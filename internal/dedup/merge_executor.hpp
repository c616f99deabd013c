#pragma once

#include <memory>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace roster::dedup {

using db::model::PersonId;

/*
  MergeExecutor

  Folds duplicate persons into a canonical one inside a single
  transaction:

    1. aliases += names other than the canonical's, capped at kMaxAliases
    2. document links repointed, repeated (person, document) rows dropped
    3. connections repointed, self-loops and stragglers dropped
    4. timeline person_ids rewritten and de-duplicated
    5. leftover links of the duplicates dropped
    6. duplicate person rows deleted
    7. canonical counts recomputed

  Re-running with duplicates that no longer exist is a no-op.
*/
class MergeExecutor {
 public:
  explicit MergeExecutor(std::shared_ptr<db::Repository> repository);

  /*
    Returns the number of duplicates actually absorbed.

    Throws util::NotFound if the canonical is gone, util::StoreError
    (or another util error) if a write fails; the transaction is then
    rolled back and nothing is applied.
  */
  std::size_t Merge(PersonId canonical_id, const std::vector<PersonId>& duplicate_ids,
                    const std::vector<std::string>& all_names);

  // Aliases after folding `all_names` into `existing`.
  static std::vector<std::string> MergeAliases(const std::string& canonical_name, const std::vector<std::string>& existing,
                                               const std::vector<std::string>& all_names);

 private:
  std::shared_ptr<db::Repository> repository_;
};

} // namespace roster::dedup
