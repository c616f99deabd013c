#include "internal/dedup/merge_executor.hpp"

#include <algorithm>

#include "internal/dedup/store_errors.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace roster::dedup {

MergeExecutor::MergeExecutor(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
}

std::vector<std::string> MergeExecutor::MergeAliases(const std::string& canonical_name,
                                                     const std::vector<std::string>& existing,
                                                     const std::vector<std::string>& all_names) {
  std::vector<std::string> aliases;
  auto add = [&](const std::string& name) {
    if (aliases.size() >= db::model::kMaxAliases) return;
    if (name.empty() || name == canonical_name) return;
    if (std::find(aliases.begin(), aliases.end(), name) != aliases.end()) return;
    aliases.push_back(name);
  };

  for (const auto& name : existing) add(name);
  for (const auto& name : all_names) add(name);
  return aliases;
}

std::size_t MergeExecutor::Merge(PersonId canonical_id, const std::vector<PersonId>& duplicate_ids,
                                 const std::vector<std::string>& all_names) {
  std::vector<PersonId> requested;
  for (auto id : duplicate_ids) {
    if (id != canonical_id) requested.push_back(id);
  }
  if (requested.empty()) return 0;

  auto tx = repository_->Begin();

  auto canonical = repository_->GetPerson(*tx, canonical_id);
  if (!canonical) {
    throw util::NotFound("merge: canonical person " + std::to_string(canonical_id) + " not found");
  }

  const auto duplicates = repository_->ExistingPersonIds(*tx, requested);
  if (duplicates.empty()) {
    tx->Rollback();
    return 0;
  }

  const auto ctx = "merge into " + std::to_string(canonical_id);

  ThrowIfDbError(repository_->RepointPersonDocuments(*tx, duplicates, canonical_id), ctx + ": repoint documents");
  ThrowIfDbError(repository_->DeleteDuplicatePersonDocuments(*tx, canonical_id), ctx + ": dedupe documents");

  ThrowIfDbError(repository_->RepointConnections(*tx, duplicates, canonical_id), ctx + ": repoint connections");
  ThrowIfDbError(repository_->DeleteSelfLoopConnections(*tx), ctx + ": drop self-loops");
  ThrowIfDbError(repository_->DeleteConnectionsTouching(*tx, duplicates), ctx + ": drop stale connections");

  ThrowIfDbError(repository_->ReplaceInTimelineEvents(*tx, duplicates, canonical_id), ctx + ": rewrite timeline");

  ThrowIfDbError(repository_->DeletePersonDocumentsFor(*tx, duplicates), ctx + ": drop stale documents");
  ThrowIfDbError(repository_->DeletePersons(*tx, duplicates), ctx + ": delete duplicates");

  canonical->aliases          = MergeAliases(canonical->name, canonical->aliases, all_names);
  canonical->document_count   = static_cast<std::int64_t>(repository_->CountPersonDocuments(*tx, canonical_id));
  canonical->connection_count = static_cast<std::int64_t>(repository_->CountPersonConnections(*tx, canonical_id));
  ThrowIfDbError(repository_->UpdatePerson(*tx, *canonical), ctx + ": update canonical");

  tx->Commit();

  ROSTER_LOG_DEBUG("merged persons",
                   {observability::IntField("canonical", canonical_id),
                    observability::IntField("duplicates", static_cast<std::int64_t>(duplicates.size())),
                    observability::IntField("documents", canonical->document_count),
                    observability::IntField("connections", canonical->connection_count)});
  return duplicates.size();
}

} // namespace roster::dedup
