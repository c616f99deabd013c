#include "internal/dedup/cascade_delete.hpp"

#include <algorithm>

#include "internal/dedup/store_errors.hpp"
#include "internal/observability/logging.hpp"

namespace roster::dedup {

CascadeDelete::CascadeDelete(std::shared_ptr<db::Repository> repository, std::size_t chunk_size)
    : repository_(std::move(repository)), chunk_size_(chunk_size == 0 ? kDefaultChunkSize : chunk_size) {
}

CascadeDeleteResult CascadeDelete::Delete(const std::vector<PersonId>& ids) {
  CascadeDeleteResult result;

  for (std::size_t begin = 0; begin < ids.size(); begin += chunk_size_) {
    const auto end = std::min(ids.size(), begin + chunk_size_);
    std::vector<PersonId> chunk(ids.begin() + static_cast<std::ptrdiff_t>(begin),
                                ids.begin() + static_cast<std::ptrdiff_t>(end));
    try {
      DeleteChunk(chunk);
      result.deleted.insert(result.deleted.end(), chunk.begin(), chunk.end());
    } catch (const std::exception& e) {
      result.failed.insert(result.failed.end(), chunk.begin(), chunk.end());
      ROSTER_LOG_ERROR("cascade delete chunk failed",
                       {observability::IntField("first_id", chunk.front()),
                        observability::IntField("size", static_cast<std::int64_t>(chunk.size())),
                        observability::StringField("error", e.what())});
    }
  }
  return result;
}

void CascadeDelete::DeleteChunk(const std::vector<PersonId>& chunk) {
  auto tx = repository_->Begin();

  ThrowIfDbError(repository_->DeleteConnectionsTouching(*tx, chunk), "cascade delete: connections");
  ThrowIfDbError(repository_->DeletePersonDocumentsFor(*tx, chunk), "cascade delete: documents");
  ThrowIfDbError(repository_->RemoveFromTimelineEvents(*tx, chunk), "cascade delete: timeline");
  ThrowIfDbError(repository_->DeletePersons(*tx, chunk), "cascade delete: persons");

  tx->Commit();
}

} // namespace roster::dedup
