#pragma once

#include <cstddef>
#include <memory>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace roster::dedup {

using db::model::PersonId;

struct CascadeDeleteResult {
  std::vector<PersonId> deleted;  // ids in chunks that committed
  std::vector<PersonId> failed;   // ids in chunks that rolled back
};

/*
  CascadeDelete

  Removes persons outright, with no alias preservation. Ids are
  processed in fixed-size chunks, one transaction per chunk:

    connections touching the chunk
    document links of the chunk
    timeline person_ids entries
    person rows

  A failing chunk is logged and rolled back; later chunks still run.
*/
class CascadeDelete {
 public:
  static constexpr std::size_t kDefaultChunkSize = 500;

  explicit CascadeDelete(std::shared_ptr<db::Repository> repository, std::size_t chunk_size = kDefaultChunkSize);

  CascadeDeleteResult Delete(const std::vector<PersonId>& ids);

 private:
  void DeleteChunk(const std::vector<PersonId>& chunk);

  std::shared_ptr<db::Repository> repository_;
  std::size_t                     chunk_size_;
};

} // namespace roster::dedup
