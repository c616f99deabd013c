#pragma once

#include <cstddef>
#include <memory>

#include "internal/db/api/repository.hpp"

namespace roster::dedup {

struct ConnectionDedupeReport {
  std::size_t before  = 0;
  std::size_t after   = 0;
  std::size_t removed = 0;
};

/*
  Keeps one connection per unordered person pair: longest
  description, then highest strength, then lowest row id.
  Self-loops are removed as well. One transaction.
*/
ConnectionDedupeReport DedupeConnections(db::Repository& repository);

/*
  Recomputes document_count / connection_count of every person from
  the link tables. Returns the number of persons whose counts changed.
*/
std::size_t RecomputeCounts(db::Repository& repository);

} // namespace roster::dedup
