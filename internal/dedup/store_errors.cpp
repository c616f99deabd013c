#include "internal/dedup/store_errors.hpp"

#include <string>

#include "internal/util/errors.hpp"

namespace roster::dedup {

void ThrowIfDbError(const db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  auto message = context + ": " + std::string(db::ToString(result.code));
  if (!result.message.empty()) message += " (" + result.message + ")";
  switch (result.code) {
    case db::ErrorCode::AlreadyExists:
      throw util::AlreadyExists(message);
    case db::ErrorCode::NotFound:
      throw util::NotFound(message);
    default:
      throw util::StoreError(message);
  }
}

} // namespace roster::dedup
