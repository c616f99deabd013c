#pragma once

#include <string>

#include "internal/db/api/result.hpp"

namespace roster::dedup {

/*
  Translates a failed repository Result into the typed exception
  upper layers catch:

    AlreadyExists -> util::AlreadyExists
    NotFound      -> util::NotFound
    anything else -> util::StoreError
*/
void ThrowIfDbError(const db::Result& result, const std::string& context);

} // namespace roster::dedup
