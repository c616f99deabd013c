#pragma once

#include <string>

#include "internal/dedup/plan.hpp"

namespace roster::dedup {

/*
  PlanStore

  Persists a DeduplicationPlan as JSON through the
  roster.dedup.v1.DeduplicationPlan protobuf schema.

  - field names are lowerCamelCase
  - int64 ids print as JSON strings; plain numbers are accepted on load
  - Save() writes a sibling temp file and renames it over the target,
    so a reader never observes a half-written plan
*/
class PlanStore {
 public:
  explicit PlanStore(std::string path);

  const std::string& Path() const {
    return path_;
  }

  bool Exists() const;

  // Throws util::NotFound if the file is missing, util::PlanFormatError
  // if it does not parse or carries unknown types/statuses.
  DeduplicationPlan Load() const;

  // Throws std::runtime_error on I/O failure.
  void Save(const DeduplicationPlan& plan) const;

  static std::string       ToJson(const DeduplicationPlan& plan);
  static DeduplicationPlan FromJson(const std::string& json);

 private:
  std::string path_;
};

} // namespace roster::dedup
