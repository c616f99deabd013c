#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/db/api/repository.hpp"
#include "internal/dedup/coordinator.hpp"
#include "internal/util/cancellation.hpp"

namespace roster::factory {

/*
  Application

  Everything one CLI invocation needs. Lives for the lifetime of the
  process.
*/
struct Application {
  std::shared_ptr<db::Repository>     repository;
  std::unique_ptr<dedup::Coordinator>    coordinator;
};

/*
  BuildRepository

  Opens the configured backend and bootstraps its schema.
  This is the ONLY place allowed to know concrete DB types.
*/
std::shared_ptr<db::Repository> BuildRepository(const roster::runtime::config::RuntimeConfig& config);

/*
  Build

  Composition root: repository, protected names, merge rules and the
  coordinator wired to `cancel`.
*/
Application Build(const roster::runtime::config::RuntimeConfig& config, const util::CancellationToken* cancel);

} // namespace roster::factory
