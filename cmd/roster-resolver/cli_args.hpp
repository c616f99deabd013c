#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace roster::cli {

/*
  Command line of roster-resolver:

    --config <file> dry-run
    --config <file> apply
    --config <file> execute-plan [<path>] [--batch N]
    --config <file> dedupe-connections
    --config <file> recompute-counts

  Every usage error is caught here, before any config or store is opened.
*/
struct Args {
  std::string config_path;
  std::string command;

  // execute-plan only
  std::optional<std::string> plan_path;
  std::size_t                batch_size = 0;
};

// nullopt on any usage error.
std::optional<Args> ParseArgs(int argc, const char* const* argv);

// Positive decimal integer, nothing else.
std::optional<std::size_t> ParseBatchSize(std::string_view text);

} // namespace roster::cli
