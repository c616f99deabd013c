#include "cmd/roster-resolver/cli_args.hpp"

#include <algorithm>
#include <array>
#include <charconv>
#include <vector>

namespace roster::cli {
namespace {

constexpr std::array<std::string_view, 5> kCommands = {"dry-run", "apply", "execute-plan", "dedupe-connections",
                                                       "recompute-counts"};

bool ParseExecutePlanArgs(const std::vector<std::string>& rest, Args& args) {
  for (std::size_t i = 0; i < rest.size(); ++i) {
    if (rest[i] == "--batch") {
      if (i + 1 >= rest.size()) return false;
      auto batch = ParseBatchSize(rest[++i]);
      if (!batch) return false;
      args.batch_size = *batch;
    } else if (!args.plan_path) {
      args.plan_path = rest[i];
    } else {
      return false;
    }
  }
  return true;
}

} // namespace

std::optional<std::size_t> ParseBatchSize(std::string_view text) {
  std::size_t value = 0;
  const auto* first = text.data();
  const auto* last  = text.data() + text.size();

  auto [end, ec] = std::from_chars(first, last, value);
  if (ec != std::errc() || end != last || text.empty() || value == 0) return std::nullopt;
  return value;
}

std::optional<Args> ParseArgs(int argc, const char* const* argv) {
  Args                     args;
  std::vector<std::string> rest;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--config") {
      if (i + 1 >= argc) return std::nullopt;
      args.config_path = argv[++i];
    } else if (args.command.empty()) {
      args.command = arg;
    } else {
      rest.push_back(arg);
    }
  }

  if (args.config_path.empty()) return std::nullopt;
  if (std::find(kCommands.begin(), kCommands.end(), args.command) == kCommands.end()) return std::nullopt;

  if (args.command == "execute-plan") {
    if (!ParseExecutePlanArgs(rest, args)) return std::nullopt;
  } else if (!rest.empty()) {
    return std::nullopt;
  }
  return args;
}

} // namespace roster::cli
