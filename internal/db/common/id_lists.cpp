#include "internal/db/common/id_lists.hpp"

#include <algorithm>
#include <charconv>
#include <unordered_set>

namespace roster::db::common {

namespace {

bool Contains(const std::vector<PersonId>& ids, PersonId id) {
  return std::find(ids.begin(), ids.end(), id) != ids.end();
}

} // namespace

bool ReplaceIds(std::vector<PersonId>& ids, const std::vector<PersonId>& from, PersonId to) {
  bool touched = false;
  for (auto& id : ids) {
    if (Contains(from, id)) {
      id      = to;
      touched = true;
    }
  }
  if (!touched) {
    return false;
  }

  std::unordered_set<PersonId> seen;
  std::vector<PersonId>        unique;
  unique.reserve(ids.size());
  for (auto id : ids) {
    if (seen.insert(id).second) {
      unique.push_back(id);
    }
  }
  ids = std::move(unique);
  return true;
}

bool RemoveIds(std::vector<PersonId>& ids, const std::vector<PersonId>& remove) {
  const auto before = ids.size();
  ids.erase(std::remove_if(ids.begin(), ids.end(), [&](PersonId id) { return Contains(remove, id); }), ids.end());
  return ids.size() != before;
}

std::string JoinIds(const std::vector<PersonId>& ids) {
  std::string out;
  for (std::size_t i = 0; i < ids.size(); ++i) {
    if (i > 0) out.push_back(',');
    out += std::to_string(ids[i]);
  }
  return out;
}

std::vector<PersonId> SplitIds(std::string_view text) {
  std::vector<PersonId> out;
  std::size_t           start = 0;
  while (start < text.size()) {
    auto end = text.find(',', start);
    if (end == std::string_view::npos) end = text.size();

    const auto token = text.substr(start, end - start);
    PersonId   value = 0;
    auto [ptr, ec]   = std::from_chars(token.data(), token.data() + token.size(), value);
    if (ec == std::errc() && ptr == token.data() + token.size()) {
      out.push_back(value);
    }
    start = end + 1;
  }
  return out;
}

std::string JoinLines(const std::vector<std::string>& lines) {
  std::string out;
  for (std::size_t i = 0; i < lines.size(); ++i) {
    if (i > 0) out.push_back('\n');
    out += lines[i];
  }
  return out;
}

std::vector<std::string> SplitLines(std::string_view text) {
  std::vector<std::string> out;
  if (text.empty()) {
    return out;
  }
  std::size_t start = 0;
  for (;;) {
    auto end = text.find('\n', start);
    if (end == std::string_view::npos) {
      out.emplace_back(text.substr(start));
      break;
    }
    out.emplace_back(text.substr(start, end - start));
    start = end + 1;
  }
  return out;
}

} // namespace roster::db::common
