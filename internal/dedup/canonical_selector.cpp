#include "internal/dedup/canonical_selector.hpp"

#include <tuple>

#include "internal/names/name_normalizer.hpp"
#include "internal/util/errors.hpp"

namespace roster::dedup {
namespace {

// Larger tuple wins; id is negated so the lower id ranks higher.
auto Rank(const db::model::PersonRecord& p, bool is_protected) {
  return std::make_tuple(is_protected,
                         p.name.find(',') == std::string::npos,
                         !names::IsAllUpperAscii(p.name),
                         names::CountMeaningfulParts(p.name),
                         names::CodePointLength(p.name),
                         -p.id);
}

} // namespace

CanonicalSelector::CanonicalSelector(const names::ProtectedNames& protected_names)
    : protected_names_(protected_names) {
}

bool CanonicalSelector::IsProtected(const db::model::PersonRecord& p) const {
  return protected_names_.Contains(p.name);
}

bool CanonicalSelector::Prefer(const db::model::PersonRecord& a, const db::model::PersonRecord& b) const {
  return Rank(a, IsProtected(a)) > Rank(b, IsProtected(b));
}

const db::model::PersonRecord& CanonicalSelector::Select(
    const std::vector<const db::model::PersonRecord*>& group) const {
  if (group.empty()) {
    throw util::InvalidState("canonical selection over an empty group");
  }

  const auto* best = group.front();
  for (const auto* candidate : group) {
    if (Prefer(*candidate, *best)) best = candidate;
  }
  return *best;
}

} // namespace roster::dedup
