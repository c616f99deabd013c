#include "internal/dedup/canonical_selector.hpp"

#include <cassert>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/util/errors.hpp"

namespace {

using roster::db::model::PersonRecord;
using roster::dedup::CanonicalSelector;
using roster::names::ProtectedNames;

PersonRecord P(std::int64_t id, const std::string& name) {
  PersonRecord p;
  p.id   = id;
  p.name = name;
  return p;
}

const PersonRecord& Pick(const CanonicalSelector& selector, const std::vector<PersonRecord>& persons) {
  std::vector<const PersonRecord*> group;
  for (const auto& p : persons) group.push_back(&p);
  return selector.Select(group);
}

void TestMixedCaseOverAllCapsRegardlessOfId() {
  ProtectedNames    none;
  CanonicalSelector selector(none);

  std::vector<PersonRecord> group = {P(4, "GHISLAINE MAXWELL"), P(10, "Ghislaine Maxwell")};
  assert(Pick(selector, group).id == 10);
}

void TestNoCommaBeatsComma() {
  ProtectedNames    none;
  CanonicalSelector selector(none);

  std::vector<PersonRecord> group = {P(1, "Maxwell, Ghislaine"), P(2, "GHISLAINE MAXWELL")};
  assert(Pick(selector, group).id == 2);
}

void TestMorePartsThenLongerThenLowerId() {
  ProtectedNames    none;
  CanonicalSelector selector(none);

  std::vector<PersonRecord> parts = {P(1, "Leslie Wexner"), P(2, "Leslie Herbert Wexner")};
  assert(Pick(selector, parts).id == 2);

  // same normalized parts, longer raw string wins
  std::vector<PersonRecord> longer = {P(1, "Jean Luc"), P(2, "Dr. Jean Luc")};
  assert(Pick(selector, longer).id == 2);

  std::vector<PersonRecord> tie = {P(7, "Glenn Dubin"), P(3, "glenn dubin"), P(5, "Glenn Dubin")};
  assert(Pick(selector, tie).id == 3);
}

void TestProtectedNameAlwaysWins() {
  ProtectedNames protected_names;
  protected_names.Add("Ghislaine Maxwell");
  CanonicalSelector selector(protected_names);

  // the protected form is upper-case with a comma and the highest id
  ProtectedNames only_caps;
  only_caps.Add("MAXWELL, GHISLAINE X");
  CanonicalSelector caps_selector(only_caps);

  std::vector<PersonRecord> group = {P(1, "Ghislaine Maxwell"), P(2, "ghislaine maxwell"),
                                     P(3, "Maxwell, Ghislaine"), P(9, "MAXWELL, GHISLAINE X")};
  assert(Pick(caps_selector, group).id == 9);
  assert(selector.IsProtected(group[0]));
  assert(selector.IsProtected(group[2]));
}

void TestEmptyGroupRejected() {
  ProtectedNames    none;
  CanonicalSelector selector(none);

  bool threw = false;
  try {
    (void)selector.Select({});
  } catch (const roster::util::InvalidState&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestMixedCaseOverAllCapsRegardlessOfId();
  TestNoCommaBeatsComma();
  TestMorePartsThenLongerThenLowerId();
  TestProtectedNameAlwaysWins();
  TestEmptyGroupRejected();

  std::cout << "roster_unit_canonical_selector: pass\n";
  return 0;
}
