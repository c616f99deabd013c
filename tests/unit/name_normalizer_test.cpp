#include "internal/names/name_normalizer.hpp"

#include <cassert>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

namespace {

using roster::names::CodePointLength;
using roster::names::CountMeaningfulParts;
using roster::names::FoldCase;
using roster::names::IsAllUpperAscii;
using roster::names::MeaningfulParts;
using roster::names::NormalizeName;

void TestPairsThatGroupTogether() {
  const std::vector<std::pair<std::string, std::string>> same = {
      {"Ghislaine Maxwell", "GHISLAINE MAXWELL"},
      {"Maxwell, Ghislaine", "Ghislaine Maxwell"},
      {"Dr. Jean-Luc Brunel", "jeanluc brunel"},
      {"Mr. Alan Dershowitz", "Alan Dershowitz"},
      {"Leslie H. Wexner", "leslie h wexner"},
      {"  Glenn   Dubin ", "Glenn Dubin"},
      {"Prince Andrew II", "prince andrew"},
      {"Ms. Sarah Kellen", "SARAH KELLEN"},
  };
  for (const auto& [a, b] : same) {
    assert(NormalizeName(a) == NormalizeName(b));
  }
}

void TestPairsThatStayApart() {
  const std::vector<std::pair<std::string, std::string>> different = {
      {"Ghislaine Maxwell", "Christine Maxwell"},
      {"Glenn Dubin", "Eva Dubin"},
      {"Maxwell", "Ghislaine Maxwell"},
      {"Drake Smith", "Smith"},
  };
  for (const auto& [a, b] : different) {
    assert(NormalizeName(a) != NormalizeName(b));
  }
}

void TestExactForms() {
  assert(NormalizeName("Maxwell, Ghislaine") == "ghislaine maxwell");
  assert(NormalizeName("Dr. Jean-Luc Brunel") == "jeanluc brunel");
  assert(NormalizeName("Drake Smith") == "drake smith");
  // two commas: no reordering
  assert(NormalizeName("Smith, John, Jr") == "smith john jr");
  // trailing comma: nothing after it to move in front
  assert(NormalizeName("Smith,") == "smith");
  assert(NormalizeName("Mr.") == "");
  assert(NormalizeName("123 456") == "");
}

void TestMeaningfulParts() {
  auto parts = MeaningfulParts(NormalizeName("Leslie H. Wexner"));
  assert(parts.size() == 2);
  assert(parts[0] == "leslie");
  assert(parts[1] == "wexner");

  assert(CountMeaningfulParts("Jeffrey Edward Epstein") == 3);
  assert(CountMeaningfulParts("Maxwell") == 1);
  assert(CountMeaningfulParts("J. Epstein") == 1);
  assert(CountMeaningfulParts("") == 0);
}

void TestCaseAndLengthHelpers() {
  assert(IsAllUpperAscii("GHISLAINE MAXWELL"));
  assert(IsAllUpperAscii("J. E."));
  assert(!IsAllUpperAscii("Ghislaine Maxwell"));

  assert(CodePointLength("abc") == 3);
  assert(CodePointLength("Jos\xC3\xA9") == 4);
}

void TestFoldCase() {
  assert(FoldCase("NADIA MARCINKOV\xC3\x81") == "nadia marcinkov\xC3\xA1");
  assert(FoldCase("NADIA MARCINKOV\xC3\x81") == FoldCase("Nadia Marcinkov\xC3\xA1"));

  // Latin Extended-A: C-caron, L-stroke, Z-caron
  assert(FoldCase("\xC4\x8C\xC5\x81\xC5\xBD") == "\xC4\x8D\xC5\x82\xC5\xBE");
  // Y-diaeresis folds back into Latin-1
  assert(FoldCase("\xC5\xB8") == "\xC3\xBF");

  // multiplication sign, sharp s, long s and Cyrillic pass through
  assert(FoldCase("\xC3\x97\xC3\x9F\xC5\xBF") == "\xC3\x97\xC3\x9F\xC5\xBF");
  assert(FoldCase("\xD0\x94") == "\xD0\x94");

  // a truncated sequence is copied as is
  assert(FoldCase("A\xC3") == "a\xC3");
}

} // namespace

int main() {
  TestPairsThatGroupTogether();
  TestPairsThatStayApart();
  TestExactForms();
  TestMeaningfulParts();
  TestCaseAndLengthHelpers();
  TestFoldCase();

  std::cout << "roster_unit_name_normalizer: pass\n";
  return 0;
}
