#include "internal/names/junk_classifier.hpp"

#include <algorithm>
#include <array>
#include <regex>
#include <string>

#include "internal/names/name_normalizer.hpp"

namespace roster::names {
namespace {

using std::regex_constants::ECMAScript;
using std::regex_constants::icase;

bool Search(std::string_view s, const std::regex& re) {
  return std::regex_search(s.begin(), s.end(), re);
}

bool HasSpace(std::string_view s) {
  return std::any_of(s.begin(), s.end(), [](char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
  });
}

bool HasForbiddenCharacter(std::string_view s) {
  if (s.find_first_of("!;&$%^\\*<>=") != std::string_view::npos) return true;
  return s.find("\xC2\xB0") != std::string_view::npos      // degree sign
         || s.find("\xE2\x80\xA2") != std::string_view::npos;  // bullet
}

template <std::size_t N>
bool Contains(const std::array<std::string_view, N>& set, std::string_view value) {
  return std::find(set.begin(), set.end(), value) != set.end();
}

constexpr std::array<std::string_view, 31> kGenericRoles = {
    "assistant united states attorney",
    "special agent",
    "case agent name",
    "correctional officer",
    "attorney general",
    "unit manager",
    "senior inspector",
    "supervisory inspector",
    "fbi assistant director",
    "deputy united states attorney",
    "supervisory staff attorney clc",
    "unknown recipient",
    "unknown sender",
    "institution duty officer",
    "victim witness coordinator",
    "day watch shu officer in charge",
    "evening watch shu officer in charge",
    "u.s. attorney",
    "assistant u.s. attorney",
    "detective",
    "officer",
    "captain",
    "sergeant",
    "warden",
    "chief",
    "administrator",
    "attorney",
    "defendant",
    "lieutenant",
    "budget",
    "unknown",
};

constexpr std::array<std::string_view, 10> kGenericNonPersons = {
    "bop employee",
    "the court",
    "union president",
    "flight engineer",
    "customs officer",
    "co-pilot",
    "fbi victim specialist",
    "legal assistant",
    "defense counsel",
    "corrections officer",
};

constexpr std::array<std::string_view, 7> kPronounFragments = {"her", "his", "him", "she", "he", "des", "ands"};

struct Patterns {
  // case-sensitive
  std::regex consecutive_digits{"[0-9]{2,}", ECMAScript};
  std::regex digit_letter_digit{"[0-9].*[a-zA-Z].*[0-9]", ECMAScript};
  std::regex capital_digit_garble{"^[A-Z][a-z]*[0-9][a-z]", ECMAScript};
  std::regex bracketed{R"(^\[.*\]$)", ECMAScript};
  std::regex caps_abbreviation{"^[A-Z]{4,}$", ECMAScript};
  std::regex caps_three{"^[A-Z]{3}$", ECMAScript};
  std::regex possessive{R"('s\s)", ECMAScript};
  std::regex org_tag{R"(\([A-Z]{2,5}\))", ECMAScript};
  std::regex comma_digit{R"(,\s*\d)", ECMAScript};
  std::regex quote_or_backslash{R"(["\\])", ECMAScript};

  // case-insensitive
  std::regex epstein_possessive{R"(^epstein's\s)", ECMAScript | icase};
  std::regex numbered_victim{R"(^(minor\s+)?victim-\d)", ECMAScript | icase};
  std::regex unknown_prefix{R"(^unknown\s)", ECMAScript | icase};
  std::regex unnamed_prefix{R"(^unnamed\s)", ECMAScript | icase};
  std::regex title_redaction{R"(^(mr|mrs|ms|dr)\.\s*\[)", ECMAScript | icase};
  std::regex title_only{R"(^(mr|mrs|ms|dr|lt|sgt|det|cap)\.\s*$)", ECMAScript | icase};
  std::regex org_suffix{R"(,?\s*(llc|inc|corp|lp|llp)\.?\s*$)", ECMAScript | icase};
  std::regex the_prefix{R"(^the\s)", ECMAScript | icase};
  std::regex former_prefix{R"(^former\s)", ECMAScript | icase};
  std::regex head_title{R"(^(chief|director|head|commissioner|superintendent|warden|commander)\s)", ECMAScript | icase};
  std::regex of_word{R"(\bof\b)", ECMAScript | icase};
  std::regex deputy_title{
      R"(^(deputy|assistant|associate|acting|interim)\s+(assistant\s+)?(attorney general|director|chief|commissioner|warden|prosecutor|counsel))",
      ECMAScript | icase};
  std::regex ausa_prefix{R"(^ausa\s)", ECMAScript | icase};
  std::regex numbered_placeholder{R"(^(officer|inmate|co\s+rookie)\s+\d)", ECMAScript | icase};
  std::regex john_doe{R"(^(john|jane)\s+doe)", ECMAScript | icase};
  std::regex title_initial{R"(^(mr|mrs|ms|dr)\.\s+[A-Z]\.?\s*$)", ECMAScript | icase};
  std::regex declarant{"^declarant", ECMAScript | icase};
  std::regex credential_only{R"(^(esq\.?|psyd|ph\.?d\.?|m\.?d\.?|j\.?d\.?|ll\.?m\.?)$)", ECMAScript | icase};
  std::regex relational{R"(^(spouse|sister|brother|son|daughter|mother|father|wife|husband)\s+of\s)", ECMAScript | icase};
  std::regex redacted_suffix{R"(\(redacted\)$)", ECMAScript | icase};
  std::regex numbered_witness{R"(^(accuser|witness|doe)\s*-?\s*\d)", ECMAScript | icase};
};

const Patterns& P() {
  static const Patterns kPatterns;
  return kPatterns;
}

} // namespace

bool IsJunkName(std::string_view name) {
  const auto  trimmed = TrimAscii(name);
  const auto  length  = CodePointLength(trimmed);
  const auto& p       = P();

  // length bounds
  if (length <= 2 || length > 60) return true;

  // OCR artifacts and role combos
  if (HasForbiddenCharacter(trimmed)) return true;
  if (trimmed.find('/') != std::string_view::npos) return true;

  // codes and garbled digits: "EFTA00012", "Donald Po4lon", "I3aktaj"
  if (Search(trimmed, p.consecutive_digits)) return true;
  if (Search(trimmed, p.digit_letter_digit)) return true;
  if (Search(trimmed, p.capital_digit_garble)) return true;

  if (Search(trimmed, p.bracketed)) return true;
  if (Search(trimmed, p.caps_abbreviation)) return true;

  const auto lower = ToLowerAscii(trimmed);
  if (Contains(kGenericRoles, lower)) return true;

  if (Search(trimmed, p.epstein_possessive)) return true;
  if (lower == "epstein victim") return true;
  if (Search(trimmed, p.numbered_victim)) return true;
  if (Search(trimmed, p.unknown_prefix) || Search(trimmed, p.unnamed_prefix)) return true;

  if (Search(trimmed, p.title_redaction)) return true;
  if (Search(trimmed, p.title_only)) return true;

  // "Des", "Ann", "Bob": a lone short word identifies nobody
  if (!HasSpace(trimmed) && length <= 3) return true;
  if (Search(trimmed, p.caps_three)) return true;

  if (Contains(kGenericNonPersons, lower)) return true;
  if (Contains(kPronounFragments, lower)) return true;

  if (Search(trimmed, p.org_suffix)) return true;
  if (Search(trimmed, p.possessive)) return true;
  if (Search(trimmed, p.the_prefix)) return true;
  if (Search(trimmed, p.former_prefix)) return true;
  if (Search(trimmed, p.head_title) && Search(trimmed, p.of_word)) return true;
  if (Search(trimmed, p.deputy_title)) return true;

  if (Search(trimmed, p.org_tag)) return true;
  if (Search(trimmed, p.ausa_prefix)) return true;
  if (Search(trimmed, p.numbered_placeholder)) return true;
  if (Search(trimmed, p.john_doe)) return true;
  if (Search(trimmed, p.title_initial)) return true;
  if (Search(trimmed, p.declarant)) return true;
  if (Search(trimmed, p.comma_digit)) return true;
  if (Search(trimmed, p.credential_only)) return true;
  if (Search(trimmed, p.quote_or_backslash) && length < 30) return true;
  if (Search(trimmed, p.relational)) return true;
  if (Search(trimmed, p.redacted_suffix)) return true;
  if (Search(trimmed, p.numbered_witness)) return true;

  return false;
}

} // namespace roster::names
