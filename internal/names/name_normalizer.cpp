#include "internal/names/name_normalizer.hpp"

#include <regex>

namespace roster::names {
namespace {

bool IsSpace(char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

const std::regex& HonorificPattern() {
  static const std::regex kPattern(R"(\b(dr|mr|mrs|ms|miss|ii|iii|iv)\b\.?)");
  return kPattern;
}

} // namespace

std::string ToLowerAscii(std::string_view s) {
  std::string out(s);
  for (auto& c : out) {
    if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
  }
  return out;
}

namespace {

char32_t LowerLatin(char32_t cp) {
  if (cp >= 0xC0 && cp <= 0xDE && cp != 0xD7) return cp + 0x20;
  if (cp == 0x178) return 0xFF;
  if (cp < 0x100 || cp >= 0x17F || cp == 0x130 || cp == 0x138 || cp == 0x149) return cp;
  // Extended-A alternates upper/lower; the parity flips at U+0139 and U+0179
  const bool odd_upper = (cp >= 0x139 && cp <= 0x148) || cp >= 0x179;
  const bool is_upper  = odd_upper ? (cp % 2 == 1) : (cp % 2 == 0);
  return is_upper ? cp + 1 : cp;
}

} // namespace

std::string FoldCase(std::string_view s) {
  std::string out;
  out.reserve(s.size());
  for (std::size_t i = 0; i < s.size(); ++i) {
    const auto b0 = static_cast<unsigned char>(s[i]);
    if (b0 < 0x80) {
      out.push_back(b0 >= 'A' && b0 <= 'Z' ? static_cast<char>(b0 - 'A' + 'a') : static_cast<char>(b0));
      continue;
    }
    if ((b0 == 0xC3 || b0 == 0xC4 || b0 == 0xC5) && i + 1 < s.size()) {
      const auto b1 = static_cast<unsigned char>(s[i + 1]);
      if ((b1 & 0xC0) == 0x80) {
        const auto cp = LowerLatin(static_cast<char32_t>(((b0 & 0x1F) << 6) | (b1 & 0x3F)));
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        ++i;
        continue;
      }
    }
    out.push_back(static_cast<char>(b0));
  }
  return out;
}

bool IsAllUpperAscii(std::string_view s) {
  for (char c : s) {
    if (c >= 'a' && c <= 'z') return false;
  }
  return true;
}

// continuation bytes (10xxxxxx) do not start a code point
std::size_t CodePointLength(std::string_view s) {
  std::size_t n = 0;
  for (char c : s) {
    if ((static_cast<unsigned char>(c) & 0xC0) != 0x80) ++n;
  }
  return n;
}

std::string_view TrimAscii(std::string_view s) {
  while (!s.empty() && IsSpace(s.front())) s.remove_prefix(1);
  while (!s.empty() && IsSpace(s.back())) s.remove_suffix(1);
  return s;
}

std::string NormalizeName(std::string_view raw) {
  std::string n = ToLowerAscii(raw);

  if (const auto comma = n.find(','); comma != std::string::npos && n.find(',', comma + 1) == std::string::npos) {
    const auto last  = TrimAscii(std::string_view(n).substr(0, comma));
    const auto first = TrimAscii(std::string_view(n).substr(comma + 1));
    if (!first.empty()) {
      n = std::string(first) + " " + std::string(last);
    }
  }

  n = std::regex_replace(n, HonorificPattern(), "");

  std::string out;
  out.reserve(n.size());
  bool pending_space = false;
  for (char c : n) {
    if (c >= 'a' && c <= 'z') {
      if (pending_space && !out.empty()) out.push_back(' ');
      pending_space = false;
      out.push_back(c);
    } else if (IsSpace(c)) {
      pending_space = true;
    }
    // periods and every other character vanish without splitting words
  }
  return out;
}

std::vector<std::string> MeaningfulParts(std::string_view normalized) {
  std::vector<std::string> parts;
  std::size_t pos = 0;
  while (pos < normalized.size()) {
    auto end = normalized.find(' ', pos);
    if (end == std::string_view::npos) end = normalized.size();
    if (end - pos >= 2) parts.emplace_back(normalized.substr(pos, end - pos));
    pos = end + 1;
  }
  return parts;
}

std::size_t CountMeaningfulParts(std::string_view raw) {
  return MeaningfulParts(NormalizeName(raw)).size();
}

} // namespace roster::names
