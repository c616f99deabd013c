#pragma once

#include <string>
#include <vector>

namespace roster::dedup {

/*
  Curated merge tables, loaded from a versioned YAML document:

    version: 1
    key_figures:
      - canonical: "Jeffrey Epstein"
        variants: ["Jeffrey E. Epstein", ...]
        delete: ["..."]              # optional
    ocr_nicknames:
      - canonical: "Glenn Dubin"
        variants: ["Glen Dubin"]
*/

inline constexpr int kRulesVersion = 1;

struct KeyFigureRule {
  std::string              canonical;
  std::vector<std::string> variants;
  std::vector<std::string> delete_names;
};

struct NicknameRule {
  std::string              canonical;
  std::vector<std::string> variants;
};

struct DedupRules {
  int                        version = kRulesVersion;
  std::vector<KeyFigureRule> key_figures;
  std::vector<NicknameRule>  ocr_nicknames;

  // Throws util::ConfigError on a missing file, a YAML error, an
  // unsupported version or an entry without a canonical name.
  static DedupRules LoadFromFile(const std::string& path);
  static DedupRules Parse(const std::string& yaml_text);
};

} // namespace roster::dedup
