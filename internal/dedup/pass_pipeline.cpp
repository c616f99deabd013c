#include "internal/dedup/pass_pipeline.hpp"

#include <algorithm>
#include <cstdlib>
#include <string>
#include <unordered_map>

#include "internal/names/junk_classifier.hpp"
#include "internal/names/name_normalizer.hpp"
#include "internal/observability/logging.hpp"

namespace roster::dedup {
namespace {

using observability::IntField;
using observability::StringField;

std::vector<std::string> Parts(const PersonRecord& p) {
  return names::MeaningfulParts(names::NormalizeName(p.name));
}

std::string JoinNames(const std::vector<const PersonRecord*>& persons) {
  std::string out;
  for (const auto* p : persons) {
    if (!out.empty()) out += ", ";
    out += p->name;
  }
  return out;
}

} // namespace

PassPipeline::PassPipeline(RunSnapshot& snapshot, const names::ProtectedNames& protected_names,
                           const DedupRules& rules, db::Repository& repository, ActionSink& sink,
                           const util::CancellationToken* cancel)
    : snapshot_(snapshot),
      protected_names_(protected_names),
      rules_(rules),
      repository_(repository),
      sink_(sink),
      cancel_(cancel),
      selector_(protected_names) {
}

PipelineReport PassPipeline::Run() {
  PipelineReport report;

  using PassFn = std::size_t (PassPipeline::*)();
  static constexpr std::array<PassFn, kPassCount> kPasses = {
      &PassPipeline::JunkRemoval,       &PassPipeline::ExactNormalized, &PassPipeline::SingleWordEvidence,
      &PassPipeline::SingleWordCleanup, &PassPipeline::KeyFigureVariants, &PassPipeline::MiddleInitial,
      &PassPipeline::OcrNickname,
  };

  for (int pass = 0; pass < kPassCount; ++pass) {
    if (Stopping()) break;

    const auto count                               = (this->*kPasses[static_cast<std::size_t>(pass)])();
    report.counts[static_cast<std::size_t>(pass)] = count;

    ROSTER_LOG_INFO(sink_.DryRun() ? "pass found" : "pass applied",
                    {IntField("pass", pass), StringField("label", PassInfoFor(pass).label),
                     IntField("persons", static_cast<std::int64_t>(count)),
                     IntField("roster", static_cast<std::int64_t>(snapshot_.roster.Size()))});
  }

  report.ambiguous = ambiguous_;
  report.cancelled = cancelled_;
  return report;
}

bool PassPipeline::Stopping() {
  if (!cancelled_ && cancel_ && cancel_->IsCancelled()) {
    cancelled_ = true;
    ROSTER_LOG_WARN("cancellation requested, stopping after the current group");
  }
  return cancelled_;
}

bool PassPipeline::IsProtected(const PersonRecord& p) const {
  return protected_names_.Contains(p.name);
}

bool PassPipeline::MayAbsorb(const PersonRecord& canonical, const PersonRecord& duplicate) const {
  if (!IsProtected(duplicate)) return true;
  return names::NormalizeName(duplicate.name) == names::NormalizeName(canonical.name);
}

std::int64_t PassPipeline::ReferenceCount(PersonId id) {
  auto tx    = repository_.Begin();
  auto total = repository_.CountPersonDocuments(*tx, id) + repository_.CountPersonConnections(*tx, id);
  tx->Rollback();
  return static_cast<std::int64_t>(total);
}

std::size_t PassPipeline::Merge(int pass, std::string_view reason, const PersonRecord& canonical,
                                const std::vector<const PersonRecord*>& duplicates,
                                const std::vector<std::string>& all_names, std::string evidence) {
  auto removed = sink_.Merge(pass, reason, canonical, duplicates, all_names, std::move(evidence));
  snapshot_.roster.Remove(removed);

  if (!removed.empty()) {
    ROSTER_LOG_DEBUG(sink_.DryRun() ? "would merge" : "merged",
                     {IntField("pass", pass), StringField("duplicates", JoinNames(duplicates)),
                      StringField("canonical", canonical.name)});
  }
  return removed.size();
}

std::size_t PassPipeline::Delete(int pass, std::string_view reason, const std::vector<const PersonRecord*>& targets) {
  if (targets.empty()) return 0;

  auto removed = sink_.Delete(pass, reason, targets);
  snapshot_.roster.Remove(removed);
  return removed.size();
}

// ------------------------------------------------------------------
// Pass 0
// ------------------------------------------------------------------

std::size_t PassPipeline::JunkRemoval() {
  std::vector<const PersonRecord*> junk;
  for (const auto* p : snapshot_.roster.Live()) {
    if (!names::IsJunkName(p->name)) continue;
    if (IsProtected(*p)) {
      ROSTER_LOG_INFO("protected name kept despite junk match", {StringField("name", p->name)});
      continue;
    }
    junk.push_back(p);
  }
  return Delete(0, "junk name", junk);
}

// ------------------------------------------------------------------
// Pass 1
// ------------------------------------------------------------------

std::size_t PassPipeline::ExactNormalized() {
  // groups keep first-seen (id) order
  std::vector<std::string>                                               order;
  std::unordered_map<std::string, std::vector<const PersonRecord*>> groups;

  for (const auto* p : snapshot_.roster.Live()) {
    auto norm = names::NormalizeName(p->name);
    if (norm.empty()) continue;
    auto [it, inserted] = groups.try_emplace(norm);
    if (inserted) order.push_back(norm);
    it->second.push_back(p);
  }

  std::size_t merged = 0;
  for (const auto& norm : order) {
    if (Stopping()) break;

    const auto& group = groups[norm];
    if (group.size() <= 1) continue;

    const auto& canonical = selector_.Select(group);

    std::vector<const PersonRecord*> duplicates;
    std::vector<std::string>         all_names;
    for (const auto* p : group) {
      all_names.push_back(p->name);
      if (p->id != canonical.id) duplicates.push_back(p);
    }
    merged += Merge(1, "exact normalized match", canonical, duplicates, all_names);
  }
  return merged;
}

// ------------------------------------------------------------------
// Pass 2
// ------------------------------------------------------------------

std::size_t PassPipeline::SingleWordEvidence() {
  std::unordered_map<std::string, std::vector<const PersonRecord*>> word_index;
  std::vector<const PersonRecord*>                                  singles;

  for (const auto* p : snapshot_.roster.Live()) {
    auto parts = Parts(*p);
    if (parts.size() == 1) {
      singles.push_back(p);
    } else if (parts.size() >= 2) {
      std::sort(parts.begin(), parts.end());
      parts.erase(std::unique(parts.begin(), parts.end()), parts.end());
      for (const auto& part : parts) word_index[part].push_back(p);
    }
  }

  struct Scored {
    const PersonRecord* person;
    std::size_t         documents;
    std::size_t         connections;
    std::size_t         score;
  };

  std::size_t merged = 0;
  for (const auto* single : singles) {
    if (Stopping()) break;
    if (IsProtected(*single)) continue;

    const auto word = Parts(*single).front();
    if (word.size() < 3) continue;

    auto candidates = word_index.find(word);
    if (candidates == word_index.end()) continue;

    std::vector<Scored> scored;
    for (const auto* candidate : candidates->second) {
      const auto docs  = snapshot_.evidence.SharedDocuments(single->id, candidate->id);
      const auto conns = snapshot_.evidence.SharedConnections(single->id, candidate->id);
      const auto score = docs * 2 + conns;
      if (score > 0) scored.push_back({candidate, docs, conns, score});
    }
    if (scored.empty()) continue;

    std::stable_sort(scored.begin(), scored.end(), [](const Scored& a, const Scored& b) { return a.score > b.score; });

    std::string_view verdict;
    if (scored.size() == 1) {
      verdict = "ONLY_MATCH";
    } else if (scored[0].score >= 2 * scored[1].score) {
      verdict = "CLEAR_WINNER";
    } else {
      ++ambiguous_;
      ROSTER_LOG_INFO("single-word name ambiguous, skipped",
                      {StringField("name", single->name), StringField("top", scored[0].person->name),
                       IntField("top_score", static_cast<std::int64_t>(scored[0].score)),
                       StringField("runner_up", scored[1].person->name),
                       IntField("runner_up_score", static_cast<std::int64_t>(scored[1].score))});
      continue;
    }

    const auto& winner = scored.front();
    auto evidence = std::string(verdict) + " score " + std::to_string(winner.score) + " (" +
                    std::to_string(winner.documents) + " shared docs, " + std::to_string(winner.connections) +
                    " shared conns)";

    merged += Merge(2, "single-word evidence", *winner.person, {single}, {single->name}, std::move(evidence));
  }
  return merged;
}

// ------------------------------------------------------------------
// Pass 3
// ------------------------------------------------------------------

std::size_t PassPipeline::SingleWordCleanup() {
  std::vector<const PersonRecord*> targets;
  for (const auto* p : snapshot_.roster.Live()) {
    if (IsProtected(*p)) continue;
    const auto norm = names::NormalizeName(p->name);
    if (!norm.empty() && names::MeaningfulParts(norm).size() <= 1) targets.push_back(p);
  }
  return Delete(3, "single-word name", targets);
}

// ------------------------------------------------------------------
// Pass 4 / Pass 6
// ------------------------------------------------------------------

std::size_t PassPipeline::MergeTableVariants(int pass, std::string_view reason, const std::string& canonical_name,
                                             const std::vector<std::string>& variants) {
  const auto* canonical = snapshot_.roster.FindByName(canonical_name);
  if (!canonical) return 0;

  std::size_t merged = 0;
  for (const auto& variant : variants) {
    if (Stopping()) break;

    const auto* row = snapshot_.roster.FindByName(variant);
    if (!row || row->id == canonical->id) continue;

    if (!MayAbsorb(*canonical, *row)) {
      ROSTER_LOG_INFO("protected variant kept", {StringField("name", row->name), StringField("canonical", canonical->name)});
      continue;
    }
    merged += Merge(pass, reason, *canonical, {row}, {row->name});
  }
  return merged;
}

std::size_t PassPipeline::KeyFigureVariants() {
  std::size_t total = 0;
  for (const auto& rule : rules_.key_figures) {
    if (Stopping()) break;

    total += MergeTableVariants(4, "key figure variant", rule.canonical, rule.variants);

    const auto* canonical = snapshot_.roster.FindByName(rule.canonical);
    if (!canonical || rule.delete_names.empty()) continue;

    std::vector<const PersonRecord*> targets;
    for (const auto& name : rule.delete_names) {
      const auto* row = snapshot_.roster.FindByName(name);
      if (!row || row->id == canonical->id || IsProtected(*row)) continue;
      if (std::find(targets.begin(), targets.end(), row) == targets.end()) targets.push_back(row);
    }
    total += Delete(4, "junk variant of " + rule.canonical, targets);
  }
  return total;
}

std::size_t PassPipeline::OcrNickname() {
  std::size_t total = 0;
  for (const auto& rule : rules_.ocr_nicknames) {
    if (Stopping()) break;
    total += MergeTableVariants(6, "OCR/nickname variant", rule.canonical, rule.variants);
  }
  return total;
}

// ------------------------------------------------------------------
// Pass 5
// ------------------------------------------------------------------

std::size_t PassPipeline::MiddleInitial() {
  std::unordered_map<std::string, std::vector<const PersonRecord*>> long_names;
  std::vector<std::pair<const PersonRecord*, std::string>>          two_word;

  for (const auto* p : snapshot_.roster.Live()) {
    const auto parts = Parts(*p);
    if (parts.size() == 2) {
      two_word.emplace_back(p, parts[0] + "|" + parts[1]);
    } else if (parts.size() >= 3) {
      long_names[parts.front() + "|" + parts.back()].push_back(p);
    }
  }

  std::size_t merged = 0;
  for (const auto& [short_form, key] : two_word) {
    if (Stopping()) break;
    if (!snapshot_.roster.Contains(short_form->id)) continue;

    auto it = long_names.find(key);
    if (it == long_names.end()) continue;

    std::vector<const PersonRecord*> matches;
    for (const auto* candidate : it->second) {
      if (snapshot_.roster.Contains(candidate->id)) matches.push_back(candidate);
    }
    if (matches.size() != 1) {
      if (matches.size() > 1) {
        ++ambiguous_;
        ROSTER_LOG_INFO("middle-initial match ambiguous, skipped",
                        {StringField("name", short_form->name), StringField("matches", JoinNames(matches))});
      }
      continue;
    }

    const auto* long_form  = matches.front();
    const auto  two_total  = ReferenceCount(short_form->id);
    const auto  long_total = ReferenceCount(long_form->id);

    const PersonRecord* canonical = nullptr;
    if (two_total != long_total) {
      canonical = two_total > long_total ? short_form : long_form;
    } else {
      canonical = short_form->id < long_form->id ? short_form : long_form;
    }

    const bool short_protected = IsProtected(*short_form);
    const bool long_protected  = IsProtected(*long_form);
    if (short_protected && long_protected) {
      ROSTER_LOG_INFO("both middle-initial forms protected, skipped",
                      {StringField("short", short_form->name), StringField("long", long_form->name)});
      continue;
    }
    if (short_protected) canonical = short_form;
    if (long_protected) canonical = long_form;

    const auto* duplicate = canonical == short_form ? long_form : short_form;
    auto evidence = "2-word data: " + std::to_string(two_total) + ", 3+-word data: " + std::to_string(long_total);

    merged += Merge(5, "middle-initial variant", *canonical, {duplicate}, {duplicate->name}, std::move(evidence));
  }
  return merged;
}

} // namespace roster::dedup
