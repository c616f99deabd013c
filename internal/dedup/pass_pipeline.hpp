#pragma once

#include <array>
#include <cstddef>

#include "internal/db/api/repository.hpp"
#include "internal/dedup/action_sink.hpp"
#include "internal/dedup/canonical_selector.hpp"
#include "internal/dedup/rules.hpp"
#include "internal/dedup/run_snapshot.hpp"
#include "internal/names/protected_names.hpp"
#include "internal/util/cancellation.hpp"

namespace roster::dedup {

struct PipelineReport {
  // Persons deleted or absorbed (apply) or proposed for it (dry-run), per pass.
  std::array<std::size_t, kPassCount> counts{};

  // Pass 2 / pass 5 candidates left alone for lack of evidence.
  std::size_t ambiguous = 0;

  bool cancelled = false;
};

/*
  PassPipeline

  The seven passes, run once in fixed order over a RunSnapshot:

    0 junk removal           delete
    1 exact normalized       merge
    2 single-word evidence   merge
    3 single-word cleanup    delete
    4 key figure variants    merge + delete
    5 middle-initial         merge
    6 OCR/nickname           merge

  Protected persons are never deleted, and never absorbed into a
  canonical whose normalized name differs from theirs.

  Cancellation is polled between groups; the group in flight always
  completes.
*/
class PassPipeline {
 public:
  PassPipeline(RunSnapshot& snapshot, const names::ProtectedNames& protected_names, const DedupRules& rules,
               db::Repository& repository, ActionSink& sink, const util::CancellationToken* cancel = nullptr);

  PipelineReport Run();

  std::size_t JunkRemoval();
  std::size_t ExactNormalized();
  std::size_t SingleWordEvidence();
  std::size_t SingleWordCleanup();
  std::size_t KeyFigureVariants();
  std::size_t MiddleInitial();
  std::size_t OcrNickname();

 private:
  bool Stopping();

  bool IsProtected(const PersonRecord& p) const;
  bool MayAbsorb(const PersonRecord& canonical, const PersonRecord& duplicate) const;

  // documents + connections currently in the store
  std::int64_t ReferenceCount(PersonId id);

  std::size_t Merge(int pass, std::string_view reason, const PersonRecord& canonical,
                    const std::vector<const PersonRecord*>& duplicates, const std::vector<std::string>& all_names,
                    std::string evidence = {});
  std::size_t Delete(int pass, std::string_view reason, const std::vector<const PersonRecord*>& targets);

  std::size_t MergeTableVariants(int pass, std::string_view reason, const std::string& canonical_name,
                                 const std::vector<std::string>& variants);

  RunSnapshot&                   snapshot_;
  const names::ProtectedNames&   protected_names_;
  const DedupRules&              rules_;
  db::Repository&                repository_;
  ActionSink&                    sink_;
  const util::CancellationToken* cancel_;
  CanonicalSelector              selector_;

  std::size_t ambiguous_ = 0;
  bool        cancelled_ = false;
};

} // namespace roster::dedup
