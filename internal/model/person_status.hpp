#pragma once

#include <cstdint>
#include <string_view>

namespace roster::model {

enum class PersonStatus : std::uint8_t {
  kNamed     = 0,
  kVictim    = 1,
  kConvicted = 2,
  kWitness   = 3,
  kCharged   = 4,
};

constexpr std::string_view ToString(PersonStatus status) {
  switch (status) {
    case PersonStatus::kVictim:
      return "victim";
    case PersonStatus::kConvicted:
      return "convicted";
    case PersonStatus::kWitness:
      return "witness";
    case PersonStatus::kCharged:
      return "charged";
    case PersonStatus::kNamed:
      break;
  }
  return "named";
}

// Unknown text reads as kNamed; upstream producers are not trusted to be exact.
constexpr PersonStatus PersonStatusFromString(std::string_view text) {
  if (text == "victim") return PersonStatus::kVictim;
  if (text == "convicted") return PersonStatus::kConvicted;
  if (text == "witness") return PersonStatus::kWitness;
  if (text == "charged") return PersonStatus::kCharged;
  return PersonStatus::kNamed;
}

} // namespace roster::model
