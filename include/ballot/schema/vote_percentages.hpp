#pragma once
#include <cstdint>

// Schema type: vote percentages.
// Governance workflow: Tally shares in basis points (10000 == 100.00%),
// floor-rounded; the two shares may sum to less than 10000.
namespace ballot::schema {

inline constexpr uint64_t kPercentageScale = 10000;

template <uint16_t Version>
struct vote_percentages;

template <>
struct vote_percentages<1> final {
  uint16_t version{1};
  uint64_t yes{};
  uint64_t no{};
};

using vote_percentages_t = vote_percentages<1>;

}  // namespace ballot::schema
