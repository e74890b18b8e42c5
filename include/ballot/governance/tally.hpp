#pragma once

#include <ballot/schema/vote_percentages.hpp>
#include <cstdint>

namespace ballot::governance::tally {

/// Yes/no shares in basis points using floor division.
///
/// Both shares are zero when no votes were cast. Rounding loss is not
/// redistributed, so `yes + no` may be below `kPercentageScale`.
/// Counts are expected to stay below 2^64 / kPercentageScale.
inline constexpr ballot::schema::vote_percentages_t percentages(
    const uint64_t yes_count,
    const uint64_t no_count) {
  const auto total = yes_count + no_count;
  if (total == 0) {
    return {};
  }
  return ballot::schema::vote_percentages_t{
      .yes = (yes_count * ballot::schema::kPercentageScale) / total,
      .no = (no_count * ballot::schema::kPercentageScale) / total};
}

/// Strict majority; a tie is not approved.
inline constexpr bool approved(const uint64_t yes_count,
                               const uint64_t no_count) {
  return yes_count > no_count;
}

}  // namespace ballot::governance::tally
