#pragma once
#include <cstdint>
#include <string>

// Schema type: proposal info.
// Governance workflow: Presentation view of a proposal: text, tally, and
// whether it still accepts votes.
namespace ballot::schema {

template <uint16_t Version>
struct proposal_info;

template <>
struct proposal_info<1> final {
  uint16_t version{1};
  std::string title;
  std::string description;
  uint64_t yes_count{};
  uint64_t no_count{};
  bool active{};
};

using proposal_info_t = proposal_info<1>;

}  // namespace ballot::schema
