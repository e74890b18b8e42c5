#pragma once
#include <ballot/schema/primitives.hpp>
#include <cstdint>
#include <string>

// Schema type: proposal state.
// Governance workflow: Stored proposal record: identity, text, running tally,
// lifecycle flag, and creation provenance.
namespace ballot::schema {

template <uint16_t Version>
struct proposal_state;

template <>
struct proposal_state<1> final {
  uint16_t version{1};
  proposal_id_t id{};
  std::string title;
  std::string description;
  uint64_t yes_count{};
  uint64_t no_count{};
  bool active{true};  // terminal once false
  timestamp_seconds_t created_at{};
  address_t creator{};
};

using proposal_state_t = proposal_state<1>;

}  // namespace ballot::schema
