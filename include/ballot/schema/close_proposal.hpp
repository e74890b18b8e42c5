#pragma once
#include <ballot/schema/primitives.hpp>
#include <cstdint>

// Schema type: close proposal.
// Governance workflow: Administrator permanently stops voting on a proposal.
namespace ballot::schema {

template <uint16_t Version>
struct close_proposal;

template <>
struct close_proposal<1> final {
  uint16_t version{1};
  proposal_id_t proposal_id{};
};

using close_proposal_t = close_proposal<1>;

}  // namespace ballot::schema
