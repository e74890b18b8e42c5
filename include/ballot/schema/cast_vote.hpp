#pragma once
#include <ballot/schema/primitives.hpp>
#include <cstdint>

// Schema type: cast vote.
// Governance workflow: One yes/no ballot from the signer on an active
// proposal; immutable once recorded.
namespace ballot::schema {

template <uint16_t Version>
struct cast_vote;

template <>
struct cast_vote<1> final {
  uint16_t version{1};
  proposal_id_t proposal_id{};
  bool support{};
};

using cast_vote_t = cast_vote<1>;

}  // namespace ballot::schema
