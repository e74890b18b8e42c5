#pragma once
#include <cstdint>
#include <string>

// Schema type: create proposal.
// Governance workflow: Administrator opens a new proposal for voting; the
// signer is recorded as creator.
namespace ballot::schema {

template <uint16_t Version>
struct create_proposal;

template <>
struct create_proposal<1> final {
  uint16_t version{1};
  std::string title;
  std::string description;
};

using create_proposal_t = create_proposal<1>;

}  // namespace ballot::schema
