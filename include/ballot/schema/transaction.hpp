#pragma once
#include <ballot/schema/cast_vote.hpp>
#include <ballot/schema/close_proposal.hpp>
#include <ballot/schema/create_proposal.hpp>
#include <ballot/schema/primitives.hpp>
#include <ballot/schema/transfer_administrator.hpp>
#include <variant>

namespace ballot::schema {

using transaction_payload_t = std::variant<create_proposal_t,
                                           cast_vote_t,
                                           close_proposal_t,
                                           transfer_administrator_t>;

template <uint16_t Version>
struct transaction;

template <>
struct transaction<1> final {
  uint16_t version{1};
  hash32_t chain_id{};
  address_t signer{};  // caller, creator, or voter depending on payload
  transaction_payload_t payload{};
};

using transaction_t = transaction<1>;

}  // namespace ballot::schema
