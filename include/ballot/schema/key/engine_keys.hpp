#pragma once

#include <ballot/schema/primitives.hpp>
#include <cstdint>
#include <string_view>
#include <tuple>

// Schema key type: engine keys.
// Governance workflow: Defines canonical key prefixes and key codecs for
// ledger state, the event log, and the committed checkpoint.
namespace ballot::schema::key {

inline constexpr std::string_view kAdministratorKeyPrefix{"SYS|STATE|ADMIN|"};
inline constexpr std::string_view kProposalCountKeyPrefix{
    "SYS|STATE|PROPOSAL_COUNT|"};
inline constexpr std::string_view kProposalKeyPrefix{"SYS|STATE|PROPOSAL|"};
inline constexpr std::string_view kVoteKeyPrefix{"SYS|STATE|VOTE|"};
inline constexpr std::string_view kEventSeqKeyPrefix{"SYS|STATE|EVENT_SEQ|"};
inline constexpr std::string_view kEventPrefix{"SYS|EVENT|"};

template <typename Encoder, typename T>
ballot::schema::bytes_t make_prefixed_key(Encoder& encoder,
                                          std::string_view prefix,
                                          const T& id) {
  // Raw prefix bytes followed by the SCALE encoded id.
  auto key = ballot::schema::make_bytes(prefix);
  encoder.encode(id, key);
  return key;
}

template <typename Encoder>
ballot::schema::bytes_t make_prefix_key(Encoder& /*encoder*/,
                                        std::string_view prefix) {
  return ballot::schema::make_bytes(prefix);
}

template <typename Encoder>
ballot::schema::bytes_t make_administrator_key(Encoder& encoder) {
  return make_prefix_key(encoder, kAdministratorKeyPrefix);
}

template <typename Encoder>
ballot::schema::bytes_t make_proposal_count_key(Encoder& encoder) {
  return make_prefix_key(encoder, kProposalCountKeyPrefix);
}

template <typename Encoder>
ballot::schema::bytes_t make_proposal_key(
    Encoder& encoder,
    const ballot::schema::proposal_id_t proposal_id) {
  return make_prefixed_key(encoder, kProposalKeyPrefix, proposal_id);
}

template <typename Encoder>
ballot::schema::bytes_t make_vote_key(
    Encoder& encoder,
    const ballot::schema::proposal_id_t proposal_id,
    const ballot::schema::address_t& voter) {
  return make_prefixed_key(encoder, kVoteKeyPrefix,
                           std::tuple{proposal_id, voter});
}

template <typename Encoder>
ballot::schema::bytes_t make_event_seq_key(Encoder& encoder) {
  return make_prefix_key(encoder, kEventSeqKeyPrefix);
}

template <typename Encoder>
ballot::schema::bytes_t make_event_key(Encoder& encoder,
                                       const uint64_t sequence) {
  return make_prefixed_key(encoder, kEventPrefix, sequence);
}

}  // namespace ballot::schema::key
