#pragma once
#include <ballot/schema/primitives.hpp>
#include <cstdint>
#include <string>
#include <variant>

// Schema type: ledger event.
// Governance workflow: Notifications emitted by the ledger after each
// successful mutation, delivered to listeners and persisted to the event log.
namespace ballot::schema {

template <uint16_t Version>
struct proposal_created;

template <>
struct proposal_created<1> final {
  uint16_t version{1};
  proposal_id_t proposal_id{};
  std::string title;
  address_t creator{};
  timestamp_seconds_t timestamp{};
};

template <uint16_t Version>
struct voted;

template <>
struct voted<1> final {
  uint16_t version{1};
  address_t voter{};
  proposal_id_t proposal_id{};
  bool support{};
  timestamp_seconds_t timestamp{};
};

template <uint16_t Version>
struct proposal_closed;

template <>
struct proposal_closed<1> final {
  uint16_t version{1};
  proposal_id_t proposal_id{};
  uint64_t yes_count{};
  uint64_t no_count{};
  timestamp_seconds_t timestamp{};
};

template <uint16_t Version>
struct administrator_transferred;

template <>
struct administrator_transferred<1> final {
  uint16_t version{1};
  address_t previous_administrator{};
  address_t new_administrator{};
  timestamp_seconds_t timestamp{};
};

using proposal_created_t = proposal_created<1>;
using voted_t = voted<1>;
using proposal_closed_t = proposal_closed<1>;
using administrator_transferred_t = administrator_transferred<1>;

using ledger_event_t = std::variant<proposal_created_t,
                                    voted_t,
                                    proposal_closed_t,
                                    administrator_transferred_t>;

template <uint16_t Version>
struct event_record;

// Persisted form: events are numbered from 1 in emission order.
template <>
struct event_record<1> final {
  uint16_t version{1};
  uint64_t sequence{};
  ledger_event_t event{};
};

using event_record_t = event_record<1>;

}  // namespace ballot::schema
