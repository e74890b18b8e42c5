#pragma once

#include <ballot/governance/outcome.hpp>
#include <ballot/schema/ledger_event.hpp>
#include <ballot/schema/primitives.hpp>
#include <ballot/schema/proposal_info.hpp>
#include <ballot/schema/proposal_state.hpp>
#include <ballot/schema/vote_percentages.hpp>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <set>
#include <shared_mutex>
#include <string>
#include <utility>
#include <vector>

namespace ballot::governance {

using vote_key_t =
    std::pair<ballot::schema::proposal_id_t, ballot::schema::address_t>;
using event_listener_t =
    std::function<void(const ballot::schema::ledger_event_t& event)>;
using subscription_id_t = uint64_t;

/// Proposal/vote state machine holding every governance rule.
///
/// Mutations are serialized and validated in full before any field changes,
/// so a rejected request leaves the ledger untouched. Queries run
/// concurrently under a shared lock and see a consistent view.
///
/// Listeners are invoked synchronously, in mutation order, after the state
/// lock is released. A listener may query the ledger but must not mutate it
/// or change subscriptions from inside the callback. An exception thrown by a
/// listener is logged and does not reach the mutating caller or stop delivery
/// to the remaining listeners.
class ledger final {
 public:
  /// Start an empty ledger administered by `administrator`.
  explicit ledger(ballot::schema::address_t administrator);

  /// Rebuild a ledger from persisted rows.
  ///
  /// `proposals` must be ordered by id starting at 0 and `votes` must only
  /// reference those ids; callers validate rows before restoring.
  ledger(ballot::schema::address_t administrator,
         std::vector<ballot::schema::proposal_state_t> proposals,
         std::set<vote_key_t> votes);

  ledger(const ledger&) = delete;
  ledger& operator=(const ledger&) = delete;
  ledger(ledger&&) = delete;
  ledger& operator=(ledger&&) = delete;

  /// Open a proposal. Only the administrator may create; title and
  /// description must be non-empty. Returns the new sequential id.
  outcome<ballot::schema::proposal_id_t> create_proposal(
      const std::string& title,
      const std::string& description,
      const ballot::schema::address_t& creator,
      ballot::schema::timestamp_seconds_t now);

  /// Permanently close a proposal (administrator only).
  outcome<void> close_proposal(ballot::schema::proposal_id_t proposal_id,
                               const ballot::schema::address_t& caller,
                               ballot::schema::timestamp_seconds_t now);

  /// Record one vote per (proposal, voter) on an active proposal.
  outcome<void> cast_vote(ballot::schema::proposal_id_t proposal_id,
                          const ballot::schema::address_t& voter,
                          bool support,
                          ballot::schema::timestamp_seconds_t now);

  /// Hand administration to `new_administrator` (current holder only).
  outcome<void> transfer_administrator(
      const ballot::schema::address_t& new_administrator,
      const ballot::schema::address_t& caller,
      ballot::schema::timestamp_seconds_t now);

  outcome<bool> has_voted(ballot::schema::proposal_id_t proposal_id,
                          const ballot::schema::address_t& voter) const;

  ballot::schema::address_t administrator() const;
  uint64_t proposal_count() const;

  outcome<ballot::schema::proposal_state_t> proposal(
      ballot::schema::proposal_id_t proposal_id) const;
  outcome<ballot::schema::proposal_info_t> proposal_info(
      ballot::schema::proposal_id_t proposal_id) const;
  std::vector<ballot::schema::proposal_id_t> all_proposal_ids() const;
  /// Linear scan over every proposal; ids are returned ascending.
  std::vector<ballot::schema::proposal_id_t> active_proposal_ids() const;
  outcome<ballot::schema::vote_percentages_t> vote_percentages(
      ballot::schema::proposal_id_t proposal_id) const;
  /// True iff yes > no; ties are rejected.
  outcome<bool> proposal_result(
      ballot::schema::proposal_id_t proposal_id) const;

  subscription_id_t subscribe(event_listener_t listener);
  bool unsubscribe(subscription_id_t subscription);

 private:
  bool exists(ballot::schema::proposal_id_t proposal_id) const;
  void publish(const ballot::schema::ledger_event_t& event);

  // Held for the whole of a mutation including listener delivery.
  std::mutex writer_mutex_;
  mutable std::shared_mutex state_mutex_;
  ballot::schema::address_t administrator_;
  std::vector<ballot::schema::proposal_state_t> proposals_;
  std::set<vote_key_t> votes_;
  std::map<subscription_id_t, event_listener_t> listeners_;
  subscription_id_t next_subscription_{1};
};

}  // namespace ballot::governance
