#include <ballot/governance/ledger.hpp>
#include <ballot/governance/tally.hpp>

#include <exception>
#include <optional>

#include <spdlog/spdlog.h>

using namespace ballot::schema;

namespace ballot::governance {

ledger::ledger(address_t administrator)
    : administrator_{administrator} {}

ledger::ledger(address_t administrator,
               std::vector<proposal_state_t> proposals,
               std::set<vote_key_t> votes)
    : administrator_{administrator},
      proposals_{std::move(proposals)},
      votes_{std::move(votes)} {}

outcome<proposal_id_t> ledger::create_proposal(const std::string& title,
                                               const std::string& description,
                                               const address_t& creator,
                                               const timestamp_seconds_t now) {
  auto writer = std::scoped_lock{writer_mutex_};
  auto event = proposal_created_t{};
  {
    auto state = std::unique_lock{state_mutex_};
    if (creator != administrator_) {
      return {.code = transaction_error_code::unauthorized};
    }
    if (title.empty() || description.empty()) {
      return {.code = transaction_error_code::invalid_input};
    }

    auto id = static_cast<proposal_id_t>(proposals_.size());
    proposals_.push_back(proposal_state_t{.id = id,
                                          .title = title,
                                          .description = description,
                                          .yes_count = 0,
                                          .no_count = 0,
                                          .active = true,
                                          .created_at = now,
                                          .creator = creator});
    event = proposal_created_t{
        .proposal_id = id, .title = title, .creator = creator, .timestamp = now};
  }
  publish(event);
  return {.value = event.proposal_id};
}

outcome<void> ledger::close_proposal(const proposal_id_t proposal_id,
                                     const address_t& caller,
                                     const timestamp_seconds_t now) {
  auto writer = std::scoped_lock{writer_mutex_};
  auto event = proposal_closed_t{};
  {
    auto state = std::unique_lock{state_mutex_};
    if (!exists(proposal_id)) {
      return {.code = transaction_error_code::not_found};
    }
    if (caller != administrator_) {
      return {.code = transaction_error_code::unauthorized};
    }
    auto& proposal = proposals_[proposal_id];
    if (!proposal.active) {
      return {.code = transaction_error_code::already_closed};
    }

    proposal.active = false;
    event = proposal_closed_t{.proposal_id = proposal_id,
                              .yes_count = proposal.yes_count,
                              .no_count = proposal.no_count,
                              .timestamp = now};
  }
  publish(event);
  return {};
}

outcome<void> ledger::cast_vote(const proposal_id_t proposal_id,
                                const address_t& voter,
                                const bool support,
                                const timestamp_seconds_t now) {
  auto writer = std::scoped_lock{writer_mutex_};
  auto event = voted_t{};
  {
    auto state = std::unique_lock{state_mutex_};
    if (!exists(proposal_id)) {
      return {.code = transaction_error_code::not_found};
    }
    auto& proposal = proposals_[proposal_id];
    if (!proposal.active) {
      return {.code = transaction_error_code::inactive};
    }
    auto [_, inserted] = votes_.emplace(proposal_id, voter);
    if (!inserted) {
      return {.code = transaction_error_code::duplicate_vote};
    }

    if (support) {
      ++proposal.yes_count;
    } else {
      ++proposal.no_count;
    }
    event = voted_t{.voter = voter,
                    .proposal_id = proposal_id,
                    .support = support,
                    .timestamp = now};
  }
  publish(event);
  return {};
}

outcome<void> ledger::transfer_administrator(const address_t& new_administrator,
                                             const address_t& caller,
                                             const timestamp_seconds_t now) {
  auto writer = std::scoped_lock{writer_mutex_};
  auto event = administrator_transferred_t{};
  {
    auto state = std::unique_lock{state_mutex_};
    if (caller != administrator_) {
      return {.code = transaction_error_code::unauthorized};
    }
    if (is_null_address(new_administrator)) {
      return {.code = transaction_error_code::invalid_input};
    }

    event = administrator_transferred_t{
        .previous_administrator = administrator_,
        .new_administrator = new_administrator,
        .timestamp = now};
    administrator_ = new_administrator;
  }
  publish(event);
  return {};
}

outcome<bool> ledger::has_voted(const proposal_id_t proposal_id,
                                const address_t& voter) const {
  auto state = std::shared_lock{state_mutex_};
  if (!exists(proposal_id)) {
    return {.code = transaction_error_code::not_found};
  }
  return {.value = votes_.contains(vote_key_t{proposal_id, voter})};
}

address_t ledger::administrator() const {
  auto state = std::shared_lock{state_mutex_};
  return administrator_;
}

uint64_t ledger::proposal_count() const {
  auto state = std::shared_lock{state_mutex_};
  return proposals_.size();
}

outcome<proposal_state_t> ledger::proposal(
    const proposal_id_t proposal_id) const {
  auto state = std::shared_lock{state_mutex_};
  if (!exists(proposal_id)) {
    return {.code = transaction_error_code::not_found};
  }
  return {.value = proposals_[proposal_id]};
}

outcome<proposal_info_t> ledger::proposal_info(
    const proposal_id_t proposal_id) const {
  auto state = std::shared_lock{state_mutex_};
  if (!exists(proposal_id)) {
    return {.code = transaction_error_code::not_found};
  }
  const auto& proposal = proposals_[proposal_id];
  return {.value = proposal_info_t{.title = proposal.title,
                                   .description = proposal.description,
                                   .yes_count = proposal.yes_count,
                                   .no_count = proposal.no_count,
                                   .active = proposal.active}};
}

std::vector<proposal_id_t> ledger::all_proposal_ids() const {
  auto state = std::shared_lock{state_mutex_};
  auto ids = std::vector<proposal_id_t>{};
  ids.reserve(proposals_.size());
  for (const auto& proposal : proposals_) {
    ids.push_back(proposal.id);
  }
  return ids;
}

std::vector<proposal_id_t> ledger::active_proposal_ids() const {
  auto state = std::shared_lock{state_mutex_};
  auto ids = std::vector<proposal_id_t>{};
  for (const auto& proposal : proposals_) {
    if (proposal.active) {
      ids.push_back(proposal.id);
    }
  }
  return ids;
}

outcome<vote_percentages_t> ledger::vote_percentages(
    const proposal_id_t proposal_id) const {
  auto state = std::shared_lock{state_mutex_};
  if (!exists(proposal_id)) {
    return {.code = transaction_error_code::not_found};
  }
  const auto& proposal = proposals_[proposal_id];
  return {.value = tally::percentages(proposal.yes_count, proposal.no_count)};
}

outcome<bool> ledger::proposal_result(const proposal_id_t proposal_id) const {
  auto state = std::shared_lock{state_mutex_};
  if (!exists(proposal_id)) {
    return {.code = transaction_error_code::not_found};
  }
  const auto& proposal = proposals_[proposal_id];
  return {.value = tally::approved(proposal.yes_count, proposal.no_count)};
}

subscription_id_t ledger::subscribe(event_listener_t listener) {
  auto writer = std::scoped_lock{writer_mutex_};
  auto id = next_subscription_++;
  listeners_.emplace(id, std::move(listener));
  return id;
}

bool ledger::unsubscribe(const subscription_id_t subscription) {
  auto writer = std::scoped_lock{writer_mutex_};
  return listeners_.erase(subscription) > 0;
}

bool ledger::exists(const proposal_id_t proposal_id) const {
  return proposal_id < proposals_.size();
}

void ledger::publish(const ledger_event_t& event) {
  for (const auto& [_, listener] : listeners_) {
    if (!listener) {
      continue;
    }
    try {
      listener(event);
    } catch (const std::exception& ex) {
      spdlog::error("Ledger event listener failed: {}", ex.what());
    }
  }
}

}  // namespace ballot::governance
