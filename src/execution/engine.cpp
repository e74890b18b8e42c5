#include <spdlog/spdlog.h>
#include <algorithm>
#include <ballot/blake3/hash.hpp>
#include <ballot/common/critical.hpp>
#include <ballot/execution/engine.hpp>
#include <ballot/schema/key/engine_keys.hpp>
#include <ballot/schema/query_error_code.hpp>
#include <chrono>
#include <iterator>
#include <optional>
#include <set>
#include <string>
#include <tuple>
#include <utility>

using namespace ballot::schema;

namespace {

using encoder_t =
    ballot::schema::encoding::encoder<ballot::schema::encoding::scale_encoder_tag>;

constexpr auto kCheckCodespace = std::string_view{"ballot.checktx"};
constexpr auto kExecuteCodespace = std::string_view{"ballot.execute"};
constexpr auto kQueryCodespace = std::string_view{"ballot.query"};
constexpr auto kMaxEventRange = uint64_t{1000};

hash32_t fold_state_root(const hash32_t& root,
                         const bytes_t& tx,
                         const uint64_t height) {
  auto material = bytes_t{};
  material.reserve(root.size() + tx.size() + 8);
  material.insert(std::end(material), std::begin(root), std::end(root));
  material.insert(std::end(material), std::begin(tx), std::end(tx));

  auto encoder = encoder_t{};
  encoder.encode(height, material);
  return ballot::blake3::hash(bytes_view_t{material.data(), material.size()});
}

std::optional<transaction_t> decode_transaction(encoder_t& encoder,
                                                const bytes_view_t& raw_tx,
                                                std::string& error) {
  if (raw_tx.empty()) {
    error = "empty transaction";
    return std::nullopt;
  }
  auto tx = encoder.try_decode<transaction_t>(raw_tx);
  if (!tx) {
    error = "transaction bytes are not a valid SCALE envelope";
  }
  return tx;
}

transaction_result_t make_error_result(const transaction_error_code code,
                                       const std::string_view codespace,
                                       std::string info) {
  return transaction_result_t{.code = static_cast<uint32_t>(code),
                              .log = std::string{to_string(code)},
                              .info = std::move(info),
                              .codespace = std::string{codespace}};
}

std::string_view payload_name(const transaction_payload_t& payload) {
  return std::visit(
      overloaded{
          [](const create_proposal_t&) {
            return std::string_view{"create_proposal"};
          },
          [](const cast_vote_t&) { return std::string_view{"cast_vote"}; },
          [](const close_proposal_t&) {
            return std::string_view{"close_proposal"};
          },
          [](const transfer_administrator_t&) {
            return std::string_view{"transfer_administrator"};
          }},
      payload);
}

transaction_event_attribute_t make_attribute(std::string key,
                                             std::string value,
                                             const bool index = false) {
  return transaction_event_attribute_t{
      .key = std::move(key), .value = std::move(value), .index = index};
}

std::string hex_address(const address_t& address) {
  return to_hex(bytes_view_t{address.data(), address.size()});
}

query_result_t make_query_error(const query_error_code code,
                                std::string log,
                                const bytes_view_t& key,
                                const uint64_t height) {
  return query_result_t{.code = static_cast<uint32_t>(code),
                        .log = std::move(log),
                        .key = make_bytes(key),
                        .height = height,
                        .codespace = std::string{kQueryCodespace}};
}

}  // namespace

namespace ballot::execution {

timestamp_seconds_t system_time_seconds() {
  return static_cast<timestamp_seconds_t>(
      std::chrono::duration_cast<std::chrono::seconds>(
          std::chrono::system_clock::now().time_since_epoch())
          .count());
}

transaction_event_t make_transaction_event(const ledger_event_t& event) {
  return std::visit(
      overloaded{
          [](const proposal_created_t& e) {
            return transaction_event_t{
                .type = "ballot.proposal_created",
                .attributes = {
                    make_attribute("proposal_id", std::to_string(e.proposal_id),
                                   true),
                    make_attribute("title", e.title),
                    make_attribute("creator", hex_address(e.creator), true),
                    make_attribute("timestamp", std::to_string(e.timestamp))}};
          },
          [](const voted_t& e) {
            return transaction_event_t{
                .type = "ballot.voted",
                .attributes = {
                    make_attribute("voter", hex_address(e.voter), true),
                    make_attribute("proposal_id", std::to_string(e.proposal_id),
                                   true),
                    make_attribute("support", e.support ? "true" : "false"),
                    make_attribute("timestamp", std::to_string(e.timestamp))}};
          },
          [](const proposal_closed_t& e) {
            return transaction_event_t{
                .type = "ballot.proposal_closed",
                .attributes = {
                    make_attribute("proposal_id", std::to_string(e.proposal_id),
                                   true),
                    make_attribute("yes_count", std::to_string(e.yes_count)),
                    make_attribute("no_count", std::to_string(e.no_count)),
                    make_attribute("timestamp", std::to_string(e.timestamp))}};
          },
          [](const administrator_transferred_t& e) {
            return transaction_event_t{
                .type = "ballot.administrator_transferred",
                .attributes = {
                    make_attribute("previous_administrator",
                                   hex_address(e.previous_administrator), true),
                    make_attribute("new_administrator",
                                   hex_address(e.new_administrator), true),
                    make_attribute("timestamp", std::to_string(e.timestamp))}};
          }},
      event);
}

engine::engine(
    ballot::schema::encoding::encoder<
        ballot::schema::encoding::scale_encoder_tag>& encoder,
    ballot::storage::storage<ballot::storage::rocksdb_storage_tag>& storage,
    hash32_t chain_id,
    address_t genesis_administrator,
    time_source_t time_source)
    : encoder_{encoder},
      storage_{storage},
      chain_id_{chain_id},
      time_source_{std::move(time_source)} {
  auto lock = std::scoped_lock{mutex_};
  if (!time_source_) {
    time_source_ = system_time_seconds;
  }
  load_persisted_state(genesis_administrator);
  ledger_->subscribe([this](const ledger_event_t& event) {
    pending_events_.push_back(event);
  });
  spdlog::info(
      "Execution engine ready at height {} with {} proposal(s), administrator "
      "{}",
      height_, ledger_->proposal_count(),
      hex_address(ledger_->administrator()));
}

transaction_result_t engine::check_transaction(const bytes_view_t& raw_tx) {
  auto lock = std::scoped_lock{mutex_};
  auto decode_error = std::string{};
  auto tx = decode_transaction(encoder_, raw_tx, decode_error);
  if (!tx) {
    spdlog::warn("CheckTx rejected undecodable transaction: {}", decode_error);
    return make_error_result(transaction_error_code::invalid_transaction,
                             kCheckCodespace, decode_error);
  }
  return validate_transaction(*tx, kCheckCodespace);
}

transaction_result_t engine::submit_transaction(const bytes_view_t& raw_tx) {
  auto lock = std::scoped_lock{mutex_};
  auto decode_error = std::string{};
  auto tx = decode_transaction(encoder_, raw_tx, decode_error);
  if (!tx) {
    spdlog::warn("Rejected undecodable transaction: {}", decode_error);
    return make_error_result(transaction_error_code::invalid_transaction,
                             kExecuteCodespace, decode_error);
  }
  auto validation = validate_transaction(*tx, kExecuteCodespace);
  if (validation.code != 0) {
    return validation;
  }
  return execute_operation(*tx);
}

transaction_result_t engine::execute_transaction(const transaction_t& tx) {
  auto lock = std::scoped_lock{mutex_};
  auto validation = validate_transaction(tx, kExecuteCodespace);
  if (validation.code != 0) {
    return validation;
  }
  return execute_operation(tx);
}

app_info_t engine::info() const {
  auto lock = std::scoped_lock{mutex_};
  return app_info_t{
      .height = height_, .state_root = state_root_, .chain_id = chain_id_};
}

query_result_t engine::query(const std::string_view path,
                             const bytes_view_t& data) const {
  auto lock = std::scoped_lock{mutex_};
  auto result = query_result_t{.key = make_bytes(data),
                               .height = height_,
                               .codespace = std::string{kQueryCodespace}};

  auto not_found = [&](const proposal_id_t id) {
    return make_query_error(query_error_code::not_found,
                            "proposal " + std::to_string(id) + " not found",
                            data, height_);
  };
  auto invalid_key = [&](const std::string_view expected) {
    return make_query_error(query_error_code::invalid_key,
                            "expected SCALE encoded " + std::string{expected},
                            data, height_);
  };

  if (path == "/engine/info") {
    result.value = encoder_.encode(app_info_t{
        .height = height_, .state_root = state_root_, .chain_id = chain_id_});
    return result;
  }
  if (path == "/governance/administrator") {
    result.value = encoder_.encode(ledger_->administrator());
    return result;
  }
  if (path == "/governance/proposal_count") {
    result.value = encoder_.encode(ledger_->proposal_count());
    return result;
  }
  if (path == "/governance/proposal_ids") {
    result.value = encoder_.encode(ledger_->all_proposal_ids());
    return result;
  }
  if (path == "/governance/active_proposal_ids") {
    result.value = encoder_.encode(ledger_->active_proposal_ids());
    return result;
  }
  if (path == "/governance/has_voted") {
    auto key =
        encoder_.try_decode<std::tuple<proposal_id_t, address_t>>(data);
    if (!key) {
      return invalid_key("(proposal_id, voter)");
    }
    auto [proposal_id, voter] = *key;
    auto voted = ledger_->has_voted(proposal_id, voter);
    if (!voted.ok()) {
      return not_found(proposal_id);
    }
    result.value = encoder_.encode(voted.value);
    return result;
  }
  if (path == "/events/range") {
    auto range = encoder_.try_decode<std::tuple<uint64_t, uint64_t>>(data);
    if (!range) {
      return invalid_key("(from_sequence, to_sequence)");
    }
    auto [from, to] = *range;
    auto records = read_events(from, to);
    result.value = encoder_.encode(records);
    return result;
  }

  if (path == "/governance/proposal" || path == "/governance/proposal_info" ||
      path == "/governance/vote_percentages" ||
      path == "/governance/proposal_result") {
    auto decoded = encoder_.try_decode<proposal_id_t>(data);
    if (!decoded) {
      return invalid_key("proposal_id");
    }
    auto proposal_id = *decoded;

    if (path == "/governance/proposal") {
      auto proposal = ledger_->proposal(proposal_id);
      if (!proposal.ok()) {
        return not_found(proposal_id);
      }
      result.value = encoder_.encode(proposal.value);
    } else if (path == "/governance/proposal_info") {
      auto info = ledger_->proposal_info(proposal_id);
      if (!info.ok()) {
        return not_found(proposal_id);
      }
      result.value = encoder_.encode(info.value);
    } else if (path == "/governance/vote_percentages") {
      auto percentages = ledger_->vote_percentages(proposal_id);
      if (!percentages.ok()) {
        return not_found(proposal_id);
      }
      result.value = encoder_.encode(percentages.value);
    } else {
      auto approved = ledger_->proposal_result(proposal_id);
      if (!approved.ok()) {
        return not_found(proposal_id);
      }
      result.value = encoder_.encode(approved.value);
    }
    return result;
  }

  spdlog::warn("Unsupported query path '{}'", path);
  return make_query_error(query_error_code::unsupported_path,
                          "unsupported query path", data, height_);
}

std::vector<event_record_t> engine::events(const uint64_t from_sequence,
                                           const uint64_t to_sequence) const {
  auto lock = std::scoped_lock{mutex_};
  return read_events(from_sequence, to_sequence);
}

std::vector<event_record_t> engine::read_events(
    const uint64_t from_sequence,
    const uint64_t to_sequence) const {
  auto records = std::vector<event_record_t>{};
  auto from = std::max<uint64_t>(from_sequence, 1);
  if (from > event_sequence_ || to_sequence < from) {
    return records;
  }
  auto to = std::min({to_sequence, event_sequence_,
                      from + (kMaxEventRange - 1)});
  records.reserve(to - from + 1);
  for (auto sequence = from; sequence <= to; ++sequence) {
    auto record = storage_.get<event_record_t>(
        encoder_, ballot::schema::key::make_event_key(encoder_, sequence));
    if (!record) {
      spdlog::warn("Event {} missing from event log", sequence);
      continue;
    }
    records.push_back(std::move(*record));
  }
  return records;
}

const ballot::governance::ledger& engine::ledger() const {
  return *ledger_;
}

transaction_result_t engine::validate_transaction(
    const transaction_t& tx,
    const std::string_view codespace) const {
  if (tx.version != 1) {
    spdlog::warn("Rejected transaction with version {}", tx.version);
    return make_error_result(
        transaction_error_code::unsupported_transaction_version, codespace,
        "expected version 1");
  }
  if (tx.chain_id != chain_id_) {
    spdlog::warn("Rejected {} for foreign chain id",
                 payload_name(tx.payload));
    return make_error_result(transaction_error_code::invalid_chain_id,
                             codespace, "chain id does not match this ledger");
  }
  return transaction_result_t{.codespace = std::string{codespace}};
}

transaction_result_t engine::execute_operation(const transaction_t& tx) {
  pending_events_.clear();
  auto now = time_source_();
  auto code = transaction_error_code::ok;
  auto data = bytes_t{};

  std::visit(
      overloaded{
          [&](const create_proposal_t& payload) {
            auto created = ledger_->create_proposal(
                payload.title, payload.description, tx.signer, now);
            code = created.code;
            if (created.ok()) {
              data = encoder_.encode(created.value);
            }
          },
          [&](const cast_vote_t& payload) {
            code = ledger_
                       ->cast_vote(payload.proposal_id, tx.signer,
                                   payload.support, now)
                       .code;
          },
          [&](const close_proposal_t& payload) {
            code =
                ledger_->close_proposal(payload.proposal_id, tx.signer, now)
                    .code;
          },
          [&](const transfer_administrator_t& payload) {
            code = ledger_
                       ->transfer_administrator(payload.new_administrator,
                                                tx.signer, now)
                       .code;
          }},
      tx.payload);

  auto operation = payload_name(tx.payload);
  if (code != transaction_error_code::ok) {
    spdlog::warn("Rejected {} from {}: {}", operation, hex_address(tx.signer),
                 to_string(code));
    pending_events_.clear();
    return make_error_result(code, kExecuteCodespace,
                             std::string{operation} + " rejected");
  }

  persist(tx);

  auto result = transaction_result_t{.data = std::move(data),
                                     .info = std::string{operation} +
                                             " accepted",
                                     .codespace = std::string{kExecuteCodespace}};
  result.events.reserve(pending_events_.size());
  for (const auto& event : pending_events_) {
    result.events.push_back(make_transaction_event(event));
  }
  pending_events_.clear();
  spdlog::debug("Applied {} from {} at height {}", operation,
                hex_address(tx.signer), height_);
  return result;
}

void engine::persist(const transaction_t& tx) {
  using namespace ballot::schema::key;

  auto rows = std::vector<ballot::storage::key_value_entry_t>{};
  auto put_row = [&](bytes_t key, const auto& value) {
    rows.emplace_back(std::move(key), encoder_.encode(value));
  };
  auto put_proposal_row = [&](const proposal_id_t proposal_id) {
    auto proposal = ledger_->proposal(proposal_id);
    if (!proposal.ok()) {
      ballot::common::critical("applied event references a missing proposal");
    }
    put_row(make_proposal_key(encoder_, proposal_id), proposal.value);
  };

  auto sequence = event_sequence_;
  for (const auto& event : pending_events_) {
    std::visit(overloaded{[&](const proposal_created_t& e) {
                            put_proposal_row(e.proposal_id);
                            put_row(make_proposal_count_key(encoder_),
                                    ledger_->proposal_count());
                          },
                          [&](const voted_t& e) {
                            put_proposal_row(e.proposal_id);
                            put_row(make_vote_key(encoder_, e.proposal_id,
                                                  e.voter),
                                    true);
                          },
                          [&](const proposal_closed_t& e) {
                            put_proposal_row(e.proposal_id);
                          },
                          [&](const administrator_transferred_t& e) {
                            put_row(make_administrator_key(encoder_),
                                    e.new_administrator);
                          }},
               event);
    ++sequence;
    put_row(make_event_key(encoder_, sequence),
            event_record_t{.sequence = sequence, .event = event});
  }
  put_row(make_event_seq_key(encoder_), sequence);

  auto next_height = height_ + 1;
  auto next_root = fold_state_root(state_root_, encoder_.encode(tx), next_height);
  storage_.commit_batch(rows, ballot::storage::committed_state{
                                  .height = next_height,
                                  .state_root = next_root});

  height_ = next_height;
  state_root_ = next_root;
  event_sequence_ = sequence;
}

void engine::load_persisted_state(const address_t& genesis_administrator) {
  using namespace ballot::schema::key;
  spdlog::debug("Loading persisted ledger state");

  if (auto committed = storage_.load_committed_state()) {
    height_ = committed->height;
    state_root_ = committed->state_root;
  }

  auto administrator =
      storage_.get<address_t>(encoder_, make_administrator_key(encoder_));
  if (!administrator) {
    if (is_null_address(genesis_administrator)) {
      ballot::common::critical(
          "no administrator stored and no genesis administrator configured");
    }
    administrator = genesis_administrator;
    storage_.put(encoder_, make_administrator_key(encoder_), *administrator);
    spdlog::info("Initialized genesis administrator {}",
                 hex_address(*administrator));
  }

  auto count = storage_.get<uint64_t>(encoder_, make_proposal_count_key(encoder_))
                   .value_or(0);
  event_sequence_ =
      storage_.get<uint64_t>(encoder_, make_event_seq_key(encoder_)).value_or(0);

  auto proposals = std::vector<proposal_state_t>{};
  for (const auto& [key, value] : storage_.list_by_prefix(
           make_prefix_key(encoder_, kProposalKeyPrefix))) {
    auto proposal = encoder_.try_decode<proposal_state_t>(value);
    if (!proposal) {
      ballot::common::critical("corrupt proposal row in storage");
    }
    proposals.push_back(std::move(*proposal));
  }
  std::ranges::sort(proposals, {}, &proposal_state_t::id);
  if (proposals.size() != count) {
    spdlog::error("Stored proposal count {} disagrees with {} proposal row(s)",
                  count, proposals.size());
    ballot::common::critical("proposal rows do not match proposal count");
  }
  for (auto i = size_t{0}; i < proposals.size(); ++i) {
    if (proposals[i].id != i) {
      ballot::common::critical("proposal ids are not contiguous");
    }
  }

  auto vote_prefix = make_prefix_key(encoder_, kVoteKeyPrefix);
  auto votes = std::set<ballot::governance::vote_key_t>{};
  auto tallies = std::vector<uint64_t>(proposals.size());
  for (const auto& [key, value] : storage_.list_by_prefix(vote_prefix)) {
    auto suffix = bytes_view_t{key}.subspan(vote_prefix.size());
    auto vote = encoder_.try_decode<std::tuple<proposal_id_t, address_t>>(suffix);
    if (!vote || std::get<0>(*vote) >= proposals.size()) {
      ballot::common::critical("corrupt vote row in storage");
    }
    votes.emplace(std::get<0>(*vote), std::get<1>(*vote));
    ++tallies[std::get<0>(*vote)];
  }
  for (const auto& proposal : proposals) {
    if (proposal.yes_count + proposal.no_count != tallies[proposal.id]) {
      spdlog::error("Proposal {} tally {}+{} disagrees with {} vote row(s)",
                    proposal.id, proposal.yes_count, proposal.no_count,
                    tallies[proposal.id]);
      ballot::common::critical("vote rows do not match proposal tallies");
    }
  }

  spdlog::info("Restored {} proposal(s), {} vote(s), {} event(s)",
               proposals.size(), votes.size(), event_sequence_);
  ledger_ = std::make_unique<ballot::governance::ledger>(
      *administrator, std::move(proposals), std::move(votes));
}

}  // namespace ballot::execution
