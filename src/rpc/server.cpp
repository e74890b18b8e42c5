#include <spdlog/spdlog.h>
#include <ballot/rpc/server.hpp>
#include <optional>
#include <string>
#include <string_view>

using namespace ballot::rpc;
using namespace ballot::schema;

namespace {

grpc::ServerUnaryReactor* finish_ok(grpc::CallbackServerContext* context) {
  auto* reactor = context->DefaultReactor();
  reactor->Finish(grpc::Status::OK);
  return reactor;
}

std::string address_string(const address_t& address) {
  return std::string{reinterpret_cast<const char*>(address.data()),
                     address.size()};
}

void populate_event(const transaction_event_t& source,
                    ballot::v1::Event* destination) {
  destination->set_type(source.type);
  for (const auto& attribute : source.attributes) {
    auto* out = destination->add_attributes();
    out->set_key(attribute.key);
    out->set_value(attribute.value);
    out->set_index(attribute.index);
  }
}

void populate_transaction_result(const transaction_result_t& source,
                                 ballot::v1::TransactionResult* destination) {
  destination->set_code(source.code);
  destination->set_data(make_string(source.data));
  destination->set_log(source.log);
  destination->set_info(source.info);
  destination->set_codespace(source.codespace);
  for (const auto& event : source.events) {
    populate_event(event, destination->add_events());
  }
}

void reject_address(std::string_view field,
                    ballot::v1::TransactionResult* destination) {
  spdlog::warn("Rejected request with malformed {} address", field);
  destination->set_code(
      static_cast<uint32_t>(transaction_error_code::invalid_input));
  destination->set_log(std::string{to_string(transaction_error_code::invalid_input)});
  destination->set_info(std::string{field} +
                        " must be 20 bytes or 40 hex digits");
  destination->set_codespace("ballot.rpc");
}

template <typename Response>
void set_failure(const transaction_error_code code, Response* response) {
  response->set_code(static_cast<uint32_t>(code));
  response->set_log(std::string{to_string(code)});
}

}  // namespace

listener::listener(ballot::execution::engine& engine)
    : execution_engine_{engine} {}

grpc::ServerUnaryReactor* listener::Info(
    grpc::CallbackServerContext* context,
    const ballot::v1::InfoRequest* /*request*/,
    ballot::v1::InfoResponse* response) {
  auto info = execution_engine_.info();
  response->set_data(info.data);
  response->set_version(info.version);
  response->set_app_version(info.app_version);
  response->set_height(info.height);
  response->set_state_root(make_string(
      bytes_view_t{info.state_root.data(), info.state_root.size()}));
  response->set_chain_id(
      make_string(bytes_view_t{info.chain_id.data(), info.chain_id.size()}));
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::CheckTransaction(
    grpc::CallbackServerContext* context,
    const ballot::v1::TransactionRequest* request,
    ballot::v1::TransactionResult* response) {
  auto check =
      execution_engine_.check_transaction(make_bytes_view(request->tx()));
  populate_transaction_result(check, response);
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::SubmitTransaction(
    grpc::CallbackServerContext* context,
    const ballot::v1::TransactionRequest* request,
    ballot::v1::TransactionResult* response) {
  auto result =
      execution_engine_.submit_transaction(make_bytes_view(request->tx()));
  populate_transaction_result(result, response);
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::CreateProposal(
    grpc::CallbackServerContext* context,
    const ballot::v1::CreateProposalRequest* request,
    ballot::v1::CreateProposalResponse* response) {
  auto creator = try_make_address(std::string_view{request->creator()});
  if (!creator) {
    reject_address("creator", response->mutable_result());
    return finish_ok(context);
  }

  auto result = execution_engine_.execute_transaction(transaction_t{
      .chain_id = execution_engine_.info().chain_id,
      .signer = *creator,
      .payload = create_proposal_t{.title = request->title(),
                                   .description = request->description()}});
  populate_transaction_result(result, response->mutable_result());
  if (result.code == 0) {
    auto encoder = ballot::schema::encoding::encoder<
        ballot::schema::encoding::scale_encoder_tag>{};
    response->set_proposal_id(encoder.decode<proposal_id_t>(result.data));
  }
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::CastVote(
    grpc::CallbackServerContext* context,
    const ballot::v1::CastVoteRequest* request,
    ballot::v1::TransactionResult* response) {
  auto voter = try_make_address(std::string_view{request->voter()});
  if (!voter) {
    reject_address("voter", response);
    return finish_ok(context);
  }

  auto result = execution_engine_.execute_transaction(transaction_t{
      .chain_id = execution_engine_.info().chain_id,
      .signer = *voter,
      .payload = cast_vote_t{.proposal_id = request->proposal_id(),
                             .support = request->support()}});
  populate_transaction_result(result, response);
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::CloseProposal(
    grpc::CallbackServerContext* context,
    const ballot::v1::CloseProposalRequest* request,
    ballot::v1::TransactionResult* response) {
  auto caller = try_make_address(std::string_view{request->caller()});
  if (!caller) {
    reject_address("caller", response);
    return finish_ok(context);
  }

  auto result = execution_engine_.execute_transaction(transaction_t{
      .chain_id = execution_engine_.info().chain_id,
      .signer = *caller,
      .payload = close_proposal_t{.proposal_id = request->proposal_id()}});
  populate_transaction_result(result, response);
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::TransferAdministrator(
    grpc::CallbackServerContext* context,
    const ballot::v1::TransferAdministratorRequest* request,
    ballot::v1::TransactionResult* response) {
  auto caller = try_make_address(std::string_view{request->caller()});
  if (!caller) {
    reject_address("caller", response);
    return finish_ok(context);
  }
  auto new_administrator =
      try_make_address(std::string_view{request->new_administrator()});
  if (!new_administrator) {
    reject_address("new_administrator", response);
    return finish_ok(context);
  }

  auto result = execution_engine_.execute_transaction(transaction_t{
      .chain_id = execution_engine_.info().chain_id,
      .signer = *caller,
      .payload = transfer_administrator_t{.new_administrator =
                                              *new_administrator}});
  populate_transaction_result(result, response);
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::GetProposal(
    grpc::CallbackServerContext* context,
    const ballot::v1::ProposalRequest* request,
    ballot::v1::GetProposalResponse* response) {
  auto proposal = execution_engine_.ledger().proposal(request->proposal_id());
  if (!proposal.ok()) {
    set_failure(proposal.code, response);
    return finish_ok(context);
  }
  auto* out = response->mutable_proposal();
  out->set_id(proposal.value.id);
  out->set_title(proposal.value.title);
  out->set_description(proposal.value.description);
  out->set_yes_count(proposal.value.yes_count);
  out->set_no_count(proposal.value.no_count);
  out->set_active(proposal.value.active);
  out->set_created_at(proposal.value.created_at);
  out->set_creator(address_string(proposal.value.creator));
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::GetProposalInfo(
    grpc::CallbackServerContext* context,
    const ballot::v1::ProposalRequest* request,
    ballot::v1::GetProposalInfoResponse* response) {
  auto info = execution_engine_.ledger().proposal_info(request->proposal_id());
  if (!info.ok()) {
    set_failure(info.code, response);
    return finish_ok(context);
  }
  auto* out = response->mutable_info();
  out->set_title(info.value.title);
  out->set_description(info.value.description);
  out->set_yes_count(info.value.yes_count);
  out->set_no_count(info.value.no_count);
  out->set_active(info.value.active);
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::GetAllProposalIds(
    grpc::CallbackServerContext* context,
    const ballot::v1::ProposalIdsRequest* /*request*/,
    ballot::v1::ProposalIdsResponse* response) {
  for (auto id : execution_engine_.ledger().all_proposal_ids()) {
    response->add_proposal_ids(id);
  }
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::GetActiveProposalIds(
    grpc::CallbackServerContext* context,
    const ballot::v1::ProposalIdsRequest* /*request*/,
    ballot::v1::ProposalIdsResponse* response) {
  for (auto id : execution_engine_.ledger().active_proposal_ids()) {
    response->add_proposal_ids(id);
  }
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::GetVotePercentages(
    grpc::CallbackServerContext* context,
    const ballot::v1::ProposalRequest* request,
    ballot::v1::GetVotePercentagesResponse* response) {
  auto percentages =
      execution_engine_.ledger().vote_percentages(request->proposal_id());
  if (!percentages.ok()) {
    set_failure(percentages.code, response);
    return finish_ok(context);
  }
  response->set_yes(percentages.value.yes);
  response->set_no(percentages.value.no);
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::GetProposalResult(
    grpc::CallbackServerContext* context,
    const ballot::v1::ProposalRequest* request,
    ballot::v1::GetProposalResultResponse* response) {
  auto approved =
      execution_engine_.ledger().proposal_result(request->proposal_id());
  if (!approved.ok()) {
    set_failure(approved.code, response);
    return finish_ok(context);
  }
  response->set_approved(approved.value);
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::HasVoted(
    grpc::CallbackServerContext* context,
    const ballot::v1::HasVotedRequest* request,
    ballot::v1::HasVotedResponse* response) {
  auto voter = try_make_address(std::string_view{request->voter()});
  if (!voter) {
    set_failure(transaction_error_code::invalid_input, response);
    return finish_ok(context);
  }
  auto voted =
      execution_engine_.ledger().has_voted(request->proposal_id(), *voter);
  if (!voted.ok()) {
    set_failure(voted.code, response);
    return finish_ok(context);
  }
  response->set_has_voted(voted.value);
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::GetAdministrator(
    grpc::CallbackServerContext* context,
    const ballot::v1::GetAdministratorRequest* /*request*/,
    ballot::v1::GetAdministratorResponse* response) {
  response->set_administrator(
      address_string(execution_engine_.ledger().administrator()));
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::GetProposalCount(
    grpc::CallbackServerContext* context,
    const ballot::v1::GetProposalCountRequest* /*request*/,
    ballot::v1::GetProposalCountResponse* response) {
  response->set_proposal_count(execution_engine_.ledger().proposal_count());
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::ListEvents(
    grpc::CallbackServerContext* context,
    const ballot::v1::ListEventsRequest* request,
    ballot::v1::ListEventsResponse* response) {
  auto records = execution_engine_.events(request->from_sequence(),
                                          request->to_sequence());
  for (const auto& record : records) {
    auto* out = response->add_events();
    out->set_sequence(record.sequence);
    populate_event(ballot::execution::make_transaction_event(record.event),
                   out->mutable_event());
  }
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::Query(
    grpc::CallbackServerContext* context,
    const ballot::v1::QueryRequest* request,
    ballot::v1::QueryResponse* response) {
  auto query = execution_engine_.query(request->path(),
                                       make_bytes_view(request->data()));
  response->set_code(query.code);
  response->set_log(query.log);
  response->set_info(query.info);
  response->set_key(make_string(query.key));
  response->set_value(make_string(query.value));
  response->set_height(query.height);
  response->set_codespace(query.codespace);
  return finish_ok(context);
}
