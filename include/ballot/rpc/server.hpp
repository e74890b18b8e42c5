#pragma once

#include <ballot/v1/governance.grpc.pb.h>
#include <ballot/execution/engine.hpp>

namespace ballot::rpc {

/// Callback listener serving `ballot.v1.Governance`.
///
/// Quick reference:
/// - Info: height, state root and chain id.
/// - CheckTransaction/SubmitTransaction: encoded envelopes, as built by
///   ballot_transaction_builder.
/// - CreateProposal/CastVote/CloseProposal/TransferAdministrator: typed
///   requests; the caller identity comes from the request and is trusted.
/// - Get*/HasVoted/ListEvents: typed reads.
/// - Query: raw engine query routes.
///
/// Every handler finishes with grpc::Status::OK; request failures are carried
/// in the response `code` and `log` fields.
struct listener final : public ballot::v1::Governance::CallbackService {
  explicit listener(ballot::execution::engine& engine);

  virtual grpc::ServerUnaryReactor* Info(
      grpc::CallbackServerContext* context,
      const ballot::v1::InfoRequest* request,
      ballot::v1::InfoResponse* response) override final;

  /// Admission check only; never mutates the ledger.
  virtual grpc::ServerUnaryReactor* CheckTransaction(
      grpc::CallbackServerContext* context,
      const ballot::v1::TransactionRequest* request,
      ballot::v1::TransactionResult* response) override final;

  virtual grpc::ServerUnaryReactor* SubmitTransaction(
      grpc::CallbackServerContext* context,
      const ballot::v1::TransactionRequest* request,
      ballot::v1::TransactionResult* response) override final;

  virtual grpc::ServerUnaryReactor* CreateProposal(
      grpc::CallbackServerContext* context,
      const ballot::v1::CreateProposalRequest* request,
      ballot::v1::CreateProposalResponse* response) override final;

  virtual grpc::ServerUnaryReactor* CastVote(
      grpc::CallbackServerContext* context,
      const ballot::v1::CastVoteRequest* request,
      ballot::v1::TransactionResult* response) override final;

  virtual grpc::ServerUnaryReactor* CloseProposal(
      grpc::CallbackServerContext* context,
      const ballot::v1::CloseProposalRequest* request,
      ballot::v1::TransactionResult* response) override final;

  virtual grpc::ServerUnaryReactor* TransferAdministrator(
      grpc::CallbackServerContext* context,
      const ballot::v1::TransferAdministratorRequest* request,
      ballot::v1::TransactionResult* response) override final;

  virtual grpc::ServerUnaryReactor* GetProposal(
      grpc::CallbackServerContext* context,
      const ballot::v1::ProposalRequest* request,
      ballot::v1::GetProposalResponse* response) override final;

  virtual grpc::ServerUnaryReactor* GetProposalInfo(
      grpc::CallbackServerContext* context,
      const ballot::v1::ProposalRequest* request,
      ballot::v1::GetProposalInfoResponse* response) override final;

  virtual grpc::ServerUnaryReactor* GetAllProposalIds(
      grpc::CallbackServerContext* context,
      const ballot::v1::ProposalIdsRequest* request,
      ballot::v1::ProposalIdsResponse* response) override final;

  virtual grpc::ServerUnaryReactor* GetActiveProposalIds(
      grpc::CallbackServerContext* context,
      const ballot::v1::ProposalIdsRequest* request,
      ballot::v1::ProposalIdsResponse* response) override final;

  virtual grpc::ServerUnaryReactor* GetVotePercentages(
      grpc::CallbackServerContext* context,
      const ballot::v1::ProposalRequest* request,
      ballot::v1::GetVotePercentagesResponse* response) override final;

  virtual grpc::ServerUnaryReactor* GetProposalResult(
      grpc::CallbackServerContext* context,
      const ballot::v1::ProposalRequest* request,
      ballot::v1::GetProposalResultResponse* response) override final;

  virtual grpc::ServerUnaryReactor* HasVoted(
      grpc::CallbackServerContext* context,
      const ballot::v1::HasVotedRequest* request,
      ballot::v1::HasVotedResponse* response) override final;

  virtual grpc::ServerUnaryReactor* GetAdministrator(
      grpc::CallbackServerContext* context,
      const ballot::v1::GetAdministratorRequest* request,
      ballot::v1::GetAdministratorResponse* response) override final;

  virtual grpc::ServerUnaryReactor* GetProposalCount(
      grpc::CallbackServerContext* context,
      const ballot::v1::GetProposalCountRequest* request,
      ballot::v1::GetProposalCountResponse* response) override final;

  virtual grpc::ServerUnaryReactor* ListEvents(
      grpc::CallbackServerContext* context,
      const ballot::v1::ListEventsRequest* request,
      ballot::v1::ListEventsResponse* response) override final;

  virtual grpc::ServerUnaryReactor* Query(
      grpc::CallbackServerContext* context,
      const ballot::v1::QueryRequest* request,
      ballot::v1::QueryResponse* response) override final;

  ballot::execution::engine& execution_engine_;
};

}  // namespace ballot::rpc
