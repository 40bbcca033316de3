#pragma once

#include <provenance/v1/ledger.grpc.pb.h>
#include <provenance/execution/engine.hpp>

namespace provenance::rpc {

/// Callback gRPC listener exposing the ledger engine.
///
/// Quick reference:
/// - Info: handshake; last committed height, state root and chain id.
/// - CheckTx: admission checks only; no state mutation.
/// - FinalizeBlock: execute an ordered block and return per-tx results plus
///   the candidate state root.
/// - Commit: persist the finalized block.
/// - Query: read committed state by route.
/// - BroadcastTx: single node convenience; CheckTx, then a one-transaction
///   block at the next height, committed at once. ABORTED while a block from
///   FinalizeBlock is still waiting for its Commit.
struct listener final : public provenance::v1::Ledger::CallbackService {
  /// Bind listener to execution engine instance.
  explicit listener(provenance::execution::engine& engine);

  virtual grpc::ServerUnaryReactor* Info(
      grpc::CallbackServerContext* context,
      const provenance::v1::InfoRequest* request,
      provenance::v1::InfoResponse* response) override final;

  virtual grpc::ServerUnaryReactor* CheckTx(
      grpc::CallbackServerContext* context,
      const provenance::v1::CheckTxRequest* request,
      provenance::v1::CheckTxResponse* response) override final;

  virtual grpc::ServerUnaryReactor* FinalizeBlock(
      grpc::CallbackServerContext* context,
      const provenance::v1::FinalizeBlockRequest* request,
      provenance::v1::FinalizeBlockResponse* response) override final;

  virtual grpc::ServerUnaryReactor* Commit(
      grpc::CallbackServerContext* context,
      const provenance::v1::CommitRequest* request,
      provenance::v1::CommitResponse* response) override final;

  virtual grpc::ServerUnaryReactor* Query(
      grpc::CallbackServerContext* context,
      const provenance::v1::QueryRequest* request,
      provenance::v1::QueryResponse* response) override final;

  virtual grpc::ServerUnaryReactor* BroadcastTx(
      grpc::CallbackServerContext* context,
      const provenance::v1::BroadcastTxRequest* request,
      provenance::v1::BroadcastTxResponse* response) override final;

  /// Backing execution engine implementing the ledger rules.
  provenance::execution::engine& execution_engine_;
};

}  // namespace provenance::rpc
