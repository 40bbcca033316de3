#include <spdlog/spdlog.h>
#include <chrono>
#include <provenance/rpc/server.hpp>
#include <string>
#include <vector>

using namespace provenance::rpc;
using namespace provenance::schema;

namespace {

grpc::ServerUnaryReactor* finish_ok(grpc::CallbackServerContext* context) {
  auto* reactor = context->DefaultReactor();
  reactor->Finish(grpc::Status::OK);
  return reactor;
}

grpc::ServerUnaryReactor* finish_error(grpc::CallbackServerContext* context,
                                       grpc::StatusCode code,
                                       const std::string& message) {
  auto* reactor = context->DefaultReactor();
  reactor->Finish(grpc::Status{code, message});
  return reactor;
}

void populate_tx_result(const transaction_result_t& source,
                        provenance::v1::TxResult* destination) {
  destination->set_code(source.code);
  destination->set_data(make_string(source.data));
  destination->set_log(source.log);
  destination->set_info(source.info);
  destination->set_codespace(source.codespace);
  for (const auto& event : source.events) {
    auto* out = destination->add_events();
    out->set_type(event.type);
    for (const auto& attribute : event.attributes) {
      auto* attr = out->add_attributes();
      attr->set_key(attribute.key);
      attr->set_value(attribute.value);
      attr->set_index(attribute.index);
    }
  }
}

timestamp_milliseconds_t now_ms() {
  return static_cast<timestamp_milliseconds_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::system_clock::now().time_since_epoch())
          .count());
}

}  // namespace

listener::listener(provenance::execution::engine& engine)
    : execution_engine_{engine} {}

grpc::ServerUnaryReactor* listener::Info(
    grpc::CallbackServerContext* context,
    const provenance::v1::InfoRequest* /*request*/,
    provenance::v1::InfoResponse* response) {
  auto info = execution_engine_.info();
  response->set_data(info.data);
  response->set_version(info.version);
  response->set_app_version(info.app_version);
  response->set_last_block_height(info.last_block_height);
  response->set_last_block_state_root(make_string(info.last_block_state_root));
  response->set_chain_id(make_string(info.chain_id));
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::CheckTx(
    grpc::CallbackServerContext* context,
    const provenance::v1::CheckTxRequest* request,
    provenance::v1::CheckTxResponse* response) {
  auto tx = make_bytes(request->tx());
  auto check = execution_engine_.check_transaction(make_bytes_view(tx));
  populate_tx_result(check, response->mutable_result());
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::FinalizeBlock(
    grpc::CallbackServerContext* context,
    const provenance::v1::FinalizeBlockRequest* request,
    provenance::v1::FinalizeBlockResponse* response) {
  if (request->height() <= 0) {
    return finish_error(context, grpc::StatusCode::INVALID_ARGUMENT,
                        "height must be positive");
  }
  auto txs = std::vector<bytes_t>{};
  txs.reserve(static_cast<size_t>(request->txs_size()));
  for (const auto& tx : request->txs()) {
    txs.push_back(make_bytes(tx));
  }
  auto block = execution_engine_.finalize_block(
      static_cast<uint64_t>(request->height()), request->time_ms(), txs);
  for (const auto& tx_result : block.tx_results) {
    populate_tx_result(tx_result, response->add_tx_results());
  }
  response->set_state_root(make_string(block.state_root));
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::Commit(
    grpc::CallbackServerContext* context,
    const provenance::v1::CommitRequest* /*request*/,
    provenance::v1::CommitResponse* response) {
  auto commit = execution_engine_.commit();
  response->set_retain_height(commit.retain_height);
  response->set_committed_height(commit.committed_height);
  response->set_state_root(make_string(commit.state_root));
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::Query(
    grpc::CallbackServerContext* context,
    const provenance::v1::QueryRequest* request,
    provenance::v1::QueryResponse* response) {
  auto data = make_bytes(request->data());
  auto query = execution_engine_.query(request->path(), make_bytes_view(data));
  response->set_code(query.code);
  response->set_log(query.log);
  response->set_info(query.info);
  response->set_key(make_string(query.key));
  response->set_value(make_string(query.value));
  response->set_height(query.height);
  response->set_codespace(query.codespace);
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::BroadcastTx(
    grpc::CallbackServerContext* context,
    const provenance::v1::BroadcastTxRequest* request,
    provenance::v1::BroadcastTxResponse* response) {
  auto tx = make_bytes(request->tx());
  auto check = execution_engine_.check_transaction(make_bytes_view(tx));
  populate_tx_result(check, response->mutable_check());
  if (check.code != 0) {
    response->set_height(execution_engine_.info().last_block_height);
    return finish_ok(context);
  }

  auto time_ms = request->time_ms() == 0 ? now_ms() : request->time_ms();
  auto committed = execution_engine_.execute_and_commit(time_ms, {tx});
  if (!committed) {
    return finish_error(context, grpc::StatusCode::ABORTED,
                        "a finalized block is awaiting commit");
  }
  const auto& [block, commit] = committed.value();
  if (!block.tx_results.empty()) {
    populate_tx_result(block.tx_results.front(), response->mutable_result());
  }
  response->set_height(commit.committed_height);
  response->set_state_root(make_string(commit.state_root));
  spdlog::debug("Broadcast transaction committed at height {} with code {}",
                commit.committed_height, response->result().code());
  return finish_ok(context);
}
