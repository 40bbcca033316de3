#include <csignal>
#include <grpcpp/ext/proto_server_reflection_plugin.h>
#include <grpcpp/grpcpp.h>
#include <grpcpp/health_check_service_interface.h>
#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <atomic>
#include <boost/program_options.hpp>
#include <chrono>
#include <fstream>
#include <iostream>
#include <provenance/execution/engine.hpp>
#include <provenance/rpc/server.hpp>
#include <provenance/schema/encoding/scale/encoder.hpp>
#include <provenance/storage/rocksdb/storage.hpp>
#include <string>
#include <thread>
#include <vector>

namespace po = boost::program_options;

std::atomic<bool>& shutdown_requested() {
  static std::atomic<bool> requested{};
  return requested;
}

void signal_handler(int) {
  shutdown_requested() = true;
}

int main(int argc, char* argv[]) {
  std::signal(SIGINT, signal_handler);
  std::signal(SIGTERM, signal_handler);

  auto grpc_address = std::string{};
  auto db_path = std::string{};
  auto config_path = std::string{};
  auto log_level = std::string{};
  auto log_file = std::string{};
  auto options = provenance::execution::engine_options{};

  auto description = po::options_description{"Provenance ledger"};
  description.add_options()("help,h", "Show the help message")(
      "config,c", po::value<std::string>(&config_path),
      "INI style configuration file; command line values take precedence")(
      "grpc-address,g",
      po::value<std::string>(&grpc_address)->default_value("0.0.0.0:26658"),
      "IP:Port for the ledger gRPC service")(
      "db-path,d",
      po::value<std::string>(&db_path)->default_value("provenance-db"),
      "RocksDB directory")(
      "chain-id",
      po::value<std::string>(&options.chain_id)
          ->default_value(options.chain_id),
      "Network name; transactions must carry its BLAKE3 hash")(
      "strict-crypto",
      po::value<bool>(&options.require_strict_crypto)->default_value(true),
      "Verify transaction signatures")(
      "max-batch-size",
      po::value<uint32_t>(&options.max_batch_size)
          ->default_value(options.max_batch_size),
      "Maximum events per batch append (1..100)")(
      "max-metadata-bytes",
      po::value<uint64_t>(&options.max_metadata_bytes)
          ->default_value(options.max_metadata_bytes),
      "Maximum opaque metadata bytes per event")(
      "log-level",
      po::value<std::string>(&log_level)->default_value("info"),
      "trace, debug, info, warn, error or critical")(
      "log-file",
      po::value<std::string>(&log_file)->default_value("provenance.log"),
      "Log file path");

  auto vm = po::variables_map{};
  try {
    po::store(po::parse_command_line(argc, argv, description), vm);
    if (vm.contains("config")) {
      auto config = std::ifstream{vm["config"].as<std::string>()};
      if (!config.good()) {
        std::cerr << "cannot open config file '"
                  << vm["config"].as<std::string>() << "'" << std::endl;
        return 1;
      }
      po::store(po::parse_config_file(config, description), vm);
    }
    po::notify(vm);
  } catch (const po::error& ex) {
    std::cerr << ex.what() << "\n" << description << std::endl;
    return 1;
  }

  if (vm.contains("help")) {
    std::cout << description << std::endl;
    return 0;
  }
  if (options.max_batch_size == 0 || options.max_batch_size > 100) {
    std::cerr << "max-batch-size must be within 1..100" << std::endl;
    return 1;
  }

  spdlog::init_thread_pool(8192, 1);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(spdlog::level::from_str(log_level));

  auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  auto file_sink =
      std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, false);

  auto logger = std::make_shared<spdlog::async_logger>(
      "provenance", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);

  auto encoder = provenance::schema::encoding::encoder<
      provenance::schema::encoding::scale_encoder_tag>{};
  auto storage = provenance::storage::make_storage<
      provenance::storage::rocksdb_storage_tag>(db_path);
  auto engine = provenance::execution::engine{encoder, storage, options};

  spdlog::info("gRPC service listening on {}", grpc_address);

  grpc::EnableDefaultHealthCheckService(true);
  grpc::reflection::InitProtoReflectionServerBuilderPlugin();

  auto grpc_listener = provenance::rpc::listener{engine};
  auto grpc_builder = grpc::ServerBuilder();
  grpc_builder.AddListeningPort(grpc_address,
                                grpc::InsecureServerCredentials());
  grpc_builder.RegisterService(&grpc_listener);
  auto grpc_server =
      std::unique_ptr<grpc::Server>(grpc_builder.BuildAndStart());
  if (!grpc_server) {
    spdlog::critical("Failed to start gRPC server on {}", grpc_address);
    spdlog::shutdown();
    return 1;
  }
  grpc_server->GetHealthCheckService()->SetServingStatus(false);

  auto threads = std::vector<std::thread>{};
  threads.emplace_back([&] { grpc_server->Wait(); });
  threads.emplace_back([&] {
    grpc_server->GetHealthCheckService()->SetServingStatus(true);
    while (!shutdown_requested()) {
      std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
    spdlog::info("Shutdown requested");
    grpc_server->GetHealthCheckService()->SetServingStatus(false);
    grpc_server->Shutdown();
  });

  for (auto& t : threads) {
    t.join();
  }

  spdlog::shutdown();
  return 0;
}
