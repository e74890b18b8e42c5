#include <csignal>
#include <grpcpp/ext/proto_server_reflection_plugin.h>
#include <grpcpp/grpcpp.h>
#include <grpcpp/health_check_service_interface.h>
#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <atomic>
#include <ballot/blake3/hash.hpp>
#include <ballot/common/log_level.hpp>
#include <ballot/rpc/server.hpp>
#include <chrono>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace {

std::atomic<bool>& shutdown_requested() {
  static std::atomic<bool> requested{};
  return requested;
}

void signal_handler(int) {
  shutdown_requested() = true;
}

void configure_logging(const std::string& log_file,
                       const spdlog::level::level_enum level) {
  spdlog::init_thread_pool(8192, 1);

  auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  auto file_sink =
      std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, false);

  auto logger = std::make_shared<spdlog::async_logger>(
      "ballotd", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);

  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(level);
}

}  // namespace

int main(int argc, char* argv[]) {
  namespace po = boost::program_options;

  std::signal(SIGINT, signal_handler);
  std::signal(SIGTERM, signal_handler);

  auto config_file = std::string{};
  auto grpc_address = std::string{};
  auto db_path = std::string{};
  auto chain_id = std::string{};
  auto administrator = std::string{};
  auto log_file = std::string{};
  auto log_level = std::string{};

  auto generic = po::options_description{"Generic"};
  generic.add_options()("help,h", "Show the help message")(
      "config,c", po::value<std::string>(&config_file),
      "INI style configuration file; command line options take precedence");

  auto settings = po::options_description{"Ballot"};
  settings.add_options()(
      "grpc-address,g",
      po::value<std::string>(&grpc_address)->default_value("0.0.0.0:26658"),
      "IP:Port for the governance gRPC service")(
      "db-path,d", po::value<std::string>(&db_path)->default_value("ballot.db"),
      "RocksDB directory")(
      "chain-id",
      po::value<std::string>(&chain_id)->default_value("ballot-local"),
      "Chain name; transactions must carry its BLAKE3 hash")(
      "administrator,a", po::value<std::string>(&administrator),
      "Genesis administrator address (40 hex digits), required for a new "
      "database")(
      "log-file", po::value<std::string>(&log_file)->default_value("ballot.log"),
      "Log file path")(
      "log-level", po::value<std::string>(&log_level)->default_value("info"),
      "trace, debug, info, warn, error, critical or off")(
      "verbose,v", "Enable verbose output");

  auto command_line = po::options_description{};
  command_line.add(generic).add(settings);

  auto vm = po::variables_map{};
  try {
    po::store(po::parse_command_line(argc, argv, command_line), vm);
    if (vm.contains("config")) {
      auto path = vm["config"].as<std::string>();
      auto input = std::ifstream{path};
      if (!input.good()) {
        std::cerr << "cannot open config file '" << path << "'" << std::endl;
        return 1;
      }
      po::store(po::parse_config_file(input, settings), vm);
    }
    po::notify(vm);
  } catch (const po::error& ex) {
    std::cerr << ex.what() << std::endl << command_line << std::endl;
    return 1;
  }

  if (vm.contains("help")) {
    std::cout << command_line << std::endl;
    return 0;
  }

  auto level = ballot::common::parse_log_level(log_level);
  if (!level) {
    std::cerr << "--log-level must be trace, debug, info, warn, error, "
                 "critical or off, got '"
              << log_level << "'" << std::endl;
    return 1;
  }
  if (vm.contains("verbose")) {
    level = spdlog::level::debug;
  }
  configure_logging(log_file, *level);

  auto genesis_administrator = ballot::schema::make_null_address();
  if (!administrator.empty()) {
    auto parsed = ballot::schema::try_make_address_from_hex(
        std::string_view{administrator});
    if (!parsed) {
      spdlog::error("--administrator must be 40 hex digits, got '{}'",
                    administrator);
      spdlog::shutdown();
      return 1;
    }
    genesis_administrator = *parsed;
  }

  auto encoder = ballot::schema::encoding::encoder<
      ballot::schema::encoding::scale_encoder_tag>{};
  auto storage =
      ballot::storage::make_storage<ballot::storage::rocksdb_storage_tag>(
          db_path);
  auto engine = ballot::execution::engine{
      encoder, storage, ballot::blake3::hash(std::string_view{chain_id}),
      genesis_administrator};

  grpc::EnableDefaultHealthCheckService(true);
  grpc::reflection::InitProtoReflectionServerBuilderPlugin();

  auto grpc_listener = ballot::rpc::listener{engine};
  auto grpc_builder = grpc::ServerBuilder{};
  grpc_builder.AddListeningPort(grpc_address,
                                grpc::InsecureServerCredentials());
  grpc_builder.RegisterService(&grpc_listener);
  auto grpc_server = std::unique_ptr<grpc::Server>{grpc_builder.BuildAndStart()};
  if (!grpc_server) {
    spdlog::critical("Failed to start gRPC service on {}", grpc_address);
    spdlog::shutdown();
    return 1;
  }
  spdlog::info("Governance service for chain '{}' listening on {}", chain_id,
               grpc_address);

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
