#include <csignal>
#include <grpcpp/ext/proto_server_reflection_plugin.h>
#include <grpcpp/grpcpp.h>
#include <grpcpp/health_check_service_interface.h>
#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <zone/common/critical.hpp>
#include <zone/config/options.hpp>
#include <zone/execution/engine.hpp>
#include <zone/rpc/grpc_transport.hpp>
#include <zone/rpc/server.hpp>

#include <atomic>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

std::atomic<bool>& shutdown_requested() {
  static std::atomic<bool> requested{};
  return requested;
}

void signal_handler(int) {
  shutdown_requested() = true;
}

void install_logger(const zone::config::options& options) {
  spdlog::init_thread_pool(8192, 1);

  auto sinks = std::vector<spdlog::sink_ptr>{};
  sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
  if (!options.log_file.empty()) {
    sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(
        options.log_file, false));
  }

  auto logger = std::make_shared<spdlog::async_logger>(
      "zone", std::begin(sinks), std::end(sinks), spdlog::thread_pool(),
      spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(options.log_level);
}

int main(int argc, char* argv[]) {
  std::signal(SIGINT, signal_handler);
  std::signal(SIGTERM, signal_handler);

  auto exit_code = 0;
  auto options = zone::config::parse_options(argc, argv, exit_code);
  if (!options) {
    return exit_code;
  }
  install_logger(*options);

  auto identity = zone::config::load_identity(*options);
  if (!identity.ok()) {
    zone::common::critical("Cannot load the zone key: {}", identity.log);
  }

  if (!zone::config::prepare_db_directory(options->db_path)) {
    zone::common::critical("Database path {} is unusable", options->db_path);
  }
  auto encoder = zone::ledger::encoder_t{};
  auto storage = zone::storage::make_storage<zone::storage::rocksdb_storage_tag>(
      options->db_path);

  auto engine = zone::execution::engine{
      encoder, storage, std::move(*identity.value),
      zone::execution::engine_options{
          .name = options->name,
          .description = options->description,
          .canons = options->canons,
          .citation_timeout = options->citation_timeout},
      std::make_shared<zone::rpc::grpc_transport>()};

  spdlog::info("Zone {} listening on {}",
               zone::schema::to_hex(engine.identity().zone_id()),
               options->listen);

  grpc::EnableDefaultHealthCheckService(true);
  grpc::reflection::InitProtoReflectionServerBuilderPlugin();

  auto grpc_service = zone::rpc::service{engine};
  auto grpc_builder = grpc::ServerBuilder();
  grpc_builder.AddListeningPort(options->listen,
                                grpc::InsecureServerCredentials());
  grpc_builder.RegisterService(&grpc_service);
  auto grpc_server = std::unique_ptr<grpc::Server>(grpc_builder.BuildAndStart());
  if (!grpc_server) {
    zone::common::critical("Failed to listen on {}", options->listen);
  }
  grpc_server->GetHealthCheckService()->SetServingStatus(false);

  auto threads = std::vector<std::thread>{};
  threads.emplace_back([&] { grpc_server->Wait(); });
  threads.emplace_back([&] {
    while (!shutdown_requested()) {
      grpc_server->GetHealthCheckService()->SetServingStatus(true);
      std::this_thread::sleep_for(std::chrono::seconds(1));
    }
    spdlog::info("Shutting down");
    grpc_server->GetHealthCheckService()->SetServingStatus(false);
    grpc_server->Shutdown();
  });

  for (auto& t : threads) {
    t.join();
  }

  spdlog::shutdown();
  return 0;
}
