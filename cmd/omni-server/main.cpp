#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/grpc/ingest_server.hpp"
#include "internal/grpc/query_server.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/runtime/server.hpp"
#include "internal/service/ingest_service.hpp"
#include "internal/service/query_service.hpp"
#include "internal/util/cancellation.hpp"

using omni::runtime::Server;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

namespace {

constexpr const char* kDefaultBindAddress = "0.0.0.0:50061";

void ShutdownObservability() {
  omni::observability::ShutdownLogging();
  omni::observability::ShutdownMetrics();
  omni::observability::ShutdownTracing();
}

} // namespace

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: omni-server <config.yaml> OR omni-server --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    auto config = omni::config::ConfigLoader::LoadFromYaml(config_path);

    omni::observability::InitializeTracing(config);
    omni::observability::InitializeMetrics(config);
    omni::observability::InitializeLogging(config);

    // Register signal handlers before recovery so a long backfill can be interrupted.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    auto app = omni::factory::Build(config);

    omni::util::CancellationToken recovery;
    std::thread                   recovery_watch([&recovery] {
      while (g_running && !recovery.IsCancelled()) std::this_thread::sleep_for(std::chrono::milliseconds(100));
      recovery.Cancel();
    });
    try {
      omni::factory::Start(app, recovery);
    } catch (...) {
      recovery.Cancel();
      recovery_watch.join();
      throw;
    }
    recovery.Cancel();
    recovery_watch.join();

    omni::service::ServiceContext ctx{app.repository, app.engine, app.catalog, app.content, app.index, app.views};

    std::vector<std::unique_ptr<grpc::Service>> services;
    services.push_back(std::make_unique<omni::grpc::IngestServer>(std::make_shared<omni::service::IngestService>(ctx)));
    services.push_back(std::make_unique<omni::grpc::QueryServer>(std::make_shared<omni::service::QueryService>(ctx)));

    const std::string bind_address = config.server().bind_address().empty() ? kDefaultBindAddress : config.server().bind_address();

    Server server(bind_address, std::move(services));
    server.Start();
    OMNI_LOG_INFO("omni server started", {omni::observability::StringField("bind_address", bind_address)});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    OMNI_LOG_INFO("Shutting down omni server");

    server.Stop();
    omni::factory::Stop(app);
    ShutdownObservability();
  } catch (const std::exception& e) {
    OMNI_LOG_ERROR("Fatal error", {omni::observability::StringField("error", e.what())});
    ShutdownObservability();
    return 2;
  }

  return 0;
}
