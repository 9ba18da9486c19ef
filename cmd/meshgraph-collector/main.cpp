#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"

using meshgraph::factory::OpenMode;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

int main(int argc, char** argv) {
  std::string config_path = "meshgraph.yaml";
  bool        explicit_config = false;
  if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path     = argv[2];
    explicit_config = true;
  } else if (argc != 1) {
    std::cerr << "Usage: meshgraph-collector [--config <config.yaml>]" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = (explicit_config || std::filesystem::exists(config_path))
                      ? meshgraph::config::ConfigLoader::LoadFromYaml(config_path)
                      : meshgraph::config::ConfigLoader::Defaults();

    meshgraph::observability::InitializeMetrics(config);
    meshgraph::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build store and listener
    // ------------------------------------------------------------
    auto store    = meshgraph::factory::BuildEventStore(config, OpenMode::kCreate);
    auto listener = meshgraph::factory::BuildListener(config, store);

    // Register signal handlers before starting the listener to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    std::atomic<bool> listener_failed{false};
    std::thread       listener_thread([&listener, &listener_failed] {
      try {
        listener->Run();
      } catch (const std::exception& e) {
        MESHGRAPH_LOG_ERROR("listener stopped", {meshgraph::observability::StringField("error", e.what())});
        listener_failed = true;
        g_running       = 0;
      }
    });
    MESHGRAPH_LOG_INFO("meshgraph collector started",
                       {meshgraph::observability::StringField("broker", config.broker().address()),
                        meshgraph::observability::IntField("port", config.broker().port()),
                        meshgraph::observability::StringField("topic", config.broker().topic())});

    while (g_running) std::this_thread::sleep_for(std::chrono::milliseconds(250));

    MESHGRAPH_LOG_INFO("shutting down meshgraph collector");

    listener->Stop();
    listener_thread.join();

    meshgraph::observability::ShutdownLogging();
    meshgraph::observability::ShutdownMetrics();
    if (listener_failed) return 2;
  } catch (const std::exception& e) {
    MESHGRAPH_LOG_ERROR("fatal error", {meshgraph::observability::StringField("error", e.what())});
    meshgraph::observability::ShutdownLogging();
    meshgraph::observability::ShutdownMetrics();
    return 2;
  }

  return 0;
}
