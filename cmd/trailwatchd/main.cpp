#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else if (argc != 1) {
    std::cerr << "Usage: trailwatchd [<config.yaml> | --config <config.yaml>]" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = config_path.empty() ? trailwatch::config::ConfigLoader::Defaults()
                                      : trailwatch::config::ConfigLoader::LoadFromYaml(config_path);

    trailwatch::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build engine (dependency graph)
    // ------------------------------------------------------------
    auto engine = trailwatch::factory::Build(config);

    // Register signal handlers before starting to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    engine->Start();
    std::thread loop_thread([&engine] { engine->Run(); });

    TRAILWATCH_LOG_INFO("trailwatch started", {trailwatch::observability::StringField("database", config.database().sqlite().path()),
                                               trailwatch::observability::IntField("roots", config.monitoring().watch_paths_size())});

    while (g_running) std::this_thread::sleep_for(std::chrono::milliseconds(200));

    TRAILWATCH_LOG_INFO("shutting down trailwatch");

    engine->Stop();
    loop_thread.join();
    engine.reset();

    trailwatch::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    TRAILWATCH_LOG_ERROR("Fatal error", {trailwatch::observability::StringField("error", e.what())});
    trailwatch::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
