#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

using engram::observability::IntField;
using engram::observability::StringField;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

static void ShutdownTelemetry() {
  engram::observability::ShutdownMetrics();
  engram::observability::ShutdownTracing();
  engram::observability::ShutdownLogging();
}

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: engramd <config.yaml> OR engramd --config <config.yaml>" << std::endl;
    return 1;
  }

  engram::runtime::config::RuntimeConfig config;
  try {
    config = engram::config::ConfigLoader::LoadFromYaml(config_path);
  } catch (const engram::util::ConfigError& e) {
    std::cerr << "engramd: " << e.what() << std::endl;
    return 1;
  }

  engram::observability::InitializeLogging(config);
  engram::observability::InitializeTracing(config);
  engram::observability::InitializeMetrics(config);

  try {
    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = engram::factory::Build(config);

    // Register signal handlers before the scheduler starts.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    if (app.scheduler) app.scheduler->Start();

    const auto stats = app.store->GetCollectionStats();
    ENGRAM_LOG_INFO("engramd started", {StringField("config", config_path), IntField("facts", static_cast<std::int64_t>(stats.facts)),
                                        IntField("files", static_cast<std::int64_t>(stats.files)),
                                        IntField("learnings", static_cast<std::int64_t>(stats.learnings))});

    while (g_running) std::this_thread::sleep_for(std::chrono::milliseconds(200));

    ENGRAM_LOG_INFO("shutting down engramd");
    if (app.scheduler) app.scheduler->Stop();
  } catch (const engram::util::ConfigError& e) {
    ENGRAM_LOG_ERROR("invalid configuration", {StringField("error", e.what())});
    ShutdownTelemetry();
    return 1;
  } catch (const engram::util::UnsupportedBackend& e) {
    ENGRAM_LOG_ERROR("unsupported index backend", {StringField("error", e.what())});
    ShutdownTelemetry();
    return 1;
  } catch (const std::exception& e) {
    ENGRAM_LOG_ERROR("fatal error", {StringField("error", e.what())});
    ShutdownTelemetry();
    return 2;
  }

  ShutdownTelemetry();
  return 0;
}
