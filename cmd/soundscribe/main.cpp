#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/runtime/server.hpp"

using soundscribe::factory::Build;
using soundscribe::observability::StringField;
using soundscribe::runtime::Server;

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
  } else {
    std::cerr << "Usage: soundscribe <config.yaml> OR soundscribe --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = soundscribe::config::ConfigLoader::LoadFromYaml(config_path);

    soundscribe::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = Build(config);

    // ------------------------------------------------------------
    // Start servers
    // ------------------------------------------------------------
    Server server(config.control().bind_address(), std::move(app.grpc_services));

    // Register signal handlers before starting servers to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    app.downloads->Start();
    server.Start();
    SOUNDSCRIBE_LOG_INFO("SoundScribe started",
                         {StringField("control", config.control().bind_address()), StringField("downloads", app.downloads->BaseUrl()),
                          StringField("output_dir", config.recording().output_dir())});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    SOUNDSCRIBE_LOG_INFO("Shutting down soundscribe");

    // An in-progress session is finalized before the surfaces go away.
    if (app.coordinator->IsRecording()) {
      SOUNDSCRIBE_LOG_INFO("Finalizing active recording before exit",
                           {StringField("session_id", app.coordinator->ActiveSessionId().value_or(""))});
    }
    app.coordinator->Shutdown();

    server.Stop();
    app.downloads->Stop();
    soundscribe::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    SOUNDSCRIBE_LOG_ERROR("Fatal error", {StringField("error", e.what())});
    soundscribe::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
