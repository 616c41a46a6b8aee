// Repository: MacReplay-gateway
// Component: Gateway Entry Point
// Purpose: Wires the gateway components and serves HTTP and gRPC until signalled.
// Copyright (c) 2025 MacReplay

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#ifdef MACREPLAY_WITH_CONTROL
#include <grpcpp/grpcpp.h>

#include "gateway_control_service.h"
#endif

#include "macreplay/cache/ArtifactCache.h"
#include "macreplay/config/ConfigStore.h"
#include "macreplay/portal/HttpTransport.h"
#include "macreplay/portal/PortalClient.h"
#include "macreplay/relay/RelayManager.h"
#include "macreplay/relay/StreamProber.h"
#include "macreplay/runtime/MacPool.h"
#include "macreplay/runtime/OccupancyTable.h"
#include "macreplay/runtime/PlaybackService.h"
#include "macreplay/runtime/PortalRegistry.h"
#include "macreplay/runtime/StreamResolver.h"
#include "macreplay/server/GatewayHTTPServer.h"
#include "macreplay/telemetry/MetricsExporter.h"
#include "macreplay/timing/Clock.h"
#include "macreplay/util/Logger.hpp"

namespace {

using macreplay::util::Logger;

std::atomic<bool> g_shutdown_requested{false};

void SignalHandler(int) { g_shutdown_requested.store(true, std::memory_order_release); }

struct CliArgs {
  std::string config_path;
  std::string epg_cache_path;
  std::string host;
  int port = 8001;
  int control_port = 50061;
  std::string ffmpeg_path = "ffmpeg";
  std::string ffprobe_path = "ffprobe";
  std::string log_file;
};

std::string HomeDirectory() {
  const char* home = std::getenv("HOME");
  return home ? home : ".";
}

std::string EnvOr(const char* name, const std::string& fallback) {
  const char* value = std::getenv(name);
  return value && *value ? value : fallback;
}

void PrintUsage(const char* program) {
  std::cout << "Usage: " << program << " [options]\n"
            << "  --config PATH        Configuration file (default $CONFIG or\n"
            << "                       ~/evilvir.us/MacReplay.json)\n"
            << "  --epg-cache PATH     Guide cache file (default ~/Evilvir.us/MacReplayEPG.xml)\n"
            << "  --host HOST:PORT     Host written into playlist and lineup URLs\n"
            << "                       (default $HOST or 127.0.0.1:8001)\n"
            << "  --port N             HTTP listen port (default 8001)\n"
            << "  --control-port N     gRPC control port, 0 disables (default 50061)\n"
            << "  --ffmpeg PATH        ffmpeg executable (default ffmpeg)\n"
            << "  --ffprobe PATH       ffprobe executable (default ffprobe)\n"
            << "  --log-file PATH      Also append log lines to PATH\n"
            << "  --help               Show this message\n";
}

bool ParsePort(const std::string& text, int& out) {
  char* end = nullptr;
  const long value = std::strtol(text.c_str(), &end, 10);
  if (end == text.c_str() || *end != '\0' || value < 0 || value > 65535) return false;
  out = static_cast<int>(value);
  return true;
}

// Returns false when the process should exit; `exit_code` says how.
bool ParseArgs(int argc, char** argv, CliArgs& args, int& exit_code) {
  args.config_path = EnvOr("CONFIG", HomeDirectory() + "/evilvir.us/MacReplay.json");
  args.epg_cache_path = HomeDirectory() + "/Evilvir.us/MacReplayEPG.xml";
  args.host = EnvOr("HOST", "127.0.0.1:8001");

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--help" || arg == "-h") {
      PrintUsage(argv[0]);
      exit_code = 0;
      return false;
    }

    std::string* target = nullptr;
    int* port_target = nullptr;
    if (arg == "--config") {
      target = &args.config_path;
    } else if (arg == "--epg-cache") {
      target = &args.epg_cache_path;
    } else if (arg == "--host") {
      target = &args.host;
    } else if (arg == "--ffmpeg") {
      target = &args.ffmpeg_path;
    } else if (arg == "--ffprobe") {
      target = &args.ffprobe_path;
    } else if (arg == "--log-file") {
      target = &args.log_file;
    } else if (arg == "--port") {
      port_target = &args.port;
    } else if (arg == "--control-port") {
      port_target = &args.control_port;
    } else {
      std::cerr << "Unknown option: " << arg << std::endl;
      PrintUsage(argv[0]);
      exit_code = 2;
      return false;
    }

    if (i + 1 >= argc) {
      std::cerr << "Missing value for " << arg << std::endl;
      exit_code = 2;
      return false;
    }
    const std::string value = argv[++i];
    if (target) {
      *target = value;
    } else if (!ParsePort(value, *port_target)) {
      std::cerr << "Invalid port for " << arg << ": " << value << std::endl;
      exit_code = 2;
      return false;
    }
  }
  return true;
}

}  // namespace

int main(int argc, char** argv) {
  CliArgs args;
  int exit_code = 0;
  if (!ParseArgs(argc, argv, args, exit_code)) {
    return exit_code;
  }

  if (!args.log_file.empty() && !Logger::SetLogFile(args.log_file)) {
    std::cerr << "Cannot open log file " << args.log_file << std::endl;
    return 1;
  }

  std::signal(SIGINT, SignalHandler);
  std::signal(SIGTERM, SignalHandler);
  std::signal(SIGPIPE, SIG_IGN);

  Logger::Info("[Main] MacReplay gateway starting");
  Logger::Info("[Main] Using config file: " + args.config_path);

  macreplay::config::ConfigStore store(args.config_path);
  if (!store.Load()) {
    Logger::Warn("[Main] Config could not be written back, changes will not persist");
  }

  auto clock = macreplay::timing::MakeSystemClock();
  auto metrics = std::make_shared<macreplay::telemetry::MetricsExporter>();
  auto transport = std::make_shared<macreplay::portal::CurlHttpTransport>();
  auto client = std::make_shared<macreplay::portal::StalkerPortalClient>(transport);
  auto prober = std::make_shared<macreplay::relay::FfprobeStreamProber>(args.ffprobe_path);

  macreplay::runtime::OccupancyTable occupancy(clock);
  metrics->SetSessionSource([&occupancy] { return occupancy.ActiveCounts(); });

  macreplay::runtime::MacPool mac_pool(store, metrics);
  macreplay::runtime::StreamResolver resolver(store, client, mac_pool, occupancy, prober,
                                              metrics);
  macreplay::relay::RelayManager relay_manager(mac_pool, metrics);

  macreplay::runtime::PlaybackOptions playback_options;
  playback_options.ffmpeg_path = args.ffmpeg_path;
  macreplay::runtime::PlaybackService playback(store, resolver, relay_manager,
                                               playback_options);

  macreplay::cache::ArtifactCacheOptions cache_options;
  cache_options.lineup_host = args.host;
  cache_options.epg_cache_path = args.epg_cache_path;
  macreplay::cache::ArtifactCache cache(store, client, clock, cache_options, metrics);

  macreplay::runtime::PortalRegistry registry(store, transport, client,
                                              [&cache] { cache.InvalidateXmltv(); });

  macreplay::server::GatewayHTTPServer http_server(args.port, store, cache, playback, occupancy,
                                                   metrics, args.host);
  if (!http_server.Start()) {
    Logger::Error("[Main] HTTP server failed to start on port " + std::to_string(args.port));
    return 1;
  }

#ifdef MACREPLAY_WITH_CONTROL
  std::unique_ptr<macreplay::control::GatewayControlImpl> control_service;
  std::unique_ptr<grpc::Server> control_server;
  if (args.control_port > 0) {
    control_service = std::make_unique<macreplay::control::GatewayControlImpl>(
        store, cache, occupancy, mac_pool, registry, args.host);
    const std::string address = "0.0.0.0:" + std::to_string(args.control_port);
    grpc::ServerBuilder builder;
    builder.AddListeningPort(address, grpc::InsecureServerCredentials());
    builder.RegisterService(control_service.get());
    control_server = builder.BuildAndStart();
    if (!control_server) {
      Logger::Error("[Main] Control service failed to start on " + address);
      http_server.Stop();
      return 1;
    }
    Logger::Info("[Main] Control service listening on " + address);
  }
#else
  if (args.control_port > 0) {
    Logger::Warn("[Main] Built without the control service, ignoring --control-port");
  }
#endif

  cache.StartBackgroundRefresh();
  Logger::Info("[Main] Serving on port " + std::to_string(http_server.GetPort()) +
               " as http://" + args.host);

  while (!g_shutdown_requested.load(std::memory_order_acquire)) {
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
  }

  Logger::Info("[Main] Shutdown requested");
#ifdef MACREPLAY_WITH_CONTROL
  if (control_server) {
    control_server->Shutdown();
  }
#endif
  http_server.Stop();
  Logger::Info("[Main] MacReplay gateway stopped");
  return 0;
}
