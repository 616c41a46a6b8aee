// Repository: MacReplay-gateway
// Component: Gateway HTTP Server
// Purpose: HTTP front end for playback, playlist, lineup, guide and status endpoints.
// Copyright (c) 2025 MacReplay

#ifndef MACREPLAY_SERVER_GATEWAY_HTTP_SERVER_H_
#define MACREPLAY_SERVER_GATEWAY_HTTP_SERVER_H_

#include <atomic>
#include <list>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "macreplay/cache/ArtifactCache.h"
#include "macreplay/config/ConfigStore.h"
#include "macreplay/runtime/OccupancyTable.h"
#include "macreplay/runtime/PlaybackService.h"
#include "macreplay/telemetry/MetricsExporter.h"

namespace macreplay::server {

// One parsed request. Header names are lower-cased.
struct ServerRequest {
  std::string method;
  std::string path;
  std::map<std::string, std::string> query;
  std::map<std::string, std::string> headers;
  std::string body;
  std::string client_address;
};

struct ServerResponse {
  int status = 200;
  std::string content_type = "text/plain";
  std::string body;
  std::map<std::string, std::string> headers;
};

// Parses the request line, headers and query string of `head` (everything
// before the blank line). Returns false on a malformed request line.
bool ParseRequestHead(const std::string& head, ServerRequest& request);

// Decodes %XX escapes and '+' in a query component.
std::string DecodeQueryComponent(const std::string& text);

// True for "true", "1" and "yes" (any case).
bool ParseBoolParameter(const std::string& value);

std::string StatusText(int status);

// GatewayHTTPServer serves the gateway over HTTP/1.1.
//
// Routes:
// - GET  /play/{portalId}/{channelId}?web=<bool> - stream, redirect or 503
// - GET  /playlist.m3u                            - cached M3U playlist
// - POST /update_playlistm3u                      - rebuilds the playlist
// - GET  /xmltv                                   - cached XMLTV guide
// - GET  /lineup.json, POST /lineup.post          - cached lineup
// - POST /refresh_lineup                          - rebuilds the lineup
// - GET  /discover.json, /lineup_status.json      - HDHomeRun descriptors
// - GET  /streaming                               - active sessions
// - GET  /metrics                                 - Prometheus metrics
//
// Thread Model:
// - One accept thread; one thread per connection, so a long relay never
//   blocks other requests.
// - Stop() shuts down open client sockets, which makes running relays see a
//   disconnect, and joins every thread.
class GatewayHTTPServer {
 public:
  GatewayHTTPServer(int port, config::ConfigStore& store, cache::ArtifactCache& cache,
                    runtime::PlaybackService& playback, runtime::OccupancyTable& occupancy,
                    std::shared_ptr<telemetry::MetricsExporter> metrics,
                    std::string advertised_host);

  ~GatewayHTTPServer();

  GatewayHTTPServer(const GatewayHTTPServer&) = delete;
  GatewayHTTPServer& operator=(const GatewayHTTPServer&) = delete;

  // Binds and starts accepting. Port 0 picks a free port (see GetPort()).
  bool Start();

  void Stop();

  bool IsRunning() const { return running_.load(std::memory_order_acquire); }

  // Bound port once started; the configured port before.
  int GetPort() const { return port_.load(std::memory_order_acquire); }

  // Routes a non-streaming request. Exposed for tests.
  ServerResponse Route(const ServerRequest& request);

 private:
  struct Connection {
    int socket = -1;
    std::string client_address;
    std::thread thread;
    std::atomic<bool> done{false};
  };

  void ServerLoop();
  void HandleConnection(Connection* connection);
  void HandlePlay(int client_socket, const ServerRequest& request,
                  const std::string& portal_id, const std::string& channel_id);
  void ReapConnections(bool all);

  ServerResponse StreamingResponse();
  ServerResponse DiscoverResponse();
  ServerResponse LineupStatusResponse();
  std::string RequestHost(const ServerRequest& request) const;
  bool HdhrEnabled() const;

  std::atomic<int> port_;
  config::ConfigStore& store_;
  cache::ArtifactCache& cache_;
  runtime::PlaybackService& playback_;
  runtime::OccupancyTable& occupancy_;
  std::shared_ptr<telemetry::MetricsExporter> metrics_;
  const std::string advertised_host_;

  std::atomic<bool> running_;
  std::atomic<bool> stop_requested_;
  int server_socket_;
  std::unique_ptr<std::thread> server_thread_;

  std::mutex connections_mutex_;
  std::list<std::unique_ptr<Connection>> connections_;
};

}  // namespace macreplay::server

#endif  // MACREPLAY_SERVER_GATEWAY_HTTP_SERVER_H_
