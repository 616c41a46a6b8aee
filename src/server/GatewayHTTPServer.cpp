// Repository: MacReplay-gateway
// Component: Gateway HTTP Server
// Purpose: HTTP front end for playback, playlist, lineup, guide and status endpoints.
// Copyright (c) 2025 MacReplay

#include "macreplay/server/GatewayHTTPServer.h"

#include <arpa/inet.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <json/json.h>

#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <sstream>

#include "macreplay/util/Logger.hpp"

#define INVALID_SOCKET -1
#define SOCKET_ERROR -1

namespace macreplay::server {

using macreplay::util::Logger;

namespace {

constexpr size_t kMaxHeadBytes = 64 * 1024;
constexpr size_t kMaxBodyBytes = 1024 * 1024;
constexpr int kReceiveTimeoutSeconds = 5;

bool SendAll(int socket, const char* data, size_t size) {
  while (size > 0) {
    const ssize_t sent = send(socket, data, size, MSG_NOSIGNAL);
    if (sent < 0) {
      if (errno == EINTR) continue;
      return false;
    }
    data += sent;
    size -= static_cast<size_t>(sent);
  }
  return true;
}

bool SendAll(int socket, const std::string& data) {
  return SendAll(socket, data.data(), data.size());
}

std::string FormatResponse(const ServerResponse& response) {
  std::ostringstream out;
  out << "HTTP/1.1 " << response.status << " " << StatusText(response.status) << "\r\n";
  out << "Content-Type: " << response.content_type << "\r\n";
  for (const auto& [name, value] : response.headers) {
    out << name << ": " << value << "\r\n";
  }
  out << "Content-Length: " << response.body.size() << "\r\n";
  out << "Connection: close\r\n";
  out << "\r\n";
  out << response.body;
  return out.str();
}

ServerResponse TextResponse(int status, const std::string& body) {
  ServerResponse response;
  response.status = status;
  response.body = body;
  return response;
}

ServerResponse JsonResponse(const Json::Value& value) {
  Json::StreamWriterBuilder builder;
  builder["indentation"] = "";
  ServerResponse response;
  response.content_type = "application/json";
  response.body = Json::writeString(builder, value);
  return response;
}

int HexValue(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

std::string PercentDecode(const std::string& text, bool plus_is_space) {
  std::string out;
  out.reserve(text.size());
  for (size_t i = 0; i < text.size(); ++i) {
    const char c = text[i];
    if (c == '%' && i + 2 < text.size()) {
      const int hi = HexValue(text[i + 1]);
      const int lo = HexValue(text[i + 2]);
      if (hi >= 0 && lo >= 0) {
        out.push_back(static_cast<char>(hi * 16 + lo));
        i += 2;
        continue;
      }
    }
    out.push_back(plus_is_space && c == '+' ? ' ' : c);
  }
  return out;
}

std::string ToLower(std::string text) {
  for (auto& c : text) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return text;
}

std::string Trim(const std::string& text) {
  const size_t begin = text.find_first_not_of(" \t");
  if (begin == std::string::npos) return "";
  const size_t end = text.find_last_not_of(" \t\r");
  return text.substr(begin, end - begin + 1);
}

// HTTP response of one /play request. Streams use chunked transfer encoding
// since the relay's length is unknown.
class SocketPlaybackResponder : public runtime::IPlaybackResponder {
 public:
  explicit SocketPlaybackResponder(int socket) : socket_(socket) {}

  void SendRedirect(const std::string& location) override {
    ServerResponse response;
    response.status = 302;
    response.headers["Location"] = location;
    failed_ = !SendAll(socket_, FormatResponse(response));
  }

  void SendError(int status, const std::string& body) override {
    failed_ = !SendAll(socket_, FormatResponse(TextResponse(status, body)));
  }

  bool BeginStream(const std::string& content_type) override {
    std::ostringstream head;
    head << "HTTP/1.1 200 OK\r\n";
    head << "Content-Type: " << content_type << "\r\n";
    head << "Transfer-Encoding: chunked\r\n";
    head << "Connection: close\r\n";
    head << "\r\n";
    streaming_ = true;
    failed_ = !SendAll(socket_, head.str());
    return !failed_;
  }

  bool Write(const char* data, size_t size) override {
    if (failed_) return false;
    if (size == 0) return true;
    char chunk_head[32];
    const int length = std::snprintf(chunk_head, sizeof(chunk_head), "%zx\r\n", size);
    if (!SendAll(socket_, chunk_head, static_cast<size_t>(length)) ||
        !SendAll(socket_, data, size) || !SendAll(socket_, "\r\n", 2)) {
      failed_ = true;
    }
    return !failed_;
  }

  bool IsConnected() override {
    if (failed_) return false;
    char probe;
    const ssize_t n = recv(socket_, &probe, 1, MSG_PEEK | MSG_DONTWAIT);
    if (n > 0) return true;
    if (n == 0) return false;
    return errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR;
  }

  // Terminates the chunked body of a stream that ended cleanly.
  void Finish() {
    if (streaming_ && !failed_ && !SendAll(socket_, "0\r\n\r\n", 5)) {
      Logger::Debug("[GatewayHTTPServer] Client left before the final chunk");
    }
  }

 private:
  int socket_;
  bool streaming_ = false;
  bool failed_ = false;
};

}  // namespace

std::string DecodeQueryComponent(const std::string& text) { return PercentDecode(text, true); }

bool ParseBoolParameter(const std::string& value) {
  const std::string lowered = ToLower(Trim(value));
  return lowered == "true" || lowered == "1" || lowered == "yes";
}

std::string StatusText(int status) {
  switch (status) {
    case 200: return "OK";
    case 302: return "Found";
    case 400: return "Bad Request";
    case 404: return "Not Found";
    case 405: return "Method Not Allowed";
    case 413: return "Payload Too Large";
    case 500: return "Internal Server Error";
    case 503: return "Service Unavailable";
    default: return "Unknown";
  }
}

bool ParseRequestHead(const std::string& head, ServerRequest& request) {
  std::istringstream lines(head);
  std::string request_line;
  if (!std::getline(lines, request_line)) return false;
  if (!request_line.empty() && request_line.back() == '\r') request_line.pop_back();

  // GET /path?query HTTP/1.1
  const size_t space1 = request_line.find(' ');
  if (space1 == std::string::npos || space1 == 0) return false;
  const size_t space2 = request_line.find(' ', space1 + 1);
  if (space2 == std::string::npos) return false;

  request.method = request_line.substr(0, space1);
  const std::string target = request_line.substr(space1 + 1, space2 - space1 - 1);
  if (target.empty() || target[0] != '/') return false;

  const size_t question = target.find('?');
  request.path = PercentDecode(target.substr(0, question), false);
  if (question != std::string::npos) {
    std::istringstream pairs(target.substr(question + 1));
    std::string pair;
    while (std::getline(pairs, pair, '&')) {
      if (pair.empty()) continue;
      const size_t equals = pair.find('=');
      const std::string key = DecodeQueryComponent(pair.substr(0, equals));
      const std::string value =
          equals == std::string::npos ? "" : DecodeQueryComponent(pair.substr(equals + 1));
      request.query[key] = value;
    }
  }

  std::string line;
  while (std::getline(lines, line)) {
    if (!line.empty() && line.back() == '\r') line.pop_back();
    if (line.empty()) break;
    const size_t colon = line.find(':');
    if (colon == std::string::npos) continue;
    request.headers[ToLower(Trim(line.substr(0, colon)))] = Trim(line.substr(colon + 1));
  }
  return true;
}

GatewayHTTPServer::GatewayHTTPServer(int port, config::ConfigStore& store,
                                     cache::ArtifactCache& cache,
                                     runtime::PlaybackService& playback,
                                     runtime::OccupancyTable& occupancy,
                                     std::shared_ptr<telemetry::MetricsExporter> metrics,
                                     std::string advertised_host)
    : port_(port),
      store_(store),
      cache_(cache),
      playback_(playback),
      occupancy_(occupancy),
      metrics_(std::move(metrics)),
      advertised_host_(std::move(advertised_host)),
      running_(false),
      stop_requested_(false),
      server_socket_(INVALID_SOCKET) {}

GatewayHTTPServer::~GatewayHTTPServer() { Stop(); }

bool GatewayHTTPServer::Start() {
  if (running_.load(std::memory_order_acquire)) {
    Logger::Error("[GatewayHTTPServer] Already running");
    return false;
  }

  server_socket_ = socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
  if (server_socket_ == INVALID_SOCKET) {
    Logger::Error("[GatewayHTTPServer] Failed to create socket: " +
                  std::string(std::strerror(errno)));
    return false;
  }

  int opt = 1;
  setsockopt(server_socket_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

  // Non-blocking accept so the loop can observe stop requests.
  int flags = fcntl(server_socket_, F_GETFL, 0);
  fcntl(server_socket_, F_SETFL, flags | O_NONBLOCK);

  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_addr.s_addr = INADDR_ANY;
  addr.sin_port = htons(static_cast<uint16_t>(port_.load()));

  if (bind(server_socket_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == SOCKET_ERROR) {
    Logger::Error("[GatewayHTTPServer] Failed to bind socket to port " +
                  std::to_string(port_.load()) + ": " + std::strerror(errno));
    close(server_socket_);
    server_socket_ = INVALID_SOCKET;
    return false;
  }

  if (listen(server_socket_, SOMAXCONN) == SOCKET_ERROR) {
    Logger::Error("[GatewayHTTPServer] Failed to listen: " + std::string(std::strerror(errno)));
    close(server_socket_);
    server_socket_ = INVALID_SOCKET;
    return false;
  }

  sockaddr_in bound{};
  socklen_t bound_len = sizeof(bound);
  if (getsockname(server_socket_, reinterpret_cast<sockaddr*>(&bound), &bound_len) == 0) {
    port_.store(ntohs(bound.sin_port), std::memory_order_release);
  }

  stop_requested_.store(false, std::memory_order_release);
  running_.store(true, std::memory_order_release);
  server_thread_ = std::make_unique<std::thread>(&GatewayHTTPServer::ServerLoop, this);

  Logger::Info("[GatewayHTTPServer] Listening on port " + std::to_string(GetPort()));
  return true;
}

void GatewayHTTPServer::Stop() {
  if (!running_.load(std::memory_order_acquire) && !server_thread_) {
    return;
  }

  Logger::Info("[GatewayHTTPServer] Stopping...");
  stop_requested_.store(true, std::memory_order_release);

  if (server_thread_ && server_thread_->joinable()) {
    server_thread_->join();
  }
  server_thread_.reset();

  if (server_socket_ != INVALID_SOCKET) {
    close(server_socket_);
    server_socket_ = INVALID_SOCKET;
  }

  {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    for (auto& connection : connections_) {
      shutdown(connection->socket, SHUT_RDWR);
    }
  }
  ReapConnections(true);

  running_.store(false, std::memory_order_release);
  Logger::Info("[GatewayHTTPServer] Stopped");
}

void GatewayHTTPServer::ServerLoop() {
  while (!stop_requested_.load(std::memory_order_acquire)) {
    sockaddr_in client_addr{};
    socklen_t client_len = sizeof(client_addr);

    // Relay children must not inherit client sockets.
    int client_socket = accept4(server_socket_, reinterpret_cast<sockaddr*>(&client_addr),
                                &client_len, SOCK_CLOEXEC);

    if (client_socket == INVALID_SOCKET) {
      if (errno == EWOULDBLOCK || errno == EAGAIN || errno == EINTR) {
        ReapConnections(false);
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        continue;
      }
      Logger::Error("[GatewayHTTPServer] accept failed: " + std::string(std::strerror(errno)));
      break;
    }

    char address[INET_ADDRSTRLEN] = {0};
    inet_ntop(AF_INET, &client_addr.sin_addr, address, sizeof(address));

    auto connection = std::make_unique<Connection>();
    connection->socket = client_socket;
    connection->client_address = address;
    Connection* raw = connection.get();
    {
      std::lock_guard<std::mutex> lock(connections_mutex_);
      connections_.push_back(std::move(connection));
    }
    raw->thread = std::thread(&GatewayHTTPServer::HandleConnection, this, raw);
  }
}

void GatewayHTTPServer::ReapConnections(bool all) {
  std::list<std::unique_ptr<Connection>> finished;
  {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    for (auto it = connections_.begin(); it != connections_.end();) {
      if (all || (*it)->done.load(std::memory_order_acquire)) {
        finished.push_back(std::move(*it));
        it = connections_.erase(it);
      } else {
        ++it;
      }
    }
  }
  for (auto& connection : finished) {
    if (connection->thread.joinable()) connection->thread.join();
    close(connection->socket);
  }
}

void GatewayHTTPServer::HandleConnection(Connection* connection) {
  const int client_socket = connection->socket;

  struct timeval timeout;
  timeout.tv_sec = kReceiveTimeoutSeconds;
  timeout.tv_usec = 0;
  setsockopt(client_socket, SOL_SOCKET, SO_RCVTIMEO, &timeout, sizeof(timeout));

  std::string data;
  size_t head_end = std::string::npos;
  char buffer[4096];
  while (head_end == std::string::npos && data.size() < kMaxHeadBytes) {
    const ssize_t bytes_read = recv(client_socket, buffer, sizeof(buffer), 0);
    if (bytes_read <= 0) {
      connection->done.store(true, std::memory_order_release);
      return;
    }
    data.append(buffer, static_cast<size_t>(bytes_read));
    head_end = data.find("\r\n\r\n");
  }

  ServerRequest request;
  request.client_address = connection->client_address;
  if (head_end == std::string::npos || !ParseRequestHead(data.substr(0, head_end), request)) {
    SendAll(client_socket, FormatResponse(TextResponse(400, "400 Bad Request\n")));
    connection->done.store(true, std::memory_order_release);
    return;
  }

  request.body = data.substr(head_end + 4);
  auto length = request.headers.find("content-length");
  if (length != request.headers.end()) {
    const size_t expected = std::strtoul(length->second.c_str(), nullptr, 10);
    if (expected > kMaxBodyBytes) {
      SendAll(client_socket, FormatResponse(TextResponse(413, "413 Payload Too Large\n")));
      connection->done.store(true, std::memory_order_release);
      return;
    }
    while (request.body.size() < expected) {
      const ssize_t bytes_read = recv(client_socket, buffer, sizeof(buffer), 0);
      if (bytes_read <= 0) break;
      request.body.append(buffer, static_cast<size_t>(bytes_read));
    }
  }

  Logger::Debug("[GatewayHTTPServer] " + request.method + " " + request.path + " from " +
                request.client_address);

  // /play/{portalId}/{channelId}
  static const std::string kPlayPrefix = "/play/";
  if (request.path.compare(0, kPlayPrefix.size(), kPlayPrefix) == 0) {
    const std::string rest = request.path.substr(kPlayPrefix.size());
    const size_t slash = rest.find('/');
    if (request.method == "GET" && slash != std::string::npos && slash > 0 &&
        slash + 1 < rest.size() && rest.find('/', slash + 1) == std::string::npos) {
      HandlePlay(client_socket, request, rest.substr(0, slash), rest.substr(slash + 1));
      connection->done.store(true, std::memory_order_release);
      return;
    }
  }

  SendAll(client_socket, FormatResponse(Route(request)));
  connection->done.store(true, std::memory_order_release);
}

void GatewayHTTPServer::HandlePlay(int client_socket, const ServerRequest& request,
                                   const std::string& portal_id,
                                   const std::string& channel_id) {
  runtime::PlayRequest play;
  play.portal_id = portal_id;
  play.channel_id = channel_id;
  play.client_address = request.client_address;
  auto web = request.query.find("web");
  play.web = web != request.query.end() && ParseBoolParameter(web->second);

  SocketPlaybackResponder responder(client_socket);
  playback_.Play(play, responder);
  responder.Finish();
}

ServerResponse GatewayHTTPServer::Route(const ServerRequest& request) {
  const std::string& path = request.path;
  const std::string& method = request.method;
  const bool get = method == "GET";
  const bool post = method == "POST";

  if (path == "/playlist.m3u") {
    if (!get) return TextResponse(405, "405 Method Not Allowed\n");
    return TextResponse(200, cache_.Playlist(RequestHost(request)));
  }
  if (path == "/update_playlistm3u") {
    if (!post) return TextResponse(405, "405 Method Not Allowed\n");
    cache_.RegeneratePlaylist(RequestHost(request));
    return TextResponse(200, "Playlist updated successfully");
  }
  if (path == "/xmltv") {
    if (!get) return TextResponse(405, "405 Method Not Allowed\n");
    ServerResponse response = TextResponse(200, cache_.Xmltv());
    response.content_type = "text/xml";
    return response;
  }
  if (path == "/lineup.json" || path == "/lineup.post") {
    if (!(post || (get && path == "/lineup.json"))) {
      return TextResponse(405, "405 Method Not Allowed\n");
    }
    Logger::Info("[GatewayHTTPServer] Lineup requested");
    ServerResponse response;
    response.content_type = "application/json";
    response.body = cache_.LineupJson();
    return response;
  }
  if (path == "/refresh_lineup") {
    if (!post) return TextResponse(405, "405 Method Not Allowed\n");
    cache_.RefreshLineup();
    Json::Value body(Json::objectValue);
    body["status"] = "Lineup refreshed successfully";
    return JsonResponse(body);
  }
  if (path == "/discover.json") {
    if (!get) return TextResponse(405, "405 Method Not Allowed\n");
    return DiscoverResponse();
  }
  if (path == "/lineup_status.json") {
    if (!get) return TextResponse(405, "405 Method Not Allowed\n");
    return LineupStatusResponse();
  }
  if (path == "/streaming") {
    if (!get) return TextResponse(405, "405 Method Not Allowed\n");
    return StreamingResponse();
  }
  if (path == "/metrics" && metrics_) {
    if (!get) return TextResponse(405, "405 Method Not Allowed\n");
    ServerResponse response = TextResponse(200, metrics_->GenerateMetricsText());
    response.content_type = "text/plain; version=0.0.4; charset=utf-8";
    return response;
  }
  if (path == "/") {
    return TextResponse(200,
                        "MacReplay Gateway\n"
                        "Playlist available at: /playlist.m3u\n"
                        "Guide available at: /xmltv\n");
  }
  return TextResponse(404, "404 Not Found\n");
}

ServerResponse GatewayHTTPServer::StreamingResponse() {
  Json::Value body(Json::objectValue);
  for (const auto& [portal_id, sessions] : occupancy_.Snapshot()) {
    Json::Value list(Json::arrayValue);
    for (const auto& session : sessions) {
      Json::Value item(Json::objectValue);
      item["mac"] = session.mac;
      item["channel id"] = session.channel_id;
      item["channel name"] = session.channel_name;
      item["client"] = session.client;
      item["portal name"] = session.portal_name;
      item["start time"] = Json::Int64(session.start_utc_s);
      list.append(item);
    }
    body[portal_id] = list;
  }
  return JsonResponse(body);
}

bool GatewayHTTPServer::HdhrEnabled() const {
  return store_.GetRawSetting("enable hdhr") == "true";
}

ServerResponse GatewayHTTPServer::DiscoverResponse() {
  if (!HdhrEnabled()) return TextResponse(404, "Error");
  Logger::Info("[GatewayHTTPServer] HDHR status requested");

  const std::string name = store_.GetRawSetting("hdhr name");
  const std::string base_url = "http://" + advertised_host_;
  char* end = nullptr;
  const std::string tuners_text = store_.GetRawSetting("hdhr tuners");
  long tuners = std::strtol(tuners_text.c_str(), &end, 10);
  if (end == tuners_text.c_str() || tuners < 0) tuners = 0;

  Json::Value body(Json::objectValue);
  body["BaseURL"] = base_url;
  body["DeviceAuth"] = name;
  body["DeviceID"] = store_.GetRawSetting("hdhr id");
  body["FirmwareName"] = "MacReplay";
  body["FirmwareVersion"] = "666";
  body["FriendlyName"] = name;
  body["LineupURL"] = base_url + "/lineup.json";
  body["Manufacturer"] = "Evilvirus";
  body["ModelNumber"] = "666";
  body["TunerCount"] = static_cast<Json::Int>(tuners);
  return JsonResponse(body);
}

ServerResponse GatewayHTTPServer::LineupStatusResponse() {
  if (!HdhrEnabled()) return TextResponse(404, "Error");
  Json::Value body(Json::objectValue);
  body["ScanInProgress"] = 0;
  body["ScanPossible"] = 0;
  body["Source"] = "Cable";
  Json::Value sources(Json::arrayValue);
  sources.append("Cable");
  body["SourceList"] = sources;
  return JsonResponse(body);
}

std::string GatewayHTTPServer::RequestHost(const ServerRequest& request) const {
  auto host = request.headers.find("host");
  if (host != request.headers.end() && !host->second.empty()) {
    return host->second;
  }
  return advertised_host_;
}

}  // namespace macreplay::server
