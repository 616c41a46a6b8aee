// Repository: MacReplay-gateway
// Component: Portal Protocol Client
// Purpose: Stateless client for the Stalker/Ministra handshake, listing, link and EPG calls.
// Copyright (c) 2025 MacReplay

#include "macreplay/portal/PortalClient.h"

#include <cmath>
#include <cstdio>
#include <sstream>

#include "macreplay/util/Logger.hpp"

namespace macreplay::portal {

namespace {

using macreplay::util::Logger;

int64_t JsonToTimestamp(const Json::Value& value) {
  if (value.isIntegral()) return value.asInt64();
  if (value.isDouble()) return static_cast<int64_t>(std::floor(value.asDouble()));
  if (value.isString()) {
    try {
      return std::stoll(value.asString());
    } catch (const std::exception&) {
      return 0;
    }
  }
  return 0;
}

bool ParseProgramme(const Json::Value& item, Programme* out) {
  if (!item.isObject()) return false;
  if (!item.isMember("start_timestamp") || !item.isMember("stop_timestamp")) return false;
  out->start_timestamp = JsonToTimestamp(item["start_timestamp"]);
  out->stop_timestamp = JsonToTimestamp(item["stop_timestamp"]);
  out->name = JsonScalarToString(item["name"]);
  out->description = JsonScalarToString(item["descr"]);
  return true;
}

}  // namespace

std::string JsonScalarToString(const Json::Value& value) {
  if (value.isString()) return value.asString();
  if (value.isBool()) return value.asBool() ? "true" : "false";
  if (value.isIntegral()) {
    return value.isInt64() ? std::to_string(value.asInt64())
                           : std::to_string(value.asUInt64());
  }
  if (value.isDouble()) {
    const double d = value.asDouble();
    if (std::floor(d) == d && std::fabs(d) < 9e15) {
      return std::to_string(static_cast<int64_t>(d));
    }
    return value.asString();
  }
  return "";
}

std::string EncodeQueryValue(const std::string& value) {
  std::string out;
  out.reserve(value.size());
  for (unsigned char c : value) {
    if (c <= 0x20 || c >= 0x7f || c == '#' || c == '"' || c == '<' || c == '>') {
      char buf[4];
      std::snprintf(buf, sizeof(buf), "%%%02X", c);
      out += buf;
    } else {
      out.push_back(static_cast<char>(c));
    }
  }
  return out;
}

HttpRequest BuildPortalRequest(const PortalEndpoint& endpoint, const std::string& query,
                               const std::string& token) {
  HttpRequest request;
  request.url = endpoint.url + "?" + query;
  request.proxy = endpoint.proxy;
  request.headers.emplace_back("User-Agent", kPortalUserAgent);
  if (!token.empty()) {
    request.headers.emplace_back("Authorization", "Bearer " + token);
  }
  request.cookies.emplace_back("mac", endpoint.mac);
  request.cookies.emplace_back("stb_lang", "en");
  request.cookies.emplace_back("timezone", "Europe/London");
  return request;
}

StalkerPortalClient::StalkerPortalClient(std::shared_ptr<IHttpTransport> transport)
    : transport_(std::move(transport)) {}

std::optional<Json::Value> StalkerPortalClient::CallJs(const PortalEndpoint& endpoint,
                                                       const std::string& query,
                                                       const std::string& token) {
  auto response = transport_->Get(BuildPortalRequest(endpoint, query, token));
  if (!response) return std::nullopt;

  Json::CharReaderBuilder builder;
  std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
  Json::Value root;
  std::string errors;
  const char* begin = response->body.data();
  const char* end = begin + response->body.size();
  if (!reader->parse(begin, end, &root, &errors)) {
    Logger::Debug("[PortalClient] Malformed JSON from " + endpoint.url + ": " + errors);
    return std::nullopt;
  }
  if (!root.isObject() || !root.isMember("js")) {
    Logger::Debug("[PortalClient] Response from " + endpoint.url + " has no js envelope");
    return std::nullopt;
  }
  return root["js"];
}

std::optional<std::string> StalkerPortalClient::Handshake(const PortalEndpoint& endpoint) {
  auto js = CallJs(endpoint, "type=stb&action=handshake&JsHttpRequest=1-xml", "");
  if (!js || !js->isObject()) return std::nullopt;
  const std::string token = JsonScalarToString((*js)["token"]);
  if (token.empty()) return std::nullopt;
  return token;
}

std::optional<Json::Value> StalkerPortalClient::GetProfile(const PortalEndpoint& endpoint,
                                                           const std::string& token) {
  auto js = CallJs(endpoint, "type=stb&action=get_profile&JsHttpRequest=1-xml", token);
  if (!js || js->isNull()) return std::nullopt;
  return js;
}

std::optional<std::string> StalkerPortalClient::GetExpiry(const PortalEndpoint& endpoint,
                                                          const std::string& token) {
  auto js = CallJs(endpoint, "type=account_info&action=get_main_info&JsHttpRequest=1-xml",
                   token);
  if (!js || !js->isObject()) return std::nullopt;
  const std::string marker = JsonScalarToString((*js)["phone"]);
  if (marker.empty()) return std::nullopt;
  return marker;
}

std::optional<std::vector<Channel>> StalkerPortalClient::ListChannels(
    const PortalEndpoint& endpoint, const std::string& token) {
  auto js = CallJs(endpoint,
                   "type=itv&action=get_all_channels&force_ch_link_check=&JsHttpRequest=1-xml",
                   token);
  if (!js || !js->isObject() || !(*js)["data"].isArray()) return std::nullopt;

  std::vector<Channel> channels;
  for (const auto& item : (*js)["data"]) {
    if (!item.isObject()) continue;
    Channel channel;
    channel.id = JsonScalarToString(item["id"]);
    if (channel.id.empty()) continue;
    channel.name = JsonScalarToString(item["name"]);
    channel.number = JsonScalarToString(item["number"]);
    channel.genre_id = JsonScalarToString(item["tv_genre_id"]);
    channel.logo = JsonScalarToString(item["logo"]);
    channel.cmd = JsonScalarToString(item["cmd"]);
    channels.push_back(std::move(channel));
  }
  return channels;
}

std::optional<GenreMap> StalkerPortalClient::ListGenres(const PortalEndpoint& endpoint,
                                                        const std::string& token) {
  auto js = CallJs(endpoint, "action=get_genres&type=itv&JsHttpRequest=1-xml", token);
  if (!js || !js->isArray()) return std::nullopt;

  GenreMap genres;
  for (const auto& item : *js) {
    if (!item.isObject() || !item.isMember("id") || !item.isMember("title")) continue;
    if (item["id"].isNull() || item["title"].isNull()) continue;
    genres[JsonScalarToString(item["id"])] = JsonScalarToString(item["title"]);
  }
  if (genres.empty()) return std::nullopt;
  return genres;
}

std::optional<std::string> StalkerPortalClient::CreateLink(const PortalEndpoint& endpoint,
                                                           const std::string& token,
                                                           const std::string& cmd) {
  const std::string query =
      "type=itv&action=create_link&cmd=" + EncodeQueryValue(cmd) +
      "&series=0&forced_storage=false&disable_ad=false&download=false"
      "&force_ch_link_check=false&JsHttpRequest=1-xml";
  auto js = CallJs(endpoint, query, token);
  if (!js || !js->isObject()) return std::nullopt;

  std::istringstream words(JsonScalarToString((*js)["cmd"]));
  std::string word;
  std::string last;
  while (words >> word) {
    last = word;
  }
  if (last.empty()) return std::nullopt;
  return last;
}

std::optional<EpgData> StalkerPortalClient::GetEpg(const PortalEndpoint& endpoint,
                                                   const std::string& token,
                                                   int period_hours) {
  const std::string query = "type=itv&action=get_epg_info&period=" +
                            std::to_string(period_hours) + "&JsHttpRequest=1-xml";
  auto js = CallJs(endpoint, query, token);
  if (!js || !js->isObject() || !(*js)["data"].isObject()) return std::nullopt;

  const Json::Value& data = (*js)["data"];
  EpgData epg;
  for (const auto& channel_id : data.getMemberNames()) {
    const Json::Value& list = data[channel_id];
    if (!list.isArray()) continue;
    std::vector<Programme>& programmes = epg[channel_id];
    for (const auto& item : list) {
      Programme programme;
      if (ParseProgramme(item, &programme)) {
        programmes.push_back(std::move(programme));
      }
    }
  }
  return epg;
}

}  // namespace macreplay::portal
