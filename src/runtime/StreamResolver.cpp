// Repository: MacReplay-gateway
// Component: Stream Resolver
// Purpose: Resolves (portal, channel) to a verified upstream link using MAC rotation
//          and cross-portal fallback.
// Copyright (c) 2025 MacReplay

#include "macreplay/runtime/StreamResolver.h"

#include <algorithm>

#include "macreplay/telemetry/MetricsExporter.h"
#include "macreplay/util/Logger.hpp"

namespace macreplay::runtime {

using macreplay::util::Logger;

namespace {

constexpr const char* kLoopbackCmdMarker = "http://localhost/";

std::string Context(const std::string& portal_id, const std::string& mac,
                    const std::string& channel_id) {
  return "Portal(" + portal_id + "):MAC(" + mac + "):Channel(" + channel_id + ")";
}

}  // namespace

const char* AttemptOutcomeToString(AttemptOutcome outcome) {
  switch (outcome) {
    case AttemptOutcome::kSuccess:
      return "success";
    case AttemptOutcome::kBusy:
      return "busy";
    case AttemptOutcome::kCredentialFailure:
      return "credential_failure";
    case AttemptOutcome::kChannelNotFound:
      return "channel_not_found";
    case AttemptOutcome::kLinkFailure:
      return "link_failure";
    case AttemptOutcome::kProbeFailure:
      return "probe_failure";
  }
  return "unknown";
}

std::string DirectLinkFromCmd(const std::string& cmd) {
  const size_t first = cmd.find(' ');
  if (first == std::string::npos) return "";
  const size_t second = cmd.find(' ', first + 1);
  return cmd.substr(first + 1, second == std::string::npos ? std::string::npos
                                                           : second - first - 1);
}

bool NeedsCreateLink(const std::string& cmd) {
  return cmd.find(kLoopbackCmdMarker) != std::string::npos;
}

StreamResolver::StreamResolver(config::ConfigStore& store,
                               std::shared_ptr<portal::IPortalClient> client,
                               MacPool& mac_pool, OccupancyTable& occupancy,
                               std::shared_ptr<relay::IStreamProber> prober,
                               std::shared_ptr<telemetry::MetricsExporter> metrics)
    : store_(store),
      client_(std::move(client)),
      mac_pool_(mac_pool),
      occupancy_(occupancy),
      prober_(std::move(prober)),
      metrics_(std::move(metrics)) {}

std::optional<RotationReason> StreamResolver::RotationFor(AttemptOutcome outcome) {
  switch (outcome) {
    case AttemptOutcome::kCredentialFailure:
      return RotationReason::kHandshakeFailed;
    case AttemptOutcome::kChannelNotFound:
      return RotationReason::kChannelNotFound;
    case AttemptOutcome::kLinkFailure:
      return RotationReason::kLinkUnavailable;
    case AttemptOutcome::kProbeFailure:
      return RotationReason::kProbeFailed;
    case AttemptOutcome::kSuccess:
    case AttemptOutcome::kBusy:
      return std::nullopt;
  }
  return std::nullopt;
}

void StreamResolver::Record(const std::string& portal_id, const char* result) {
  if (metrics_) {
    metrics_->RecordResolution(portal_id, result);
  }
}

StreamResolver::Attempt StreamResolver::TryMac(const config::Portal& portal,
                                               const config::MacEntry& mac,
                                               const std::string& channel_id,
                                               const PlayRequest& request,
                                               const config::Settings& settings) {
  Attempt attempt;
  const std::string context = Context(portal.id, mac.mac, channel_id);

  StreamSession session;
  session.portal_id = portal.id;
  session.portal_name = portal.name;
  session.mac = mac.mac;
  session.channel_id = channel_id;
  session.client = request.client_address;
  auto custom_name = portal.custom_names.find(channel_id);
  if (custom_name != portal.custom_names.end()) {
    session.channel_name = custom_name->second;
  }

  auto lease = occupancy_.TryOccupy(session, portal.streams_per_mac);
  if (!lease) {
    Logger::Debug("[StreamResolver] " + context + ": MAC busy, skipping");
    attempt.outcome = AttemptOutcome::kBusy;
    return attempt;
  }
  Logger::Info("[StreamResolver] Trying " + context);

  const portal::PortalEndpoint endpoint{portal.url, mac.mac, portal.proxy};
  auto token = client_->Handshake(endpoint);
  if (!token || !client_->GetProfile(endpoint, *token)) {
    attempt.outcome = AttemptOutcome::kCredentialFailure;
    return attempt;
  }
  auto channels = client_->ListChannels(endpoint, *token);
  if (!channels) {
    attempt.outcome = AttemptOutcome::kCredentialFailure;
    return attempt;
  }

  auto channel = std::find_if(channels->begin(), channels->end(),
                              [&](const portal::Channel& c) { return c.id == channel_id; });
  if (channel == channels->end()) {
    attempt.outcome = AttemptOutcome::kChannelNotFound;
    return attempt;
  }
  attempt.channel_name =
      custom_name != portal.custom_names.end() ? custom_name->second : channel->name;
  lease->SetChannelName(attempt.channel_name);

  std::string link;
  if (NeedsCreateLink(channel->cmd)) {
    link = client_->CreateLink(endpoint, *token, channel->cmd).value_or("");
  } else {
    link = DirectLinkFromCmd(channel->cmd);
  }
  if (link.empty()) {
    attempt.outcome = AttemptOutcome::kLinkFailure;
    return attempt;
  }

  if (settings.test_streams) {
    relay::ProbeRequest probe;
    probe.link = link;
    probe.proxy = portal.proxy;
    probe.timeout_seconds = settings.ffmpeg_timeout_s;
    if (!prober_->Probe(probe)) {
      attempt.outcome = AttemptOutcome::kProbeFailure;
      return attempt;
    }
  }

  ResolvedStream stream;
  stream.portal_id = portal.id;
  stream.portal_name = portal.name;
  stream.mac = mac.mac;
  stream.channel_id = channel_id;
  stream.channel_name = attempt.channel_name;
  stream.link = link;
  stream.proxy = portal.proxy;
  stream.requested_portal_id = request.portal_id;
  stream.requested_channel_id = request.channel_id;

  attempt.outcome = AttemptOutcome::kSuccess;
  attempt.stream = std::move(stream);
  attempt.lease = std::move(lease);
  return attempt;
}

std::optional<StreamResolver::Attempt> StreamResolver::TryFallbacks(
    const PlayRequest& request, const std::string& channel_name,
    const config::Settings& settings) {
  for (const auto& portal : store_.GetEnabledPortals()) {
    if (portal.id == request.portal_id) continue;

    std::vector<std::string> fallback_ids;
    for (const auto& [id, name] : portal.fallback_channels) {
      if (name == channel_name) fallback_ids.push_back(id);
    }
    if (fallback_ids.empty()) continue;

    for (const auto& mac : portal.macs) {
      std::optional<AttemptOutcome> failure;
      for (const auto& fallback_id : fallback_ids) {
        Attempt attempt = TryMac(portal, mac, fallback_id, request, settings);
        if (attempt.outcome == AttemptOutcome::kSuccess) {
          Logger::Info("[StreamResolver] Fallback found for Portal(" + request.portal_id +
                       "):Channel(" + request.channel_id + ") on " +
                       Context(portal.id, mac.mac, fallback_id));
          attempt.stream->via_fallback = true;
          return attempt;
        }
        if (attempt.outcome == AttemptOutcome::kBusy) break;
        failure = attempt.outcome;
      }
      if (failure) {
        Logger::Info("[StreamResolver] Unable to use fallback " +
                     Context(portal.id, mac.mac, request.channel_id) + " (" +
                     AttemptOutcomeToString(*failure) + ")");
        if (!mac_pool_.Rotate(portal.id, mac.mac, *RotationFor(*failure))) {
          Logger::Debug("[StreamResolver] Fallback MAC order of Portal(" + portal.id +
                        ") changed concurrently");
        }
      }
    }
  }
  return std::nullopt;
}

ResolutionResult StreamResolver::Resolve(const PlayRequest& request) {
  ResolutionResult result;
  auto portal = store_.GetPortal(request.portal_id);
  if (!portal) {
    Logger::Warn("[StreamResolver] IP(" + request.client_address + ") requested unknown Portal(" +
                 request.portal_id + ")");
    result.status = ResolutionResult::Status::kUnknownPortal;
    return result;
  }
  const config::Settings settings = store_.GetSettings();

  Logger::Info("[StreamResolver] IP(" + request.client_address + ") requested Portal(" +
               request.portal_id + "):Channel(" + request.channel_id + ")");

  std::string channel_name;
  auto custom_name = portal->custom_names.find(request.channel_id);
  if (custom_name != portal->custom_names.end()) {
    channel_name = custom_name->second;
  }

  bool attempted = false;
  for (const auto& mac : portal->macs) {
    Attempt attempt = TryMac(*portal, mac, request.channel_id, request, settings);
    if (attempt.outcome == AttemptOutcome::kBusy) continue;

    attempted = true;
    if (!attempt.channel_name.empty()) channel_name = attempt.channel_name;

    if (attempt.outcome == AttemptOutcome::kSuccess) {
      result.status = ResolutionResult::Status::kResolved;
      result.stream = std::move(attempt.stream);
      result.lease = std::move(attempt.lease);
      Record(request.portal_id, "resolved");
      return result;
    }

    Logger::Info("[StreamResolver] Unable to connect to " +
                 Context(request.portal_id, mac.mac, request.channel_id) + " (" +
                 AttemptOutcomeToString(attempt.outcome) + "), moving MAC");
    // Drop the admission before the rotation is visible.
    attempt.lease.reset();
    if (!mac_pool_.Rotate(request.portal_id, mac.mac, *RotationFor(attempt.outcome))) {
      Logger::Debug("[StreamResolver] MAC order of Portal(" + request.portal_id +
                    ") changed concurrently");
    }

    if (!settings.try_all_macs) break;
  }

  if (!request.web) {
    if (channel_name.empty()) {
      Logger::Info("[StreamResolver] Portal(" + request.portal_id + "):Channel(" +
                   request.channel_id + ") has no known name, no fallback search");
    } else {
      Logger::Info("[StreamResolver] Portal(" + request.portal_id + "):Channel(" +
                   request.channel_id + ") is not working. Looking for fallbacks...");
      auto fallback = TryFallbacks(request, channel_name, settings);
      if (fallback) {
        result.status = ResolutionResult::Status::kResolved;
        result.stream = std::move(fallback->stream);
        result.lease = std::move(fallback->lease);
        Record(request.portal_id, "fallback");
        return result;
      }
    }
  }

  result.status = ResolutionResult::Status::kUnavailable;
  result.no_free_mac = !attempted;
  if (attempted) {
    Logger::Warn("[StreamResolver] No working streams found for Portal(" + request.portal_id +
                 "):Channel(" + request.channel_id + ")");
    Record(request.portal_id, "unavailable");
  } else {
    Logger::Warn("[StreamResolver] No free MAC for Portal(" + request.portal_id +
                 "):Channel(" + request.channel_id + ")");
    Record(request.portal_id, "no_free_mac");
  }
  return result;
}

}  // namespace macreplay::runtime
