// Repository: MacReplay-gateway
// Component: GatewayControl gRPC Service Implementation
// Purpose: Implements the GatewayControl service for operator maintenance of the gateway.
// Copyright (c) 2025 MacReplay

#include "gateway_control_service.h"

#include <algorithm>
#include <string>
#include <utility>

#include "macreplay/util/Logger.hpp"

namespace macreplay
{
  namespace control
  {

    using macreplay::util::Logger;

    namespace
    {
      constexpr char kApiVersion[] = "1.0.0";
      constexpr char kPlaylistEntryMarker[] = "#EXTINF";

      int32_t CountPlaylistEntries(const std::string &playlist)
      {
        int32_t count = 0;
        size_t pos = playlist.find(kPlaylistEntryMarker);
        while (pos != std::string::npos)
        {
          ++count;
          pos = playlist.find(kPlaylistEntryMarker, pos + 1);
        }
        return count;
      }

      runtime::PortalSpec ToPortalSpec(const PortalDefinition &definition)
      {
        runtime::PortalSpec spec;
        spec.name = definition.name();
        spec.url = definition.url();
        spec.proxy = definition.proxy();
        spec.macs.assign(definition.macs().begin(), definition.macs().end());
        spec.streams_per_mac =
            definition.has_streams_per_mac() ? definition.streams_per_mac() : 1;
        spec.epg_offset_hours = definition.epg_offset_hours();
        spec.enabled = definition.has_enabled() ? definition.enabled() : true;
        return spec;
      }

      void FillPortalChange(const runtime::PortalChangeResult &result,
                            PortalChangeResponse *response)
      {
        response->set_success(result.success);
        response->set_message(result.message);
        response->set_portal_id(result.portal_id);
        for (const auto &mac : result.working_macs)
        {
          response->add_working_macs(mac);
        }
        for (const auto &mac : result.dead_macs)
        {
          response->add_dead_macs(mac);
        }
      }

      grpc::Status ValidateDefinition(const PortalDefinition &definition)
      {
        if (definition.name().empty() || definition.url().empty())
        {
          return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT,
                              "Portal name and url are required");
        }
        if (definition.macs_size() == 0)
        {
          return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT,
                              "At least one MAC is required");
        }
        return grpc::Status::OK;
      }
    } // namespace

    GatewayControlImpl::GatewayControlImpl(config::ConfigStore &store,
                                           cache::ArtifactCache &cache,
                                           runtime::OccupancyTable &occupancy,
                                           runtime::MacPool &mac_pool,
                                           runtime::PortalRegistry &registry,
                                           std::string advertised_host)
        : store_(store),
          cache_(cache),
          occupancy_(occupancy),
          mac_pool_(mac_pool),
          registry_(registry),
          advertised_host_(std::move(advertised_host))
    {
      Logger::Info(std::string("[GatewayControlImpl] Service initialized (API version: ") +
                   kApiVersion + ")");
    }

    GatewayControlImpl::~GatewayControlImpl()
    {
      Logger::Info("[GatewayControlImpl] Service shutting down");
    }

    grpc::Status GatewayControlImpl::RefreshLineup(grpc::ServerContext *context,
                                                   const RefreshLineupRequest *request,
                                                   RefreshLineupResponse *response)
    {
      Logger::Info("[RefreshLineup] Request received");

      const auto lineup = cache_.RefreshLineup();
      response->set_success(true);
      response->set_message("Lineup refreshed successfully");
      response->set_channel_count(static_cast<int32_t>(lineup.size()));
      return grpc::Status::OK;
    }

    grpc::Status GatewayControlImpl::RefreshEpg(grpc::ServerContext *context,
                                                const RefreshEpgRequest *request,
                                                RefreshEpgResponse *response)
    {
      Logger::Info("[RefreshEpg] Request received");

      const std::string document = cache_.RefreshXmltv();
      if (document.empty())
      {
        response->set_success(false);
        response->set_message("Guide could not be serialized");
        return grpc::Status(grpc::StatusCode::INTERNAL, "XMLTV generation failed");
      }

      response->set_success(true);
      response->set_message("EPG refreshed successfully");
      response->set_document_bytes(static_cast<int64_t>(document.size()));
      return grpc::Status::OK;
    }

    grpc::Status GatewayControlImpl::RegeneratePlaylist(grpc::ServerContext *context,
                                                        const RegeneratePlaylistRequest *request,
                                                        RegeneratePlaylistResponse *response)
    {
      const std::string host = request->host().empty() ? advertised_host_ : request->host();
      Logger::Info("[RegeneratePlaylist] Request received: host=" + host);

      const std::string playlist = cache_.RegeneratePlaylist(host);
      response->set_success(true);
      response->set_message("Playlist updated successfully");
      response->set_entry_count(CountPlaylistEntries(playlist));
      return grpc::Status::OK;
    }

    grpc::Status GatewayControlImpl::ListSessions(grpc::ServerContext *context,
                                                  const ListSessionsRequest *request,
                                                  ListSessionsResponse *response)
    {
      const std::string &filter = request->portal_id();

      for (const auto &[portal_id, sessions] : occupancy_.Snapshot())
      {
        if (!filter.empty() && portal_id != filter)
        {
          continue;
        }
        for (const auto &session : sessions)
        {
          Session *out = response->add_sessions();
          out->set_session_id(session.session_id);
          out->set_portal_id(session.portal_id);
          out->set_portal_name(session.portal_name);
          out->set_mac(session.mac);
          out->set_channel_id(session.channel_id);
          out->set_channel_name(session.channel_name);
          out->set_client(session.client);
          out->set_start_time_utc_s(session.start_utc_s);
        }
      }
      return grpc::Status::OK;
    }

    grpc::Status GatewayControlImpl::RotateMac(grpc::ServerContext *context,
                                               const RotateMacRequest *request,
                                               RotateMacResponse *response)
    {
      const std::string &portal_id = request->portal_id();
      const std::string &mac = request->mac();
      Logger::Info("[RotateMac] Request received: portal_id=" + portal_id + ", mac=" + mac);

      const auto order = mac_pool_.RotationOrder(portal_id);
      if (order.empty())
      {
        response->set_success(false);
        response->set_message("Portal not found");
        return grpc::Status(grpc::StatusCode::NOT_FOUND, "Portal does not exist");
      }
      const bool known = std::any_of(order.begin(), order.end(),
                                     [&](const config::MacEntry &entry)
                                     { return entry.mac == mac; });
      if (!known)
      {
        response->set_success(false);
        response->set_message("MAC not found");
        return grpc::Status(grpc::StatusCode::NOT_FOUND, "MAC is not configured for portal");
      }

      if (!mac_pool_.Rotate(portal_id, mac, runtime::RotationReason::kOperatorRequest))
      {
        response->set_success(false);
        response->set_message("Rotation failed");
        return grpc::Status(grpc::StatusCode::INTERNAL, "MAC order could not be saved");
      }

      for (const auto &entry : mac_pool_.RotationOrder(portal_id))
      {
        response->add_mac_order(entry.mac);
      }
      response->set_success(true);
      response->set_message("MAC rotated");
      return grpc::Status::OK;
    }

    grpc::Status GatewayControlImpl::AddPortal(grpc::ServerContext *context,
                                               const AddPortalRequest *request,
                                               PortalChangeResponse *response)
    {
      Logger::Info("[AddPortal] Request received: name=" + request->portal().name());

      grpc::Status valid = ValidateDefinition(request->portal());
      if (!valid.ok())
      {
        response->set_success(false);
        response->set_message(valid.error_message());
        return valid;
      }

      const auto result = registry_.AddPortal(ToPortalSpec(request->portal()));
      FillPortalChange(result, response);
      if (!result.success)
      {
        return grpc::Status(grpc::StatusCode::FAILED_PRECONDITION, result.message);
      }
      return grpc::Status::OK;
    }

    grpc::Status GatewayControlImpl::UpdatePortal(grpc::ServerContext *context,
                                                  const UpdatePortalRequest *request,
                                                  PortalChangeResponse *response)
    {
      const std::string &portal_id = request->portal_id();
      Logger::Info("[UpdatePortal] Request received: portal_id=" + portal_id);

      if (!store_.GetPortal(portal_id))
      {
        response->set_success(false);
        response->set_message("Portal not found");
        return grpc::Status(grpc::StatusCode::NOT_FOUND, "Portal does not exist");
      }

      grpc::Status valid = ValidateDefinition(request->portal());
      if (!valid.ok())
      {
        response->set_success(false);
        response->set_message(valid.error_message());
        return valid;
      }

      const auto result =
          registry_.UpdatePortal(portal_id, ToPortalSpec(request->portal()), request->retest());
      FillPortalChange(result, response);
      if (!result.success)
      {
        return grpc::Status(grpc::StatusCode::FAILED_PRECONDITION, result.message);
      }
      return grpc::Status::OK;
    }

    grpc::Status GatewayControlImpl::RemovePortal(grpc::ServerContext *context,
                                                  const RemovePortalRequest *request,
                                                  RemovePortalResponse *response)
    {
      const std::string &portal_id = request->portal_id();
      Logger::Info("[RemovePortal] Request received: portal_id=" + portal_id);

      if (!registry_.RemovePortal(portal_id))
      {
        response->set_success(false);
        response->set_message("Portal not found");
        return grpc::Status(grpc::StatusCode::NOT_FOUND, "Portal does not exist");
      }

      response->set_success(true);
      response->set_message("Portal removed");
      return grpc::Status::OK;
    }

    grpc::Status GatewayControlImpl::GetVersion(grpc::ServerContext *context,
                                                const ApiVersionRequest *request,
                                                ApiVersion *response)
    {
      Logger::Debug("[GetVersion] Request received");
      response->set_version(kApiVersion);
      return grpc::Status::OK;
    }

  } // namespace control
} // namespace macreplay
