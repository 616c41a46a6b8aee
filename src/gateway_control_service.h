// Repository: MacReplay-gateway
// Component: GatewayControl gRPC Service Implementation
// Purpose: Implements the GatewayControl service for operator maintenance of the gateway.
// Copyright (c) 2025 MacReplay

#ifndef MACREPLAY_GATEWAY_CONTROL_SERVICE_H_
#define MACREPLAY_GATEWAY_CONTROL_SERVICE_H_

#include <memory>
#include <string>

#include <grpcpp/grpcpp.h>

#include "macreplay/gateway_control.grpc.pb.h"
#include "macreplay/cache/ArtifactCache.h"
#include "macreplay/config/ConfigStore.h"
#include "macreplay/runtime/MacPool.h"
#include "macreplay/runtime/OccupancyTable.h"
#include "macreplay/runtime/PortalRegistry.h"

namespace macreplay {
namespace control {

// GatewayControlImpl implements the gRPC service defined in gateway_control.proto.
// Every RPC delegates to the same components the HTTP endpoints use.
class GatewayControlImpl final : public GatewayControl::Service {
 public:
  GatewayControlImpl(config::ConfigStore& store, cache::ArtifactCache& cache,
                     runtime::OccupancyTable& occupancy, runtime::MacPool& mac_pool,
                     runtime::PortalRegistry& registry, std::string advertised_host);
  ~GatewayControlImpl() override;

  // Disable copy and move
  GatewayControlImpl(const GatewayControlImpl&) = delete;
  GatewayControlImpl& operator=(const GatewayControlImpl&) = delete;

  // RPC implementations
  grpc::Status RefreshLineup(grpc::ServerContext* context,
                             const RefreshLineupRequest* request,
                             RefreshLineupResponse* response) override;

  grpc::Status RefreshEpg(grpc::ServerContext* context,
                          const RefreshEpgRequest* request,
                          RefreshEpgResponse* response) override;

  grpc::Status RegeneratePlaylist(grpc::ServerContext* context,
                                  const RegeneratePlaylistRequest* request,
                                  RegeneratePlaylistResponse* response) override;

  grpc::Status ListSessions(grpc::ServerContext* context,
                            const ListSessionsRequest* request,
                            ListSessionsResponse* response) override;

  grpc::Status RotateMac(grpc::ServerContext* context,
                         const RotateMacRequest* request,
                         RotateMacResponse* response) override;

  grpc::Status AddPortal(grpc::ServerContext* context,
                         const AddPortalRequest* request,
                         PortalChangeResponse* response) override;

  grpc::Status UpdatePortal(grpc::ServerContext* context,
                            const UpdatePortalRequest* request,
                            PortalChangeResponse* response) override;

  grpc::Status RemovePortal(grpc::ServerContext* context,
                            const RemovePortalRequest* request,
                            RemovePortalResponse* response) override;

  grpc::Status GetVersion(grpc::ServerContext* context,
                          const ApiVersionRequest* request,
                          ApiVersion* response) override;

 private:
  config::ConfigStore& store_;
  cache::ArtifactCache& cache_;
  runtime::OccupancyTable& occupancy_;
  runtime::MacPool& mac_pool_;
  runtime::PortalRegistry& registry_;
  const std::string advertised_host_;
};

}  // namespace control
}  // namespace macreplay

#endif  // MACREPLAY_GATEWAY_CONTROL_SERVICE_H_
