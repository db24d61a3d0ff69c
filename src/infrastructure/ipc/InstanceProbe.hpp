#pragma once

#include "core/services/ILocalPlatform.hpp"
#include "core/types/InstanceRole.hpp"
#include "core/types/RendezvousEndpoint.hpp"
#include "infrastructure/ipc/RelayConnection.hpp"

#include <chrono>
#include <memory>

namespace linkrelay::infra {

/**
 * @brief Result of probing a rendezvous endpoint.
 */
struct ProbeOutcome {
    core::ProbeResult result{core::ProbeResult::Absent}; ///< Classification
    std::unique_ptr<RelayConnection> connection; ///< Open connection to the leader when Alive
};

/**
 * @brief Determines whether a leader is listening on an endpoint.
 *
 * A successful connect means a live leader. A refused connect on an existing
 * socket file means the previous leader died without cleanup; the stale file
 * is removed so that a new leader can bind. A missing file means no leader.
 * Every other failure is raised instead of being mistaken for "no leader".
 */
class InstanceProbe {
public:
    InstanceProbe(const core::ILocalPlatform& platform, std::chrono::milliseconds connectTimeout);

    /**
     * @brief Probes the endpoint.
     * @param endpoint Endpoint to probe.
     * @return The classification, with the open connection when Alive.
     * @throws core::InstanceError (Environment) on unexpected failures.
     */
    ProbeOutcome probe(const core::RendezvousEndpoint& endpoint) const;

private:
    void removeStaleArtifact(const core::RendezvousEndpoint& endpoint) const;

    const core::ILocalPlatform& platform_;
    std::chrono::milliseconds connectTimeout_;
};

} // namespace linkrelay::infra
