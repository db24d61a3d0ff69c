#include "infrastructure/ipc/InstanceProbe.hpp"

#include "core/types/InstanceError.hpp"

#include <spdlog/spdlog.h>

namespace linkrelay::infra {

InstanceProbe::InstanceProbe(const core::ILocalPlatform& platform,
                             std::chrono::milliseconds connectTimeout)
    : platform_(platform), connectTimeout_(connectTimeout) {}

ProbeOutcome InstanceProbe::probe(const core::RendezvousEndpoint& endpoint) const {
    ProbeOutcome outcome;
    auto connection = std::make_unique<RelayConnection>();

    auto ec = connection->connect(endpoint, connectTimeout_);
    if (!ec) {
        spdlog::debug("Probe of {}: leader is alive", endpoint.toString());
        outcome.result = core::ProbeResult::Alive;
        outcome.connection = std::move(connection);
        return outcome;
    }

    switch (platform_.classifyConnectError(ec)) {
    case core::ConnectFailure::DeadPeer:
        spdlog::info("Found stale rendezvous artifact {}", endpoint.toString());
        removeStaleArtifact(endpoint);
        outcome.result = core::ProbeResult::Stale;
        return outcome;
    case core::ConnectFailure::NoSuchEndpoint:
        spdlog::debug("Probe of {}: no endpoint", endpoint.toString());
        outcome.result = core::ProbeResult::Absent;
        return outcome;
    case core::ConnectFailure::Other:
    default:
        throw core::InstanceError(core::InstanceErrorKind::Environment,
                                  "Cannot probe " + endpoint.toString() + ": " + ec.message());
    }
}

void InstanceProbe::removeStaleArtifact(const core::RendezvousEndpoint& endpoint) const {
    std::error_code ec;
    if (std::filesystem::exists(std::filesystem::symlink_status(endpoint.socketPath, ec)) &&
        !platform_.isSocketArtifact(endpoint.socketPath)) {
        // Never delete a file this subsystem did not create
        throw core::InstanceError(core::InstanceErrorKind::Environment,
                                  endpoint.toString() + " exists and is not a socket");
    }

    if (!platform_.removeArtifact(endpoint.socketPath, ec)) {
        throw core::InstanceError(core::InstanceErrorKind::Environment,
                                  "Cannot remove stale artifact " + endpoint.toString() + ": " +
                                      ec.message());
    }
    spdlog::debug("Removed stale artifact {}", endpoint.toString());
}

} // namespace linkrelay::infra
