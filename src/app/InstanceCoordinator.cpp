#include "app/InstanceCoordinator.hpp"

#include "core/types/InstanceError.hpp"
#include "infrastructure/ipc/EndpointResolver.hpp"
#include "infrastructure/ipc/PayloadCodec.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace linkrelay::app {

namespace {

infra::ServerLimits limitsFrom(const infra::InstanceConfig& config) {
    infra::ServerLimits limits;
    limits.readTimeout = std::chrono::milliseconds(std::max(config.readTimeoutMs, 0));
    limits.maxPayloadBytes = config.maxPayloadBytes;
    return limits;
}

core::RendezvousEndpoint resolveEndpoint(const infra::InstanceConfig& config,
                                         const core::ILocalPlatform& platform) {
    infra::EndpointResolver resolver(platform);
    return resolver.resolve(config.binaryName, config.socketDirectory, config.socketFileName);
}

} // namespace

InstanceCoordinator::InstanceCoordinator(infra::InstanceConfig config,
                                         infra::AsioContext& context,
                                         std::shared_ptr<core::ILocalPlatform> platform)
    : config_(std::move(config)), context_(context), platform_(std::move(platform)),
      endpoint_(resolveEndpoint(config_, *platform_)),
      probe_(*platform_, std::chrono::milliseconds(config_.connectTimeoutMs)) {
    dispatcher_ = std::make_shared<infra::EventDispatcher>(context_);
    server_ = std::make_shared<infra::ConnectionServer>(context_, dispatcher_, limitsFrom(config_));
    shutdown_ = std::make_unique<infra::ShutdownCoordinator>(context_, server_, *platform_);

    spdlog::debug("Rendezvous endpoint: {}", endpoint_.toString());
}

InstanceCoordinator::~InstanceCoordinator() {
    shutdown();
}

core::InstanceRole InstanceCoordinator::decide(const std::vector<std::string>& args) {
    std::lock_guard lock(mutex_);
    if (role_) {
        return *role_;
    }

    // Serialises probe, stale cleanup and bind against other launches
    auto claim = platform_->acquireClaimLock(endpoint_.lockPath());

    for (int attempt = 0; attempt < 2; ++attempt) {
        auto outcome = probe_.probe(endpoint_);
        spdlog::debug("Probe of {}: {}", endpoint_.toString(),
                      core::probeResultToString(outcome.result));

        if (outcome.result == core::ProbeResult::Alive) {
            relay(*outcome.connection, args);
            role_ = core::InstanceRole::Follower;
            spdlog::info("Another instance is running; relayed {} argument(s)", args.size());
            return *role_;
        }

        auto ec = server_->bind(endpoint_);
        if (!ec) {
            shutdown_->recordBoundArtifact();
            role_ = core::InstanceRole::Leader;
            spdlog::info("Acting as primary instance on {}", endpoint_.toString());
            return *role_;
        }

        if (attempt == 0 && platform_->isAddressInUse(ec)) {
            spdlog::warn("Endpoint {} was claimed concurrently, probing again",
                         endpoint_.toString());
            continue;
        }

        throw core::InstanceError(core::InstanceErrorKind::Environment,
                                  "Cannot listen on " + endpoint_.toString() + ": " +
                                      ec.message());
    }

    throw core::InstanceError(core::InstanceErrorKind::Environment,
                              "Endpoint " + endpoint_.toString() +
                                  " is in use but no instance answers");
}

void InstanceCoordinator::relay(infra::RelayConnection& connection,
                                const std::vector<std::string>& args) {
    auto payload = infra::PayloadCodec::encode(args);
    auto ec = connection.sendAndClose(payload);
    if (ec) {
        throw core::InstanceError(core::InstanceErrorKind::Transmission,
                                  "Failed to relay arguments to " + endpoint_.toString() + ": " +
                                      ec.message());
    }
}

std::optional<core::InstanceRole> InstanceCoordinator::role() const {
    std::lock_guard lock(mutex_);
    return role_;
}

void InstanceCoordinator::setEventSink(std::weak_ptr<core::IEventSink> sink) {
    dispatcher_->setSink(std::move(sink));
}

void InstanceCoordinator::startServing(infra::ShutdownCoordinator::ShutdownCallback onShutdown) {
    if (role() != core::InstanceRole::Leader) {
        spdlog::error("Only the primary instance can serve relayed links");
        return;
    }

    if (!context_.isRunning()) {
        spdlog::warn("I/O context is not running; relayed links will wait");
    }

    server_->start();
    shutdown_->watchSignals(std::move(onShutdown));
}

size_t InstanceCoordinator::dispatchLaunchArguments(const std::vector<std::string>& args) {
    if (role() != core::InstanceRole::Leader) {
        return 0;
    }
    return server_->dispatchArguments(args, core::LinkOrigin::LaunchArguments);
}

bool InstanceCoordinator::shutdown() {
    if (role() != core::InstanceRole::Leader) {
        return false;
    }
    return shutdown_->shutdown();
}

} // namespace linkrelay::app
