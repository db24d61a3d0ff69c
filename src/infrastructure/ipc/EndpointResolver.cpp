#include "infrastructure/ipc/EndpointResolver.hpp"

#include "core/types/InstanceError.hpp"

#include <spdlog/spdlog.h>

namespace linkrelay::infra {

namespace {

bool endsWith(const std::string& value, const std::string& suffix) {
    return value.size() >= suffix.size() &&
           value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

EndpointResolver::EndpointResolver(const core::ILocalPlatform& platform) : platform_(platform) {}

core::RendezvousEndpoint EndpointResolver::resolve(const std::string& binaryName,
                                                   const std::filesystem::path& directory,
                                                   const std::string& fileName) const {
    auto baseName = std::filesystem::path(binaryName).filename().string();
    std::string name = fileName.empty() ? baseName : fileName;
    if (name.empty()) {
        throw core::InstanceError(core::InstanceErrorKind::Environment,
                                  "Cannot derive a rendezvous name from an empty binary name");
    }

    std::filesystem::path socketDir = directory;
    if (socketDir.empty()) {
        auto runtimeDir = platform_.runtimeDirectory();
        if (!runtimeDir) {
            throw core::InstanceError(core::InstanceErrorKind::Environment,
                                      "No runtime or temporary directory available");
        }
        socketDir = runtimeDir->path;
        if (runtimeDir->sharedWithOtherUsers) {
            // Keep users of a shared temp directory apart
            std::string stem = endsWith(name, kSocketSuffix)
                                   ? name.substr(0, name.size() - std::string(kSocketSuffix).size())
                                   : name;
            name = stem + "-" + platform_.userTag();
        }
    }

    if (!endsWith(name, kSocketSuffix)) {
        name += kSocketSuffix;
    }

    core::RendezvousEndpoint endpoint{socketDir / name};
    if (endpoint.socketPath.string().size() > platform_.maxAddressLength()) {
        throw core::InstanceError(core::InstanceErrorKind::Environment,
                                  "Rendezvous path too long for a local socket: " +
                                      endpoint.toString());
    }

    spdlog::debug("Resolved rendezvous endpoint {}", endpoint.toString());
    return endpoint;
}

} // namespace linkrelay::infra
