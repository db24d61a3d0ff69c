#pragma once

#include "core/services/ILocalPlatform.hpp"
#include "core/types/RendezvousEndpoint.hpp"

#include <filesystem>
#include <string>

namespace linkrelay::infra {

/**
 * @brief Computes the rendezvous endpoint shared by all launches of an application.
 *
 * Pure composition of paths: the same inputs always produce the same
 * endpoint and nothing is created on disk.
 */
class EndpointResolver {
public:
    /// Suffix marking a file as this subsystem's socket artifact.
    static constexpr const char* kSocketSuffix = ".sock";

    explicit EndpointResolver(const core::ILocalPlatform& platform);

    /**
     * @brief Resolves the endpoint for an application binary.
     * @param binaryName Executable name or path; only its base name is used.
     * @param directory Override directory; empty selects the platform runtime directory.
     * @param fileName Override socket file name; empty uses the binary name.
     * @return The resolved endpoint.
     * @throws core::InstanceError (Environment) if no usable address can be formed.
     */
    core::RendezvousEndpoint resolve(const std::string& binaryName,
                                     const std::filesystem::path& directory = {},
                                     const std::string& fileName = {}) const;

private:
    const core::ILocalPlatform& platform_;
};

} // namespace linkrelay::infra
