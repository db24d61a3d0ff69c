#pragma once

#include "core/services/ILocalPlatform.hpp"

namespace linkrelay::infra {

/**
 * @brief ILocalPlatform adapter for Linux and the BSDs.
 *
 * Runtime artifacts go to $XDG_RUNTIME_DIR when it exists, otherwise to the
 * system temporary directory. A refused connection means a dead peer on a
 * leftover socket file; a missing file means no endpoint. The claim lock is
 * an flock(2) on the endpoint's lock file.
 */
class UnixLocalPlatform : public core::ILocalPlatform {
public:
    std::optional<core::RuntimeDirectory> runtimeDirectory() const override;
    std::string userTag() const override;
    std::size_t maxAddressLength() const override;
    core::ConnectFailure classifyConnectError(const std::error_code& ec) const override;
    bool isAddressInUse(const std::error_code& ec) const override;
    bool isSocketArtifact(const std::filesystem::path& path) const override;
    bool removeArtifact(const std::filesystem::path& path, std::error_code& ec) const override;
    std::optional<core::ArtifactIdentity> artifactIdentity(
        const std::filesystem::path& path) const override;
    std::unique_ptr<core::IClaimLock> acquireClaimLock(
        const std::filesystem::path& lockPath) const override;
};

} // namespace linkrelay::infra
