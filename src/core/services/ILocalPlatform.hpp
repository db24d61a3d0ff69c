/**
 * @file ILocalPlatform.hpp
 * @brief Platform capabilities needed by single-instance coordination.
 *
 * Endpoint resolution, probing and role decision are written once against
 * this interface. Adapters supply the handful of platform-specific answers:
 * where per-user runtime files live, how long a local address may be, and how
 * connection and bind failures are classified.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <system_error>

namespace linkrelay::core {

/**
 * @brief Classification of a failed connect to a local endpoint.
 */
enum class ConnectFailure {
    DeadPeer,       ///< The address exists but nobody is listening
    NoSuchEndpoint, ///< The address does not exist
    Other           ///< Anything else; never interpreted as "no leader"
};

/**
 * @brief Directory in which rendezvous artifacts are created.
 */
struct RuntimeDirectory {
    std::filesystem::path path; ///< Directory path
    bool sharedWithOtherUsers{false}; ///< True for a system-wide temp directory
};

/**
 * @brief Identifies one concrete file, independent of its path.
 */
struct ArtifactIdentity {
    std::uint64_t device{0};
    std::uint64_t inode{0};
    std::int64_t changedNs{0}; ///< Status change time; tells apart a reused inode

    bool operator==(const ArtifactIdentity&) const = default;
};

/**
 * @brief Exclusive claim on an endpoint, released on destruction.
 */
class IClaimLock {
public:
    virtual ~IClaimLock() = default;
};

/**
 * @brief Narrow platform capability interface for local rendezvous.
 */
class ILocalPlatform {
public:
    virtual ~ILocalPlatform() = default;

    /**
     * @brief Locates the directory for runtime artifacts of this user.
     * @return The directory, or nullopt if none can be determined.
     */
    virtual std::optional<RuntimeDirectory> runtimeDirectory() const = 0;

    /**
     * @brief Returns a tag distinguishing this user inside a shared directory.
     */
    virtual std::string userTag() const = 0;

    /**
     * @brief Maximum length in bytes of a local socket address.
     */
    virtual std::size_t maxAddressLength() const = 0;

    /**
     * @brief Classifies the error of a failed connect attempt.
     * @param ec Error returned by the connect attempt.
     * @return The failure class.
     */
    virtual ConnectFailure classifyConnectError(const std::error_code& ec) const = 0;

    /**
     * @brief Checks whether a bind failure means the address is already taken.
     * @param ec Error returned by bind.
     */
    virtual bool isAddressInUse(const std::error_code& ec) const = 0;

    /**
     * @brief Checks whether a path refers to a local socket artifact.
     * @param path Path to inspect.
     */
    virtual bool isSocketArtifact(const std::filesystem::path& path) const = 0;

    /**
     * @brief Removes a rendezvous artifact.
     *
     * A missing artifact counts as successfully removed, so concurrent
     * cleanups of the same artifact all succeed.
     *
     * @param path Artifact to remove.
     * @param ec Set on failure.
     * @return True if the artifact no longer exists.
     */
    virtual bool removeArtifact(const std::filesystem::path& path, std::error_code& ec) const = 0;

    /**
     * @brief Identifies the file currently at a path.
     * @return The identity, or nullopt if nothing exists there.
     */
    virtual std::optional<ArtifactIdentity> artifactIdentity(
        const std::filesystem::path& path) const = 0;

    /**
     * @brief Blocks until the exclusive claim lock for an endpoint is held.
     * @param lockPath Lock file belonging to the endpoint.
     * @return The held lock.
     * @throws InstanceError if the lock file cannot be opened or locked.
     */
    virtual std::unique_ptr<IClaimLock> acquireClaimLock(const std::filesystem::path& lockPath) const = 0;
};

} // namespace linkrelay::core
