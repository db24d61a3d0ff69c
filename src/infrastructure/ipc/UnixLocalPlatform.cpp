#include "infrastructure/ipc/UnixLocalPlatform.hpp"

#include "core/types/InstanceError.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <sys/un.h>
#include <unistd.h>

namespace linkrelay::infra {

namespace {

class FileClaimLock : public core::IClaimLock {
public:
    explicit FileClaimLock(int fd) : fd_(fd) {}

    ~FileClaimLock() override {
        flock(fd_, LOCK_UN);
        close(fd_);
    }

    FileClaimLock(const FileClaimLock&) = delete;
    FileClaimLock& operator=(const FileClaimLock&) = delete;

private:
    int fd_;
};

} // namespace

std::optional<core::RuntimeDirectory> UnixLocalPlatform::runtimeDirectory() const {
    std::error_code ec;

    if (const char* runtimeDir = std::getenv("XDG_RUNTIME_DIR"); runtimeDir && *runtimeDir) {
        std::filesystem::path path(runtimeDir);
        if (std::filesystem::is_directory(path, ec)) {
            return core::RuntimeDirectory{path, false};
        }
        spdlog::debug("XDG_RUNTIME_DIR {} is not a directory, using temp directory", runtimeDir);
    }

    auto tempDir = std::filesystem::temp_directory_path(ec);
    if (!ec && std::filesystem::is_directory(tempDir, ec)) {
        return core::RuntimeDirectory{tempDir, true};
    }

    if (std::filesystem::is_directory("/tmp", ec)) {
        return core::RuntimeDirectory{"/tmp", true};
    }

    return std::nullopt;
}

std::string UnixLocalPlatform::userTag() const {
    return std::to_string(getuid());
}

std::size_t UnixLocalPlatform::maxAddressLength() const {
    // sun_path must keep room for the terminating NUL
    return sizeof(sockaddr_un::sun_path) - 1;
}

core::ConnectFailure UnixLocalPlatform::classifyConnectError(const std::error_code& ec) const {
    if (ec == std::errc::connection_refused) {
        return core::ConnectFailure::DeadPeer;
    }
    if (ec == std::errc::no_such_file_or_directory) {
        return core::ConnectFailure::NoSuchEndpoint;
    }
    return core::ConnectFailure::Other;
}

bool UnixLocalPlatform::isAddressInUse(const std::error_code& ec) const {
    return ec == std::errc::address_in_use;
}

bool UnixLocalPlatform::isSocketArtifact(const std::filesystem::path& path) const {
    std::error_code ec;
    return std::filesystem::is_socket(std::filesystem::symlink_status(path, ec));
}

bool UnixLocalPlatform::removeArtifact(const std::filesystem::path& path,
                                       std::error_code& ec) const {
    ec.clear();
    std::filesystem::remove(path, ec);
    if (ec == std::errc::no_such_file_or_directory) {
        ec.clear();
    }
    return !ec;
}

std::optional<core::ArtifactIdentity> UnixLocalPlatform::artifactIdentity(
    const std::filesystem::path& path) const {
    struct stat info {};
    if (lstat(path.c_str(), &info) != 0) {
        return std::nullopt;
    }
    return core::ArtifactIdentity{
        static_cast<std::uint64_t>(info.st_dev), static_cast<std::uint64_t>(info.st_ino),
        static_cast<std::int64_t>(info.st_ctim.tv_sec) * 1'000'000'000 + info.st_ctim.tv_nsec};
}

std::unique_ptr<core::IClaimLock> UnixLocalPlatform::acquireClaimLock(
    const std::filesystem::path& lockPath) const {
    int fd = open(lockPath.c_str(), O_CREAT | O_RDWR | O_CLOEXEC, 0600);
    if (fd < 0) {
        throw core::InstanceError(core::InstanceErrorKind::Environment,
                                  "Cannot open lock file " + lockPath.string() + ": " +
                                      std::strerror(errno));
    }

    int rc = 0;
    do {
        rc = flock(fd, LOCK_EX);
    } while (rc != 0 && errno == EINTR);

    if (rc != 0) {
        int error = errno;
        close(fd);
        throw core::InstanceError(core::InstanceErrorKind::Environment,
                                  "Cannot lock " + lockPath.string() + ": " + std::strerror(error));
    }

    return std::make_unique<FileClaimLock>(fd);
}

} // namespace linkrelay::infra
