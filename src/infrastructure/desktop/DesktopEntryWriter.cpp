#include "infrastructure/desktop/DesktopEntryWriter.hpp"

#include <spdlog/spdlog.h>

#include <cstring>
#include <fstream>
#include <sstream>
#include <thread>
#include <vector>

#include <spawn.h>
#include <sys/wait.h>

extern char** environ;

namespace linkrelay::infra {

namespace fs = std::filesystem;

namespace {

constexpr const char* kEntrySuffix = ".desktop";

fs::path orDefault(const std::string& configured, const fs::path& fallback) {
    return configured.empty() ? fallback : fs::path(configured);
}

bool endsWith(const std::string& value, const std::string& suffix) {
    return value.size() >= suffix.size() &&
           value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

DesktopEntryWriter::DesktopEntryWriter(DesktopEntryConfig config, std::string binaryName,
                                       fs::path homeDirectory, fs::path executablePath)
    : config_(std::move(config)), binaryName_(std::move(binaryName)),
      executablePath_(std::move(executablePath)) {
    auto dataHome = homeDirectory / ".local" / "share";
    auto appData = orDefault(config_.appDataDirectory, dataHome / binaryName_);

    entryDirectory_ = orDefault(config_.entryDirectory, dataHome / "applications");
    binDirectory_ = orDefault(config_.binDirectory, appData / "bin");
    iconsDirectory_ = orDefault(config_.iconsDirectory, appData / "icons");

    entryFileName_ = config_.entryFileName.empty() ? binaryName_ : config_.entryFileName;
    if (!endsWith(entryFileName_, kEntrySuffix)) {
        entryFileName_ += kEntrySuffix;
    }

    if (config_.version.empty()) {
        config_.version = "1.0.0";
    }
    if (config_.displayName.empty()) {
        config_.displayName = binaryName_;
    }

    installedBinary_ = executablePath_;
    if (!config_.iconPath.empty()) {
        installedIcon_ = config_.iconPath;
    }
}

bool DesktopEntryWriter::install() {
    if (!isEnabled()) {
        spdlog::debug("No URL scheme configured, skipping desktop entry");
        return true;
    }

    if (!createDirectory(entryDirectory_) || !createDirectory(binDirectory_) ||
        !createDirectory(iconsDirectory_)) {
        return false;
    }

    if (!installIcon()) {
        return false;
    }

    if (config_.installBinary && !installBinary()) {
        return false;
    }

    auto path = entryPath();
    std::ofstream file(path, std::ios::trunc);
    if (!file) {
        spdlog::error("Failed to open desktop entry for writing: {}", path.string());
        return false;
    }

    file << renderEntry();
    file.close();
    if (!file) {
        spdlog::error("Failed to write desktop entry: {}", path.string());
        return false;
    }

    spdlog::info("Registered {} in {}", config_.mimeType, path.string());
    refreshDatabase();
    return true;
}

std::string DesktopEntryWriter::renderEntry() const {
    std::ostringstream out;
    out << "[Desktop Entry]\n"
        << "Version=" << config_.version << "\n"
        << "Type=Application\n"
        << "Name=" << config_.displayName << "\n"
        << "Exec=" << installedBinary_.string() << " %U\n"
        << "Icon=" << installedIcon_.string() << "\n"
        << "MimeType=" << config_.mimeType << "\n"
        << "StartupNotify=true\n"
        << "Terminal=false\n"
        << "SingleMainWindow=true\n";
    return out.str();
}

bool DesktopEntryWriter::createDirectory(const fs::path& dir) const {
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        spdlog::error("Failed to create directory {}: {}", dir.string(), ec.message());
        return false;
    }
    return true;
}

bool DesktopEntryWriter::installIcon() {
    if (config_.iconPath.empty()) {
        return true;
    }

    fs::path source(config_.iconPath);
    auto target = iconsDirectory_ / source.filename();

    std::error_code ec;
    fs::copy_file(source, target, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        spdlog::error("Failed to copy icon {} to {}: {}", source.string(), target.string(),
                      ec.message());
        return false;
    }

    installedIcon_ = target;
    return true;
}

bool DesktopEntryWriter::installBinary() {
    auto target = binDirectory_ / executablePath_.filename();

    std::error_code ec;
    if (fs::exists(target, ec) && fs::equivalent(executablePath_, target, ec)) {
        // Already running the installed copy
        installedBinary_ = target;
        return true;
    }

    ec.clear();
    fs::copy_file(executablePath_, target, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        spdlog::error("Failed to install {} to {}: {}", executablePath_.string(),
                      target.string(), ec.message());
        return false;
    }

    fs::permissions(target,
                    fs::perms::owner_exec | fs::perms::group_exec | fs::perms::others_exec,
                    fs::perm_options::add, ec);
    if (ec) {
        spdlog::warn("Cannot mark {} executable: {}", target.string(), ec.message());
    }

    installedBinary_ = target;
    return true;
}

void DesktopEntryWriter::refreshDatabase() const {
    if (config_.databaseUpdateCommand.empty()) {
        return;
    }

    std::string command = config_.databaseUpdateCommand;
    std::string directory = entryDirectory_.string();
    std::vector<char*> argv{command.data(), directory.data(), nullptr};

    pid_t pid = 0;
    int rc = posix_spawnp(&pid, command.c_str(), nullptr, nullptr, argv.data(), environ);
    if (rc != 0) {
        spdlog::warn("Cannot start {} for {}: {}", command, directory, std::strerror(rc));
        return;
    }

    spdlog::debug("Started {} (pid {}) for {}", command, pid, directory);

    // Reap the child without holding up startup
    std::thread([pid, command]() {
        int status = 0;
        if (waitpid(pid, &status, 0) == pid && !(WIFEXITED(status) && WEXITSTATUS(status) == 0)) {
            spdlog::warn("{} did not complete successfully", command);
        }
    }).detach();
}

} // namespace linkrelay::infra
