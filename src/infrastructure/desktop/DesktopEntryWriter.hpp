#pragma once

#include "infrastructure/config/ConfigManager.hpp"

#include <filesystem>
#include <string>

namespace linkrelay::infra {

/**
 * @brief Installs a freedesktop.org launcher entry registering the URL scheme handler.
 *
 * Unset paths in the configuration fall back to the XDG defaults below
 * <home>/.local/share. Nothing is written unless a MIME type is configured.
 */
class DesktopEntryWriter {
public:
    /**
     * @brief Constructs a writer and resolves all default paths.
     * @param config Desktop entry settings.
     * @param binaryName Application binary name.
     * @param homeDirectory User home directory.
     * @param executablePath Path of the running executable.
     */
    DesktopEntryWriter(DesktopEntryConfig config, std::string binaryName,
                       std::filesystem::path homeDirectory, std::filesystem::path executablePath);

    bool isEnabled() const { return !config_.mimeType.empty(); }

    /**
     * @brief Creates the directories, copies the binary and icon, writes the entry.
     *
     * Afterwards starts the configured database update command on the entry
     * directory without waiting for it. Failing to start it is only logged.
     * @return True on success or when disabled; false if any step failed.
     */
    bool install();

    /**
     * @brief Renders the entry file for the current installed paths.
     */
    std::string renderEntry() const;

    std::filesystem::path entryPath() const { return entryDirectory_ / entryFileName_; }
    const std::filesystem::path& installedBinaryPath() const { return installedBinary_; }
    const std::filesystem::path& installedIconPath() const { return installedIcon_; }

private:
    bool createDirectory(const std::filesystem::path& dir) const;
    bool installIcon();
    bool installBinary();
    void refreshDatabase() const;

    DesktopEntryConfig config_;
    std::string binaryName_;
    std::filesystem::path executablePath_;

    std::filesystem::path entryDirectory_;
    std::string entryFileName_;
    std::filesystem::path binDirectory_;
    std::filesystem::path iconsDirectory_;
    std::filesystem::path installedBinary_;
    std::filesystem::path installedIcon_;
};

} // namespace linkrelay::infra
