#pragma once

#include <cstddef>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>

namespace linkrelay::infra {

/**
 * @brief Settings of single-instance coordination and the relay server.
 */
struct InstanceConfig {
    std::string binaryName;       ///< Application identity; empty uses argv[0].
    std::string socketDirectory;  ///< Rendezvous directory; empty uses the runtime dir.
    std::string socketFileName;   ///< Socket file name; empty uses the binary name.
    int connectTimeoutMs{500};    ///< Probe connect timeout in milliseconds.
    int readTimeoutMs{5000};      ///< Per-connection read timeout; 0 disables it.
    size_t maxPayloadBytes{65536}; ///< Largest accepted relay payload.
    int workerThreads{2};         ///< I/O worker threads of the leader.
};

/**
 * @brief Settings of the launcher entry registering the URL scheme handler.
 *
 * Empty paths select the XDG defaults under ~/.local/share.
 */
struct DesktopEntryConfig {
    std::string mimeType;          ///< e.g. "x-scheme-handler/myapp"; empty disables the entry.
    std::string entryDirectory;    ///< Directory of the .desktop file.
    std::string entryFileName;     ///< File name of the .desktop file.
    std::string appDataDirectory;  ///< Per-application data directory.
    std::string binDirectory;      ///< Where the executable is installed.
    std::string iconsDirectory;    ///< Where the icon is copied.
    std::string iconPath;          ///< Icon to install; empty for none.
    std::string version{"1.0.0"};  ///< Version= field.
    std::string displayName;       ///< Name= field; empty uses the binary name.
    bool installBinary{true};      ///< Copy the running executable into binDirectory.
    std::string databaseUpdateCommand{"update-desktop-database"}; ///< Run on the entry directory; empty skips it.
};

/**
 * @brief Application configuration settings.
 */
struct AppConfig {
    // General settings
    std::string logLevel{"info"}; ///< spdlog level name.
    bool logToFile{true};         ///< Also log to a rotating file.

    InstanceConfig instance;         ///< Single-instance coordination.
    DesktopEntryConfig desktopEntry; ///< Desktop integration.

    // Window state
    int windowX{100};            ///< Window X position.
    int windowY{100};            ///< Window Y position.
    int windowWidth{640};        ///< Window width in pixels.
    int windowHeight{420};       ///< Window height in pixels.
    bool windowMaximized{false}; ///< Window maximized state.
};

/**
 * @brief Manages application configuration persistence.
 *
 * Loads and saves the configuration as JSON. Missing sections and keys keep
 * their defaults.
 */
class ConfigManager {
public:
    /**
     * @brief Constructs a ConfigManager for the specified config directory.
     * @param configDir Path to the configuration directory (created if missing).
     */
    explicit ConfigManager(const std::filesystem::path& configDir);

    /**
     * @brief Loads configuration from disk, writing defaults on first run.
     * @return True if loaded successfully, false otherwise.
     */
    bool load();

    /**
     * @brief Saves configuration to disk.
     * @return True if saved successfully, false otherwise.
     */
    bool save();

    AppConfig& config() { return config_; }
    const AppConfig& config() const { return config_; }

    std::filesystem::path configPath() const { return configPath_; }

    /**
     * @brief Returns the path to the log file.
     * @return Path to linkrelay.log inside the config directory.
     */
    std::filesystem::path logPath() const;

    std::string configDir() const { return configDir_.string(); }

private:
    nlohmann::json toJson() const;
    void fromJson(const nlohmann::json& j);

    std::filesystem::path configDir_;
    std::filesystem::path configPath_;
    AppConfig config_;
};

} // namespace linkrelay::infra
