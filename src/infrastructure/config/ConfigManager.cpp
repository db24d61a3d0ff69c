#include "infrastructure/config/ConfigManager.hpp"

#include <spdlog/spdlog.h>

#include <cstdint>
#include <fstream>

namespace linkrelay::infra {

ConfigManager::ConfigManager(const std::filesystem::path& configDir) : configDir_(configDir) {
    if (!std::filesystem::exists(configDir_)) {
        std::filesystem::create_directories(configDir_);
    }

    configPath_ = configDir_ / "config.json";
}

bool ConfigManager::load() {
    if (!std::filesystem::exists(configPath_)) {
        spdlog::info("Config file not found, using defaults");
        return save();
    }

    try {
        std::ifstream file(configPath_);
        if (!file) {
            spdlog::error("Failed to open config file: {}", configPath_.string());
            return false;
        }

        nlohmann::json j;
        file >> j;
        fromJson(j);

        spdlog::info("Loaded configuration from {}", configPath_.string());
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Failed to load config: {}", e.what());
        return false;
    }
}

bool ConfigManager::save() {
    try {
        auto j = toJson();

        std::ofstream file(configPath_);
        if (!file) {
            spdlog::error("Failed to open config file for writing: {}", configPath_.string());
            return false;
        }

        file << j.dump(2);
        spdlog::debug("Saved configuration to {}", configPath_.string());
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Failed to save config: {}", e.what());
        return false;
    }
}

nlohmann::json ConfigManager::toJson() const {
    nlohmann::json j;

    // General
    j["general"]["log_level"] = config_.logLevel;
    j["general"]["log_to_file"] = config_.logToFile;

    // Instance coordination
    const auto& inst = config_.instance;
    j["instance"]["binary_name"] = inst.binaryName;
    j["instance"]["socket_directory"] = inst.socketDirectory;
    j["instance"]["socket_file_name"] = inst.socketFileName;
    j["instance"]["connect_timeout_ms"] = inst.connectTimeoutMs;
    j["instance"]["read_timeout_ms"] = inst.readTimeoutMs;
    j["instance"]["max_payload_bytes"] = inst.maxPayloadBytes;
    j["instance"]["worker_threads"] = inst.workerThreads;

    // Desktop entry
    const auto& de = config_.desktopEntry;
    j["desktop_entry"]["mime_type"] = de.mimeType;
    j["desktop_entry"]["entry_directory"] = de.entryDirectory;
    j["desktop_entry"]["entry_file_name"] = de.entryFileName;
    j["desktop_entry"]["app_data_directory"] = de.appDataDirectory;
    j["desktop_entry"]["bin_directory"] = de.binDirectory;
    j["desktop_entry"]["icons_directory"] = de.iconsDirectory;
    j["desktop_entry"]["icon_path"] = de.iconPath;
    j["desktop_entry"]["version"] = de.version;
    j["desktop_entry"]["display_name"] = de.displayName;
    j["desktop_entry"]["install_binary"] = de.installBinary;
    j["desktop_entry"]["database_update_command"] = de.databaseUpdateCommand;

    // Window state
    j["window"]["x"] = config_.windowX;
    j["window"]["y"] = config_.windowY;
    j["window"]["width"] = config_.windowWidth;
    j["window"]["height"] = config_.windowHeight;
    j["window"]["maximized"] = config_.windowMaximized;

    return j;
}

void ConfigManager::fromJson(const nlohmann::json& j) {
    // General
    if (j.contains("general")) {
        const auto& g = j["general"];
        config_.logLevel = g.value("log_level", "info");
        config_.logToFile = g.value("log_to_file", true);
    }

    // Instance coordination
    if (j.contains("instance")) {
        const auto& i = j["instance"];
        auto& inst = config_.instance;
        inst.binaryName = i.value("binary_name", "");
        inst.socketDirectory = i.value("socket_directory", "");
        inst.socketFileName = i.value("socket_file_name", "");
        inst.connectTimeoutMs = i.value("connect_timeout_ms", 500);
        inst.readTimeoutMs = i.value("read_timeout_ms", 5000);
        auto maxPayload = i.value("max_payload_bytes", std::int64_t{65536});
        inst.workerThreads = i.value("worker_threads", 2);

        if (inst.connectTimeoutMs <= 0) {
            spdlog::warn("Invalid connect_timeout_ms {}, using 500", inst.connectTimeoutMs);
            inst.connectTimeoutMs = 500;
        }
        if (inst.readTimeoutMs < 0) {
            spdlog::warn("Invalid read_timeout_ms {}, disabling the read timeout",
                         inst.readTimeoutMs);
            inst.readTimeoutMs = 0;
        }
        if (maxPayload <= 0) {
            spdlog::warn("Invalid max_payload_bytes {}, using 65536", maxPayload);
            maxPayload = 65536;
        }
        inst.maxPayloadBytes = static_cast<size_t>(maxPayload);
        if (inst.workerThreads < 1) {
            spdlog::warn("Invalid worker_threads {}, using 1", inst.workerThreads);
            inst.workerThreads = 1;
        }
    }

    // Desktop entry
    if (j.contains("desktop_entry")) {
        const auto& d = j["desktop_entry"];
        auto& de = config_.desktopEntry;
        de.mimeType = d.value("mime_type", "");
        de.entryDirectory = d.value("entry_directory", "");
        de.entryFileName = d.value("entry_file_name", "");
        de.appDataDirectory = d.value("app_data_directory", "");
        de.binDirectory = d.value("bin_directory", "");
        de.iconsDirectory = d.value("icons_directory", "");
        de.iconPath = d.value("icon_path", "");
        de.version = d.value("version", "1.0.0");
        de.displayName = d.value("display_name", "");
        de.installBinary = d.value("install_binary", true);
        de.databaseUpdateCommand =
            d.value("database_update_command", "update-desktop-database");
    }

    // Window state
    if (j.contains("window")) {
        const auto& w = j["window"];
        config_.windowX = w.value("x", 100);
        config_.windowY = w.value("y", 100);
        config_.windowWidth = w.value("width", 640);
        config_.windowHeight = w.value("height", 420);
        config_.windowMaximized = w.value("maximized", false);
    }
}

std::filesystem::path ConfigManager::logPath() const {
    return configDir_ / "linkrelay.log";
}

} // namespace linkrelay::infra
