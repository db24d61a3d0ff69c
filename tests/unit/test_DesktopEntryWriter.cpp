#include <catch2/catch_test_macros.hpp>

#include "infrastructure/desktop/DesktopEntryWriter.hpp"
#include "support/TestSupport.hpp"

#include <fstream>
#include <sstream>

using namespace linkrelay;

namespace {

std::string readFile(const std::filesystem::path& path) {
    std::ifstream file(path);
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

void writeFile(const std::filesystem::path& path, const std::string& content) {
    std::ofstream file(path);
    file << content;
}

} // namespace

TEST_CASE("DesktopEntryWriter resolves default paths", "[DesktopEntryWriter]") {
    infra::DesktopEntryConfig config;
    config.mimeType = "x-scheme-handler/app";

    infra::DesktopEntryWriter writer(config, "app", "/home/u", "/opt/app/app");

    SECTION("Entry goes to the applications directory") {
        REQUIRE(writer.entryPath() == "/home/u/.local/share/applications/app.desktop");
    }

    SECTION("Entry without installation points at the running binary") {
        auto entry = writer.renderEntry();
        REQUIRE(entry.find("Exec=/opt/app/app %U\n") != std::string::npos);
        REQUIRE(entry.find("Name=app\n") != std::string::npos);
        REQUIRE(entry.find("Version=1.0.0\n") != std::string::npos);
    }

    SECTION("Configured file name gets the suffix") {
        config.entryFileName = "custom";
        infra::DesktopEntryWriter custom(config, "app", "/home/u", "/opt/app/app");
        REQUIRE(custom.entryPath().filename() == "custom.desktop");
    }
}

TEST_CASE("DesktopEntryWriter installs the entry", "[DesktopEntryWriter]") {
    test::TestDir dir("desktop");
    auto home = dir.path() / "home";
    auto exe = dir.path() / "build" / "app";
    std::filesystem::create_directories(exe.parent_path());
    writeFile(exe, "#!/bin/sh\n");

    infra::DesktopEntryConfig config;
    config.mimeType = "x-scheme-handler/app";
    config.databaseUpdateCommand.clear();

    SECTION("Disabled without a MIME type") {
        infra::DesktopEntryConfig disabled;
        infra::DesktopEntryWriter writer(disabled, "app", home, exe);

        REQUIRE_FALSE(writer.isEnabled());
        REQUIRE(writer.install());
        REQUIRE_FALSE(std::filesystem::exists(home));
    }

    SECTION("Writes the entry and installs the binary") {
        infra::DesktopEntryWriter writer(config, "app", home, exe);

        REQUIRE(writer.install());

        auto installed = home / ".local" / "share" / "app" / "bin" / "app";
        REQUIRE(std::filesystem::exists(installed));
        REQUIRE(std::filesystem::is_directory(home / ".local" / "share" / "app" / "icons"));
        REQUIRE(writer.installedBinaryPath() == installed);

        auto expected = "[Desktop Entry]\n"
                        "Version=1.0.0\n"
                        "Type=Application\n"
                        "Name=app\n"
                        "Exec=" + installed.string() + " %U\n"
                        "Icon=\n"
                        "MimeType=x-scheme-handler/app\n"
                        "StartupNotify=true\n"
                        "Terminal=false\n"
                        "SingleMainWindow=true\n";
        REQUIRE(readFile(writer.entryPath()) == expected);
    }

    SECTION("Copies the icon and references the copy") {
        auto icon = dir.path() / "logo.png";
        writeFile(icon, "png");
        config.iconPath = icon.string();
        config.installBinary = false;
        config.displayName = "My App";
        config.version = "2.0.0";

        infra::DesktopEntryWriter writer(config, "app", home, exe);
        REQUIRE(writer.install());

        auto copied = home / ".local" / "share" / "app" / "icons" / "logo.png";
        REQUIRE(std::filesystem::exists(copied));
        REQUIRE(readFile(copied) == "png");

        auto entry = readFile(writer.entryPath());
        REQUIRE(entry.find("Icon=" + copied.string() + "\n") != std::string::npos);
        REQUIRE(entry.find("Name=My App\n") != std::string::npos);
        REQUIRE(entry.find("Version=2.0.0\n") != std::string::npos);
        REQUIRE(entry.find("Exec=" + exe.string() + " %U\n") != std::string::npos);
    }

    SECTION("Missing icon fails the installation") {
        config.iconPath = (dir.path() / "missing.png").string();

        infra::DesktopEntryWriter writer(config, "app", home, exe);
        REQUIRE_FALSE(writer.install());
        REQUIRE_FALSE(std::filesystem::exists(writer.entryPath()));
    }

    SECTION("Already installed binary is not copied onto itself") {
        config.binDirectory = exe.parent_path().string();

        infra::DesktopEntryWriter writer(config, "app", home, exe);
        REQUIRE(writer.install());
        REQUIRE(writer.installedBinaryPath() == exe);
        REQUIRE(readFile(exe) == "#!/bin/sh\n");
    }
}

TEST_CASE("DesktopEntryWriter refreshes the desktop database", "[DesktopEntryWriter]") {
    test::TestDir dir("desktop");
    auto home = dir.path() / "home";
    auto exe = dir.path() / "app";
    writeFile(exe, "#!/bin/sh\n");

    // Stand-in for update-desktop-database that records its argument
    auto marker = dir.path() / "refreshed";
    auto command = dir.path() / "refresh-db";
    writeFile(command, "#!/bin/sh\necho \"$1\" > " + marker.string() + "\n");
    std::filesystem::permissions(command, std::filesystem::perms::owner_all);

    infra::DesktopEntryConfig config;
    config.mimeType = "x-scheme-handler/app";
    config.installBinary = false;

    SECTION("Runs the command on the entry directory") {
        config.databaseUpdateCommand = command.string();
        infra::DesktopEntryWriter writer(config, "app", home, exe);

        REQUIRE(writer.install());

        REQUIRE(test::waitFor([&]() { return readFile(marker).find('\n') != std::string::npos; }));
        REQUIRE(readFile(marker) == writer.entryPath().parent_path().string() + "\n");
    }

    SECTION("Missing command does not fail the installation") {
        config.databaseUpdateCommand = (dir.path() / "no-such-command").string();
        infra::DesktopEntryWriter writer(config, "app", home, exe);

        REQUIRE(writer.install());
        REQUIRE(std::filesystem::exists(writer.entryPath()));
    }

    SECTION("Empty command skips the refresh") {
        config.databaseUpdateCommand.clear();
        infra::DesktopEntryWriter writer(config, "app", home, exe);

        REQUIRE(writer.install());
        REQUIRE_FALSE(std::filesystem::exists(marker));
    }
}
