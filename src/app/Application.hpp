#pragma once

#include "app/InstanceCoordinator.hpp"
#include "infrastructure/config/ConfigManager.hpp"
#include "infrastructure/network/AsioContext.hpp"
#include "viewmodels/DeepLinkViewModel.hpp"

#include <QApplication>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace linkrelay::app {

/**
 * @brief Owns the application's components and runs it.
 *
 * The instance role is decided before any UI exists. A follower returns from
 * run() as soon as its arguments are relayed; only the leader creates the Qt
 * application and its window.
 */
class Application {
public:
    /**
     * @brief Loads configuration, sets up logging and resolves the endpoint.
     * @throws core::InstanceError (Environment) if the endpoint cannot be resolved.
     */
    Application(int& argc, char** argv);
    ~Application();

    /**
     * @brief Decides the role and, for the leader, runs the event loop.
     * @return Process exit code.
     * @throws core::InstanceError on startup failures.
     */
    int run();

    // Accessors
    infra::ConfigManager& config() { return *config_; }
    infra::AsioContext& asioContext() { return *asioContext_; }
    InstanceCoordinator& coordinator() { return *coordinator_; }

private:
    void initializeLogging();
    void initializeComponents();
    void installDesktopEntry();

    std::vector<std::string> launchArguments() const;
    std::filesystem::path executablePath() const;

    int& argc_;
    char** argv_;
    std::string binaryName_;

    std::unique_ptr<infra::ConfigManager> config_;
    std::unique_ptr<infra::AsioContext> asioContext_;
    std::unique_ptr<InstanceCoordinator> coordinator_;

    std::unique_ptr<QApplication> qtApp_;
    std::shared_ptr<viewmodels::DeepLinkViewModel> deepLinkViewModel_;
};

} // namespace linkrelay::app
