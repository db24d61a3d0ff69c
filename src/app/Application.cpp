#include "app/Application.hpp"

#include "core/types/InstanceError.hpp"
#include "infrastructure/desktop/DesktopEntryWriter.hpp"
#include "ui/windows/MainWindow.hpp"

#include <QDir>
#include <QMetaObject>
#include <QStandardPaths>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <algorithm>

#include <unistd.h>

namespace linkrelay::app {

Application::Application(int& argc, char** argv) : argc_(argc), argv_(argv) {
    // Names are needed by QStandardPaths before the QApplication exists
    QCoreApplication::setApplicationName("LinkRelay");
    QCoreApplication::setApplicationVersion("1.0.0");
    QCoreApplication::setOrganizationName("LinkRelay");

    auto configDir =
        QStandardPaths::writableLocation(QStandardPaths::AppDataLocation).toStdString();
    config_ = std::make_unique<infra::ConfigManager>(configDir);
    if (!config_->load()) {
        spdlog::warn("Using default configuration");
    }

    initializeLogging();
    initializeComponents();
}

Application::~Application() {
    if (coordinator_) {
        coordinator_->shutdown();
    }

    if (asioContext_) {
        asioContext_->stop();
    }

    coordinator_.reset();
    deepLinkViewModel_.reset();
    asioContext_.reset();
    qtApp_.reset();
}

void Application::initializeLogging() {
    const auto& general = config_->config();

    auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    std::vector<spdlog::sink_ptr> sinks{consoleSink};

    if (general.logToFile) {
        auto logPath = config_->logPath();
        try {
            auto fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                logPath.string(), 5 * 1024 * 1024, 3);
            fileSink->set_level(spdlog::level::debug);
            sinks.push_back(fileSink);
        } catch (const spdlog::spdlog_ex& e) {
            spdlog::warn("Cannot open log file {}: {}; logging to console only", logPath.string(),
                         e.what());
        }
    }

    auto logger = std::make_shared<spdlog::logger>("linkrelay", sinks.begin(), sinks.end());

    auto level = spdlog::level::from_str(general.logLevel);
    if (level == spdlog::level::off && general.logLevel != "off") {
        level = spdlog::level::info;
    }
    logger->set_level(level);
    consoleSink->set_level(level);
    spdlog::set_default_logger(logger);

    spdlog::info("LinkRelay {} starting (pid {})",
                 QCoreApplication::applicationVersion().toStdString(), ::getpid());
    if (general.logToFile) {
        spdlog::info("Log file: {}", config_->logPath().string());
    }
}

void Application::initializeComponents() {
    auto instanceConfig = config_->config().instance;
    if (instanceConfig.binaryName.empty() && argc_ > 0) {
        instanceConfig.binaryName = std::filesystem::path(argv_[0]).filename().string();
    }

    binaryName_ = std::filesystem::path(instanceConfig.binaryName).filename().string();

    // Asio context
    auto threads = static_cast<size_t>(std::max(instanceConfig.workerThreads, 1));
    asioContext_ = std::make_unique<infra::AsioContext>(threads);

    // Instance coordination
    coordinator_ = std::make_unique<InstanceCoordinator>(instanceConfig, *asioContext_);

    spdlog::info("Application components initialized");
}

void Application::installDesktopEntry() {
    infra::DesktopEntryWriter writer(config_->config().desktopEntry, binaryName_,
                                     QDir::homePath().toStdString(), executablePath());
    if (!writer.install()) {
        coordinator_->shutdown();
        throw core::InstanceError(core::InstanceErrorKind::Environment,
                                  "Failed to install desktop entry " +
                                      writer.entryPath().string());
    }
}

std::vector<std::string> Application::launchArguments() const {
    std::vector<std::string> args;
    for (int i = 1; i < argc_; ++i) {
        args.emplace_back(argv_[i]);
    }
    return args;
}

std::filesystem::path Application::executablePath() const {
    std::error_code ec;
    auto path = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (!ec) {
        return path;
    }

    spdlog::debug("Cannot read /proc/self/exe: {}", ec.message());
    return std::filesystem::absolute(argv_[0], ec);
}

int Application::run() {
    auto args = launchArguments();

    if (coordinator_->decide(args) == core::InstanceRole::Follower) {
        spdlog::info("Handed over to the running instance, exiting");
        return 0;
    }

    installDesktopEntry();
    asioContext_->start();

    qtApp_ = std::make_unique<QApplication>(argc_, argv_);

    deepLinkViewModel_ = std::make_shared<viewmodels::DeepLinkViewModel>();
    coordinator_->setEventSink(deepLinkViewModel_);

    ui::MainWindow mainWindow(*deepLinkViewModel_, *config_,
                              QString::fromStdString(coordinator_->endpoint().toString()));
    mainWindow.restoreWindowState();

    auto* qtApp = qtApp_.get();
    coordinator_->startServing([qtApp]() {
        QMetaObject::invokeMethod(qtApp, []() { QCoreApplication::quit(); },
                                  Qt::QueuedConnection);
    });
    coordinator_->dispatchLaunchArguments(args);

    int exitCode = qtApp_->exec();

    coordinator_->shutdown();
    spdlog::info("Application shutting down...");
    return exitCode;
}

} // namespace linkrelay::app
