#include "app/Application.hpp"
#include "core/types/InstanceError.hpp"

#include <spdlog/spdlog.h>

int main(int argc, char* argv[]) {
    try {
        linkrelay::app::Application app(argc, argv);
        return app.run();
    } catch (const linkrelay::core::InstanceError& e) {
        if (e.kind() == linkrelay::core::InstanceErrorKind::Transmission) {
            spdlog::error("Could not reach the running instance: {}", e.what());
        } else {
            spdlog::critical("Startup failed: {}", e.what());
        }
        return e.exitCode();
    } catch (const std::exception& e) {
        spdlog::critical("Fatal error: {}", e.what());
        return 1;
    }
}
