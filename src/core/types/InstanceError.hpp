/**
 * @file InstanceError.hpp
 * @brief Exception type for startup failures of the instance coordinator.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace linkrelay::core {

/**
 * @brief Classes of failure that abort startup.
 */
enum class InstanceErrorKind {
    Environment, ///< The rendezvous endpoint cannot be resolved, probed or bound
    Transmission ///< A follower could not hand its payload to the live leader
};

/**
 * @brief Error thrown when single-instance coordination cannot proceed.
 *
 * Runtime conditions while serving never raise this error; they are isolated
 * to their connection and logged.
 */
class InstanceError : public std::runtime_error {
public:
    InstanceError(InstanceErrorKind kind, const std::string& message);

    [[nodiscard]] InstanceErrorKind kind() const { return kind_; }

    /**
     * @brief Process exit code associated with this error.
     * @return 1 for environment errors, 2 for transmission failures.
     */
    [[nodiscard]] int exitCode() const;

private:
    InstanceErrorKind kind_;
};

} // namespace linkrelay::core
