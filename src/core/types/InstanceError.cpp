#include "core/types/InstanceError.hpp"

namespace linkrelay::core {

InstanceError::InstanceError(InstanceErrorKind kind, const std::string& message)
    : std::runtime_error(message), kind_(kind) {}

int InstanceError::exitCode() const {
    return kind_ == InstanceErrorKind::Transmission ? 2 : 1;
}

} // namespace linkrelay::core
