#pragma once

#include <cstdint>
#include "core/errors/pilot_errors.hpp"

namespace deploypilot::process {

// Asks the kernel for a free TCP port on the loopback interface. The port is
// released before returning, so a caller racing another process can still
// lose it; callers report that as a launch failure.
core::errors::Result<std::uint16_t> allocate_free_port();

}  // namespace deploypilot::process
