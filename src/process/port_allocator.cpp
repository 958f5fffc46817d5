#include "process/port_allocator.hpp"

#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <netinet/in.h>
#include <string>
#include <sys/socket.h>
#include <unistd.h>

namespace deploypilot::process {

using core::errors::ErrorCategory;
using core::errors::PilotError;

core::errors::Result<std::uint16_t> allocate_free_port() {
    const int fd = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        return PilotError{ErrorCategory::Internal,
                          std::string("Failed to create socket: ") + std::strerror(errno),
                          "port_allocation_failed"};
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;

    if (::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0) {
        const std::string reason = std::strerror(errno);
        static_cast<void>(::close(fd));
        return PilotError{ErrorCategory::Internal, "Failed to bind socket: " + reason,
                          "port_allocation_failed"};
    }

    socklen_t len = sizeof(addr);
    if (::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len) != 0) {
        const std::string reason = std::strerror(errno);
        static_cast<void>(::close(fd));
        return PilotError{ErrorCategory::Internal, "getsockname failed: " + reason,
                          "port_allocation_failed"};
    }

    static_cast<void>(::close(fd));
    return static_cast<std::uint16_t>(ntohs(addr.sin_port));
}

}  // namespace deploypilot::process
