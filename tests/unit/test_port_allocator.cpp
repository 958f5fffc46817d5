#include <cstdint>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>
#include <gtest/gtest.h>
#include "core/errors/pilot_errors.hpp"
#include "process/port_allocator.hpp"

namespace {

using deploypilot::core::errors::get_value;
using deploypilot::core::errors::is_error;
using deploypilot::process::allocate_free_port;

TEST(PortAllocatorTest, ReturnsNonZeroPort) {
    auto result = allocate_free_port();
    ASSERT_FALSE(is_error(result));
    EXPECT_GT(get_value(result), 0);
}

TEST(PortAllocatorTest, ReturnedPortCanBeBound) {
    auto result = allocate_free_port();
    ASSERT_FALSE(is_error(result));
    const std::uint16_t port = get_value(result);

    const int fd = socket(AF_INET, SOCK_STREAM, 0);
    ASSERT_GE(fd, 0);
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = htons(port);
    const int bound = bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
    close(fd);
    EXPECT_EQ(bound, 0);
}

}  // namespace
