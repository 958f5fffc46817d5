#pragma once
#include <ctime>
#include <random>
#include <sstream>
#include <string>

namespace deploypilot::core::config {

    // 8 random hex characters.
    inline std::string generate_token() {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(0, 15);

        std::stringstream ss;
        for (int i = 0; i < 8; ++i) {
            ss << std::hex << dis(gen);
        }
        return ss.str();
    }

    // "<prefix>-YYYYMMDDHHMMSS-<8 hex>", e.g. "ui-20240101120000-3fa9c2d1".
    // Callers that keep a table must still check for collisions.
    inline std::string generate_session_id(const std::string& prefix) {
        const std::time_t now = std::time(nullptr);
        std::tm local{};
        localtime_r(&now, &local);
        char stamp[16] = {0};
        std::strftime(stamp, sizeof(stamp), "%Y%m%d%H%M%S", &local);
        return prefix + "-" + stamp + "-" + generate_token();
    }

} // namespace deploypilot::core::config
