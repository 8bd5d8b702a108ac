#pragma once
#include <chrono>
#include <cstdint>

namespace hookguard::core::config {

    inline std::int64_t now_unix_ms() {
        const auto now = std::chrono::system_clock::now();
        const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                            now.time_since_epoch())
                            .count();
        return static_cast<std::int64_t>(ms);
    }

} // namespace hookguard::core::config
