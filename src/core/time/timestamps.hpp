#pragma once
#include <chrono>
#include <cstdint>

namespace strand::core::time {

    inline std::int64_t now_unix_ms() {
        const auto now = std::chrono::system_clock::now();
        return static_cast<std::int64_t>(
            std::chrono::duration_cast<std::chrono::milliseconds>(
                now.time_since_epoch())
                .count());
    }

    inline std::int64_t steady_now_ms() {
        const auto now = std::chrono::steady_clock::now();
        return static_cast<std::int64_t>(
            std::chrono::duration_cast<std::chrono::milliseconds>(
                now.time_since_epoch())
                .count());
    }

} // namespace strand::core::time
