#pragma once
#include <chrono>
#include <cstdint>

namespace arena::core::clock {

    // Wall-clock timestamp used for every audit record (transactions,
    // ruleset versions, events, release stamps).
    inline std::int64_t now_unix_ms() {
        const auto now = std::chrono::system_clock::now();
        const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                            now.time_since_epoch())
                            .count();
        return static_cast<std::int64_t>(ms);
    }

    inline double elapsed_ms(const std::chrono::steady_clock::time_point started) {
        const auto ended = std::chrono::steady_clock::now();
        return std::chrono::duration<double, std::milli>(ended - started).count();
    }

} // namespace arena::core::clock
