#ifndef SAFEIO_DATE_TIME_H
#define SAFEIO_DATE_TIME_H

#include <chrono>
#include <filesystem>

namespace safeio {
    using safeio_clock = std::chrono::system_clock;
    // Microsecond precision is plenty for capture stamps and keeps the representation portable
    using timestamp_t = std::chrono::time_point<safeio_clock, std::chrono::microseconds>;

    inline timestamp_t now() noexcept {
        return std::chrono::time_point_cast<std::chrono::microseconds>(safeio_clock::now());
    }

    // Filesystem clocks differ per platform; last_write_time values are brought onto the system clock.
    inline timestamp_t to_timestamp(std::filesystem::file_time_type ft) {
        return std::chrono::time_point_cast<std::chrono::microseconds>(std::chrono::file_clock::to_sys(ft));
    }
} // namespace safeio
#endif  // SAFEIO_DATE_TIME_H
