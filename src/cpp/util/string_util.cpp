#include <safeio/util/string_utils.h>

#include <fmt/chrono.h>
#include <fmt/format.h>

namespace safeio {
    namespace {
        std::tm local_tm(const timestamp_t &value) {
            return fmt::localtime(safeio_clock::to_time_t(value));
        }
    } // namespace

    std::string to_string(const timestamp_t &value) {
        auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(value.time_since_epoch()).count() % 1000;
        if (millis < 0) { millis += 1000; }
        return fmt::format("{:%Y-%m-%dT%H:%M:%S}.{:03}", local_tm(value), millis);
    }

    std::string modified_label(const timestamp_t &value) {
        return fmt::format("on {:%d %b %Y at %H:%M:%S}", local_tm(value));
    }
} // namespace safeio
