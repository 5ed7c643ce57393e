#include <safeio/util/unique_id.h>

#include <fmt/format.h>
#include <uuid/uuid.h>

#include <atomic>

namespace safeio {
    namespace {
        std::atomic<unique_id_t> last_id{0};

        unique_id_t draw_time_low() {
            uuid_t uuid;
            uuid_generate_time(uuid);
            // time_low occupies the first four bytes, stored big-endian
            return static_cast<unique_id_t>(uuid[0]) << 24 | static_cast<unique_id_t>(uuid[1]) << 16 |
                   static_cast<unique_id_t>(uuid[2]) << 8 | static_cast<unique_id_t>(uuid[3]);
        }
    } // namespace

    unique_id_t unique_id() {
        unique_id_t candidate = draw_time_low();
        unique_id_t previous = last_id.load(std::memory_order_relaxed);
        unique_id_t chosen;
        do {
            chosen = candidate == previous ? previous + 1 : candidate;
        } while (!last_id.compare_exchange_weak(previous, chosen, std::memory_order_relaxed));
        return chosen;
    }

    std::string repr_hex(unique_id_t id, bool prefix) {
        return prefix ? fmt::format("0x{:08x}", id) : fmt::format("{:08x}", id);
    }
} // namespace safeio
