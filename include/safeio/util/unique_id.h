#ifndef SAFEIO_UTIL_UNIQUE_ID_H
#define SAFEIO_UTIL_UNIQUE_ID_H

#include <safeio/safeio_export.h>

#include <cstdint>
#include <string>

namespace safeio {
    using unique_id_t = uint32_t;

    /**
     * Draw a new 32-bit identifier.
     *
     * The value is the time_low field of a time-based (version 1) UUID, so successive IDs follow the clock.
     * Should the clock not have advanced between two draws, the previous ID plus one is returned instead, which
     * guarantees that two IDs drawn in direct succession in one process never collide.
     */
    SAFEIO_EXPORT unique_id_t unique_id();

    /**
     * Render an identifier as 8 lowercase hex digits, e.g. "a8de13fa", or "0xa8de13fa" when prefix is set.
     */
    SAFEIO_EXPORT std::string repr_hex(unique_id_t id, bool prefix = false);
} // namespace safeio

#endif // SAFEIO_UTIL_UNIQUE_ID_H
