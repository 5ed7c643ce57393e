#ifndef SAFEIO_STRING_UTILS_H
#define SAFEIO_STRING_UTILS_H

#include <safeio/util/date_time.h>

#include <string>

namespace safeio {
    // Local time, e.g. "2025-12-12T17:07:48.653"
    std::string to_string(const timestamp_t &value);

    // Local time phrased for notices, e.g. "on 11 Dec 2025 at 11:25:35"
    std::string modified_label(const timestamp_t &value);
} // namespace safeio

#endif  // SAFEIO_STRING_UTILS_H
