#ifndef SAFEIO_UTIL_CHECKSUM_H
#define SAFEIO_UTIL_CHECKSUM_H

#include <safeio/safeio_export.h>

#include <cstddef>
#include <cstdint>
#include <filesystem>

namespace safeio {
    using checksum_t = uint32_t;

    /**
     * CRC-32C (Castagnoli) over a memory block. Pass a previous result as seed to continue a running checksum.
     * Used for change detection only, never as an integrity guarantee.
     */
    SAFEIO_EXPORT checksum_t crc32c(const void *data, size_t size, checksum_t seed = 0) noexcept;

    /**
     * CRC-32C of the full contents of a file.
     * @throws IOFailure if the file cannot be opened or read
     */
    SAFEIO_EXPORT checksum_t file_checksum(const std::filesystem::path &path);
} // namespace safeio

#endif // SAFEIO_UTIL_CHECKSUM_H
