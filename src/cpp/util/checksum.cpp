#include <safeio/util/checksum.h>
#include <safeio/util/errors.h>

#include <array>
#include <fstream>

namespace safeio {
    namespace {
        constexpr checksum_t CASTAGNOLI_POLY = 0x82F63B78u;  // reflected

        constexpr std::array<checksum_t, 256> make_table() {
            std::array<checksum_t, 256> table{};
            for (checksum_t i = 0; i < 256; ++i) {
                checksum_t c = i;
                for (int k = 0; k < 8; ++k) {
                    c = (c & 1u) ? CASTAGNOLI_POLY ^ (c >> 1u) : c >> 1u;
                }
                table[i] = c;
            }
            return table;
        }

        constexpr auto CRC_TABLE = make_table();
    } // namespace

    checksum_t crc32c(const void *data, size_t size, checksum_t seed) noexcept {
        checksum_t crc = ~seed;
        const auto *bytes = static_cast<const unsigned char *>(data);
        for (size_t i = 0; i < size; ++i) {
            crc = CRC_TABLE[(crc ^ bytes[i]) & 0xFFu] ^ (crc >> 8u);
        }
        return ~crc;
    }

    checksum_t file_checksum(const std::filesystem::path &path) {
        std::ifstream in(path, std::ios::binary);
        if (!in) { throw_error<IOFailure>("Unable to open {} for checksumming", path.string()); }

        std::array<char, 64 * 1024> buffer;
        checksum_t crc = 0;
        while (in) {
            in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
            auto got = in.gcount();
            if (got > 0) { crc = crc32c(buffer.data(), static_cast<size_t>(got), crc); }
        }
        if (in.bad()) { throw_error<IOFailure>("Read error while checksumming {}", path.string()); }
        return crc;
    }
} // namespace safeio
