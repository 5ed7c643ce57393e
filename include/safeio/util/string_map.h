#ifndef SAFEIO_UTIL_STRING_MAP_H
#define SAFEIO_UTIL_STRING_MAP_H

#include <ankerl/unordered_dense.h>

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace safeio {
    // Transparent hash so maps keyed by std::string can be probed with a std::string_view
    struct string_hash {
        using is_transparent = void;
        using is_avalanching = void;

        [[nodiscard]] uint64_t operator()(std::string_view s) const noexcept {
            return ankerl::unordered_dense::hash<std::string_view>{}(s);
        }
    };

    template<typename V>
    using string_map = ankerl::unordered_dense::map<std::string, V, string_hash, std::equal_to<>>;
} // namespace safeio

#endif // SAFEIO_UTIL_STRING_MAP_H
