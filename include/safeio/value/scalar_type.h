#ifndef SAFEIO_VALUE_SCALAR_TYPE_H
#define SAFEIO_VALUE_SCALAR_TYPE_H

#include <safeio/value/type_meta.h>

#include <concepts>
#include <iomanip>
#include <new>
#include <ostream>
#include <sstream>
#include <string>
#include <type_traits>

namespace safeio::value {

    /**
     * ScalarTypeOps - Generate TypeOps for a copyable type T
     */
    template<typename T>
    struct ScalarTypeOps {
        static void destruct(void* dest, const TypeMeta*) {
            static_cast<T*>(dest)->~T();
        }

        static void copy_construct(void* dest, const void* src, const TypeMeta*) {
            new (dest) T(*static_cast<const T*>(src));
        }

        static bool equals(const void* a, const void* b, const TypeMeta*) {
            if constexpr (requires(const T& x, const T& y) { { x == y } -> std::convertible_to<bool>; }) {
                return *static_cast<const T*>(a) == *static_cast<const T*>(b);
            } else {
                return a == b;
            }
        }

        static std::string to_string(const void* v, const TypeMeta* meta) {
            const T& value = *static_cast<const T*>(v);
            if constexpr (std::is_same_v<T, bool>) {
                return value ? "true" : "false";
            } else if constexpr (std::is_integral_v<T>) {
                return std::to_string(value);
            } else if constexpr (std::is_floating_point_v<T>) {
                std::ostringstream oss;
                oss << std::setprecision(6) << value;
                return oss.str();
            } else if constexpr (std::is_same_v<T, std::string>) {
                return "\"" + value + "\"";
            } else if constexpr (requires { { value.to_string() } -> std::convertible_to<std::string>; }) {
                return value.to_string();
            } else if constexpr (requires(std::ostream& os) { os << value; }) {
                std::ostringstream oss;
                oss << value;
                return oss.str();
            } else {
                return "<" + meta->type_name() + ">";
            }
        }

        static constexpr TypeOps ops{
            .destruct = std::is_trivially_destructible_v<T> ? nullptr : &destruct,
            .copy_construct = &copy_construct,
            .equals = &equals,
            .to_string = &to_string,
        };
    };

    /**
     * ScalarTypeMeta - TypeMeta for stored types
     *
     * Usage:
     *   const TypeMeta* int_meta = ScalarTypeMeta<int>::get();
     */
    template<typename T>
    struct ScalarTypeMeta {
        static const TypeMeta instance;

        static const TypeMeta* get() { return &instance; }
    };

    template<typename T>
    const TypeMeta ScalarTypeMeta<T>::instance = {
        .size = sizeof(T),
        .alignment = alignof(T),
        .ops = &ScalarTypeOps<T>::ops,
        .type_info = &typeid(T),
    };

    /**
     * Helper to get TypeMeta for any stored type
     */
    template<typename T>
    const TypeMeta* scalar_type_meta() {
        return ScalarTypeMeta<std::remove_cvref_t<T>>::get();
    }

} // namespace safeio::value

#endif // SAFEIO_VALUE_SCALAR_TYPE_H
