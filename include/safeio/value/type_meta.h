#ifndef SAFEIO_VALUE_TYPE_META_H
#define SAFEIO_VALUE_TYPE_META_H

#include <cstddef>
#include <string>
#include <typeinfo>

namespace safeio::value {

    // Forward declarations
    struct TypeMeta;

    /**
     * TypeOps - Function pointers for type operations
     *
     * All operations take raw pointers and the TypeMeta for context.
     * This enables type-erased operations on any stored value.
     */
    struct TypeOps {
        // Lifecycle
        void (*destruct)(void* dest, const TypeMeta* meta);
        void (*copy_construct)(void* dest, const void* src, const TypeMeta* meta);

        // Comparison
        bool (*equals)(const void* a, const void* b, const TypeMeta* meta);

        // String representation (for notices/debugging)
        std::string (*to_string)(const void* v, const TypeMeta* meta);
    };

    /**
     * TypeMeta - Layout and operations of one stored type
     *
     * Instances are static and unique per type, so pointer equality is type identity.
     */
    struct TypeMeta {
        size_t size;            // sizeof(T)
        size_t alignment;       // alignof(T)
        const TypeOps* ops;
        const std::type_info* type_info;

        void destruct_at(void* dest) const {
            if (ops->destruct) ops->destruct(dest, this);
        }

        void copy_construct_at(void* dest, const void* src) const {
            ops->copy_construct(dest, src, this);
        }

        [[nodiscard]] bool equals_at(const void* a, const void* b) const {
            return ops->equals(a, b, this);
        }

        [[nodiscard]] std::string to_string_at(const void* v) const {
            return ops->to_string(v, this);
        }

        [[nodiscard]] std::string type_name() const {
            return type_info ? type_info->name() : "<unknown>";
        }
    };

} // namespace safeio::value

#endif // SAFEIO_VALUE_TYPE_META_H
