#ifndef SAFEIO_VALUE_VALUE_H
#define SAFEIO_VALUE_VALUE_H

#include <safeio/value/scalar_type.h>

#include <concepts>
#include <new>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>

namespace safeio::value {

    /**
     * Value - Owning, type-erased value
     *
     * Holds heap storage and a reference to the TypeMeta describing it. The storage address is stable for the
     * lifetime of the Value, including across moves of the Value itself.
     *
     * Value is move only. Duplicating one is always explicit through Value::copy, which copy-constructs the stored
     * object, so a copy never aliases the source.
     */
    class Value {
    public:
        Value() = default;

        template<typename T>
            requires (!std::same_as<std::remove_cvref_t<T>, Value> && std::copy_constructible<std::remove_cvref_t<T>>)
        static Value from(T&& v) {
            using U = std::remove_cvref_t<T>;
            Value result;
            result._schema = scalar_type_meta<U>();
            result._storage = ::operator new(sizeof(U), std::align_val_t{alignof(U)});
            try {
                new (result._storage) U(std::forward<T>(v));
            } catch (...) {
                ::operator delete(result._storage, std::align_val_t{alignof(U)});
                result._storage = nullptr;
                throw;
            }
            return result;
        }

        ~Value() { reset(); }

        // Move only
        Value(Value&& other) noexcept
            : _storage(other._storage)
            , _schema(other._schema) {
            other._storage = nullptr;
            other._schema = nullptr;
        }

        Value& operator=(Value&& other) noexcept {
            if (this != &other) {
                reset();
                _storage = other._storage;
                _schema = other._schema;
                other._storage = nullptr;
                other._schema = nullptr;
            }
            return *this;
        }

        Value(const Value&) = delete;
        Value& operator=(const Value&) = delete;

        // Deep copy of another value
        static Value copy(const Value& other) {
            if (!other.valid()) return {};
            Value result;
            void* storage = ::operator new(other._schema->size, std::align_val_t{other._schema->alignment});
            try {
                other._schema->copy_construct_at(storage, other._storage);
            } catch (...) {
                ::operator delete(storage, std::align_val_t{other._schema->alignment});
                throw;
            }
            result._storage = storage;
            result._schema = other._schema;
            return result;
        }

        // Validity and type
        [[nodiscard]] bool valid() const { return _storage && _schema; }
        [[nodiscard]] const TypeMeta* schema() const { return _schema; }

        template<typename T>
        [[nodiscard]] bool is_type() const {
            return valid() && _schema == scalar_type_meta<T>();
        }

        [[nodiscard]] bool same_type_as(const Value& other) const {
            return _schema == other._schema;
        }

        // Safe typed access - returns nullptr if type doesn't match
        template<typename T>
        [[nodiscard]] T* try_as() {
            if (!is_type<T>()) return nullptr;
            return static_cast<T*>(_storage);
        }

        template<typename T>
        [[nodiscard]] const T* try_as() const {
            if (!is_type<T>()) return nullptr;
            return static_cast<const T*>(_storage);
        }

        // Checked typed access - throws if type doesn't match
        template<typename T>
        [[nodiscard]] T& as() {
            if (!valid()) throw std::runtime_error("as<T>() on invalid Value");
            if (!is_type<T>()) throw std::runtime_error("as<T>() type mismatch, holds " + _schema->type_name());
            return *static_cast<T*>(_storage);
        }

        template<typename T>
        [[nodiscard]] const T& as() const {
            if (!valid()) throw std::runtime_error("as<T>() on invalid Value");
            if (!is_type<T>()) throw std::runtime_error("as<T>() type mismatch, holds " + _schema->type_name());
            return *static_cast<const T*>(_storage);
        }

        // Raw storage access
        [[nodiscard]] const void* data() const { return _storage; }

        [[nodiscard]] bool equals(const Value& other) const {
            if (!valid() || !other.valid()) return !valid() && !other.valid();
            return same_type_as(other) && _schema->equals_at(_storage, other._storage);
        }

        [[nodiscard]] std::string to_string() const {
            return valid() ? _schema->to_string_at(_storage) : "<unset>";
        }

    private:
        void reset() noexcept {
            if (_storage && _schema) {
                _schema->destruct_at(_storage);
                ::operator delete(_storage, std::align_val_t{_schema->alignment});
            }
            _storage = nullptr;
            _schema = nullptr;
        }

        void* _storage{nullptr};
        const TypeMeta* _schema{nullptr};
    };

} // namespace safeio::value

#endif // SAFEIO_VALUE_VALUE_H
