#pragma once

#include <safeio/util/errors.h>

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>

namespace safeio {

    /**
     * The storage backend consumed by protected_store / protected_load.
     *
     * store writes the whole value to path, replacing whatever is there; load reads it back.
     * Neither operation protects anything on its own.
     */
    template<typename T>
    struct Serializer {
        virtual ~Serializer() = default;

        virtual void store(const T &value, const std::filesystem::path &path) const = 0;

        [[nodiscard]] virtual T load(const std::filesystem::path &path) const = 0;
    };

    /**
     * Stores values as JSON documents. T must be convertible with nlohmann::json (to_json / from_json).
     */
    template<typename T>
    struct JsonSerializer final : Serializer<T> {
        explicit JsonSerializer(int indent = 2) : _indent(indent) {
        }

        void store(const T &value, const std::filesystem::path &path) const override {
            std::ofstream out(path, std::ios::binary | std::ios::trunc);
            if (!out) { throw_error<IOFailure>("Unable to open {} for writing", path.string()); }
            out << nlohmann::json(value).dump(_indent);
            if (!out.flush()) { throw_error<IOFailure>("Write error on {}", path.string()); }
        }

        [[nodiscard]] T load(const std::filesystem::path &path) const override {
            std::ifstream in(path, std::ios::binary);
            if (!in) { throw_error<IOFailure>("Unable to open {} for reading", path.string()); }
            return nlohmann::json::parse(in).template get<T>();
        }

    private:
        int _indent;
    };

} // namespace safeio
