#pragma once

#include <safeio/safeio_export.h>
#include <safeio/util/string_map.h>
#include <safeio/value/value.h>

#include <concepts>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace safeio {

    /**
     * A single named slot in a BindingScope.
     */
    struct Binding {
        value::Value value;
        bool immutable{false};
    };

    /**
     * A named set of bindings, standing in for a module or namespace that values are assigned into.
     *
     * Nothing here protects anything; BindingRegistry::assign is the guarded way to rebind a name.
     * Safehouses protecting this scope are stored here too, as immutable bindings, so clearing the scope
     * also clears its backups.
     */
    class SAFEIO_EXPORT BindingScope {
    public:
        explicit BindingScope(std::string name);

        BindingScope(const BindingScope &) = delete;
        BindingScope &operator=(const BindingScope &) = delete;
        BindingScope(BindingScope &&) noexcept = default;
        BindingScope &operator=(BindingScope &&) noexcept = default;

        [[nodiscard]] const std::string &name() const { return _name; }

        [[nodiscard]] bool exists(std::string_view name) const;

        // false for unbound names
        [[nodiscard]] bool is_immutable(std::string_view name) const;

        /**
         * @throws NotFound if name is unbound
         */
        [[nodiscard]] const value::Value &get(std::string_view name) const;
        [[nodiscard]] value::Value &get(std::string_view name);

        template<typename T>
        [[nodiscard]] const T &get_as(std::string_view name) const {
            return get(name).template as<T>();
        }

        // Binds (or rebinds) name unconditionally
        void set(std::string_view name, value::Value value, bool immutable = false);

        template<typename T>
            requires (!std::same_as<std::remove_cvref_t<T>, value::Value>)
        void set(std::string_view name, T &&value, bool immutable = false) {
            set(name, value::Value::from(std::forward<T>(value)), immutable);
        }

        /**
         * Unbind name and hand its value to the caller.
         * @throws NotFound if name is unbound
         */
        [[nodiscard]] value::Value take(std::string_view name);

        bool erase(std::string_view name);

        void clear();

        [[nodiscard]] size_t size() const { return _bindings.size(); }

        // Sorted
        [[nodiscard]] std::vector<std::string> names() const;

    private:
        std::string _name;
        string_map<Binding> _bindings;
    };

} // namespace safeio
