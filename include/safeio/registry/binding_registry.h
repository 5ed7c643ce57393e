#pragma once

#include <safeio/registry/binding_scope.h>
#include <safeio/registry/refugee.h>
#include <safeio/registry/registry_observer.h>
#include <safeio/registry/safehouse.h>
#include <safeio/safeio_export.h>
#include <safeio/serialization/serializer.h>
#include <safeio/util/string_map.h>

#include <concepts>
#include <filesystem>
#include <memory>
#include <string_view>
#include <type_traits>
#include <vector>

namespace safeio {

    /**
     * Observers used when none are supplied: a single NoticeLog writing to stderr.
     */
    SAFEIO_EXPORT std::vector<RegistryObserver::s_ptr> default_registry_observers();

    /**
     * @brief Owns BindingScopes and rebinds names in them without losing the values being replaced.
     *
     * Displaced values are deep-copied into a Safehouse that lives, as an immutable binding, in the same scope.
     * The registry is an ordinary object: create one per context (or per test) rather than sharing global state.
     *
     * Not safe for unsynchronised concurrent use; callers must serialise access per (scope, name).
     */
    class SAFEIO_EXPORT BindingRegistry {
    public:
        static constexpr std::string_view DEFAULT_HOUSE_NAME{"SAFEHOUSE"};
        static constexpr std::string_view DEFAULT_SCOPE_NAME{"Main"};

        explicit BindingRegistry(std::vector<RegistryObserver::s_ptr> observers = default_registry_observers());

        BindingRegistry(const BindingRegistry &) = delete;
        BindingRegistry &operator=(const BindingRegistry &) = delete;

        // Creates the scope on first use
        BindingScope &scope(std::string_view name = DEFAULT_SCOPE_NAME);

        [[nodiscard]] bool has_scope(std::string_view name) const;

        // Destroys the scope together with every Safehouse living in it
        bool drop_scope(std::string_view name);

        [[nodiscard]] const std::vector<RegistryObserver::s_ptr> &observers() const { return _observers; }

        /**
         * Return the Safehouse of scope bound at name, creating it if needed.
         *
         * Anything else bound at name (including a Safehouse belonging to another scope) is first housed in the new
         * Safehouse, which then takes its place.
         */
        Safehouse &get_or_create_safehouse(BindingScope &scope, std::string_view name = DEFAULT_HOUSE_NAME);

        /**
         * Deep-copy the current value of name into safehouse.
         *
         * @throws NotFound if name is not bound in scope
         * @throws std::invalid_argument if safehouse does not belong to scope
         */
        const Refugee &house(std::string_view name, Safehouse &safehouse, const BindingScope &scope);

        /**
         * @throws NotFound for an unknown ID
         */
        [[nodiscard]] static const Refugee &retrieve(unique_id_t id, const Safehouse &safehouse);

        /**
         * Every Refugee of name, oldest first.
         * @throws NotFound if name was never housed
         */
        [[nodiscard]] static Safehouse::refugee_list retrieve(std::string_view name, const Safehouse &safehouse);

        /**
         * Bind name to value in scope, housing any value it replaces in the Safehouse house_name.
         *
         * Validation happens before anything is touched. An immutable binding stays immutable after the overwrite.
         *
         * @throws InvalidName if name (or house_name) is not a valid identifier, or if name is the bound Safehouse
         *         that would receive the displaced value
         * @throws ConstantBinding if name is immutable and allow_constant_overwrite is false
         * @return the newly bound value
         */
        const value::Value &assign(std::string_view name, value::Value value, BindingScope &scope,
                                   std::string_view house_name = DEFAULT_HOUSE_NAME,
                                   bool allow_constant_overwrite = false);

        template<typename T>
            requires (!std::same_as<std::remove_cvref_t<T>, value::Value>)
        const std::remove_cvref_t<T> &assign(std::string_view name, T &&value, BindingScope &scope,
                                             std::string_view house_name = DEFAULT_HOUSE_NAME,
                                             bool allow_constant_overwrite = false) {
            return assign(name, value::Value::from(std::forward<T>(value)), scope, house_name,
                          allow_constant_overwrite).template as<std::remove_cvref_t<T>>();
        }

        /**
         * Load the object stored at path and assign it to name, housing any value it replaces.
         */
        template<typename T>
        const T &protected_load(std::string_view name, const std::filesystem::path &path, BindingScope &scope,
                                const Serializer<T> &serializer, std::string_view house_name = DEFAULT_HOUSE_NAME) {
            return assign(name, serializer.load(path), scope, house_name);
        }

        /**
         * A valid name starts with an ASCII letter or '_', continues with letters, digits, '_' or '!',
         * and is not a reserved word.
         */
        [[nodiscard]] static bool is_valid_name(std::string_view name);

    private:
        string_map<std::unique_ptr<BindingScope>> _scopes;
        std::vector<RegistryObserver::s_ptr> _observers;
    };

} // namespace safeio
