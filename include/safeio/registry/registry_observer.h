#pragma once

#include <memory>
#include <string_view>

namespace safeio {

    class BindingScope;
    class Refugee;
    class Safehouse;

    /**
     * Receives the notices raised while a BindingRegistry rebinds names.
     * All hooks default to no-ops; override the ones of interest.
     */
    struct RegistryObserver {
        using s_ptr = std::shared_ptr<RegistryObserver>;

        virtual ~RegistryObserver() = default;

        // A value that was not a Safehouse sat where a Safehouse was requested; it is now housed in the new one.
        virtual void on_safehouse_displaced(const BindingScope &scope, std::string_view name, const Safehouse &house,
                                            const Refugee &refugee) {
        };

        // assign replaced an existing binding after housing its value.
        virtual void on_binding_displaced(const BindingScope &scope, std::string_view name, const Safehouse &house,
                                          const Refugee &refugee) {
        };

        // assign is about to overwrite an immutable binding because the override was requested.
        virtual void on_constant_overwrite(const BindingScope &scope, std::string_view name) {
        };
    };

} // namespace safeio
