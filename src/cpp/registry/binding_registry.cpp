#include <safeio/notice_log.h>
#include <safeio/registry/binding_registry.h>
#include <safeio/util/errors.h>
#include <safeio/util/scope.h>
#include <safeio/util/unique_id.h>

#include <fmt/format.h>

#include <algorithm>
#include <array>
#include <stdexcept>

namespace safeio {

    namespace {
        constexpr std::array<std::string_view, 29> RESERVED_WORDS{
            "baremodule", "begin", "break", "catch", "const", "continue", "do", "else", "elseif", "end",
            "export", "false", "finally", "for", "function", "global", "if", "import", "let", "local",
            "macro", "module", "quote", "return", "struct", "true", "try", "using", "while",
        };

        constexpr bool is_ascii_alpha(char c) { return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z'); }
        constexpr bool is_ascii_digit(char c) { return c >= '0' && c <= '9'; }
    } // namespace

    std::vector<RegistryObserver::s_ptr> default_registry_observers() {
        return {std::make_shared<NoticeLog>()};
    }

    BindingRegistry::BindingRegistry(std::vector<RegistryObserver::s_ptr> observers)
        : _observers(std::move(observers)) {
    }

    BindingScope &BindingRegistry::scope(std::string_view name) {
        auto it = _scopes.find(name);
        if (it == _scopes.end()) {
            it = _scopes.emplace(std::string(name), std::make_unique<BindingScope>(std::string(name))).first;
        }
        return *it->second;
    }

    bool BindingRegistry::has_scope(std::string_view name) const {
        return _scopes.contains(name);
    }

    bool BindingRegistry::drop_scope(std::string_view name) {
        auto it = _scopes.find(name);
        if (it == _scopes.end()) { return false; }
        _scopes.erase(it);
        return true;
    }

    bool BindingRegistry::is_valid_name(std::string_view name) {
        if (name.empty() || !(is_ascii_alpha(name.front()) || name.front() == '_')) { return false; }
        bool chars_ok = std::ranges::all_of(name.substr(1), [](char c) {
            return is_ascii_alpha(c) || is_ascii_digit(c) || c == '_' || c == '!';
        });
        return chars_ok && std::ranges::find(RESERVED_WORDS, name) == RESERVED_WORDS.end();
    }

    Safehouse &BindingRegistry::get_or_create_safehouse(BindingScope &scope, std::string_view name) {
        if (!scope.exists(name)) {
            scope.set(name, value::Value::from(Safehouse(scope.name(), std::string(name))), true);
            return scope.get(name).as<Safehouse>();
        }

        if (auto *existing = scope.get(name).try_as<Safehouse>(); existing && existing->scope_name() == scope.name()) {
            return *existing;
        }

        // Bind the new Safehouse under a name no caller can use, house the occupant, then move it into place
        auto internal_name = fmt::format("##{}#{}", name, repr_hex(unique_id()));
        scope.set(internal_name, value::Value::from(Safehouse(scope.name(), std::string(name))), true);
        auto drop_internal = make_scope_exit([&] { scope.erase(internal_name); });

        auto &house = scope.get(internal_name).as<Safehouse>();
        const auto &refugee = this->house(name, house, scope);
        scope.set(name, scope.take(internal_name), true);

        // The stored Safehouse keeps its address when its binding moves
        for (const auto &observer : _observers) { observer->on_safehouse_displaced(scope, name, house, refugee); }
        return house;
    }

    const Refugee &BindingRegistry::house(std::string_view name, Safehouse &safehouse, const BindingScope &scope) {
        if (safehouse.scope_name() != scope.name()) {
            throw_error<std::invalid_argument>("Safehouse {} does not belong to scope {}.", safehouse.qualified_name(),
                                               scope.name());
        }
        return safehouse.admit(Refugee(scope.name(), std::string(name), value::Value::copy(scope.get(name))));
    }

    const Refugee &BindingRegistry::retrieve(unique_id_t id, const Safehouse &safehouse) {
        return safehouse[id];
    }

    Safehouse::refugee_list BindingRegistry::retrieve(std::string_view name, const Safehouse &safehouse) {
        return safehouse[name];
    }

    const value::Value &BindingRegistry::assign(std::string_view name, value::Value value, BindingScope &scope,
                                                std::string_view house_name, bool allow_constant_overwrite) {
        // ValidateName
        if (!is_valid_name(name)) { throw_error<InvalidName>("'{}' is not a valid variable name.", name); }
        if (!is_valid_name(house_name)) { throw_error<InvalidName>("'{}' is not a valid safehouse name.", house_name); }
        if (name == house_name && scope.exists(name)) {
            throw_error<InvalidName>("'{}' names the safehouse that would receive its current value in {}.", name,
                                     scope.name());
        }

        // CheckConstant
        const bool constant = scope.is_immutable(name);
        if (constant && !allow_constant_overwrite) {
            throw_error<ConstantBinding>(
                "Variable `{}` in {} is a constant. Use `allow_constant_overwrite=true` to overwrite it.", name,
                scope.name());
        }
        if (constant) {
            for (const auto &observer : _observers) { observer->on_constant_overwrite(scope, name); }
        }

        // CheckExisting
        if (scope.exists(name)) {
            auto &safehouse = get_or_create_safehouse(scope, house_name);
            const auto &refugee = house(name, safehouse, scope);
            for (const auto &observer : _observers) {
                observer->on_binding_displaced(scope, name, safehouse, refugee);
            }
        }

        // Bind
        scope.set(name, std::move(value), constant);
        return scope.get(name);
    }

} // namespace safeio
