#include <safeio/registry/binding_scope.h>
#include <safeio/util/errors.h>

#include <algorithm>
#include <utility>

namespace safeio {

    BindingScope::BindingScope(std::string name) : _name(std::move(name)) {
    }

    bool BindingScope::exists(std::string_view name) const {
        return _bindings.contains(name);
    }

    bool BindingScope::is_immutable(std::string_view name) const {
        auto it = _bindings.find(name);
        return it != _bindings.end() && it->second.immutable;
    }

    const value::Value &BindingScope::get(std::string_view name) const {
        auto it = _bindings.find(name);
        if (it == _bindings.end()) { throw_error<NotFound>("Variable `{}` is not defined in {}.", name, _name); }
        return it->second.value;
    }

    value::Value &BindingScope::get(std::string_view name) {
        return const_cast<value::Value &>(std::as_const(*this).get(name));
    }

    void BindingScope::set(std::string_view name, value::Value value, bool immutable) {
        auto it = _bindings.find(name);
        if (it != _bindings.end()) {
            it->second = Binding{std::move(value), immutable};
        } else {
            _bindings.emplace(std::string(name), Binding{std::move(value), immutable});
        }
    }

    value::Value BindingScope::take(std::string_view name) {
        auto it = _bindings.find(name);
        if (it == _bindings.end()) { throw_error<NotFound>("Variable `{}` is not defined in {}.", name, _name); }
        value::Value result = std::move(it->second.value);
        _bindings.erase(it);
        return result;
    }

    bool BindingScope::erase(std::string_view name) {
        auto it = _bindings.find(name);
        if (it == _bindings.end()) { return false; }
        _bindings.erase(it);
        return true;
    }

    void BindingScope::clear() {
        _bindings.clear();
    }

    std::vector<std::string> BindingScope::names() const {
        std::vector<std::string> result;
        result.reserve(_bindings.size());
        for (const auto &[name, _] : _bindings) { result.push_back(name); }
        std::ranges::sort(result);
        return result;
    }

} // namespace safeio
