#include <safeio/registry/safehouse.h>
#include <safeio/util/errors.h>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <algorithm>
#include <memory>
#include <stdexcept>

namespace safeio {

    Safehouse::Safehouse(std::string scope_name, std::string name)
        : _scope_name(std::move(scope_name)), _name(std::move(name)) {
    }

    Safehouse::Safehouse(const Safehouse &other)
        : _scope_name(other._scope_name), _name(other._name), _variables(other._variables) {
        _refugees.reserve(other._refugees.size());
        for (const auto &[id, refugee] : other._refugees) { _refugees.emplace(id, std::make_unique<Refugee>(*refugee)); }
    }

    std::string Safehouse::qualified_name() const {
        return fmt::format("{}.{}", _scope_name, _name);
    }

    const Refugee &Safehouse::admit(Refugee refugee) {
        auto id = refugee.id();
        auto varname = refugee.varname();
        if (_refugees.contains(id)) {
            throw_error<std::logic_error>("Refugee #{} is already housed in {}", repr_hex(id), qualified_name());
        }
        auto &stored = _refugees.emplace(id, std::make_unique<Refugee>(std::move(refugee))).first->second;
        _variables[varname].push_back(id);
        return *stored;
    }

    const Refugee &Safehouse::operator[](unique_id_t id) const {
        auto it = _refugees.find(id);
        if (it == _refugees.end()) {
            throw_error<NotFound>("No refugee with ID {} in safehouse {}.", repr_hex(id, true), qualified_name());
        }
        return *it->second;
    }

    Safehouse::refugee_list Safehouse::operator[](std::string_view varname) const {
        auto it = _variables.find(varname);
        if (it == _variables.end()) {
            throw_error<NotFound>("Variable `{}` has never been housed in safehouse {}.", varname, qualified_name());
        }
        refugee_list result;
        result.reserve(it->second.size());
        for (auto id : it->second) { result.emplace_back((*this)[id]); }
        return result;
    }

    void Safehouse::clear() {
        _variables.clear();
        _refugees.clear();
    }

    std::string Safehouse::to_string() const {
        std::vector<std::string> counts;
        counts.reserve(_variables.size());
        for (const auto &[varname, ids] : _variables) { counts.push_back(fmt::format("{}@{}", ids.size(), varname)); }
        std::ranges::sort(counts);
        return fmt::format("Safehouse{{{}}}({})", _scope_name, fmt::join(counts, ", "));
    }

    std::string Safehouse::describe() const {
        std::string out = fmt::format("Safehouse{{{}}} with {} refugees in {} variables:", _scope_name,
                                      _refugees.size(), _variables.size());
        for (const auto &[varname, ids] : _variables) {
            for (auto id : ids) { out += fmt::format("\n  {}", (*this)[id].to_string()); }
        }
        return out;
    }

} // namespace safeio
