#pragma once

#include <safeio/registry/refugee.h>
#include <safeio/safeio_export.h>
#include <safeio/util/string_map.h>
#include <safeio/util/unique_id.h>

#include <ankerl/unordered_dense.h>

#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace safeio {

    /**
     * A Safehouse holds the Refugees of variables from one BindingScope, and lives in that same scope.
     *
     * Two indexes are kept in step: variable name to the IDs housed under it (oldest first), and ID to Refugee.
     * Every ID in the first appears exactly once as a key of the second and vice versa.
     *
     * Refugees are heap-allocated and never move once admitted, so references handed out by admit and
     * operator[] stay valid until clear() or the Safehouse's destruction.
     *
     * Copying a Safehouse deep-copies every Refugee it holds.
     */
    class SAFEIO_EXPORT Safehouse {
    public:
        using id_list = std::vector<unique_id_t>;
        using refugee_list = std::vector<std::reference_wrapper<const Refugee>>;
        using refugee_map = ankerl::unordered_dense::map<unique_id_t, std::unique_ptr<Refugee>>;

        Safehouse(std::string scope_name, std::string name);

        Safehouse(const Safehouse &other);
        Safehouse(Safehouse &&other) noexcept = default;
        Safehouse &operator=(const Safehouse &) = delete;
        Safehouse &operator=(Safehouse &&other) noexcept = default;

        [[nodiscard]] const std::string &scope_name() const { return _scope_name; }
        [[nodiscard]] const std::string &name() const { return _name; }

        // e.g. "Main.SAFEHOUSE"
        [[nodiscard]] std::string qualified_name() const;

        /**
         * Take in a Refugee, appending its ID to the history of its variable.
         * @throws std::logic_error if a Refugee with the same ID is already housed here
         */
        const Refugee &admit(Refugee refugee);

        /**
         * @throws NotFound for an unknown ID
         */
        [[nodiscard]] const Refugee &operator[](unique_id_t id) const;

        /**
         * All Refugees housed under varname, in the order they were housed.
         * @throws NotFound if varname was never housed
         */
        [[nodiscard]] refugee_list operator[](std::string_view varname) const;

        [[nodiscard]] bool contains(unique_id_t id) const { return _refugees.contains(id); }
        [[nodiscard]] bool contains(std::string_view varname) const { return _variables.contains(varname); }

        [[nodiscard]] const string_map<id_list> &variables() const { return _variables; }
        [[nodiscard]] const refugee_map &refugees() const { return _refugees; }

        [[nodiscard]] size_t size() const { return _refugees.size(); }
        [[nodiscard]] bool empty() const { return _refugees.empty(); }

        // Drops every Refugee
        void clear();

        // Safehouse{Main}(2@x, 1@y)
        [[nodiscard]] std::string to_string() const;

        // Header line followed by one line per Refugee
        [[nodiscard]] std::string describe() const;

    private:
        std::string _scope_name;
        std::string _name;
        string_map<id_list> _variables;
        refugee_map _refugees;
    };

} // namespace safeio
