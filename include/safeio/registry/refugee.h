#pragma once

#include <safeio/safeio_export.h>
#include <safeio/util/date_time.h>
#include <safeio/util/unique_id.h>
#include <safeio/value/value.h>

#include <string>

namespace safeio {

    /**
     * A Refugee holds a copy of a variable's value displaced from a BindingScope. It is a member of a Safehouse
     * of that scope. Use operator* to access the stored value.
     *
     * A Refugee never changes after construction. Copying one deep-copies the stored value.
     */
    class SAFEIO_EXPORT Refugee {
    public:
        /**
         * Takes ownership of an already copied value; draws a fresh ID and stamps the capture time.
         */
        Refugee(std::string scope_name, std::string varname, value::Value val);

        Refugee(const Refugee &other);
        Refugee(Refugee &&other) noexcept = default;
        Refugee &operator=(const Refugee &) = delete;
        Refugee &operator=(Refugee &&) noexcept = default;

        [[nodiscard]] const std::string &scope_name() const { return _scope_name; }
        [[nodiscard]] const std::string &varname() const { return _varname; }
        [[nodiscard]] unique_id_t id() const { return _id; }
        [[nodiscard]] const timestamp_t &housed() const { return _housed; }

        [[nodiscard]] const value::Value &operator*() const { return _val; }
        [[nodiscard]] const value::Value *operator->() const { return &_val; }

        template<typename T>
        [[nodiscard]] const T &get() const { return _val.template as<T>(); }

        // Refugee{Main}(x#e2606248 = "Hello")
        [[nodiscard]] std::string to_string() const;

        // Multi-line form with capture time
        [[nodiscard]] std::string describe() const;

    private:
        std::string _scope_name;
        std::string _varname;
        unique_id_t _id;
        timestamp_t _housed;
        value::Value _val;
    };

} // namespace safeio
