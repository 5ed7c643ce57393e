#include <safeio/registry/refugee.h>
#include <safeio/util/string_utils.h>

#include <fmt/format.h>

namespace safeio {

    Refugee::Refugee(std::string scope_name, std::string varname, value::Value val)
        : _scope_name(std::move(scope_name)), _varname(std::move(varname)), _id(unique_id()), _housed(now()),
          _val(std::move(val)) {
    }

    Refugee::Refugee(const Refugee &other)
        : _scope_name(other._scope_name), _varname(other._varname), _id(other._id), _housed(other._housed),
          _val(value::Value::copy(other._val)) {
    }

    std::string Refugee::to_string() const {
        return fmt::format("Refugee{{{}}}({}#{} = {})", _scope_name, _varname, repr_hex(_id), _val.to_string());
    }

    std::string Refugee::describe() const {
        return fmt::format("Refugee{{{}}}({}#{}) housed at {}:\n  {}", _scope_name, _varname, repr_hex(_id),
                           safeio::to_string(_housed), _val.to_string());
    }

} // namespace safeio
