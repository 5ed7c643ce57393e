#include <safeio/notice_log.h>
#include <safeio/registry/binding_scope.h>
#include <safeio/registry/safehouse.h>
#include <safeio/util/unique_id.h>

#include <fmt/format.h>

namespace safeio {

    // Static member initialization
    bool NoticeLog::_enabled = true;

    NoticeLog::NoticeLog(std::FILE *out) : _out(out) {
    }

    void NoticeLog::set_enabled(bool value) {
        _enabled = value;
    }

    bool NoticeLog::enabled() {
        return _enabled;
    }

    void NoticeLog::_print(const std::string &msg) const {
        if (!_enabled || _out == nullptr) { return; }
        fmt::print(_out, "Warning: {}\n", msg);
        std::fflush(_out);
    }

    void NoticeLog::on_backup_created(const std::filesystem::path &original, const std::filesystem::path &backup,
                                      const std::string &modified) {
        _print(fmt::format("File {} already exists. Last modified {}. The EXISTING file has been renamed to {}.",
                           original.string(), modified, backup.string()));
    }

    void NoticeLog::on_failure_unchanged(const std::filesystem::path &original, const std::filesystem::path &backup) {
        _print(fmt::format(
            "An error occurred during executing the function, and a file exists at {}. The file remains unchanged. "
            "However, a backup copy has been saved to {}.", original.string(), backup.string()));
    }

    void NoticeLog::on_failure_modified(const std::filesystem::path &original, const std::filesystem::path &backup) {
        _print(fmt::format(
            "An error occurred during executing the function, and a file exists at {}. The file has been MODIFIED. "
            "The existing file has been backed up to {}. Retrieve timely if needed.", original.string(),
            backup.string()));
    }

    void NoticeLog::on_bookkeeping_failed(const std::filesystem::path &original, const std::filesystem::path &backup,
                                          const std::exception &error) {
        _print(fmt::format("Backup bookkeeping for {} did not complete ({}). Any surviving copy is at {}.",
                           original.string(), error.what(), backup.string()));
    }

    void NoticeLog::on_safehouse_displaced(const BindingScope &scope, std::string_view name, const Safehouse &house,
                                           const Refugee &refugee) {
        _print(fmt::format(
            "A variable named `{}` already exists in scope `{}` but is not a Safehouse. This variable has been housed "
            "in a new Safehouse with the given name `{}` (ID {}).", name, scope.name(), house.name(),
            repr_hex(refugee.id(), true)));
    }

    void NoticeLog::on_binding_displaced(const BindingScope &scope, std::string_view name, const Safehouse &house,
                                         const Refugee &refugee) {
        _print(fmt::format(
            "Variable `{}` already defined in {}. The existing value has been stored in safehouse `{}` with ID {}.",
            name, scope.name(), house.qualified_name(), repr_hex(refugee.id(), true)));
    }

    void NoticeLog::on_constant_overwrite(const BindingScope &scope, std::string_view name) {
        _print(fmt::format("Assigning to constant variable `{}` in {}.", name, scope.name()));
    }

} // namespace safeio
