#pragma once

#include <safeio/guard/file_guard_observer.h>
#include <safeio/registry/registry_observer.h>
#include <safeio/safeio_export.h>

#include <cstdio>
#include <string>

namespace safeio {

    /**
     * @brief Writes every notice as a human-readable "Warning: ..." line.
     *
     * This is the observer installed when a FileGuard or BindingRegistry is built without explicit observers.
     * Messages are formatted here and nowhere else, so the wording is stable across both protocols.
     */
    class SAFEIO_EXPORT NoticeLog : public FileGuardObserver, public RegistryObserver {
    public:
        /**
         * @param out destination stream, stderr unless redirected; the stream is not owned
         */
        explicit NoticeLog(std::FILE *out = stderr);

        void on_backup_created(const std::filesystem::path &original, const std::filesystem::path &backup,
                               const std::string &modified) override;
        void on_failure_unchanged(const std::filesystem::path &original, const std::filesystem::path &backup) override;
        void on_failure_modified(const std::filesystem::path &original, const std::filesystem::path &backup) override;
        void on_bookkeeping_failed(const std::filesystem::path &original, const std::filesystem::path &backup,
                                   const std::exception &error) override;

        void on_safehouse_displaced(const BindingScope &scope, std::string_view name, const Safehouse &house,
                                    const Refugee &refugee) override;
        void on_binding_displaced(const BindingScope &scope, std::string_view name, const Safehouse &house,
                                  const Refugee &refugee) override;
        void on_constant_overwrite(const BindingScope &scope, std::string_view name) override;

        // Silences every NoticeLog in the process, e.g. for batch jobs that expect overwrites
        static void set_enabled(bool value);
        [[nodiscard]] static bool enabled();

    private:
        std::FILE *_out;

        static bool _enabled;

        void _print(const std::string &msg) const;
    };

} // namespace safeio
