#pragma once

#include <exception>
#include <filesystem>
#include <memory>
#include <string>

namespace safeio {

    /**
     * Receives the notices raised while a FileGuard protects a path.
     * All hooks default to no-ops; override the ones of interest.
     */
    struct FileGuardObserver {
        using s_ptr = std::shared_ptr<FileGuardObserver>;

        virtual ~FileGuardObserver() = default;

        /**
         * The content at original changed, and its prior content now lives at backup.
         * @param modified the prior modification time, phrased e.g. "on 11 Dec 2025 at 11:25:35"
         */
        virtual void on_backup_created(const std::filesystem::path &original, const std::filesystem::path &backup,
                                       const std::string &modified) {
        };

        // The operation failed without touching the file; the temporary copy is kept at backup.
        virtual void on_failure_unchanged(const std::filesystem::path &original, const std::filesystem::path &backup) {
        };

        // The operation failed after changing the file; the prior content lives at backup.
        virtual void on_failure_modified(const std::filesystem::path &original, const std::filesystem::path &backup) {
        };

        // Bookkeeping after a failed operation did not complete. The operation's own error is still rethrown.
        virtual void on_bookkeeping_failed(const std::filesystem::path &original, const std::filesystem::path &backup,
                                           const std::exception &error) {
        };
    };

} // namespace safeio
