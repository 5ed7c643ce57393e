#pragma once

#include <safeio/guard/file_guard_config.h>
#include <safeio/guard/file_guard_observer.h>
#include <safeio/safeio_export.h>
#include <safeio/serialization/serializer.h>
#include <safeio/util/checksum.h>
#include <safeio/util/unique_id.h>

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace safeio {

    /**
     * Observers used when none are supplied: a single NoticeLog writing to stderr.
     */
    SAFEIO_EXPORT std::vector<FileGuardObserver::s_ptr> default_file_guard_observers();

    /**
     * @brief Runs write operations against a path without silently losing what was there before.
     *
     * Protocol for an existing file: snapshot (checksum plus a temporary copy), run the operation, compare
     * checksums. Changed content promotes the temporary copy to a permanent sibling {stem}_{8hex}{ext}; unchanged
     * content discards it. A failing operation keeps whichever copy is relevant and its exception is rethrown
     * unchanged once the bookkeeping is done.
     *
     * A path with no existing file is passed straight through, with no snapshot and no notice.
     *
     * Not safe for concurrent use against the same path; callers must serialise access per path.
     */
    class SAFEIO_EXPORT FileGuard {
    public:
        explicit FileGuard(FileGuardConfig config = {},
                           std::vector<FileGuardObserver::s_ptr> observers = default_file_guard_observers());

        [[nodiscard]] const FileGuardConfig &config() const { return _config; }
        [[nodiscard]] const std::vector<FileGuardObserver::s_ptr> &observers() const { return _observers; }

        /**
         * Run operation(path) under protection and return its result.
         *
         * @throws IOFailure if the snapshot cannot be taken (the operation is not run), or if bookkeeping fails
         *         after a successful operation
         * @throws whatever operation throws, after bookkeeping
         */
        template<typename F>
        auto protect(const std::filesystem::path &path, F &&operation)
            -> std::invoke_result_t<F &, const std::filesystem::path &> {
            using result_t = std::invoke_result_t<F &, const std::filesystem::path &>;

            auto snapshot = take_snapshot(path);
            if (!snapshot) { return std::invoke(operation, path); }

            if constexpr (std::is_void_v<result_t>) {
                run_or_settle(*snapshot, [&] { std::invoke(operation, path); });
                settle_success(*snapshot);
            } else {
                result_t result = run_or_settle(*snapshot, [&]() -> result_t { return std::invoke(operation, path); });
                settle_success(*snapshot);
                return result;
            }
        }

        /**
         * Store value at path through serializer, protecting whatever was there. Returns path.
         */
        template<typename T>
        std::filesystem::path protected_store(const T &value, const std::filesystem::path &path,
                                              const Serializer<T> &serializer) {
            protect(path, [&](const std::filesystem::path &p) { serializer.store(value, p); });
            return path;
        }

        /**
         * Store value under a generated name {8hex}{default_extension} in the current directory.
         */
        template<typename T>
        std::filesystem::path protected_store(const T &value, const Serializer<T> &serializer) {
            return protected_store(value, generated_store_path(), serializer);
        }

        /**
         * The permanent backup name for path and id: {stem}{separator}{8hex}{ext}, next to path.
         */
        [[nodiscard]] std::filesystem::path backup_path(const std::filesystem::path &path, unique_id_t id) const;

        /**
         * The first ID from id upwards whose backup and temporary names for path are both unused.
         * IDs wrap, so a backup left by an earlier run can carry the ID just drawn.
         * @throws IOFailure after MAX_NAME_ATTEMPTS taken names
         */
        [[nodiscard]] unique_id_t free_backup_id(const std::filesystem::path &path, unique_id_t id) const;

        static constexpr size_t MAX_NAME_ATTEMPTS{64};

    private:
        struct Snapshot {
            std::filesystem::path original;
            std::filesystem::path backup_tmp;
            std::filesystem::path new_path;
            checksum_t before{0};
            std::string modified;
        };

        [[nodiscard]] std::filesystem::path temp_path(const std::filesystem::path &path, unique_id_t id) const;

        [[nodiscard]] std::optional<Snapshot> take_snapshot(const std::filesystem::path &path) const;

        void settle_success(const Snapshot &snapshot) const;

        // Best effort: never throws over the operation's exception
        void settle_failure(const Snapshot &snapshot) const noexcept;

        [[nodiscard]] bool content_changed(const Snapshot &snapshot) const;

        void promote(const Snapshot &snapshot) const;

        [[nodiscard]] std::filesystem::path generated_store_path() const;

        template<typename F>
        decltype(auto) run_or_settle(const Snapshot &snapshot, F &&fn) const {
            try {
                return fn();
            } catch (...) {
                settle_failure(snapshot);
                throw;
            }
        }

        FileGuardConfig _config;
        std::vector<FileGuardObserver::s_ptr> _observers;
    };

    /**
     * Protect path around operation with a default-configured FileGuard.
     */
    template<typename F>
    auto protect(const std::filesystem::path &path, F &&operation)
        -> std::invoke_result_t<F &, const std::filesystem::path &> {
        FileGuard guard;
        return guard.protect(path, std::forward<F>(operation));
    }

} // namespace safeio
