#include <safeio/guard/file_guard.h>
#include <safeio/notice_log.h>
#include <safeio/util/date_time.h>
#include <safeio/util/errors.h>
#include <safeio/util/scope.h>
#include <safeio/util/string_utils.h>

#include <fmt/format.h>

#include <system_error>

namespace fs = std::filesystem;

namespace safeio {

    std::vector<FileGuardObserver::s_ptr> default_file_guard_observers() {
        return {std::make_shared<NoticeLog>()};
    }

    FileGuard::FileGuard(FileGuardConfig config, std::vector<FileGuardObserver::s_ptr> observers)
        : _config(std::move(config)), _observers(std::move(observers)) {
    }

    fs::path FileGuard::backup_path(const fs::path &path, unique_id_t id) const {
        auto file_name = fmt::format("{}{}{}{}", path.stem().string(), _config.backup_separator, repr_hex(id),
                                     path.extension().string());
        return path.parent_path() / file_name;
    }

    fs::path FileGuard::temp_path(const fs::path &path, unique_id_t id) const {
        return _config.resolved_temp_directory() /
               fmt::format("safeio-{}_{}{}", path.stem().string(), repr_hex(id), path.extension().string());
    }

    unique_id_t FileGuard::free_backup_id(const fs::path &path, unique_id_t id) const {
        for (size_t attempt = 0; attempt < MAX_NAME_ATTEMPTS; ++attempt, ++id) {
            if (!fs::exists(backup_path(path, id)) && !fs::exists(temp_path(path, id))) { return id; }
        }
        throw_error<IOFailure>("No free backup name for {} after {} attempts", path.string(), MAX_NAME_ATTEMPTS);
    }

    std::optional<FileGuard::Snapshot> FileGuard::take_snapshot(const fs::path &path) const {
        std::error_code ec;
        auto status = fs::status(path, ec);
        if (status.type() == fs::file_type::not_found) { return std::nullopt; }
        if (ec) { throw_error<IOFailure>("Unable to inspect {} before writing: {}", path.string(), ec.message()); }
        if (!fs::is_regular_file(status)) { return std::nullopt; }

        Snapshot snapshot{};
        snapshot.original = path;

        // Only a copy this call started may be removed on failure
        bool copy_started = false;
        scope_fail cleanup{[&] {
            std::error_code ignored;
            if (copy_started) { fs::remove(snapshot.backup_tmp, ignored); }
        }};
        try {
            auto id = free_backup_id(path, unique_id());
            snapshot.backup_tmp = temp_path(path, id);
            snapshot.new_path = backup_path(path, id);
            snapshot.modified = modified_label(to_timestamp(fs::last_write_time(path)));
            snapshot.before = file_checksum(path);
            copy_started = true;
            fs::copy_file(path, snapshot.backup_tmp);
        } catch (const fs::filesystem_error &e) {
            if (e.code() == std::errc::file_exists) { copy_started = false; }
            throw_error<IOFailure>("Unable to back up {} before writing: {}", path.string(), e.what());
        }
        return snapshot;
    }

    bool FileGuard::content_changed(const Snapshot &snapshot) const {
        // An operation that removed or replaced the file with something else counts as a modification
        std::error_code ec;
        if (!fs::is_regular_file(snapshot.original, ec)) { return true; }
        return file_checksum(snapshot.original) != snapshot.before;
    }

    void FileGuard::promote(const Snapshot &snapshot) const {
        if (fs::exists(snapshot.new_path)) {
            throw_error<IOFailure>("Backup target {} appeared while {} was being written", snapshot.new_path.string(),
                                   snapshot.original.string());
        }
        std::error_code ec;
        fs::rename(snapshot.backup_tmp, snapshot.new_path, ec);
        if (ec) {
            // Temporary directory on another filesystem
            fs::copy_file(snapshot.backup_tmp, snapshot.new_path);
            fs::remove(snapshot.backup_tmp);
        }
        for (const auto &observer : _observers) {
            observer->on_backup_created(snapshot.original, snapshot.new_path, snapshot.modified);
        }
    }

    void FileGuard::settle_success(const Snapshot &snapshot) const {
        try {
            if (content_changed(snapshot)) {
                promote(snapshot);
            } else {
                fs::remove(snapshot.backup_tmp);
            }
        } catch (const fs::filesystem_error &e) {
            throw_error<IOFailure>("Unable to settle the backup of {} (copy kept at {}): {}",
                                   snapshot.original.string(), snapshot.backup_tmp.string(), e.what());
        }
    }

    void FileGuard::settle_failure(const Snapshot &snapshot) const noexcept {
        try {
            if (content_changed(snapshot)) {
                promote(snapshot);
                for (const auto &observer : _observers) {
                    observer->on_failure_modified(snapshot.original, snapshot.new_path);
                }
            } else {
                for (const auto &observer : _observers) {
                    observer->on_failure_unchanged(snapshot.original, snapshot.backup_tmp);
                }
            }
        } catch (const std::exception &e) {
            for (const auto &observer : _observers) {
                observer->on_bookkeeping_failed(snapshot.original, snapshot.backup_tmp, e);
            }
        }
    }

    fs::path FileGuard::generated_store_path() const {
        return fs::current_path() / fmt::format("{}{}", repr_hex(unique_id()), _config.default_extension);
    }

} // namespace safeio
