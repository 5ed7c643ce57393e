/**
 * @file test_file_guard.cpp
 * @brief Unit tests for FileGuard::protect.
 *
 * Covers:
 * - Pass-through when no file exists
 * - Backup on change, no backup when nothing changed
 * - Failing operations: unchanged file, modified file, removed file
 * - Snapshot failures aborting before the operation runs
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <safeio/guard/file_guard.h>
#include <safeio/util/errors.h>

#include "test_support.h"

#include <algorithm>
#include <regex>
#include <stdexcept>

using namespace safeio;
using namespace safeio::testing;

namespace {

const std::string hello_world = "Hello World";
const std::string hello_again = "Hello Again!";

struct GuardFixture {
    TempDir dir;
    TempDir scratch;
    fs::path path = dir / "greeting.dat";
    std::shared_ptr<RecordingObserver> recorder = std::make_shared<RecordingObserver>();
    FileGuard guard{FileGuardConfig{.temp_directory = scratch.path}, {recorder}};

    [[nodiscard]] std::vector<std::string> backups() const {
        std::vector<std::string> result;
        for (const auto& name : dir.files()) {
            if (name != "greeting.dat") { result.push_back(name); }
        }
        return result;
    }
};

bool is_backup_name(const std::string& name) {
    static const std::regex pattern{"greeting_[0-9a-f]{8}\\.dat"};
    return std::regex_match(name, pattern);
}

}  // namespace

// ============================================================================
// Successful operations
// ============================================================================

TEST_CASE_METHOD(GuardFixture, "FileGuard - no existing file passes straight through", "[guard][protect]") {
    auto written = guard.protect(path, [](const fs::path& p) { return write_file(p, hello_world); });

    CHECK(written == hello_world.size());
    CHECK(read_file(path) == hello_world);
    CHECK(backups().empty());
    CHECK(scratch.files().empty());
    CHECK(recorder->notices.empty());
}

TEST_CASE_METHOD(GuardFixture, "FileGuard - overwriting keeps exactly one backup of the prior content",
                 "[guard][protect]") {
    write_file(path, hello_world);

    auto written = guard.protect(path, [](const fs::path& p) { return write_file(p, hello_again); });

    CHECK(written == hello_again.size());
    CHECK(read_file(path) == hello_again);

    auto names = backups();
    REQUIRE(names.size() == 1);
    CHECK(is_backup_name(names.front()));
    CHECK(read_file(dir / names.front()) == hello_world);
    CHECK(scratch.files().empty());

    REQUIRE(recorder->notices.size() == 1);
    const auto& notice = recorder->notices.front();
    CHECK(notice.event == Event::BackupCreated);
    CHECK(notice.original == path);
    CHECK(notice.backup == dir / names.front());
}

TEST_CASE_METHOD(GuardFixture, "FileGuard - repeated overwrites keep every prior version", "[guard][protect]") {
    write_file(path, "v1");
    guard.protect(path, [](const fs::path& p) { write_file(p, "v2"); });
    guard.protect(path, [](const fs::path& p) { write_file(p, "v3"); });

    CHECK(read_file(path) == "v3");
    auto names = backups();
    REQUIRE(names.size() == 2);
    std::vector<std::string> contents;
    for (const auto& name : names) { contents.push_back(read_file(dir / name)); }
    std::ranges::sort(contents);
    CHECK(contents == std::vector<std::string>{"v1", "v2"});
}

TEST_CASE_METHOD(GuardFixture, "FileGuard - unchanged content leaves no backup behind", "[guard][protect]") {
    write_file(path, hello_world);

    SECTION("read-only operation") {
        auto content = guard.protect(path, [](const fs::path& p) { return read_file(p); });
        CHECK(content == hello_world);
    }
    SECTION("rewrite with identical bytes") {
        guard.protect(path, [](const fs::path& p) { write_file(p, hello_world); });
    }

    CHECK(read_file(path) == hello_world);
    CHECK(backups().empty());
    CHECK(scratch.files().empty());
    CHECK(recorder->notices.empty());
}

TEST_CASE_METHOD(GuardFixture, "FileGuard - backup name uses the configured separator", "[guard][config]") {
    FileGuard dashed{FileGuardConfig{.temp_directory = scratch.path, .backup_separator = "-"}, {recorder}};
    CHECK(dashed.backup_path(dir / "archive.tar.gz", 0x00c0ffee) == dir / "archive.tar-00c0ffee.gz");
    CHECK(guard.backup_path(dir / "notes", 0xa8de13fa) == dir / "notes_a8de13fa");
}

// ============================================================================
// Failing operations
// ============================================================================

TEST_CASE_METHOD(GuardFixture, "FileGuard - failure without modification keeps the temporary copy",
                 "[guard][protect][failure]") {
    write_file(path, hello_world);

    CHECK_THROWS_WITH(guard.protect(path, [](const fs::path&) -> int { throw std::runtime_error("Intentional Error"); }),
                      "Intentional Error");

    CHECK(read_file(path) == hello_world);
    CHECK(backups().empty());

    REQUIRE(recorder->notices.size() == 1);
    const auto& notice = recorder->notices.front();
    CHECK(notice.event == Event::FailureUnchanged);
    REQUIRE(fs::exists(notice.backup));
    CHECK(notice.backup.parent_path() == scratch.path);
    CHECK(read_file(notice.backup) == hello_world);
}

TEST_CASE_METHOD(GuardFixture, "FileGuard - failure after modification promotes the backup",
                 "[guard][protect][failure]") {
    write_file(path, hello_again);

    CHECK_THROWS_WITH(guard.protect(path, [](const fs::path& p) {
        write_file(p, "Hello Error!?");
        throw std::runtime_error("Intentional Error after write");
    }), "Intentional Error after write");

    CHECK(read_file(path) == "Hello Error!?");
    auto names = backups();
    REQUIRE(names.size() == 1);
    CHECK(read_file(dir / names.front()) == hello_again);
    CHECK(scratch.files().empty());

    CHECK(recorder->events() == std::vector<Event>{Event::BackupCreated, Event::FailureModified});
    CHECK(recorder->notices[1].backup == dir / names.front());
}

TEST_CASE_METHOD(GuardFixture, "FileGuard - the original exception type reaches the caller",
                 "[guard][protect][failure]") {
    struct CustomError {
        int code;
    };
    write_file(path, hello_world);

    try {
        guard.protect(path, [](const fs::path&) { throw CustomError{7}; });
        FAIL("expected CustomError");
    } catch (const CustomError& e) {
        CHECK(e.code == 7);
    }
}

TEST_CASE_METHOD(GuardFixture, "FileGuard - an operation removing the file counts as a modification",
                 "[guard][protect]") {
    write_file(path, hello_world);

    guard.protect(path, [](const fs::path& p) { fs::remove(p); });

    CHECK_FALSE(fs::exists(path));
    auto names = backups();
    REQUIRE(names.size() == 1);
    CHECK(read_file(dir / names.front()) == hello_world);
}

TEST_CASE_METHOD(GuardFixture, "FileGuard - failure on a missing file passes straight through",
                 "[guard][protect][failure]") {
    CHECK_THROWS_AS(guard.protect(path, [](const fs::path&) { throw std::logic_error("nope"); }), std::logic_error);
    CHECK(dir.files().empty());
    CHECK(recorder->notices.empty());
}

// ============================================================================
// Snapshot failures
// ============================================================================

TEST_CASE("FileGuard - unusable temporary directory aborts before the operation", "[guard][protect][io]") {
    TempDir dir;
    auto path = dir / "greeting.dat";
    write_file(path, hello_world);
    auto recorder = std::make_shared<RecordingObserver>();
    FileGuard guard{FileGuardConfig{.temp_directory = dir / "does-not-exist"}, {recorder}};

    bool ran = false;
    CHECK_THROWS_AS(guard.protect(path, [&](const fs::path& p) {
        ran = true;
        write_file(p, hello_again);
    }), IOFailure);

    CHECK_FALSE(ran);
    CHECK(read_file(path) == hello_world);
    CHECK(dir.files() == std::vector<std::string>{"greeting.dat"});
    CHECK(recorder->notices.empty());
}

TEST_CASE("FileGuard - a path that cannot be inspected aborts before the operation", "[guard][protect][io]") {
    TempDir dir;
    auto path = dir / "loop";
    fs::create_symlink("loop", path);
    auto recorder = std::make_shared<RecordingObserver>();
    FileGuard guard{FileGuardConfig{.temp_directory = dir.path}, {recorder}};

    bool ran = false;
    CHECK_THROWS_AS(guard.protect(path, [&](const fs::path&) { ran = true; }), IOFailure);

    CHECK_FALSE(ran);
    CHECK(dir.files() == std::vector<std::string>{"loop"});
    CHECK(recorder->notices.empty());
}

// ============================================================================
// Backup names
// ============================================================================

TEST_CASE_METHOD(GuardFixture, "FileGuard - names left by earlier runs are never reused", "[guard][names]") {
    auto taken_backup = dir / "greeting_00000010.dat";
    auto taken_temp = scratch / "safeio-greeting_00000011.dat";
    write_file(taken_backup, "earlier backup");
    write_file(taken_temp, "earlier temporary copy");

    CHECK(guard.free_backup_id(path, 0x10) == 0x12);
    CHECK(guard.free_backup_id(path, 0x20) == 0x20);

    CHECK(read_file(taken_backup) == "earlier backup");
    CHECK(read_file(taken_temp) == "earlier temporary copy");
}

// ============================================================================
// Bookkeeping failures
// ============================================================================

TEST_CASE_METHOD(GuardFixture, "FileGuard - failed bookkeeping after a failing operation still rethrows its error",
                 "[guard][protect][failure]") {
    struct WriteAborted {
        std::string reason;
    };
    write_file(path, hello_world);
    const auto scratch_dir = scratch.path;

    try {
        guard.protect(path, [&](const fs::path& p) {
            write_file(p, hello_again);
            fs::remove_all(scratch_dir);
            throw WriteAborted{"disk went away"};
        });
        FAIL("expected WriteAborted");
    } catch (const WriteAborted& e) {
        CHECK(e.reason == "disk went away");
    }

    CHECK(read_file(path) == hello_again);
    CHECK(backups().empty());
    REQUIRE(recorder->events() == std::vector<Event>{Event::BookkeepingFailed});
    CHECK(recorder->notices.front().original == path);
}

TEST_CASE_METHOD(GuardFixture, "FileGuard - failed bookkeeping after a successful operation raises IOFailure",
                 "[guard][protect][io]") {
    write_file(path, hello_world);
    const auto scratch_dir = scratch.path;

    CHECK_THROWS_AS(guard.protect(path, [&](const fs::path& p) {
        write_file(p, hello_again);
        fs::remove_all(scratch_dir);
    }), IOFailure);

    CHECK(read_file(path) == hello_again);
    CHECK(backups().empty());
    CHECK(recorder->notices.empty());
}
