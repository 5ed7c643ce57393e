#include <catch2/catch_test_macros.hpp>

#include <safeio/guard/file_guard.h>
#include <safeio/registry/binding_registry.h>
#include <safeio/serialization/serializer.h>

#include "test_support.h"

#include <map>
#include <string>

using namespace safeio;
using namespace safeio::testing;

TEST_CASE("protected_load - loads into an unbound name", "[registry][load]") {
    TempDir dir;
    auto recorder = std::make_shared<RecordingObserver>();
    BindingRegistry registry{{recorder}};
    auto &scope = registry.scope();
    JsonSerializer<std::map<std::string, int>> serializer;
    auto path = dir / "scores.json";
    serializer.store({{"alice", 3}}, path);

    const auto &loaded = registry.protected_load("scores", path, scope, serializer);

    CHECK(loaded.at("alice") == 3);
    CHECK(&loaded == &scope.get_as<std::map<std::string, int>>("scores"));
    CHECK(recorder->notices.empty());
}

TEST_CASE("protected_load - the replaced value is housed", "[registry][load]") {
    TempDir dir;
    auto recorder = std::make_shared<RecordingObserver>();
    BindingRegistry registry{{recorder}};
    auto &scope = registry.scope("Loader");
    JsonSerializer<std::string> serializer;
    auto path = dir / "greeting.json";
    serializer.store("from disk", path);

    registry.assign("greeting", std::string("in memory"), scope);
    CHECK(registry.protected_load("greeting", path, scope, serializer, "BACKUPS") == "from disk");

    const auto &house = scope.get_as<Safehouse>("BACKUPS");
    auto housed = house["greeting"];
    REQUIRE(housed.size() == 1);
    CHECK(housed.front().get().get<std::string>() == "in memory");
    CHECK(recorder->events() == std::vector<Event>{Event::BindingDisplaced});
}

TEST_CASE("protected_load - a failing load leaves the binding alone", "[registry][load]") {
    TempDir dir;
    BindingRegistry registry{std::vector<RegistryObserver::s_ptr>{}};
    auto &scope = registry.scope();
    JsonSerializer<int> serializer;

    registry.assign("n", 1, scope);
    CHECK_THROWS_AS(registry.protected_load("n", dir / "missing.json", scope, serializer), IOFailure);
    CHECK(scope.get_as<int>("n") == 1);
    CHECK_FALSE(scope.exists(BindingRegistry::DEFAULT_HOUSE_NAME));
}

TEST_CASE("protected_store then protected_load keeps both sides backed up", "[registry][guard][load]") {
    TempDir dir;
    TempDir scratch;
    auto recorder = std::make_shared<RecordingObserver>();
    FileGuard guard{FileGuardConfig{.temp_directory = scratch.path}, {recorder}};
    BindingRegistry registry{{recorder}};
    auto &scope = registry.scope();
    JsonSerializer<int> serializer;
    auto path = dir / "counter.json";

    guard.protected_store(1, path, serializer);
    guard.protected_store(2, path, serializer);
    registry.assign("counter", 0, scope);
    registry.protected_load("counter", path, scope, serializer);

    CHECK(scope.get_as<int>("counter") == 2);
    CHECK(dir.files().size() == 2);
    CHECK(recorder->events() == std::vector<Event>{Event::BackupCreated, Event::BindingDisplaced});
}
