/**
 * @file test_value.cpp
 * @brief Unit tests for the owning type-erased Value.
 *
 * Covers:
 * - Construction from typed values and typed access
 * - Value::copy producing an independent deep copy
 * - Move semantics keeping the stored address
 * - equals() / to_string()
 */

#include <catch2/catch_test_macros.hpp>

#include <safeio/value/value.h>

#include <map>
#include <stdexcept>
#include <string>
#include <vector>

using namespace safeio::value;

namespace {

struct Point {
    int x{0};
    int y{0};

    bool operator==(const Point&) const = default;

    [[nodiscard]] std::string to_string() const {
        return "Point(" + std::to_string(x) + ", " + std::to_string(y) + ")";
    }
};

}  // namespace

// ============================================================================
// Construction and access
// ============================================================================

TEST_CASE("Value - default constructed is invalid", "[value]") {
    Value v;
    CHECK_FALSE(v.valid());
    CHECK(v.schema() == nullptr);
    CHECK(v.to_string() == "<unset>");
}

TEST_CASE("Value - from() stores and exposes the typed value", "[value]") {
    auto v = Value::from(int64_t{42});
    REQUIRE(v.valid());
    CHECK(v.is_type<int64_t>());
    CHECK_FALSE(v.is_type<int>());
    CHECK(v.as<int64_t>() == 42);
    CHECK(v.try_as<std::string>() == nullptr);
    CHECK_THROWS_AS(v.as<std::string>(), std::runtime_error);
}

TEST_CASE("Value - schema identity is per type", "[value]") {
    auto a = Value::from(std::string("a"));
    auto b = Value::from(std::string("b"));
    auto c = Value::from(1.5);
    CHECK(a.same_type_as(b));
    CHECK_FALSE(a.same_type_as(c));
}

// ============================================================================
// Deep copy
// ============================================================================

TEST_CASE("Value - copy does not alias the source", "[value][copy]") {
    auto original = Value::from(std::vector<std::string>{"alpha", "beta"});
    auto duplicate = Value::copy(original);

    original.as<std::vector<std::string>>().push_back("gamma");

    CHECK(duplicate.as<std::vector<std::string>>().size() == 2);
    CHECK(original.as<std::vector<std::string>>().size() == 3);
    CHECK(duplicate.data() != original.data());
}

TEST_CASE("Value - copy of nested containers is deep", "[value][copy]") {
    using nested = std::map<std::string, std::vector<int>>;
    auto original = Value::from(nested{{"a", {1, 2}}});
    auto duplicate = Value::copy(original);

    original.as<nested>()["a"].push_back(3);

    CHECK(duplicate.as<nested>().at("a") == std::vector<int>{1, 2});
}

TEST_CASE("Value - copy of an invalid value is invalid", "[value][copy]") {
    Value empty;
    CHECK_FALSE(Value::copy(empty).valid());
}

TEST_CASE("Value - move keeps the stored address", "[value]") {
    auto v = Value::from(std::string("payload"));
    const void* address = v.data();
    Value moved = std::move(v);
    CHECK(moved.data() == address);
    CHECK_FALSE(v.valid());
}

// ============================================================================
// Comparison and rendering
// ============================================================================

TEST_CASE("Value - equals compares type and content", "[value]") {
    CHECK(Value::from(1).equals(Value::from(1)));
    CHECK_FALSE(Value::from(1).equals(Value::from(2)));
    CHECK_FALSE(Value::from(1).equals(Value::from(1L)));
    CHECK(Value::from(Point{1, 2}).equals(Value::from(Point{1, 2})));
    CHECK(Value().equals(Value()));
}

TEST_CASE("Value - to_string renders common types", "[value]") {
    CHECK(Value::from(7).to_string() == "7");
    CHECK(Value::from(true).to_string() == "true");
    CHECK(Value::from(std::string("Hello")).to_string() == "\"Hello\"");
    CHECK(Value::from(2.5).to_string() == "2.5");
    CHECK(Value::from(Point{3, 4}).to_string() == "Point(3, 4)");
}
