/**
 *  @file       test_event.cpp
 *
 *  Unit tests for the Event value type.
 */

#include "chronostore/core/errors.hpp"
#include "chronostore/core/event.hpp"
#include "chronostore/core/types.hpp"

#include <catch2/catch_test_macros.hpp>
#include <compare>
#include <functional>
#include <string>

using chronostore::core::Event;
using chronostore::core::kNoType;
using chronostore::core::StoreError;
using chronostore::core::toString;
using chronostore::core::TypeLabel;
using chronostore::core::validateForInsert;

TEST_CASE("Event exposes its fields", "[event][Event]")
{
    Event event{"some_type", 123};

    REQUIRE(event.timestamp() == 123);
    REQUIRE(event.type() == TypeLabel{"some_type"});
}

TEST_CASE("Event accepts the no-type label", "[event][Event]")
{
    Event event{kNoType, 7};

    REQUIRE_FALSE(event.type().has_value());
    REQUIRE(toString(event.type()) == "<no type>");
}

TEST_CASE("TypeLabel toString", "[types][TypeLabel]")
{
    REQUIRE(toString(TypeLabel{"cpu"}) == "cpu");
    REQUIRE(toString(TypeLabel{""}).empty());
    REQUIRE(toString(kNoType) == "<no type>");
}

TEST_CASE("Event compare orders by timestamp", "[event][Event]")
{
    SECTION("earlier compares less")
    {
        Event one{"a", 1};
        Event other{"a", 2};
        REQUIRE(one.compare(other) == std::strong_ordering::less);
    }

    SECTION("later compares greater")
    {
        Event one{"a", 2};
        Event other{"a", 1};
        REQUIRE(one.compare(other) == std::strong_ordering::greater);
    }

    SECTION("type does not participate")
    {
        Event one{"z", 1};
        Event other{"a", 2};
        REQUIRE(one.compare(other) == std::strong_ordering::less);
    }
}

TEST_CASE("Event compare never reports equality", "[event][Event]")
{
    Event one{"a", 1};
    Event other{"a", 1};

    REQUIRE(one.compare(other) != std::strong_ordering::equal);
    REQUIRE(other.compare(one) != std::strong_ordering::equal);
    REQUIRE(one.compare(one) != std::strong_ordering::equal);
}

TEST_CASE("Event hash covers type and timestamp", "[event][Event]")
{
    Event event{"a", 1};
    Event same{"a", 1};

    REQUIRE(event.hash() == same.hash());
    REQUIRE(std::hash<Event>{}(event) == event.hash());

    // Not guaranteed in general, but these inputs must not collide
    REQUIRE(event.hash() != Event("a", 2).hash());
    REQUIRE(event.hash() != Event("b", 1).hash());
}

TEST_CASE("validateForInsert enforces non-negative timestamps", "[event][validateForInsert]")
{
    REQUIRE(validateForInsert(Event{"a", 0}).has_value());
    REQUIRE(validateForInsert(Event{"a", 42}).has_value());

    auto rejected = validateForInsert(Event{"a", -1});
    REQUIRE_FALSE(rejected.has_value());
    REQUIRE(rejected.error() == StoreError::kNegativeTimestamp);
}
