/**
 * @file test_emptiness.cpp
 * @brief Tests for the logical emptiness classifier
 */

#include <gtest/gtest.h>
#include "cfgbind/Emptiness.hpp"

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

using namespace cfgbind;

namespace {

struct Inventory {
    int count = 0;
    bool is_empty() const { return count == 0; }
};

struct Basket {
    std::vector<int> items;
    bool empty() const { return items.empty(); }
};

struct Opinionated {
    bool is_empty() const { throw std::runtime_error("cannot tell"); }
};

struct Stubborn {
    bool empty() const { throw 42; }
};

struct Opaque {
    int value = 0;
};

} // namespace

// ============================================================================
// Null and absent
// ============================================================================

TEST(IsEmpty, NullIsEmpty) {
    EXPECT_TRUE(is_empty(Value(nullptr)));
    EXPECT_TRUE(is_empty(RawValue::null()));
}

TEST(IsEmpty, AbsentIsEmpty) {
    EXPECT_TRUE(is_empty(RawValue::absent()));
}

// ============================================================================
// Strings and collections
// ============================================================================

TEST(IsEmpty, Strings) {
    EXPECT_TRUE(is_empty(RawValue(Value(""))));
    EXPECT_FALSE(is_empty(RawValue(Value("x"))));
    EXPECT_FALSE(is_empty(RawValue(Value(" "))));
}

TEST(IsEmpty, Arrays) {
    EXPECT_TRUE(is_empty(RawValue(Value::array())));
    EXPECT_FALSE(is_empty(RawValue(Value::array({1}))));
    // An array holding only null is not empty
    EXPECT_FALSE(is_empty(RawValue(Value::array({nullptr}))));
}

TEST(IsEmpty, Objects) {
    EXPECT_TRUE(is_empty(RawValue(Value::object())));
    EXPECT_FALSE(is_empty(RawValue(Value{{"a", 1}})));
}

TEST(IsEmpty, Binary) {
    EXPECT_TRUE(is_empty(Value::binary(std::vector<std::uint8_t>{})));
    EXPECT_FALSE(is_empty(Value::binary(std::vector<std::uint8_t>{0x01, 0x02})));
}

// ============================================================================
// Scalars are never empty
// ============================================================================

TEST(IsEmpty, ScalarsAreNotEmpty) {
    EXPECT_FALSE(is_empty(RawValue(Value(0))));
    EXPECT_FALSE(is_empty(RawValue(Value(0.0))));
    EXPECT_FALSE(is_empty(RawValue(Value(false))));
}

// ============================================================================
// Host objects
// ============================================================================

TEST(IsEmpty, HostObjectWithIsEmpty) {
    EXPECT_TRUE(is_empty(RawValue::host_object(Inventory{0})));
    EXPECT_FALSE(is_empty(RawValue::host_object(Inventory{3})));
}

TEST(IsEmpty, HostObjectWithEmpty) {
    EXPECT_TRUE(is_empty(RawValue::host_object(Basket{})));
    EXPECT_FALSE(is_empty(RawValue::host_object(Basket{{1, 2}})));
}

TEST(IsEmpty, StandardContainersAsHostObjects) {
    EXPECT_TRUE(is_empty(RawValue::host_object(std::string())));
    EXPECT_FALSE(is_empty(RawValue::host_object(std::vector<int>{7})));
}

TEST(IsEmpty, HostObjectWithoutQueryIsNotEmpty) {
    RawValue raw = RawValue::host_object(Opaque{});
    EXPECT_FALSE(try_query_empty(raw).has_value());
    EXPECT_FALSE(is_empty(raw));
}

TEST(IsEmpty, FailingQueryIsNotEmpty) {
    RawValue raw = RawValue::host_object(Opinionated{});
    EXPECT_NO_THROW(is_empty(raw));
    EXPECT_FALSE(is_empty(raw));
    EXPECT_FALSE(try_query_empty(raw).has_value());
}

TEST(IsEmpty, QueryThrowingNonStandardExceptionIsNotEmpty) {
    RawValue raw = RawValue::host_object(Stubborn{});
    EXPECT_NO_THROW(is_empty(raw));
    EXPECT_FALSE(is_empty(raw));
    EXPECT_FALSE(try_query_empty(raw).has_value());
}
