/**
 * @file test-type-coercion.cpp
 * @brief Unit tests for attribute value coercion
 *
 * This file verifies the re-typing of attribute values to the native shape
 * of their declared PostgreSQL type:
 *
 * - Integer widening and narrowing
 * - Floating-point and numeric conversions
 * - Boolean casts from strings, characters and numbers
 * - Character and text normalization
 * - Geometric and opaque values recovered from strings
 * - Identity on values already in native shape
 *
 * @see qb::pgtext::coerce
 * @see qb::pgtext::cast_to_boolean
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *         http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#include <limits>
#include <gtest/gtest.h>
#include "../pgtext.h"
#include "../src/util/text_format.h"

using namespace qb::pgtext;

/**
 * @brief Test fixture for value coercion
 */
class TypeCoercionTest : public ::testing::Test {
protected:
    /**
     * @brief Values in the native shape of their type, paired with the type
     */
    std::vector<std::pair<value, oid>> native_values;

    void
    SetUp() override {
        native_values = {{value(smallint(7)), oid::int2},
                         {value(integer(42)), oid::int4},
                         {value(bigint(1) << 40), oid::int8},
                         {value(1.5f), oid::float4},
                         {value(2.25), oid::float8},
                         {value(decimal("12.345")), oid::numeric},
                         {value(true), oid::boolean},
                         {value('x'), oid::char_},
                         {value("hello"), oid::text},
                         {value(point{1, 2}), oid::point},
                         {value(box{{1, 2}, {3, 4}}), oid::box},
                         {value(typed_value{"json", std::string("{}")}), oid::json},
                         {value(), oid::int4}};
    }

    void
    TearDown() override {
        native_values.clear();
    }
};

/**
 * @brief Test that a 4-byte integer is widened without loss for int8 and oid
 */
TEST_F(TypeCoercionTest, IntegerWidening) {
    auto result = coerce(value(integer(123456)), oid::int8);
    ASSERT_TRUE(result.holds<bigint>());
    EXPECT_EQ(result.get<bigint>(), 123456);

    auto extreme = coerce(value(std::numeric_limits<integer>::min()), oid::int8);
    ASSERT_TRUE(extreme.holds<bigint>());
    EXPECT_EQ(extreme.get<bigint>(), std::numeric_limits<integer>::min());

    auto row_id = coerce(value(integer(9)), oid::oid_t);
    EXPECT_TRUE(row_id.holds<bigint>());
}

/**
 * @brief Test that narrowing casts truncate like a C++ static_cast
 */
TEST_F(TypeCoercionTest, IntegerNarrowing) {
    auto small = coerce(value(integer(300)), oid::int2);
    ASSERT_TRUE(small.holds<smallint>());
    EXPECT_EQ(small.get<smallint>(), 300);

    auto truncated = coerce(value(bigint(70000)), oid::int2);
    ASSERT_TRUE(truncated.holds<smallint>());
    EXPECT_EQ(truncated.get<smallint>(), static_cast<smallint>(70000));

    auto from_long = coerce(value(bigint(5)), oid::int4);
    ASSERT_TRUE(from_long.holds<integer>());
    EXPECT_EQ(from_long.get<integer>(), 5);
}

/**
 * @brief Test floating-point conversions
 */
TEST_F(TypeCoercionTest, FloatingPoint) {
    auto f = coerce(value(1.5), oid::float4);
    ASSERT_TRUE(f.holds<float>());
    EXPECT_FLOAT_EQ(f.get<float>(), 1.5f);

    auto from_int = coerce(value(integer(3)), oid::float4);
    EXPECT_TRUE(from_int.holds<float>());

    auto d = coerce(value(0.5f), oid::float8);
    ASSERT_TRUE(d.holds<double>());
    EXPECT_DOUBLE_EQ(d.get<double>(), 0.5);

    auto from_long = coerce(value(bigint(10)), oid::float8);
    ASSERT_TRUE(from_long.holds<double>());
    EXPECT_DOUBLE_EQ(from_long.get<double>(), 10.0);
}

/**
 * @brief Test numeric conversions go through the decimal text of the value
 */
TEST_F(TypeCoercionTest, Numeric) {
    auto from_int = coerce(value(integer(12)), oid::numeric);
    ASSERT_TRUE(from_int.holds<decimal>());
    EXPECT_EQ(from_int.get<decimal>(), decimal(12));

    auto from_double = coerce(value(0.1), oid::numeric);
    ASSERT_TRUE(from_double.holds<decimal>());
    EXPECT_EQ(from_double.get<decimal>(), decimal("0.1"));

    auto from_long = coerce(value(bigint(12)), oid::numeric);
    EXPECT_TRUE(from_long.holds<bigint>());
}

/**
 * @brief Test boolean coercion for bool and bit columns
 */
TEST_F(TypeCoercionTest, Boolean) {
    EXPECT_EQ(coerce(value("t"), oid::boolean), value(true));
    EXPECT_EQ(coerce(value("off"), oid::boolean), value(false));
    EXPECT_EQ(coerce(value(integer(1)), oid::bit), value(true));
    EXPECT_EQ(coerce(value('0'), oid::bit), value(false));

    // not a boolean: returned unchanged
    EXPECT_EQ(coerce(value("maybe"), oid::boolean), value("maybe"));
    EXPECT_EQ(coerce(value(integer(2)), oid::boolean), value(integer(2)));
}

/**
 * @brief Test the boolean cast table
 */
TEST_F(TypeCoercionTest, CastToBoolean) {
    for (auto text : {"1", "true", "T", "yes", "Y", "on", " TRUE "})
        EXPECT_TRUE(cast_to_boolean(value(text))) << text;
    for (auto text : {"0", "false", "F", "no", "N", "OFF", "\tf\n"})
        EXPECT_FALSE(cast_to_boolean(value(text))) << text;

    for (char c : {'1', 't', 'T', 'y', 'Y'})
        EXPECT_TRUE(cast_to_boolean(value(c))) << c;
    for (char c : {'0', 'f', 'F', 'n', 'N'})
        EXPECT_FALSE(cast_to_boolean(value(c))) << c;

    EXPECT_TRUE(cast_to_boolean(value(1.0)));
    EXPECT_FALSE(cast_to_boolean(value(bigint(0))));
    EXPECT_TRUE(cast_to_boolean(value(decimal(1))));
    EXPECT_TRUE(cast_to_boolean(value(true)));

    EXPECT_THROW(cast_to_boolean(value("2")), error::conversion_error);
    EXPECT_THROW(cast_to_boolean(value('x')), error::conversion_error);
    EXPECT_THROW(cast_to_boolean(value(0.5)), error::conversion_error);
    EXPECT_THROW(cast_to_boolean(value()), error::conversion_error);
}

/**
 * @brief Test single characters for char columns
 */
TEST_F(TypeCoercionTest, Character) {
    EXPECT_EQ(coerce(value("x"), oid::char_), value('x'));
    EXPECT_EQ(coerce(value("y"), oid::bpchar), value('y'));
    EXPECT_EQ(coerce(value("xy"), oid::bpchar), value("xy"));
    EXPECT_EQ(coerce(value(""), oid::char_), value(""));
    EXPECT_EQ(coerce(value(integer(1)), oid::char_), value(integer(1)));
}

/**
 * @brief Test text normalization, one byte text becomes a character
 */
TEST_F(TypeCoercionTest, Text) {
    EXPECT_EQ(coerce(value(integer(42)), oid::text), value("42"));
    EXPECT_EQ(coerce(value(integer(7)), oid::text), value('7'));
    EXPECT_EQ(coerce(value("a"), oid::text), value('a'));
    EXPECT_EQ(coerce(value(true), oid::text), value("true"));
    EXPECT_EQ(coerce(value(2.5), oid::text), value("2.5"));
}

/**
 * @brief Test that the single character rules count bytes
 *
 * A multi-byte UTF-8 character is kept as text.
 */
TEST_F(TypeCoercionTest, CharacterRulesCountBytes) {
    std::string const e_acute("\xc3\xa9");
    EXPECT_EQ(coerce(value(e_acute), oid::char_), value(e_acute));
    EXPECT_EQ(coerce(value(e_acute), oid::bpchar), value(e_acute));
    EXPECT_EQ(coerce(value(e_acute), oid::text), value(e_acute));
    EXPECT_TRUE(coerce(value(e_acute), oid::text).holds<std::string>());
    EXPECT_EQ(coerce(value("\x7f"), oid::text), value('\x7f'));
}

/**
 * @brief Test geometric values recovered from their text form
 */
TEST_F(TypeCoercionTest, Geometry) {
    EXPECT_EQ(coerce(value("(1.5,-2)"), oid::point), value(point{1.5, -2}));
    EXPECT_EQ(coerce(value("(1,2),(3,4)"), oid::box), value(box{{1, 2}, {3, 4}}));

    // invalid text is returned unchanged
    EXPECT_EQ(coerce(value("(1,x)"), oid::point), value("(1,x)"));
    EXPECT_EQ(coerce(value("(1,2)"), oid::box), value("(1,2)"));
}

/**
 * @brief Test opaque values for json and bit strings
 */
TEST_F(TypeCoercionTest, OpaqueValues) {
    auto json = coerce(value("{\"a\":1}"), oid::json);
    ASSERT_TRUE(json.holds<typed_value>());
    EXPECT_EQ(json.get<typed_value>().type, "json");
    EXPECT_EQ(json.get<typed_value>().value, std::string("{\"a\":1}"));
    EXPECT_EQ(json.get<typed_value>().json()["a"], 1);

    auto bits = coerce(value('1'), oid::varbit);
    ASSERT_TRUE(bits.holds<typed_value>());
    EXPECT_EQ(bits.get<typed_value>(), (typed_value{"unknown", std::string("1")}));

    EXPECT_EQ(coerce(value(integer(1)), oid::json), value(integer(1)));
}

/**
 * @brief Test that null and unknown OIDs pass through
 */
TEST_F(TypeCoercionTest, PassThrough) {
    EXPECT_TRUE(coerce(value(), oid::int8).is_null());
    EXPECT_EQ(coerce(value("abc"), oid::uuid), value("abc"));
    EXPECT_EQ(coerce(value(integer(3)), oid::varchar), value(integer(3)));
}

/**
 * @brief Test that values in native shape are left as they are
 */
TEST_F(TypeCoercionTest, NativeValuesAreUnchanged) {
    for (auto const &[v, type_oid] : native_values)
        EXPECT_EQ(coerce(v, type_oid), v) << v << " as " << type_oid;
}

/**
 * @brief Test that coercing twice gives the same result as coercing once
 */
TEST_F(TypeCoercionTest, Idempotent) {
    std::vector<std::pair<value, oid>> inputs{{value(integer(5)), oid::int8},
                                              {value("yes"), oid::boolean},
                                              {value("(0,0)"), oid::point},
                                              {value(0.25), oid::numeric},
                                              {value(bigint(9)), oid::float4},
                                              {value("z"), oid::text},
                                              {value("[1]"), oid::json}};
    for (auto const &[v, type_oid] : inputs) {
        auto const once = coerce(v, type_oid);
        EXPECT_EQ(coerce(once, type_oid), once) << v << " as " << type_oid;
    }
}

/**
 * @brief Test number text helpers
 */
TEST_F(TypeCoercionTest, NumberText) {
    EXPECT_EQ(util::format_double(1.5), "1.5");
    EXPECT_EQ(util::format_double(0.1), "0.1");
    EXPECT_EQ(util::format_double(1e20), "1e+20");
    EXPECT_EQ(util::format_float(0.1f), "0.1");
    EXPECT_EQ(util::format_double(-std::numeric_limits<double>::infinity()), "-Infinity");

    EXPECT_EQ(util::parse_double(" +2.5 "), 2.5);
    EXPECT_EQ(util::parse_double("-1e3"), -1000.0);
    EXPECT_FALSE(util::parse_double("1,5").has_value());
    EXPECT_FALSE(util::parse_double("+-1").has_value());
    EXPECT_FALSE(util::parse_double("").has_value());

    EXPECT_TRUE(util::is_numeric_literal("-.5e-3"));
    EXPECT_TRUE(util::is_numeric_literal("7."));
    EXPECT_FALSE(util::is_numeric_literal("--1"));
    EXPECT_FALSE(util::is_numeric_literal("."));
    EXPECT_FALSE(util::is_numeric_literal(" 1"));
}

int
main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
