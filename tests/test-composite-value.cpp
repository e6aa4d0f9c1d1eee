/**
 * @file test-composite-value.cpp
 * @brief Unit tests for composite values
 *
 * This file verifies the life cycle of a composite value:
 *
 * - Descriptor registration and resolution through the type catalog
 * - Materialization of raw attributes, with date/time parsing
 * - Caller requested conversions with attributes_as()
 * - Rendering to the server literal, including quoting of special characters,
 *   nested composites, json and binary attributes
 * - Equality and hashing
 *
 * @see qb::pgtext::composite_value
 * @see qb::pgtext::descriptor_cache
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

#include <sstream>
#include <unordered_set>
#include <gtest/gtest.h>
#include "../pgtext.h"

using namespace qb::pgtext;

/**
 * @brief Test fixture for composite values
 *
 * Registers a few composite types used across the tests.
 */
class CompositeValueTest : public ::testing::Test {
protected:
    descriptor_cache      cache;
    session_ptr           session;
    struct_descriptor_ptr item_type;
    struct_descriptor_ptr event_type;
    struct_descriptor_ptr text_pair_type;

    void
    SetUp() override {
        session   = session_context::default_session();
        item_type = cache.resolve("inventory_item", {{"name", oid::text},
                                                     {"supplier_id", oid::int4},
                                                     {"price", oid::numeric}});
        event_type = cache.resolve("event", {{"id", oid::int8},
                                             {"day", oid::date},
                                             {"at", oid::timestamptz},
                                             {"flag", oid::bit}});
        text_pair_type = cache.resolve("text_pair", {{"a", oid::text}, {"b", oid::text}});
    }

    void
    TearDown() override {
        session.reset();
    }

    composite_value
    make_item(value name, value supplier, value price) {
        std::vector<value> raw{std::move(name), std::move(supplier), std::move(price)};
        return composite_value::materialize(item_type, std::move(raw), session);
    }

    composite_value
    make_text_pair(value a, value b) {
        std::vector<value> raw{std::move(a), std::move(b)};
        return composite_value::materialize(text_pair_type, std::move(raw), session);
    }
};

/**
 * @brief Test that the cache hands out one descriptor per type
 */
TEST_F(CompositeValueTest, DescriptorCache) {
    auto again = cache.resolve("inventory_item", {});
    EXPECT_EQ(again, item_type);
    EXPECT_EQ(cache.find("inventory_item"), item_type);
    EXPECT_EQ(cache.find("missing"), nullptr);
    EXPECT_EQ(cache.size(), 3u);

    ASSERT_EQ(item_type->size(), 3u);
    EXPECT_EQ((*item_type)[1].name, "supplier_id");
    EXPECT_EQ((*item_type)[1].type_name, "int4");
    EXPECT_EQ((*item_type)[2].type_oid, oid::numeric);
    EXPECT_EQ(item_type->index_of("price"), 2u);
    EXPECT_THROW(item_type->at(3), error::client_error);

    EXPECT_THROW(cache.resolve("broken", {{"x", static_cast<oid>(999999)}}),
                 error::client_error);
}

/**
 * @brief Test that raw attributes are coerced to their declared types
 */
TEST_F(CompositeValueTest, MaterializeCoerces) {
    auto item = make_item(value("fuzzy dice"), value(bigint(42)), value(1.99));
    EXPECT_EQ(item.sql_type_name(), "inventory_item");
    EXPECT_EQ(item[0], value("fuzzy dice"));
    EXPECT_EQ(item[1], value(integer(42)));
    ASSERT_TRUE(item[2].holds<decimal>());
    EXPECT_EQ(item[2].get<decimal>(), decimal("1.99"));
    EXPECT_EQ(item.attribute("supplier_id"), value(integer(42)));
    EXPECT_THROW(item.attribute("weight"), error::client_error);
}

/**
 * @brief Test that nulls are kept
 */
TEST_F(CompositeValueTest, MaterializeKeepsNulls) {
    auto item = make_item(value(), value(), value());
    for (auto const &attribute : item.attributes())
        EXPECT_TRUE(attribute.is_null());
    EXPECT_EQ(item.render(), "(,,)");
}

/**
 * @brief Test that the number of values must match the number of fields
 */
TEST_F(CompositeValueTest, MaterializeChecksSize) {
    std::vector<value> raw{value("a")};
    EXPECT_THROW(composite_value::materialize(item_type, std::move(raw), session),
                 error::client_error);
    std::vector<value> none;
    EXPECT_THROW(composite_value::materialize(nullptr, std::move(none), session),
                 error::client_error);
}

/**
 * @brief Test that date/time attributes are parsed, and kept as text when invalid
 */
TEST_F(CompositeValueTest, MaterializeTemporal) {
    std::vector<value> raw{value(integer(1)), value("2024-03-01"),
                           value("2024-03-01 10:00:00+02"), value("1")};
    auto event = composite_value::materialize(event_type, std::move(raw), session);
    EXPECT_EQ(event[0], value(bigint(1)));
    EXPECT_EQ(event[1], value(date{2024, 3, 1}));
    ASSERT_TRUE(event[2].holds<timestamp>());
    EXPECT_EQ(event[2].get<timestamp>().time.utc_offset, 7200);
    EXPECT_EQ(event[3], value(true));

    std::vector<value> bad{value(integer(2)), value("someday"), value("soon"), value()};
    auto invalid = composite_value::materialize(event_type, std::move(bad), session);
    EXPECT_EQ(invalid[1], value("someday"));
    EXPECT_EQ(invalid[2], value("soon"));
}

/**
 * @brief Test that the session calendar applies to zoned attributes
 */
TEST_F(CompositeValueTest, MaterializeWithSessionCalendar) {
    auto utc_session = session_context::from_options({{options::TIMEZONE, "UTC"}});
    std::vector<value> raw{value(integer(1)), value(), value("2024-01-01 01:00:00+02"),
                           value()};
    auto event = composite_value::materialize(event_type, std::move(raw), utc_session);
    ASSERT_TRUE(event[2].holds<timestamp>());
    EXPECT_EQ(to_string(event[2].get<timestamp>()), "2023-12-31 23:00:00+00");
}

/**
 * @brief Test conversions to requested representations
 */
TEST_F(CompositeValueTest, AttributesAs) {
    auto item = make_item(value("12"), value(integer(7)), value(integer(3)));

    type_map map{{"text", target_kind::integer},
                 {"int4", target_kind::string},
                 {"numeric", target_kind::double_precision}};
    auto converted = item.attributes_as(map);
    ASSERT_EQ(converted.size(), 3u);
    EXPECT_EQ(converted[0], value(integer(12)));
    EXPECT_EQ(converted[1], value("7"));
    EXPECT_EQ(converted[2], value(3.0));

    // attributes keep their own representation
    EXPECT_EQ(item[0], value("12"));

    // no entry, the attribute is returned as is
    auto untouched = item.attributes_as({});
    EXPECT_EQ(untouched, item.attributes());
}

/**
 * @brief Test the remaining supported conversions
 */
TEST_F(CompositeValueTest, AttributesAsSupportedKinds) {
    auto pair      = make_text_pair(value("yes"), value());
    auto converted = pair.attributes_as({{"text", target_kind::boolean}});
    EXPECT_EQ(converted[0], value(true));
    EXPECT_THROW(pair.attributes_as({{"text", target_kind::bigint}}), error::conversion_error);

    auto numbers = make_text_pair(value("9000000000"), value("2.5"));
    auto as_long = numbers.attributes_as({{"text", target_kind::bigint}});
    EXPECT_EQ(as_long[0], value(bigint(9000000000)));
    EXPECT_EQ(as_long[1], value(bigint(2)));

    auto as_decimal = numbers.attributes_as({{"text", target_kind::decimal}});
    EXPECT_EQ(as_decimal[1], value(decimal("2.5")));

    auto stamps = make_text_pair(value("2024-03-01 12:00:00"), value());
    auto as_timestamp = stamps.attributes_as({{"text", target_kind::timestamp}});
    ASSERT_TRUE(as_timestamp[0].holds<timestamp>());
    EXPECT_EQ(as_timestamp[0].get<timestamp>().time.hour, 12);
    EXPECT_TRUE(as_timestamp[1].is_null());
}

/**
 * @brief Test that malformed text is reported as a conversion error
 */
TEST_F(CompositeValueTest, AttributesAsBadValue) {
    auto pair = make_text_pair(value("abc"), value("1"));
    try {
        pair.attributes_as({{"text", target_kind::integer}});
        FAIL() << "conversion of abc to integer must fail";
    } catch (error::unsupported_conversion const &) {
        FAIL() << "integer is a supported conversion";
    } catch (error::conversion_error const &e) {
        EXPECT_NE(std::string(e.what()).find("Bad value for type int"), std::string::npos);
    }

    auto out_of_range = make_text_pair(value("3000000000"), value());
    EXPECT_THROW(out_of_range.attributes_as({{"text", target_kind::integer}}),
                 error::conversion_error);

    for (auto text : {"--1", "+-5", ".", "--0.5", "1e", "1.2.3", "0x10"}) {
        auto malformed = make_text_pair(value(text), value());
        EXPECT_THROW(malformed.attributes_as({{"text", target_kind::bigint}}),
                     error::conversion_error)
            << text;
        EXPECT_THROW(malformed.attributes_as({{"text", target_kind::integer}}),
                     error::conversion_error)
            << text;
        EXPECT_THROW(malformed.attributes_as({{"text", target_kind::decimal}}),
                     error::conversion_error)
            << text;
    }

    auto lenient = make_text_pair(value(" +1.5e1 "), value(".5"));
    auto converted = lenient.attributes_as({{"text", target_kind::decimal}});
    EXPECT_EQ(converted[0], value(decimal(15)));
    EXPECT_EQ(converted[1], value(decimal("0.5")));
}

/**
 * @brief Test that unsupported kinds are rejected with the requested kind
 */
TEST_F(CompositeValueTest, AttributesAsUnsupportedKind) {
    auto pair = make_text_pair(value("abc"), value("1"));
    for (auto kind : {target_kind::smallint, target_kind::real, target_kind::bytes,
                      target_kind::date, target_kind::time, target_kind::character}) {
        try {
            pair.attributes_as({{"text", kind}});
            FAIL() << "conversion to " << kind << " must be rejected";
        } catch (error::unsupported_conversion const &e) {
            EXPECT_EQ(e.requested(), kind);
            std::ostringstream expected;
            expected << "Unsupported conversion to " << kind << ".";
            EXPECT_EQ(std::string(e.what()), expected.str());
        }
    }

    // a value already of the requested kind is not converted
    auto already = make_item(value("x"), value(integer(1)), value());
    EXPECT_NO_THROW(already.attributes_as({{"text", target_kind::character}}));
}

/**
 * @brief Test rendering of plain attributes
 */
TEST_F(CompositeValueTest, RenderPlain) {
    auto item = make_item(value("dice"), value(integer(42)), value(decimal("1.5")));
    EXPECT_EQ(item.render(), "(dice,42,1.5)");

    auto with_null = make_item(value("dice"), value(), value(decimal("1.5")));
    EXPECT_EQ(with_null.render(), "(dice,,1.5)");

    std::ostringstream os;
    os << item;
    EXPECT_EQ(os.str(), "(dice,42,1.5)");
}

/**
 * @brief Test that special characters make the attribute quoted
 */
TEST_F(CompositeValueTest, RenderQuoting) {
    EXPECT_EQ(make_text_pair(value("a,b"), value()).render(), "(\"a,b\",)");
    EXPECT_EQ(make_text_pair(value("a b"), value("(x)")).render(), "(\"a b\",\"(x)\")");
    EXPECT_EQ(make_text_pair(value("say \"hi\""), value()).render(), R"(("say ""hi""",))");
    EXPECT_EQ(make_text_pair(value(R"(c:\dir)"), value()).render(), R"(("c:\\dir",))");
    EXPECT_EQ(make_text_pair(value(""), value()).render(), "(,)");
}

/**
 * @brief Test that rendering then scanning gives back plain fields
 */
TEST_F(CompositeValueTest, RenderScanRoundTrip) {
    auto pair = make_text_pair(value("alpha"), value("beta-1.5"));
    token_list expected{std::string("alpha"), std::string("beta-1.5")};
    EXPECT_EQ(parse_composite_literal(pair.render()), expected);

    auto quoted = make_text_pair(value("a,b"), value("x"));
    token_list expected_quoted{std::string("a,b"), std::string("x")};
    EXPECT_EQ(parse_composite_literal(quoted.render()), expected_quoted);
}

/**
 * @brief Test the bit, json, binary and geometric renderings
 */
TEST_F(CompositeValueTest, RenderSpecialValues) {
    std::vector<value> raw{value(integer(1)), value(), value(), value(true)};
    auto event = composite_value::materialize(event_type, std::move(raw), session);
    EXPECT_EQ(event.render(), "(1,,,1)");

    auto doc_type = cache.resolve("doc", {{"body", oid::json}, {"data", oid::bytea}});
    std::vector<value> doc_raw{value("{\"k\":1}"), value(bytea{'h', 'i'})};
    auto doc = composite_value::materialize(doc_type, std::move(doc_raw), session);
    EXPECT_EQ(doc.render(), R"(("{\\""k\\"":1}",hi))");

    auto shape_type = cache.resolve("shape", {{"p", oid::point}, {"b", oid::box}});
    std::vector<value> shape_raw{value("(1,2)"), value("(0,0),(1,1)")};
    auto shape = composite_value::materialize(shape_type, std::move(shape_raw), session);
    EXPECT_EQ(shape.render(), R"(("(1,2)","(0,0),(1,1)"))");
}

/**
 * @brief Test binary attributes decoded with the session encoding
 */
TEST_F(CompositeValueTest, RenderBinaryWithEncoding) {
    auto latin1 = session_context::from_options({{options::CLIENT_ENCODING, "LATIN1"}});
    auto type   = cache.resolve("blob", {{"data", oid::bytea}});
    std::vector<value> raw{value(bytea{'\xe9', 't', '\xe9'})};
    auto blob = composite_value::materialize(type, std::move(raw), latin1);
    EXPECT_EQ(blob.render(), "(\xc3\xa9t\xc3\xa9)");
}

/**
 * @brief Test that nested composites are doubled, then doubled again when quoted
 */
TEST_F(CompositeValueTest, RenderNested) {
    auto inner = make_text_pair(value("a b"), value("c"));
    EXPECT_EQ(inner.render(), R"(("a b",c))");

    auto outer_type = cache.resolve("outer", {{"id", oid::int4}, {"inner", oid::record}});
    std::vector<value> raw{value(integer(1)),
                           value(composite_ref{std::make_shared<const composite_value>(inner)})};
    auto outer = composite_value::materialize(outer_type, std::move(raw), session);
    EXPECT_EQ(outer.render(), R"((1,"(""""a b"""",c)"))");
}

/**
 * @brief Test equality and hashing
 */
TEST_F(CompositeValueTest, EqualityAndHash) {
    auto a = make_item(value("dice"), value(integer(42)), value(decimal("1.5")));
    auto b = make_item(value("dice"), value(bigint(42)), value(1.5));
    EXPECT_EQ(a, b);
    EXPECT_EQ(a.hash(), b.hash());
    EXPECT_EQ(std::hash<composite_value>{}(a), std::hash<composite_value>{}(b));

    auto c = make_item(value("dice"), value(integer(43)), value(decimal("1.5")));
    EXPECT_NE(a, c);

    // same attributes, other type name
    auto other_type = cache.resolve("other_item", {{"name", oid::text},
                                                   {"supplier_id", oid::int4},
                                                   {"price", oid::numeric}});
    std::vector<value> raw{value("dice"), value(integer(42)), value(decimal("1.5"))};
    auto d = composite_value::materialize(other_type, std::move(raw), session);
    EXPECT_NE(a, d);

    std::unordered_set<value> values{value(integer(1)), value(integer(1)), value("1")};
    EXPECT_EQ(values.size(), 2u);
}

/**
 * @brief Test that nested composites compare by content
 */
TEST_F(CompositeValueTest, NestedEquality) {
    auto inner1 = make_text_pair(value("x"), value("y"));
    auto inner2 = make_text_pair(value("x"), value("y"));
    value ref1(composite_ref{std::make_shared<const composite_value>(inner1)});
    value ref2(composite_ref{std::make_shared<const composite_value>(inner2)});
    EXPECT_EQ(ref1, ref2);
    EXPECT_EQ(ref1.hash(), ref2.hash());
}

/**
 * @brief Test building a composite value from its literal text
 */
TEST_F(CompositeValueTest, ParseLiteral) {
    auto item = composite_value::parse(item_type, "(\"fuzzy dice\",42,1.99)", session);
    EXPECT_EQ(item[0], value("fuzzy dice"));
    EXPECT_EQ(item[1], value("42"));
    EXPECT_EQ(item[2], value("1.99"));
    EXPECT_EQ(item.render(), "(\"fuzzy dice\",42,1.99)");

    // missing fields are null, surplus fields are ignored
    auto short_item = composite_value::parse(item_type, "(dice)", session);
    EXPECT_EQ(short_item[0], value("dice"));
    EXPECT_TRUE(short_item[1].is_null());
    EXPECT_TRUE(short_item[2].is_null());

    auto long_item = composite_value::parse(item_type, "(a,1,2,3,4)", session);
    EXPECT_EQ(long_item.size(), 3u);
}

int
main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
