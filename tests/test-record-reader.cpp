/**
 * @file test-record-reader.cpp
 * @brief Unit tests for sequential reading of composite literal fields
 *
 * This file verifies reading the fields of a composite literal into C++
 * variables:
 *
 * - Numeric, boolean, text and decimal fields
 * - Binary, date/time and geometric fields
 * - Null handling with std::optional
 * - Failure reporting of read() and get()
 *
 * @see qb::pgtext::record_reader
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

#include <gtest/gtest.h>
#include "../pgtext.h"

using namespace qb::pgtext;

/**
 * @brief User structure mapped from a composite literal
 */
struct inventory_item {
    std::string             name;
    integer                 supplier_id = 0;
    std::optional<decimal>  price;
};

/**
 * @brief Test fixture for the record reader
 */
class RecordReaderTest : public ::testing::Test {
protected:
    /**
     * @brief Read an inventory item from its literal
     * @return true if every field was read
     */
    static bool
    read_item(std::string_view literal, inventory_item &item) {
        record_reader reader(literal);
        return reader.read(item.name) && reader.read(item.supplier_id) &&
               reader.read(item.price);
    }
};

/**
 * @brief Test reading a user structure
 */
TEST_F(RecordReaderTest, ReadStructure) {
    inventory_item item;
    ASSERT_TRUE(read_item("(\"fuzzy dice\",42,1.99)", item));
    EXPECT_EQ(item.name, "fuzzy dice");
    EXPECT_EQ(item.supplier_id, 42);
    ASSERT_TRUE(item.price.has_value());
    EXPECT_EQ(*item.price, decimal("1.99"));

    inventory_item no_price;
    ASSERT_TRUE(read_item("(dice,7,)", no_price));
    EXPECT_FALSE(no_price.price.has_value());
}

/**
 * @brief Test numeric and boolean fields
 */
TEST_F(RecordReaderTest, ReadScalars) {
    record_reader reader("(1,-2,9000000000,1.5,2.25,t,off)");
    EXPECT_EQ(reader.remaining(), 7u);
    EXPECT_EQ(reader.get<smallint>(), 1);
    EXPECT_EQ(reader.get<integer>(), -2);
    EXPECT_EQ(reader.get<bigint>(), 9000000000LL);
    EXPECT_FLOAT_EQ(reader.get<float>(), 1.5f);
    EXPECT_DOUBLE_EQ(reader.get<double>(), 2.25);
    EXPECT_TRUE(reader.get<bool>());
    EXPECT_FALSE(reader.get<bool>());
    EXPECT_EQ(reader.remaining(), 0u);
}

/**
 * @brief Test binary, date/time and geometric fields
 */
TEST_F(RecordReaderTest, ReadStructuredFields) {
    record_reader reader(R"(("\\x68690a",2024-03-01,"12:30:00","2024-03-01 12:30:00+02","(1,2)","(0,0),(1,1)"))");
    bytea data;
    ASSERT_TRUE(reader.read(data));
    EXPECT_EQ(data, (bytea{'h', 'i', '\n'}));

    EXPECT_EQ(reader.get<date>(), (date{2024, 3, 1}));
    EXPECT_EQ(reader.get<time_of_day>().hour, 12);
    EXPECT_EQ(reader.get<timestamp>().time.utc_offset, 7200);
    EXPECT_EQ(reader.get<point>(), (point{1, 2}));
    EXPECT_EQ(reader.get<box>(), (box{{0, 0}, {1, 1}}));
}

/**
 * @brief Test null fields
 */
TEST_F(RecordReaderTest, NullFields) {
    record_reader reader("(,,)");
    std::optional<integer> maybe = 5;
    ASSERT_TRUE(reader.read(maybe));
    EXPECT_FALSE(maybe.has_value());
    EXPECT_TRUE(reader.was_null());

    integer plain = 0;
    EXPECT_FALSE(reader.read(plain));
    EXPECT_TRUE(reader.was_null());

    EXPECT_THROW(reader.get<std::string>(), error::value_is_null);
    EXPECT_THROW(reader.get<std::string>(), error::client_error);
}

/**
 * @brief Test fields that do not convert to the requested type
 */
TEST_F(RecordReaderTest, ConversionFailure) {
    record_reader reader("(abc,70000,maybe,\\\\q1)");
    integer number = 0;
    EXPECT_FALSE(reader.read(number));
    EXPECT_FALSE(reader.was_null());

    EXPECT_THROW(reader.get<smallint>(), error::conversion_error);
    EXPECT_THROW(reader.get<bool>(), error::conversion_error);

    bytea data;
    EXPECT_FALSE(reader.read(data));
    EXPECT_EQ(reader.remaining(), 0u);
}

/**
 * @brief Test that numeric fields follow the decimal grammar
 */
TEST_F(RecordReaderTest, DecimalGrammar) {
    record_reader reader("(--1,+-5,.,1e,-.5,+2.50,3E2)");
    decimal number;
    EXPECT_FALSE(reader.read(number));
    EXPECT_FALSE(reader.read(number));
    EXPECT_FALSE(reader.read(number));
    EXPECT_FALSE(reader.read(number));
    EXPECT_EQ(reader.get<decimal>(), decimal("-0.5"));
    EXPECT_EQ(reader.get<decimal>(), decimal("2.5"));
    EXPECT_EQ(reader.get<decimal>(), decimal(300));
}

/**
 * @brief Test the set of field types a reader accepts
 *
 * Reading into any other type does not compile.
 */
TEST_F(RecordReaderTest, ReadableTypes) {
    static_assert(record_reader::is_readable_v<integer>);
    static_assert(record_reader::is_readable_v<decimal>);
    static_assert(record_reader::is_readable_v<box>);
    static_assert(!record_reader::is_readable_v<unsigned>);
    static_assert(!record_reader::is_readable_v<char>);
    static_assert(!record_reader::is_readable_v<long double>);
    static_assert(!record_reader::is_readable_v<typed_value>);

    record_reader reader("(1,2)");
    std::optional<bigint> first;
    ASSERT_TRUE(reader.read(first));
    EXPECT_EQ(first, 1);
    EXPECT_EQ(reader.get<std::optional<double>>(), 2.0);
}

/**
 * @brief Test reading past the last field
 */
TEST_F(RecordReaderTest, EndOfRecord) {
    record_reader reader("(1)");
    reader.skip();
    integer number = 0;
    EXPECT_FALSE(reader.read(number));
    EXPECT_FALSE(reader.was_null());
    EXPECT_THROW(reader.get<integer>(), error::client_error);
}

/**
 * @brief Test reading date/time fields with the session calendar
 */
TEST_F(RecordReaderTest, SessionCalendar) {
    auto session = session_context::from_options({{options::TIMEZONE, "+01"}});
    record_reader reader(token_list{std::string("2024-03-01 23:30:00+00")}, session);
    auto ts = reader.get<timestamp>();
    EXPECT_EQ(ts.day, (date{2024, 3, 2}));
    EXPECT_EQ(ts.time.hour, 0);
    EXPECT_EQ(ts.time.utc_offset, 3600);
}

int
main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
