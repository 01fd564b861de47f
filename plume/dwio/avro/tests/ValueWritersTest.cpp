/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#include "plume/dwio/avro/ValueWriters.h"

#include <cmath>
#include <limits>

#include <gtest/gtest.h>

#include "plume/common/base/tests/GTestUtils.h"
#include "plume/common/config/Config.h"
#include "plume/dwio/avro/BinaryEncoder.h"
#include "plume/dwio/avro/tests/utils/BinaryDecoder.h"
#include "plume/dwio/avro/tests/utils/RecordingEncoder.h"
#include "plume/type/DecimalUtil.h"
#include "plume/type/Uuid.h"

using namespace facebook::plume;
using namespace facebook::plume::dwio::avro;
using namespace facebook::plume::dwio::avro::test;

namespace {

std::string bytes(std::initializer_list<uint8_t> values) {
  std::string result;
  for (auto value : values) {
    result.push_back(static_cast<char>(value));
  }
  return result;
}

Variant decimal(int64_t unscaled, int32_t scale) {
  return Variant(Decimal{unscaled, scale});
}

class ValueWritersTest : public testing::Test {
 protected:
  // Writes 'values' with 'writer' and returns the encoded bytes.
  std::string write(
      const ValueWriterPtr& writer,
      const std::vector<Variant>& values) {
    std::string data;
    WriterConfig config(std::make_shared<const config::ConfigBase>(
        std::unordered_map<std::string, std::string>{}));
    BinaryEncoder encoder(std::make_unique<InMemoryWriteFile>(&data), config);
    for (const auto& value : values) {
      writer->write(value, encoder);
    }
    encoder.flush();
    return data;
  }

  std::string write(const ValueWriterPtr& writer, const Variant& value) {
    return write(writer, std::vector<Variant>{value});
  }

  std::vector<std::string> record(
      const ValueWriterPtr& writer,
      const Variant& value) {
    RecordingEncoder encoder;
    writer->write(value, encoder);
    return encoder.events();
  }

  // Writes 'values', decodes them back with 'schema' and checks that the
  // decoded values are equal and that all bytes were consumed.
  void assertRoundTrip(
      const ValueWriterPtr& writer,
      const DecodeSchemaPtr& schema,
      const std::vector<Variant>& values) {
    const auto data = write(writer, values);
    BinaryDecoder decoder(data);
    for (const auto& expected : values) {
      auto actual = decoder.read(*schema);
      ASSERT_EQ(expected, actual)
          << expected.toString() << " vs. " << actual.toString();
    }
    ASSERT_TRUE(decoder.atEnd()) << decoder.remaining() << " bytes left";
  }
};

} // namespace

TEST_F(ValueWritersTest, decimalBytes) {
  auto writer = ValueWriters::decimal(9, 2);
  EXPECT_EQ(bytes({0x00, 0x00, 0x30, 0x39}), write(writer, decimal(12345, 2)));
  EXPECT_EQ(bytes({0xFF, 0xFF, 0xFF, 0x9C}), write(writer, decimal(-100, 2)));
  EXPECT_EQ(bytes({0x00, 0x00, 0x00, 0x00}), write(writer, decimal(0, 2)));
  EXPECT_EQ(bytes({0xFF, 0xFF, 0xFF, 0xFF}), write(writer, decimal(-1, 2)));
  EXPECT_EQ(
      bytes({0x3B, 0x9A, 0xC9, 0xFF}), write(writer, decimal(999'999'999, 2)));
  EXPECT_EQ(
      bytes({0xC4, 0x65, 0x36, 0x01}),
      write(writer, decimal(-999'999'999, 2)));
}

TEST_F(ValueWritersTest, decimalLength) {
  auto length = [](int32_t precision) {
    return DecimalWriter(precision, 0).length();
  };
  EXPECT_EQ(1, length(1));
  EXPECT_EQ(1, length(2));
  EXPECT_EQ(2, length(3));
  EXPECT_EQ(2, length(4));
  EXPECT_EQ(3, length(5));
  EXPECT_EQ(4, length(9));
  EXPECT_EQ(5, length(10));
  EXPECT_EQ(8, length(18));
  EXPECT_EQ(9, length(19));
  EXPECT_EQ(16, length(38));

  PLUME_ASSERT_USER_THROW(
      ValueWriters::decimal(0, 0),
      "Decimal precision must be in range [1, 38], got 0");
  PLUME_ASSERT_USER_THROW(
      ValueWriters::decimal(39, 0),
      "Decimal precision must be in range [1, 38], got 39");
}

TEST_F(ValueWritersTest, decimalPreconditions) {
  auto writer = ValueWriters::decimal(4, 2);
  EXPECT_EQ(bytes({0x27, 0x0F}), write(writer, decimal(9999, 2)));
  EXPECT_EQ(bytes({0xD8, 0xF1}), write(writer, decimal(-9999, 2)));

  PLUME_ASSERT_USER_THROW(
      write(writer, decimal(10000, 2)),
      "Cannot write value as decimal(4,2), too large: "
      "unscaled 10000, scale 2");
  PLUME_ASSERT_USER_THROW(
      write(writer, decimal(100, 3)),
      "Cannot write value as decimal(4,2), wrong scale: "
      "unscaled 100, scale 3");
  PLUME_ASSERT_USER_THROW(write(writer, Variant(1.5)), "wrong kind!");
}

TEST_F(ValueWritersTest, decimalExtremeScale) {
  // The scale is reported as is, never expanded into digits.
  auto writer = ValueWriters::decimal(9, 2);
  PLUME_ASSERT_USER_THROW(
      write(
          writer,
          Variant(Decimal{1, std::numeric_limits<int32_t>::min()})),
      "Cannot write value as decimal(9,2), wrong scale: "
      "unscaled 1, scale -2147483648");
  PLUME_ASSERT_USER_THROW(
      write(
          writer,
          Variant(Decimal{1, std::numeric_limits<int32_t>::max()})),
      "Cannot write value as decimal(9,2), wrong scale: "
      "unscaled 1, scale 2147483647");
  PLUME_ASSERT_USER_THROW(
      write(writer, Variant(Decimal{-7, 1000000000})),
      "wrong scale: unscaled -7, scale 1000000000");
}

TEST_F(ValueWritersTest, decimalMaxPrecision) {
  auto writer = ValueWriters::decimal(38, 0);
  const auto max = DecimalUtil::kPowersOfTen[38] - 1;
  const auto data = write(writer, Variant(Decimal{max, 0}));
  ASSERT_EQ(16, data.size());
  EXPECT_EQ(0x4B, static_cast<uint8_t>(data[0]));

  PLUME_ASSERT_USER_THROW(
      write(writer, Variant(Decimal{DecimalUtil::kPowersOfTen[38], 0})),
      "too large");

  assertRoundTrip(
      writer,
      DecodeSchema::decimal(38, 0),
      {Variant(Decimal{max, 0}),
       Variant(Decimal{-max, 0}),
       Variant(Decimal{1, 0}),
       Variant(Decimal{-1, 0}),
       Variant(Decimal{HugeInt::build(1, 0), 0})});
}

TEST_F(ValueWritersTest, uuid) {
  const auto uuid = UuidUtil::parse("00112233-4455-6677-8899-aabbccddeeff");
  EXPECT_EQ(
      bytes(
          {0x00,
           0x11,
           0x22,
           0x33,
           0x44,
           0x55,
           0x66,
           0x77,
           0x88,
           0x99,
           0xAA,
           0xBB,
           0xCC,
           0xDD,
           0xEE,
           0xFF}),
      write(ValueWriters::uuids(), Variant(uuid)));

  assertRoundTrip(
      ValueWriters::uuids(),
      DecodeSchema::uuids(),
      {Variant(uuid),
       Variant(int128_t(0)),
       Variant(UuidUtil::parse("ffffffff-ffff-ffff-ffff-ffffffffffff"))});
}

TEST_F(ValueWritersTest, option) {
  auto nullFirst = ValueWriters::option(0, ValueWriters::longs());
  EXPECT_EQ(bytes({0x00}), write(nullFirst, Variant::null(TypeKind::BIGINT)));
  EXPECT_EQ(bytes({0x02, 0x0E}), write(nullFirst, Variant(int64_t(7))));

  auto nullSecond = ValueWriters::option(1, ValueWriters::longs());
  EXPECT_EQ(bytes({0x02}), write(nullSecond, Variant::null(TypeKind::BIGINT)));
  EXPECT_EQ(bytes({0x00, 0x0E}), write(nullSecond, Variant(int64_t(7))));

  auto* writer = dynamic_cast<const OptionWriter*>(nullSecond.get());
  ASSERT_NE(writer, nullptr);
  EXPECT_EQ(1, writer->nullIndex());
  EXPECT_EQ(0, writer->valueIndex());

  PLUME_ASSERT_USER_THROW(
      ValueWriters::option(2, ValueWriters::ints()), "Invalid option index: 2");
  PLUME_ASSERT_USER_THROW(
      ValueWriters::option(-1, ValueWriters::ints()),
      "Invalid option index: -1");
}

TEST_F(ValueWritersTest, array) {
  auto writer = ValueWriters::array(ValueWriters::ints());
  EXPECT_EQ(
      bytes({0x06, 0x02, 0x04, 0x06, 0x00}),
      write(writer, Variant::array({1, 2, 3})));
  EXPECT_EQ(bytes({0x00}), write(writer, Variant::array({})));

  EXPECT_EQ(
      (std::vector<std::string>{
          "arrayStart",
          "count(2)",
          "item",
          "int(1)",
          "item",
          "int(2)",
          "arrayEnd"}),
      record(writer, Variant::array({1, 2})));
  EXPECT_EQ(
      (std::vector<std::string>{"arrayStart", "count(0)", "arrayEnd"}),
      record(writer, Variant::array({})));
}

TEST_F(ValueWritersTest, fixed) {
  auto writer = ValueWriters::fixed(4);
  EXPECT_EQ("abcd", write(writer, Variant::binary("abcd")));
  PLUME_ASSERT_USER_THROW(
      write(writer, Variant::binary("abc")),
      "Cannot write byte array of length 3 as fixed[4]");
  PLUME_ASSERT_USER_THROW(
      write(writer, Variant::binary("abcde")),
      "Cannot write byte array of length 5 as fixed[4]");

  EXPECT_EQ("", write(ValueWriters::fixed(0), Variant::binary("")));
  PLUME_ASSERT_USER_THROW(
      ValueWriters::fixed(-1), "Fixed length must not be negative");
}

TEST_F(ValueWritersTest, primitives) {
  EXPECT_EQ(bytes({0x01}), write(ValueWriters::booleans(), Variant(true)));
  EXPECT_EQ(bytes({0x7F}), write(ValueWriters::ints(), Variant(-64)));
  EXPECT_EQ(
      bytes({0xAC, 0x02}), write(ValueWriters::longs(), Variant(int64_t(150))));
  EXPECT_EQ(
      bytes({0x00, 0x00, 0x80, 0x3F}),
      write(ValueWriters::floats(), Variant(1.0f)));
  EXPECT_EQ(
      bytes({0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0xF0, 0x3F}),
      write(ValueWriters::doubles(), Variant(1.0)));
  EXPECT_EQ(
      bytes({0x04, 'h', 'i'}),
      write(ValueWriters::strings(), Variant("hi")));
  EXPECT_EQ(
      bytes({0x04, 0x00, 0x01}),
      write(
          ValueWriters::bytes(),
          Variant::binary(std::string("\x00\x01", 2))));
}

TEST_F(ValueWritersTest, primitiveEncoderCalls) {
  using Events = std::vector<std::string>;
  EXPECT_EQ(Events{"int(-64)"}, record(ValueWriters::ints(), Variant(-64)));
  EXPECT_EQ(
      Events{"long(150)"},
      record(ValueWriters::longs(), Variant(int64_t(150))));
  EXPECT_EQ(
      Events{"float(1.5)"}, record(ValueWriters::floats(), Variant(1.5f)));
  EXPECT_EQ(
      Events{"double(2.25)"},
      record(ValueWriters::doubles(), Variant(2.25)));
}

TEST_F(ValueWritersTest, nulls) {
  auto writer = ValueWriters::nulls();
  EXPECT_EQ("", write(writer, Variant::null(TypeKind::UNKNOWN)));
  EXPECT_EQ("", write(writer, Variant::null(TypeKind::VARCHAR)));
  EXPECT_EQ(
      std::vector<std::string>{"null"},
      record(writer, Variant::null(TypeKind::INTEGER)));
  PLUME_ASSERT_USER_THROW(
      write(writer, Variant(1)), "Cannot write non-null INTEGER value as null");
}

TEST_F(ValueWritersTest, wrongInput) {
  PLUME_ASSERT_USER_THROW(
      write(ValueWriters::ints(), Variant("x")),
      "wrong kind! VARCHAR != INTEGER");
  PLUME_ASSERT_USER_THROW(
      write(ValueWriters::ints(), Variant::null(TypeKind::INTEGER)),
      "missing Variant value of kind INTEGER");
  PLUME_ASSERT_USER_THROW(
      write(ValueWriters::strings(), Variant::binary("x")),
      "wrong kind! VARBINARY != VARCHAR");
}

TEST_F(ValueWritersTest, singletons) {
  EXPECT_EQ(ValueWriters::nulls(), ValueWriters::nulls());
  EXPECT_EQ(ValueWriters::booleans(), ValueWriters::booleans());
  EXPECT_EQ(ValueWriters::ints(), ValueWriters::ints());
  EXPECT_EQ(ValueWriters::longs(), ValueWriters::longs());
  EXPECT_EQ(ValueWriters::floats(), ValueWriters::floats());
  EXPECT_EQ(ValueWriters::doubles(), ValueWriters::doubles());
  EXPECT_EQ(ValueWriters::strings(), ValueWriters::strings());
  EXPECT_EQ(ValueWriters::bytes(), ValueWriters::bytes());
  EXPECT_EQ(ValueWriters::uuids(), ValueWriters::uuids());
  EXPECT_NE(ValueWriters::fixed(4), ValueWriters::fixed(4));
  EXPECT_NE(ValueWriters::decimal(9, 2), ValueWriters::decimal(9, 2));
}

TEST_F(ValueWritersTest, maps) {
  const auto value = Variant::map({{"b", 2}, {"a", 1}});

  auto arrayMap =
      ValueWriters::arrayMap(ValueWriters::strings(), ValueWriters::ints());
  EXPECT_EQ(
      (std::vector<std::string>{
          "arrayStart",
          "count(2)",
          "item",
          "string(b)",
          "int(2)",
          "item",
          "string(a)",
          "int(1)",
          "arrayEnd"}),
      record(arrayMap, value));

  auto map = ValueWriters::map(ValueWriters::strings(), ValueWriters::ints());
  EXPECT_EQ(
      (std::vector<std::string>{
          "mapStart",
          "count(2)",
          "item",
          "string(b)",
          "int(2)",
          "item",
          "string(a)",
          "int(1)",
          "mapEnd"}),
      record(map, value));

  // Both layouts produce the same bytes.
  EXPECT_EQ(
      bytes({0x04, 0x02, 'b', 0x04, 0x02, 'a', 0x02, 0x00}),
      write(arrayMap, value));
  EXPECT_EQ(write(arrayMap, value), write(map, value));
  EXPECT_EQ(bytes({0x00}), write(map, Variant::map({})));

  // Keys are written by the key writer, so they need not be strings.
  assertRoundTrip(
      ValueWriters::arrayMap(ValueWriters::ints(), ValueWriters::booleans()),
      DecodeSchema::arrayMap(DecodeSchema::ints(), DecodeSchema::booleans()),
      {Variant::map({{3, true}, {1, false}}), Variant::map({})});
}

TEST_F(ValueWritersTest, recordFraming) {
  auto writer = ValueWriters::record(
      {ValueWriters::ints(),
       ValueWriters::option(0, ValueWriters::strings()),
       ValueWriters::booleans()});
  EXPECT_EQ(
      (std::vector<std::string>{
          "int(1)", "index(1)", "string(x)", "boolean(false)"}),
      record(writer, Variant::row({1, "x", false})));
  EXPECT_EQ(
      (std::vector<std::string>{"int(1)", "index(0)", "boolean(true)"}),
      record(
          writer, Variant::row({1, Variant::null(TypeKind::VARCHAR), true})));
  EXPECT_TRUE(record(ValueWriters::record({}), Variant::row({})).empty());
  EXPECT_EQ(
      3, dynamic_cast<const RecordWriter*>(writer.get())->numFields());

  PLUME_ASSERT_USER_THROW(
      write(writer, Variant::row({1})),
      "Row has 1 fields, cannot access field 1");
}

TEST_F(ValueWritersTest, recordFieldContext) {
  auto inner = ValueWriters::record(
      {ValueWriters::ints(), ValueWriters::fixed(2)});
  auto outer = ValueWriters::record({ValueWriters::longs(), inner});

  try {
    write(inner, Variant::row({1, Variant::binary("abc")}));
    FAIL() << "Expected an exception";
  } catch (const PlumeUserError& e) {
    EXPECT_EQ("record field 1", e.context());
    EXPECT_EQ(
        "Cannot write byte array of length 3 as fixed[2]", e.message());
  }

  try {
    write(
        outer,
        Variant::row({int64_t(1), Variant::row({"x", Variant::binary("ab")})}));
    FAIL() << "Expected an exception";
  } catch (const PlumeUserError& e) {
    EXPECT_EQ("record field 1, record field 0", e.context());
    EXPECT_EQ("wrong kind! VARCHAR != INTEGER", e.message());
  }

  // The context is only active while a record is written.
  EXPECT_TRUE(getExceptionContext().message().empty());
}

TEST_F(ValueWritersTest, roundTripPrimitives) {
  assertRoundTrip(
      ValueWriters::ints(),
      DecodeSchema::ints(),
      {0,
       1,
       -1,
       63,
       -64,
       64,
       std::numeric_limits<int32_t>::max(),
       std::numeric_limits<int32_t>::min()});
  assertRoundTrip(
      ValueWriters::longs(),
      DecodeSchema::longs(),
      {int64_t(0),
       int64_t(-1),
       std::numeric_limits<int64_t>::max(),
       std::numeric_limits<int64_t>::min(),
       int64_t(1) << 40});
  assertRoundTrip(
      ValueWriters::floats(),
      DecodeSchema::floats(),
      {0.0f,
       -0.0f,
       1.5f,
       std::numeric_limits<float>::quiet_NaN(),
       std::numeric_limits<float>::infinity(),
       -std::numeric_limits<float>::infinity(),
       std::numeric_limits<float>::min(),
       std::numeric_limits<float>::max()});
  assertRoundTrip(
      ValueWriters::doubles(),
      DecodeSchema::doubles(),
      {0.0,
       -0.0,
       -2.25,
       std::numeric_limits<double>::quiet_NaN(),
       std::numeric_limits<double>::infinity(),
       -std::numeric_limits<double>::infinity(),
       std::numeric_limits<double>::denorm_min(),
       std::numeric_limits<double>::lowest()});
  assertRoundTrip(
      ValueWriters::strings(),
      DecodeSchema::strings(),
      {"", "abc", "\xE2\x82\xAC uro", std::string(300, 'x')});
  assertRoundTrip(
      ValueWriters::bytes(),
      DecodeSchema::bytes(),
      {Variant::binary(""), Variant::binary(std::string("\x00\xFF\x7F", 3))});
  assertRoundTrip(
      ValueWriters::booleans(), DecodeSchema::booleans(), {true, false});
}

TEST_F(ValueWritersTest, negativeZero) {
  const auto data = write(ValueWriters::doubles(), Variant(-0.0));
  BinaryDecoder decoder(data);
  EXPECT_TRUE(std::signbit(decoder.readDouble()));

  const auto floatData = write(ValueWriters::floats(), Variant(-0.0f));
  BinaryDecoder floatDecoder(floatData);
  EXPECT_TRUE(std::signbit(floatDecoder.readFloat()));
}

TEST_F(ValueWritersTest, roundTripNested) {
  // row(id bigint, tags array(row(name varchar, price decimal(9,2))?)?,
  //     attrs map(varchar, double), flags map(integer, boolean),
  //     payload varbinary, code fixed[3], uuid, score real, nothing)
  auto writer = ValueWriters::record(
      {ValueWriters::longs(),
       ValueWriters::option(
           0,
           ValueWriters::array(ValueWriters::record(
               {ValueWriters::strings(),
                ValueWriters::option(1, ValueWriters::decimal(9, 2))}))),
       ValueWriters::map(ValueWriters::strings(), ValueWriters::doubles()),
       ValueWriters::arrayMap(ValueWriters::ints(), ValueWriters::booleans()),
       ValueWriters::bytes(),
       ValueWriters::fixed(3),
       ValueWriters::uuids(),
       ValueWriters::floats(),
       ValueWriters::nulls()});
  auto schema = DecodeSchema::record(
      {DecodeSchema::longs(),
       DecodeSchema::option(
           0,
           DecodeSchema::array(DecodeSchema::record(
               {DecodeSchema::strings(),
                DecodeSchema::option(1, DecodeSchema::decimal(9, 2))}))),
       DecodeSchema::map(DecodeSchema::strings(), DecodeSchema::doubles()),
       DecodeSchema::arrayMap(DecodeSchema::ints(), DecodeSchema::booleans()),
       DecodeSchema::bytes(),
       DecodeSchema::fixed(3),
       DecodeSchema::uuids(),
       DecodeSchema::floats(),
       DecodeSchema::nulls()});

  const auto uuid = UuidUtil::parse("f79c3e09-677c-4bbd-a479-3f349cb785e7");
  std::vector<Variant> rows{
      Variant::row(
          {int64_t(1),
           Variant::array(
               {Variant::row({"apple", decimal(125, 2)}),
                Variant::row({"pear", Variant::null(TypeKind::DECIMAL)})}),
           Variant::map({{"weight", 1.5}, {"height", -2.0}}),
           Variant::map({{1, true}}),
           Variant::binary("\x01\x02"),
           Variant::binary("xyz"),
           Variant(uuid),
           Variant(0.25f),
           Variant::null(TypeKind::UNKNOWN)}),
      Variant::row(
          {int64_t(-2),
           Variant::null(TypeKind::ARRAY),
           Variant::map({}),
           Variant::map({}),
           Variant::binary(""),
           Variant::binary("abc"),
           Variant(int128_t(0)),
           Variant(std::numeric_limits<float>::quiet_NaN()),
           Variant::null(TypeKind::UNKNOWN)}),
      Variant::row(
          {int64_t(3),
           Variant::array({}),
           Variant::map({{"", 0.0}}),
           Variant::map({{-1, false}, {2, true}}),
           Variant::binary("z"),
           Variant::binary("   "),
           Variant(uuid),
           Variant(-1.0f),
           Variant::null(TypeKind::UNKNOWN)}),
  };
  assertRoundTrip(writer, schema, rows);
}
