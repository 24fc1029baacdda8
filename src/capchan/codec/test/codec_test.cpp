/* capchan: Typed capability channels
 * Copyright 2023 Akamai Technologies, Inc.
 *
 * Licensed under the Apache License, Version 2.0 (the
 * "License"); you may not use this file except in
 * compliance with the License.  You may obtain a copy
 * of the License at
 *
 *   https://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in
 * writing, software distributed under the License is
 * distributed on an "AS IS" BASIS, WITHOUT WARRANTIES OR
 * CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing
 * permissions and limitations under the License. */

#include "capchan/codec/codec.hpp"
#include "capchan/codec/capability_context.hpp"
#include "capchan/codec/error.hpp"
#include "capchan/transport/raw_transport.hpp"
#include "capchan/test/test_logger.hpp"
#include "capchan_wire.pb.h"
#include <gtest/gtest.h>
#include <boost/fusion/include/adapt_struct.hpp>
#include <cmath>
#include <cstdint>
#include <limits>

namespace capchan::codec::test
{

/// Sample record type.
struct Point
{
  /// X.
  int32_t m_x = 0;
  /// Y.
  int32_t m_y = 0;
  /// Label.
  std::string m_label;

  /// Equality.
  bool operator==(const Point& other) const
  {
    return (m_x == other.m_x) && (m_y == other.m_y) && (m_label == other.m_label);
  }
};

/// Same shape as Point, but with differently named members.
struct Other_point
{
  /// Column.
  int32_t m_col = 0;
  /// Row.
  int32_t m_row = 0;
  /// Label.
  std::string m_label;
};

/// Sample record nesting other types.
struct Shape
{
  /// Name.
  std::string m_name;
  /// Vertices.
  std::vector<Point> m_vertices;
  /// Optional fill color, as RGB.
  std::optional<std::tuple<uint8_t, uint8_t, uint8_t>> m_fill;
};

/// Sample enumeration.
enum class Color : uint8_t
{
  S_RED = 1,
  S_GREEN = 2
};

} // namespace capchan::codec::test

BOOST_FUSION_ADAPT_STRUCT(capchan::codec::test::Point, m_x, m_y, m_label)
BOOST_FUSION_ADAPT_STRUCT(capchan::codec::test::Other_point, m_col, m_row, m_label)
BOOST_FUSION_ADAPT_STRUCT(capchan::codec::test::Shape, m_name, m_vertices, m_fill)

namespace capchan::codec::test
{

namespace
{

using capchan::test::Test_logger;
using std::string;
using std::vector;

/**
 * Encodes `value` (which must contain no capabilities) and decodes the result as `Target`.
 *
 * @return `true` on success; else `false` and `*err_code` is set.
 */
template<typename Target, typename Source>
bool transcode(Test_logger* logger, const Source& value, Target* target, Error_code* err_code)
{
  Encode_context enc_ctx(logger);
  string bytes;
  if (!encode(value, &enc_ctx, &bytes, err_code))
  {
    return false;
  }
  // else
  EXPECT_EQ(enc_ctx.size(), 0u);

  Decode_context dec_ctx(logger, {});
  return decode(util::Blob_const(bytes.data(), bytes.size()), &dec_ctx, target, err_code);
}

/// Encodes then decodes `value` as the same type and checks the result equals it.
template<typename T>
void expect_round_trip(Test_logger* logger, const T& value)
{
  T decoded{};
  Error_code err_code;
  ASSERT_TRUE(transcode(logger, value, &decoded, &err_code)) << err_code << ' ' << err_code.message();
  EXPECT_TRUE(decoded == value);
}

} // Anonymous namespace

TEST(Codec, Scalars)
{
  Test_logger logger;
  expect_round_trip(&logger, true);
  expect_round_trip(&logger, false);
  expect_round_trip(&logger, std::numeric_limits<int8_t>::min());
  expect_round_trip(&logger, std::numeric_limits<int64_t>::min());
  expect_round_trip(&logger, std::numeric_limits<uint64_t>::max());
  expect_round_trip(&logger, uint16_t(0));
  expect_round_trip(&logger, -0.5);
  expect_round_trip(&logger, 3.25f);
  expect_round_trip(&logger, Color::S_GREEN);
}

TEST(Codec, Strings_and_bytes)
{
  Test_logger logger;
  expect_round_trip(&logger, string());
  expect_round_trip(&logger, string("hello"));
  // Text is not required to be valid UTF-8.
  expect_round_trip(&logger, string("\xff\xfe\0x", 4));
  expect_round_trip(&logger, vector<uint8_t>{ 0, 1, 255 });
}

TEST(Codec, Containers)
{
  Test_logger logger;
  expect_round_trip(&logger, vector<int>());
  expect_round_trip(&logger, vector<string>{ "a", "", "c" });
  expect_round_trip(&logger, std::map<string, int>{ { "one", 1 }, { "two", 2 } });
  expect_round_trip(&logger, std::make_pair(string("k"), 7u));
  expect_round_trip(&logger, std::make_tuple(1, string("two"), 3.0, vector<bool>{ true, false }));
  expect_round_trip(&logger, std::tuple<>());
  expect_round_trip(&logger, std::optional<int>());
  expect_round_trip(&logger, std::optional<int>(5));
  // Nested optionals stay distinguishable.
  expect_round_trip(&logger, std::optional<std::optional<int>>(std::optional<int>()));
  expect_round_trip(&logger, std::optional<std::optional<int>>());
}

TEST(Codec, Records)
{
  Test_logger logger;
  expect_round_trip(&logger, Point{ -1, 2, "p" });

  Shape shape;
  shape.m_name = "triangle";
  shape.m_vertices = { Point{ 0, 0, "a" }, Point{ 1, 0, "b" }, Point{ 0, 1, "c" } };
  shape.m_fill = std::make_tuple(uint8_t(255), uint8_t(0), uint8_t(128));

  Shape decoded;
  Error_code err_code;
  ASSERT_TRUE(transcode(&logger, shape, &decoded, &err_code));
  EXPECT_EQ(decoded.m_name, shape.m_name);
  EXPECT_EQ(decoded.m_vertices, shape.m_vertices);
  EXPECT_EQ(decoded.m_fill, shape.m_fill);
}

TEST(Codec, Integer_out_of_range)
{
  Test_logger logger;
  Error_code err_code;

  uint8_t small;
  EXPECT_FALSE(transcode(&logger, 256, &small, &err_code));
  EXPECT_EQ(err_code, error::Code::S_INTEGER_OUT_OF_RANGE);
  EXPECT_FALSE(transcode(&logger, -1, &small, &err_code));
  EXPECT_EQ(err_code, error::Code::S_INTEGER_OUT_OF_RANGE);

  int64_t big;
  EXPECT_FALSE(transcode(&logger, std::numeric_limits<uint64_t>::max(), &big, &err_code));
  EXPECT_EQ(err_code, error::Code::S_INTEGER_OUT_OF_RANGE);

  // In range: signedness of the source does not matter.
  EXPECT_TRUE(transcode(&logger, 255, &small, &err_code));
  EXPECT_EQ(small, 255);
  EXPECT_TRUE(transcode(&logger, 5u, &big, &err_code));
  EXPECT_EQ(big, 5);
}

TEST(Codec, Float_out_of_range)
{
  Test_logger logger;
  Error_code err_code;

  float narrow = 1;
  EXPECT_FALSE(transcode(&logger, 1e300, &narrow, &err_code));
  EXPECT_EQ(err_code, error::Code::S_FLOAT_OUT_OF_RANGE);
  EXPECT_FALSE(transcode(&logger, -1e300, &narrow, &err_code));
  EXPECT_EQ(err_code, error::Code::S_FLOAT_OUT_OF_RANGE);
  EXPECT_EQ(narrow, 1);

  // Infinities and NaN are not out of range.
  EXPECT_TRUE(transcode(&logger, std::numeric_limits<double>::infinity(), &narrow, &err_code));
  EXPECT_TRUE(std::isinf(narrow) && (narrow > 0));
  EXPECT_TRUE(transcode(&logger, std::numeric_limits<double>::quiet_NaN(), &narrow, &err_code));
  EXPECT_TRUE(std::isnan(narrow));
  EXPECT_TRUE(transcode(&logger, double(std::numeric_limits<float>::max()), &narrow, &err_code));
  EXPECT_EQ(narrow, std::numeric_limits<float>::max());

  double wide;
  EXPECT_TRUE(transcode(&logger, 1e300, &wide, &err_code));
  EXPECT_EQ(wide, 1e300);
}

TEST(Codec, Wrong_shape)
{
  Test_logger logger;
  Error_code err_code;

  int num;
  EXPECT_FALSE(transcode(&logger, string("5"), &num, &err_code));
  EXPECT_EQ(err_code, error::Code::S_WRONG_KIND);

  string str;
  EXPECT_FALSE(transcode(&logger, vector<uint8_t>{ 'a' }, &str, &err_code));
  EXPECT_EQ(err_code, error::Code::S_WRONG_KIND);

  std::pair<int, int> pair;
  EXPECT_FALSE(transcode(&logger, std::make_tuple(1, 2, 3), &pair, &err_code));
  EXPECT_EQ(err_code, error::Code::S_WRONG_ARITY);

  Other_point other;
  EXPECT_FALSE(transcode(&logger, Point{ 1, 2, "p" }, &other, &err_code));
  EXPECT_EQ(err_code, error::Code::S_RECORD_FIELD_MISMATCH);

  Point point;
  EXPECT_FALSE(transcode(&logger, std::make_tuple(1, 2, string("p")), &point, &err_code));
  EXPECT_EQ(err_code, error::Code::S_WRONG_KIND);
}

TEST(Codec, Malformed_bytes)
{
  Test_logger logger;
  Decode_context ctx(&logger, {});
  const string GARBAGE = "\xff\xff\xff\xff\xff";
  int num;
  Error_code err_code;
  EXPECT_FALSE(decode(util::Blob_const(GARBAGE.data(), GARBAGE.size()), &ctx, &num, &err_code));
  EXPECT_EQ(err_code, error::Code::S_MALFORMED_MESSAGE);
  EXPECT_THROW(decode(util::Blob_const(GARBAGE.data(), GARBAGE.size()), &ctx, &num), flow::error::Runtime_error);
}

TEST(Codec, Capability_indices_and_count)
{
  Test_logger logger;

  transport::Raw_sender snd;
  transport::Raw_receiver rcv;
  ASSERT_TRUE(transport::create_raw_pair(&logger, "cap", &snd, &rcv));

  // Indices are assigned in order of addition.
  Encode_context enc_ctx(&logger);
  EXPECT_EQ(enc_ctx.add_capability(snd.native_handle()), 0u);
  EXPECT_EQ(enc_ctx.add_capability(snd.native_handle()), 1u);
  EXPECT_EQ(enc_ctx.size(), 2u);
  ASSERT_EQ(enc_ctx.capabilities().size(), 2u);
  EXPECT_EQ(enc_ctx.capabilities()[1].m_native_handle, snd.native_handle().m_native_handle);

  // A message declaring 1 capability but delivered with none is rejected.
  wire::Envelope envelope;
  envelope.set_n_capabilities(1);
  envelope.mutable_root()->set_capability_index(0);
  const auto bytes = envelope.SerializeAsString();
  Decode_context empty_ctx(&logger, {});
  int num;
  Error_code err_code;
  EXPECT_FALSE(decode(util::Blob_const(bytes.data(), bytes.size()), &empty_ctx, &num, &err_code));
  EXPECT_EQ(err_code, error::Code::S_CAPABILITY_COUNT_MISMATCH);

  // Lookups beyond the delivered capabilities are reported.
  transport::Raw_sender_list delivered;
  delivered.emplace_back();
  ASSERT_TRUE(snd.clone(&delivered.back()));
  Decode_context dec_ctx(&logger, std::move(delivered));
  EXPECT_EQ(dec_ctx.size(), 1u);
  transport::Raw_sender clone;
  EXPECT_FALSE(dec_ctx.clone_sender_at(1, &clone, &err_code));
  EXPECT_EQ(err_code, error::Code::S_CAPABILITY_INDEX_OUT_OF_RANGE);
  EXPECT_TRUE(clone.null());
  EXPECT_TRUE(dec_ctx.clone_sender_at(0, &clone, &err_code));
  EXPECT_FALSE(clone.null());
} // TEST(Codec, Capability_indices_and_count)

} // namespace capchan::codec::test
