/*
 *   Copyright (C) 2020 Nippon Telegraph and Telephone Corporation.

 *   Licensed under the Apache License, Version 2.0 (the "License");
 *   you may not use this file except in compliance with the License.
 *   You may obtain a copy of the License at

 *   http://www.apache.org/licenses/LICENSE-2.0

 *   Unless required by applicable law or agreed to in writing, software
 *   distributed under the License is distributed on an "AS IS" BASIS,
 *   WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 *   See the License for the specific language governing permissions and
 *   limitations under the License.
 */

#include <cstdint>
#include <limits>
#include <string>

#include "gtest/gtest.h"
#include "intpack/codec.h"
#include "test_helper.hpp"

using TestHelper::Bytes;

TEST(SignedCodecTest, PackNegative1Byte) {
  ASSERT_EQ(Bytes({0x7f}), IntPack::PackInt(-1));
  ASSERT_EQ(Bytes({0x7e}), IntPack::PackInt(-2));
  ASSERT_EQ(Bytes({0x40}), IntPack::PackInt(-64));
}

TEST(SignedCodecTest, PackNegative2Byte) {
  ASSERT_EQ(Bytes({0x3f, 0xff}), IntPack::PackInt(-65));
  ASSERT_EQ(Bytes({0x30, 0x00}), IntPack::PackInt(-4160));
  ASSERT_EQ(Bytes({0x20, 0x01}), IntPack::PackInt(-8255));
  ASSERT_EQ(Bytes({0x20, 0x00}), IntPack::PackInt(-8256));
}

TEST(SignedCodecTest, PackNegativeMulti) {
  // The low nibble counts the elided 0xff bytes of the raw value.
  ASSERT_EQ(Bytes({0x16, 0xdf, 0xbf}), IntPack::PackInt(-8257));
  ASSERT_EQ(Bytes({0x16, 0x80, 0x00}), IntPack::PackInt(-32768));
  ASSERT_EQ(Bytes({0x16, 0x7f, 0xff}), IntPack::PackInt(-32769));
  ASSERT_EQ(Bytes({0x15, 0xfe, 0xff, 0xff}), IntPack::PackInt(-65537));
  ASSERT_EQ(Bytes({0x10, 0x80, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00}),
            IntPack::PackInt(std::numeric_limits<int64_t>::min()));
}

TEST(SignedCodecTest, NonNegativeValuesShareTheUnsignedEncoding) {
  for (const int64_t x : TestHelper::SignedBoundaries()) {
    if (x < 0) continue;
    ASSERT_EQ(IntPack::PackUint(static_cast<uint64_t>(x)), IntPack::PackInt(x))
        << x;
  }
  TestHelper::RandomValues random(11);
  for (size_t i = 0; i < 10000; i++) {
    const int64_t x = random.NextSigned();
    if (x < 0) continue;
    ASSERT_EQ(IntPack::PackUint(static_cast<uint64_t>(x)), IntPack::PackInt(x))
        << x;
  }
}

TEST(SignedCodecTest, UnpackBoundaries) {
  for (const int64_t x : TestHelper::SignedBoundaries()) {
    const auto packed = IntPack::PackInt(x);
    ASSERT_EQ(x, IntPack::UnpackInt(packed)) << TestHelper::ToHex(packed);
  }
}

TEST(SignedCodecTest, RoundTripRandomValues) {
  TestHelper::RandomValues random(20200402);
  for (size_t i = 0; i < 100000; i++) {
    const int64_t x   = random.NextSigned();
    const auto packed = IntPack::PackInt(x);
    ASSERT_EQ(x, IntPack::UnpackInt(packed)) << TestHelper::ToHex(packed);
  }
}

TEST(SignedCodecTest, RoundTripDenseRangeAroundZero) {
  for (int64_t x = -70000; x < 70000; x++) {
    ASSERT_EQ(x, IntPack::UnpackInt(IntPack::PackInt(x)));
  }
}

TEST(SignedCodecTest, EncodingIsMinimal) {
  ASSERT_EQ(1u, IntPack::PackInt(-64).size());
  ASSERT_EQ(2u, IntPack::PackInt(-65).size());
  ASSERT_EQ(2u, IntPack::PackInt(-8256).size());
  ASSERT_EQ(3u, IntPack::PackInt(-8257).size());
  for (int bytes = 2; bytes < 8; bytes++) {
    // Smallest value whose raw bytes beyond `bytes` are all 0xff, and the
    // one below it.
    const int64_t first = -(int64_t{1} << (8 * bytes));
    ASSERT_EQ(static_cast<size_t>(bytes) + 1, IntPack::PackInt(first).size());
    ASSERT_EQ(static_cast<size_t>(bytes) + 2,
              IntPack::PackInt(first - 1).size());
  }
  ASSERT_EQ(IntPack::kMaxPackedSize,
            IntPack::PackInt(std::numeric_limits<int64_t>::min()).size());
}

TEST(SignedCodecTest, PackedSizeMatchesEncoding) {
  for (const int64_t x : TestHelper::SignedBoundaries()) {
    ASSERT_EQ(IntPack::PackInt(x).size(), IntPack::PackedSizeInt(x)) << x;
  }
  TestHelper::RandomValues random(13);
  for (size_t i = 0; i < 10000; i++) {
    const int64_t x = random.NextSigned();
    ASSERT_EQ(IntPack::PackInt(x).size(), IntPack::PackedSizeInt(x)) << x;
  }
}

TEST(SignedCodecTest, AcceptsEveryLowBitVariantOfShortMarkers) {
  ASSERT_EQ(-64, IntPack::UnpackInt(Bytes({0x40})));
  ASSERT_EQ(-48, IntPack::UnpackInt(Bytes({0x50})));
  ASSERT_EQ(-32, IntPack::UnpackInt(Bytes({0x60})));
  ASSERT_EQ(-1, IntPack::UnpackInt(Bytes({0x7f})));
  ASSERT_EQ(-8256, IntPack::UnpackInt(Bytes({0x20, 0x00})));
  ASSERT_EQ(-4160, IntPack::UnpackInt(Bytes({0x30, 0x00})));
}

TEST(SignedCodecTest, UnpacksNonNegativeCategories) {
  ASSERT_EQ(0, IntPack::UnpackInt(Bytes({0x80})));
  ASSERT_EQ(8256, IntPack::UnpackInt(Bytes({0xe1, 0x00})));
  ASSERT_EQ(std::numeric_limits<int64_t>::max(),
            IntPack::UnpackInt(IntPack::PackUint(
                static_cast<uint64_t>(std::numeric_limits<int64_t>::max()))));
}

TEST(SignedCodecTest, IgnoresTrailingBytes) {
  ASSERT_EQ(-1, IntPack::UnpackInt(Bytes({0x7f, 0x00})));
  ASSERT_EQ(-8257, IntPack::UnpackInt(Bytes({0x16, 0xdf, 0xbf, 0x80})));
}
