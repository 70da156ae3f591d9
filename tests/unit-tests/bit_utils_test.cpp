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

#include "util/bit_utils.hpp"

#include <cstdint>
#include <limits>

#include "gtest/gtest.h"

using namespace IntPack::Util;

TEST(BitUtilsTest, BitCastKeepsTheBitPattern) {
  ASSERT_EQ(std::numeric_limits<uint64_t>::max(), BitCast<uint64_t>(int64_t{-1}));
  ASSERT_EQ(0x8000'0000'0000'0000ULL,
            BitCast<uint64_t>(std::numeric_limits<int64_t>::min()));
  ASSERT_EQ(std::numeric_limits<int64_t>::min(),
            BitCast<int64_t>(uint64_t{0x8000'0000'0000'0000ULL}));
  ASSERT_EQ(42, BitCast<int64_t>(uint64_t{42}));
}

TEST(BitUtilsTest, GetBits) {
  ASSERT_EQ(0x3f, GetBits(0xff, 6, 0));
  ASSERT_EQ(0x1f, GetBits(0x1fff, 13, 8));
  ASSERT_EQ(0xff, GetBits(0x1fff, 8, 0));
  ASSERT_EQ(0x10, GetBits(0x1000, 13, 8));
}

TEST(BitUtilsTest, CountLeadingZeros) {
  ASSERT_EQ(64u, CountLeadingZeros(0));
  ASSERT_EQ(63u, CountLeadingZeros(1));
  ASSERT_EQ(0u, CountLeadingZeros(std::numeric_limits<uint64_t>::max()));
}

TEST(BitUtilsTest, CountLeadingOnes) {
  ASSERT_EQ(64u, CountLeadingOnes(-1));
  ASSERT_EQ(56u, CountLeadingOnes(-256));
  ASSERT_EQ(55u, CountLeadingOnes(-257));
  ASSERT_EQ(1u, CountLeadingOnes(std::numeric_limits<int64_t>::min()));
  ASSERT_EQ(0u, CountLeadingOnes(0));
}
