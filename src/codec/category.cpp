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

#include "codec/category.h"

#include "util/bit_utils.hpp"

namespace IntPack {
namespace Codec {

Category Classify(const uint64_t value) noexcept {
  if (value <= kPositive1ByteMax) return Category::Positive1Byte;
  if (value <= kPositive2ByteMax) return Category::Positive2Byte;
  return Category::PositiveMulti;
}

Category Classify(const int64_t value) noexcept {
  if (value >= 0) return Classify(static_cast<uint64_t>(value));
  if (value < kNegative2ByteMin) return Category::NegativeMulti;
  if (value < kNegative1ByteMin) return Category::Negative2Byte;
  return Category::Negative1Byte;
}

Category ClassifyHeader(const uint8_t header) noexcept {
  if (header < kNegativeMultiMarker) return Category::Reserved;
  if (header < kNegative2ByteMarker) return Category::NegativeMulti;
  if (header < kNegative1ByteMarker) return Category::Negative2Byte;
  if (header < kPositive1ByteMarker) return Category::Negative1Byte;
  if (header < kPositive2ByteMarker) return Category::Positive1Byte;
  if (header < kPositiveMultiMarker) return Category::Positive2Byte;
  if (header < 0xf0) return Category::PositiveMulti;
  return Category::Reserved;
}

int PayloadLength(const uint8_t header) noexcept {
  const int nibble = Util::GetBits(header, 4, 0);
  switch (ClassifyHeader(header)) {
    case Category::NegativeMulti:
      // The nibble counts the elided 0xff bytes of the raw value.
      return nibble < 8 ? 8 - nibble : -1;
    case Category::Negative2Byte:
    case Category::Positive2Byte:
      return 1;
    case Category::Negative1Byte:
    case Category::Positive1Byte:
      return 0;
    case Category::PositiveMulti:
      return (1 <= nibble && nibble <= 8) ? nibble : -1;
    case Category::Reserved:
      break;
  }
  return -1;
}

const char* ToString(const Category category) noexcept {
  switch (category) {
    case Category::Reserved:
      return "Reserved";
    case Category::NegativeMulti:
      return "NegativeMulti";
    case Category::Negative2Byte:
      return "Negative2Byte";
    case Category::Negative1Byte:
      return "Negative1Byte";
    case Category::Positive1Byte:
      return "Positive1Byte";
    case Category::Positive2Byte:
      return "Positive2Byte";
    case Category::PositiveMulti:
      return "PositiveMulti";
  }
  return "Unknown";
}

}  // namespace Codec
}  // namespace IntPack
