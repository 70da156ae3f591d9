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

#ifndef INTPACK_CODEC_CATEGORY_H
#define INTPACK_CODEC_CATEGORY_H

#include <cstddef>
#include <cstdint>

/*
 * Layout of the header byte.
 *
 * Header      | Next  |
 * byte        | bytes | Min value          | Max value
 * ------------+-------+--------------------+---------------------
 * [00 00xxxx] | -     | reserved           |
 * [00 01llll] | 8-l   | INT64_MIN          | -2^13 - 2^6 - 1
 * [00 1xxxxx] | 1     | -2^13 - 2^6        | -2^6 - 1
 * [01 xxxxxx] | 0     | -2^6               | -1
 * [10 xxxxxx] | 0     | 0                  | 2^6 - 1
 * [11 0xxxxx] | 1     | 2^6                | 2^13 + 2^6 - 1
 * [11 10llll] | l     | 2^13 + 2^6         | UINT64_MAX
 * [11 11xxxx] | -     | reserved           |
 *
 * Categories are ordered by the values they hold, and so are their markers;
 * within a category the payload is big-endian. That makes byte-wise
 * comparison of two encodings agree with numeric comparison.
 */

namespace IntPack {
namespace Codec {

enum class Category {
  Reserved,
  NegativeMulti,
  Negative2Byte,
  Negative1Byte,
  Positive1Byte,
  Positive2Byte,
  PositiveMulti,
};

constexpr uint8_t kNegativeMultiMarker = 0x10;
constexpr uint8_t kNegative2ByteMarker = 0x20;
constexpr uint8_t kNegative1ByteMarker = 0x40;
constexpr uint8_t kPositive1ByteMarker = 0x80;
constexpr uint8_t kPositive2ByteMarker = 0xc0;
constexpr uint8_t kPositiveMultiMarker = 0xe0;

constexpr int64_t kNegative1ByteMin  = -(int64_t{1} << 6);
constexpr int64_t kNegative2ByteMin  = -(int64_t{1} << 13) + kNegative1ByteMin;
constexpr uint64_t kPositive1ByteMax = (uint64_t{1} << 6) - 1;
constexpr uint64_t kPositive2ByteMax = (uint64_t{1} << 13) + kPositive1ByteMax;

static_assert(kNegative2ByteMin == -8256);
static_assert(kPositive2ByteMax == 8255);

Category Classify(uint64_t value) noexcept;
Category Classify(int64_t value) noexcept;

/**
 * @brief
 * Returns the category selected by the high bits of a header byte.
 * Every low-bit variant of a short marker maps to the same category, e.g.,
 * 0x80, 0x90, 0xa0 and 0xb0 are all Positive1Byte. Length nibbles of
 * multi-byte headers are not validated here; see PayloadLength.
 */
Category ClassifyHeader(uint8_t header) noexcept;

/**
 * @brief
 * Returns the number of bytes following `header`, or 0 for 1-byte
 * categories.
 * @return -1 if `header` is reserved or carries a length nibble outside the
 * range its category can produce.
 */
int PayloadLength(uint8_t header) noexcept;

const char* ToString(Category category) noexcept;

}  // namespace Codec
}  // namespace IntPack

#endif /* INTPACK_CODEC_CATEGORY_H */
