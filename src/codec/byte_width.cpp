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

#include "codec/byte_width.h"

#include <intpack/codec.h>

#include <algorithm>

#include "codec/category.h"
#include "util/bit_utils.hpp"

namespace IntPack {
namespace Codec {

size_t BytesForMagnitude(const uint64_t magnitude) noexcept {
  const size_t elided = Util::CountLeadingZeros(magnitude) >> 3;
  return std::max<size_t>(sizeof(uint64_t) - elided, 1);
}

size_t BytesForNegative(const int64_t value) noexcept {
  const size_t elided = Util::CountLeadingOnes(value) >> 3;
  return std::max<size_t>(sizeof(uint64_t) - elided, 1);
}

}  // namespace Codec

size_t PackedSizeUint(const uint64_t value) noexcept {
  switch (Codec::Classify(value)) {
    case Codec::Category::Positive1Byte:
      return 1;
    case Codec::Category::Positive2Byte:
      return 2;
    default:
      return 1 + Codec::BytesForMagnitude(value -
                                          (Codec::kPositive2ByteMax + 1));
  }
}

size_t PackedSizeInt(const int64_t value) noexcept {
  if (value >= 0) return PackedSizeUint(static_cast<uint64_t>(value));
  switch (Codec::Classify(value)) {
    case Codec::Category::Negative1Byte:
      return 1;
    case Codec::Category::Negative2Byte:
      return 2;
    default:
      return 1 + Codec::BytesForNegative(value);
  }
}

}  // namespace IntPack
