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

#include <intpack/codec.h>

#include <string>
#include <string_view>

#include "codec/big_endian.hpp"
#include "codec/byte_width.h"
#include "codec/category.h"
#include "codec/frame.h"
#include "util/bit_utils.hpp"

namespace IntPack {

using namespace Codec;

std::string PackInt(const int64_t x) {
  // Non-negative values share one encoding space with unsigned ones.
  if (x >= 0) return PackUint(static_cast<uint64_t>(x));

  std::string packed;
  packed.reserve(PackedSizeInt(x));

  switch (Classify(x)) {
    case Category::NegativeMulti: {
      const size_t size = BytesForNegative(x);
      packed.push_back(
          static_cast<char>(kNegativeMultiMarker | (sizeof(uint64_t) - size)));
      AppendBigEndian(packed, Util::BitCast<uint64_t>(x), size);
      break;
    }
    case Category::Negative2Byte: {
      const auto y = static_cast<uint64_t>(x - kNegative2ByteMin);
      packed.push_back(
          static_cast<char>(kNegative2ByteMarker | Util::GetBits(y, 13, 8)));
      packed.push_back(static_cast<char>(Util::GetBits(y, 8, 0)));
      break;
    }
    default: {
      const auto y = static_cast<uint64_t>(x - kNegative1ByteMin);
      packed.push_back(
          static_cast<char>(kNegative1ByteMarker | Util::GetBits(y, 6, 0)));
      break;
    }
  }
  return packed;
}

int64_t UnpackInt(const std::string_view bytes) {
  const Frame frame = ReadFrame(bytes);

  switch (frame.category) {
    case Category::NegativeMulti: {
      const uint64_t raw = ReadBigEndian(frame.payload.data(),
                                         frame.payload.size(), ~uint64_t{0});
      return Util::BitCast<int64_t>(raw);
    }
    case Category::Negative2Byte: {
      const int64_t y = (int64_t{Util::GetBits(frame.header, 5, 0)} << 8) |
                        static_cast<unsigned char>(frame.payload[0]);
      return y + kNegative2ByteMin;
    }
    case Category::Negative1Byte:
      return kNegative1ByteMin + Util::GetBits(frame.header, 6, 0);
    default:
      return Util::BitCast<int64_t>(UnpackUint(bytes));
  }
}

}  // namespace IntPack
