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

#include <spdlog/fmt/fmt.h>

#include <limits>
#include <string>
#include <string_view>

#include "codec/big_endian.hpp"
#include "codec/byte_width.h"
#include "codec/category.h"
#include "codec/frame.h"
#include "util/bit_utils.hpp"

namespace IntPack {

using namespace Codec;

std::string PackUint(const uint64_t x) {
  std::string packed;
  packed.reserve(PackedSizeUint(x));

  switch (Classify(x)) {
    case Category::Positive1Byte:
      packed.push_back(
          static_cast<char>(kPositive1ByteMarker | Util::GetBits(x, 6, 0)));
      break;
    case Category::Positive2Byte: {
      const uint64_t y = x - (kPositive1ByteMax + 1);
      packed.push_back(
          static_cast<char>(kPositive2ByteMarker | Util::GetBits(y, 13, 8)));
      packed.push_back(static_cast<char>(Util::GetBits(y, 8, 0)));
      break;
    }
    default: {
      const uint64_t y  = x - (kPositive2ByteMax + 1);
      const size_t size = BytesForMagnitude(y);
      packed.push_back(static_cast<char>(kPositiveMultiMarker | size));
      AppendBigEndian(packed, y, size);
      break;
    }
  }
  return packed;
}

uint64_t UnpackUint(const std::string_view bytes) {
  const Frame frame = ReadFrame(bytes);

  switch (frame.category) {
    case Category::Positive1Byte:
      return Util::GetBits(frame.header, 6, 0);
    case Category::Positive2Byte: {
      const uint64_t y = (uint64_t{Util::GetBits(frame.header, 5, 0)} << 8) |
                         static_cast<unsigned char>(frame.payload[0]);
      return y + kPositive1ByteMax + 1;
    }
    case Category::PositiveMulti: {
      const uint64_t y = ReadBigEndian(frame.payload.data(),
                                       frame.payload.size());
      if (y > std::numeric_limits<uint64_t>::max() - (kPositive2ByteMax + 1)) {
        ThrowDecodeError(DecodeErrorKind::InvalidMarker,
                         "multi-byte payload exceeds the uint64_t range");
      }
      return y + kPositive2ByteMax + 1;
    }
    default:
      ThrowDecodeError(
          DecodeErrorKind::InvalidMarker,
          fmt::format("header {0:#04x} ({1}) is not an unsigned category",
                      frame.header, ToString(frame.category)));
  }
}

}  // namespace IntPack
