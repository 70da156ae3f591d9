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

#include "codec/frame.h"

#include "util/logger.hpp"

namespace IntPack {
namespace Codec {

void ThrowDecodeError(const DecodeErrorKind kind, const std::string& what) {
  SPDLOG_DEBUG("IntPack decode failed ({0}): {1}", ToString(kind), what);
  throw DecodeError(kind, what);
}

Frame ReadFrame(const std::string_view bytes) {
  if (bytes.empty()) {
    ThrowDecodeError(DecodeErrorKind::Truncated, "empty buffer");
  }

  const auto header = static_cast<uint8_t>(bytes[0]);
  const int length  = PayloadLength(header);
  if (length < 0) {
    ThrowDecodeError(DecodeErrorKind::InvalidMarker,
                     fmt::format("header {0:#04x} is not a valid marker",
                                 header));
  }
  if (bytes.size() < static_cast<size_t>(length) + 1) {
    ThrowDecodeError(
        DecodeErrorKind::Truncated,
        fmt::format("header {0:#04x} ({1}) claims {2} payload byte(s), "
                    "{3} available",
                    header, ToString(ClassifyHeader(header)), length,
                    bytes.size() - 1));
  }
  return Frame{header, ClassifyHeader(header), bytes.substr(1, length)};
}

}  // namespace Codec
}  // namespace IntPack
