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

#ifndef INTPACK_CODEC_FRAME_H
#define INTPACK_CODEC_FRAME_H

#include <intpack/decode_error.h>

#include <cstdint>
#include <string>
#include <string_view>

#include "codec/category.h"

namespace IntPack {
namespace Codec {

/**
 * @brief
 * A validated view of one encoded integer: its header byte, the category the
 * header selects and exactly the payload bytes the header claims. Bytes of
 * the input past the payload are not part of the frame.
 */
struct Frame {
  uint8_t header;
  Category category;
  std::string_view payload;
};

/**
 * @brief
 * Splits the leading encoding off `bytes`.
 * @throw DecodeError (InvalidMarker) if the header is reserved or has an
 * impossible length nibble; DecodeError (Truncated) if `bytes` is empty or
 * shorter than the header claims.
 */
Frame ReadFrame(std::string_view bytes);

/**
 * @brief
 * Logs the failure at debug level and throws it.
 */
[[noreturn]] void ThrowDecodeError(DecodeErrorKind kind,
                                   const std::string& what);

}  // namespace Codec
}  // namespace IntPack

#endif /* INTPACK_CODEC_FRAME_H */
