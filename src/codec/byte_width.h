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

#ifndef INTPACK_CODEC_BYTE_WIDTH_H
#define INTPACK_CODEC_BYTE_WIDTH_H

#include <cstddef>
#include <cstdint>

namespace IntPack {
namespace Codec {

/**
 * @brief
 * Minimal number of big-endian bytes that hold `magnitude` without loss:
 * 8 - floor(leading_zero_bits / 8), and 1 (a single zero byte) for zero.
 */
size_t BytesForMagnitude(uint64_t magnitude) noexcept;

/**
 * @brief
 * Minimal number of bytes that hold the two's-complement pattern of a
 * negative `value` once its leading 0xff bytes are elided:
 * 8 - floor(leading_one_bits / 8), at least 1.
 */
size_t BytesForNegative(int64_t value) noexcept;

}  // namespace Codec
}  // namespace IntPack

#endif /* INTPACK_CODEC_BYTE_WIDTH_H */
