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

#ifndef INTPACK_CODEC_H
#define INTPACK_CODEC_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "decode_error.h"

namespace IntPack {

/**
 * @brief
 * The longest encoding any 64-bit integer can have: one header byte followed
 * by at most eight payload bytes.
 */
constexpr size_t kMaxPackedSize = sizeof(uint64_t) + 1;

/**
 * @brief
 * Encodes an unsigned integer into a variable-length, order-preserving byte
 * sequence. For any a and b, `a < b` iff `PackUint(a) < PackUint(b)` where the
 * right-hand side is the byte-wise (unsigned char) comparison of
 * std::string. Thread-safe.
 * @return a string of 1 to kMaxPackedSize bytes.
 */
std::string PackUint(uint64_t value);

/**
 * @brief
 * Decodes a sequence produced by PackUint.
 * Only the bytes implied by the header are read; anything after them is
 * ignored and left to the caller. Thread-safe.
 * @throw DecodeError with DecodeErrorKind::InvalidMarker if the header is not
 * a non-negative category, or DecodeErrorKind::Truncated if `bytes` is shorter
 * than the header claims.
 */
uint64_t UnpackUint(std::string_view bytes);

/**
 * @brief
 * Encodes a signed integer. Non-negative values share their encoding with
 * PackUint, i.e., `PackInt(x) == PackUint(x)` for every x >= 0, and the
 * encodings of negative values sort before all of them. Thread-safe.
 */
std::string PackInt(int64_t value);

/**
 * @brief
 * Decodes a sequence produced by PackInt (or by PackUint, for values not
 * greater than INT64_MAX). Thread-safe.
 * @throw DecodeError on a reserved header or a truncated buffer.
 */
int64_t UnpackInt(std::string_view bytes);

/**
 * @brief
 * Returns the number of bytes PackUint produces for `value`, without encoding
 * it. Since encodings are minimal, `PackedSizeUint(UnpackUint(b))` is also the
 * number of bytes UnpackUint consumed from `b`.
 */
size_t PackedSizeUint(uint64_t value) noexcept;

/**
 * @brief
 * Returns the number of bytes PackInt produces for `value`.
 */
size_t PackedSizeInt(int64_t value) noexcept;

}  // namespace IntPack

#endif /* INTPACK_CODEC_H */
