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

#ifndef INTPACK_UTIL_BIT_UTILS_HPP
#define INTPACK_UTIL_BIT_UTILS_HPP

#include <cstdint>
#include <cstring>
#include <type_traits>

namespace IntPack {
namespace Util {

/**
 * @brief
 * Reinterprets the bit pattern of `from` as type To. Both types must have the
 * same size; the copy goes through std::memcpy, so no aliasing rule is
 * violated and compilers lower it to a plain register move.
 */
template <typename To, typename From>
inline To BitCast(const From& from) noexcept {
  static_assert(sizeof(To) == sizeof(From),
                "BitCast requires types of the same size");
  static_assert(std::is_trivially_copyable_v<To> &&
                    std::is_trivially_copyable_v<From>,
                "BitCast requires trivially copyable types");
  To to;
  std::memcpy(&to, &from, sizeof(To));
  return to;
}

// Extracts bits [end, start) of x, i.e., (x mod 2^start) >> end.
constexpr uint8_t GetBits(const uint64_t x, const unsigned start,
                          const unsigned end) {
  return static_cast<uint8_t>((x & ((1llu << start) - 1)) >> end);
}

// Number of leading zero bits; 64 for zero.
constexpr unsigned CountLeadingZeros(const uint64_t x) {
  return x == 0 ? 64 : static_cast<unsigned>(__builtin_clzll(x));
}

// Number of leading one bits of the two's-complement pattern; 64 for -1.
inline unsigned CountLeadingOnes(const int64_t x) {
  return CountLeadingZeros(~BitCast<uint64_t>(x));
}

}  // namespace Util
}  // namespace IntPack

#endif /* INTPACK_UTIL_BIT_UTILS_HPP */
