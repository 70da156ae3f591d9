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

#ifndef INTPACK_CODEC_BIG_ENDIAN_HPP
#define INTPACK_CODEC_BIG_ENDIAN_HPP

#include <cstddef>
#include <cstdint>
#include <string>

namespace IntPack {
namespace Codec {

// Appends the low `len` bytes of `v`, most significant first.
inline void AppendBigEndian(std::string& dst, const uint64_t v,
                            const size_t len) {
  for (size_t shift = (len - 1) << 3;; shift -= 8) {
    dst.push_back(static_cast<char>((v >> shift) & 0xFF));
    if (shift == 0) break;
  }
}

// Shifts `len` big-endian bytes from `p` into `init`. Passing all-one bits as
// `init` sign-extends a truncated negative value.
inline uint64_t ReadBigEndian(const char* p, const size_t len,
                              uint64_t init = 0) {
  uint64_t x = init;
  for (size_t i = 0; i < len; i++) {
    x = (x << 8) | static_cast<uint64_t>(static_cast<unsigned char>(p[i]));
  }
  return x;
}

}  // namespace Codec
}  // namespace IntPack

#endif /* INTPACK_CODEC_BIG_ENDIAN_HPP */
