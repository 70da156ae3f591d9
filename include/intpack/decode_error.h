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

#ifndef INTPACK_DECODE_ERROR_H
#define INTPACK_DECODE_ERROR_H

#include <stdexcept>
#include <string>

namespace IntPack {

/*
  @brief The reasons a byte sequence cannot be decoded. Encoding never fails.
  - InvalidMarker: the header byte does not name a category the decoder
    accepts (reserved ranges 0x00-0x0F and 0xF0-0xFF, a category of the other
    signedness, or an out-of-range length nibble).
  - Truncated: the buffer is shorter than the length implied by its header.
 */
enum class DecodeErrorKind { InvalidMarker, Truncated };

inline const char* ToString(const DecodeErrorKind kind) noexcept {
  switch (kind) {
    case DecodeErrorKind::InvalidMarker:
      return "InvalidMarker";
    case DecodeErrorKind::Truncated:
      return "Truncated";
  }
  return "Unknown";
}

class DecodeError : public std::runtime_error {
 public:
  DecodeError(const DecodeErrorKind kind, const std::string& what)
      : std::runtime_error(std::string(ToString(kind)) + ": " + what),
        kind_(kind) {}

  DecodeErrorKind Kind() const noexcept { return kind_; }

 private:
  DecodeErrorKind kind_;
};

}  // namespace IntPack

#endif /* INTPACK_DECODE_ERROR_H */
