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

#include <intpack/intpack.h>

#include <algorithm>
#include <cassert>
#include <cstdint>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

int main() {
  {
    // Pack: byte-wise order of the encodings follows numeric order
    std::vector<int64_t> values = {1000000, -1, 0, -8257, 63, 64, -65, 8256};
    std::vector<std::string> keys;
    for (auto v : values) { keys.push_back(IntPack::PackInt(v)); }

    std::sort(keys.begin(), keys.end());
    std::sort(values.begin(), values.end());
    for (size_t i = 0; i < keys.size(); i++) {
      const auto decoded = IntPack::UnpackInt(keys[i]);
      std::cout << decoded << " (" << keys[i].size() << " bytes)" << std::endl;
      assert(decoded == values[i]);
    }
  }

  {
    // Composite key: two encodings concatenated, split with PackedSizeUint
    const std::string key = IntPack::PackUint(2020) + IntPack::PackUint(4);
    const auto year       = IntPack::UnpackUint(key);
    const auto month =
        IntPack::UnpackUint(std::string_view(key).substr(
            IntPack::PackedSizeUint(year)));
    assert(year == 2020 && month == 4);
  }

  {
    // Unpack: malformed input is reported, never silently decoded
    try {
      IntPack::UnpackUint(std::string(1, '\xe1'));
      assert(false);
    } catch (const IntPack::DecodeError& e) {
      assert(e.Kind() == IntPack::DecodeErrorKind::Truncated);
      std::cout << e.what() << std::endl;
    }
  }

  return 0;
}
