/*
 * Copyright 2023 SiFive, Inc.
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You should have received a copy of LICENSE.Apache2 along with
 * this software. If not, you may obtain a copy at
 *
 *    https://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#ifndef STARGEN_RENDER_LAYOUT_H
#define STARGEN_RENDER_LAYOUT_H

#include <stddef.h>
#include <stdint.h>

#include <ostream>

namespace stargen {

// How a comma separated sequence (call arguments, list, dict and tuple
// elements) is laid out. The value is line_break * 3 + trailing_comma.
enum class Layout : uint8_t {
  SingleLine,
  SingleLineComma,
  SingleLineCommaTwoAndMore,

  MultilineMultiple,
  MultilineMultipleComma,
  MultilineMultipleCommaTwoAndMore,

  Multiline,
  MultilineComma,
  MultilineCommaTwoAndMore,
};

static constexpr unsigned LAYOUT_COUNT = 9;

enum class LineBreak : uint8_t { Never, Multiple, Always };
enum class TrailingComma : uint8_t { Never, Always, TwoAndMore };

inline LineBreak layout_line_break(Layout layout) {
  return static_cast<LineBreak>(static_cast<unsigned>(layout) / 3);
}

inline TrailingComma layout_trailing_comma(Layout layout) {
  return static_cast<TrailingComma>(static_cast<unsigned>(layout) % 3);
}

inline bool layout_valid(Layout layout) { return static_cast<unsigned>(layout) < LAYOUT_COUNT; }

const char *layout_string(Layout layout);
std::ostream &operator<<(std::ostream &os, Layout layout);

struct LayoutDecision {
  bool break_lines;
  bool trailing_comma;

  bool operator==(const LayoutDecision &other) const {
    return break_lines == other.break_lines && trailing_comma == other.trailing_comma;
  }
  bool operator!=(const LayoutDecision &other) const { return !(*this == other); }
};

// Structure of a sequence of `count` elements under `layout`. An empty
// sequence never breaks and never gets a trailing comma.
LayoutDecision decide(Layout layout, size_t count);

}  // namespace stargen

#endif
