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

#include "render/layout.h"

namespace stargen {

const char *layout_string(Layout layout) {
  switch (layout) {
    case Layout::SingleLine:
      return "SingleLine";
    case Layout::SingleLineComma:
      return "SingleLineComma";
    case Layout::SingleLineCommaTwoAndMore:
      return "SingleLineCommaTwoAndMore";
    case Layout::MultilineMultiple:
      return "MultilineMultiple";
    case Layout::MultilineMultipleComma:
      return "MultilineMultipleComma";
    case Layout::MultilineMultipleCommaTwoAndMore:
      return "MultilineMultipleCommaTwoAndMore";
    case Layout::Multiline:
      return "Multiline";
    case Layout::MultilineComma:
      return "MultilineComma";
    case Layout::MultilineCommaTwoAndMore:
      return "MultilineCommaTwoAndMore";
  }
  return "invalid";
}

std::ostream &operator<<(std::ostream &os, Layout layout) {
  if (!layout_valid(layout)) return os << static_cast<unsigned>(layout);
  return os << layout_string(layout);
}

LayoutDecision decide(Layout layout, size_t count) {
  LayoutDecision out{false, false};

  switch (layout_line_break(layout)) {
    case LineBreak::Never:
      break;
    case LineBreak::Multiple:
      out.break_lines = count > 1;
      break;
    case LineBreak::Always:
      out.break_lines = count > 0;
      break;
  }

  switch (layout_trailing_comma(layout)) {
    case TrailingComma::Never:
      break;
    case TrailingComma::Always:
      out.trailing_comma = count > 0;
      break;
    case TrailingComma::TwoAndMore:
      out.trailing_comma = count > 1;
      break;
  }

  return out;
}

}  // namespace stargen
