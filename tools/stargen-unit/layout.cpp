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

#include "unit.h"

using stargen::Layout;
using stargen::LayoutDecision;
using stargen::decide;

TEST(layout_axes) {
  EXPECT_TRUE(stargen::layout_line_break(Layout::SingleLineComma) == stargen::LineBreak::Never);
  EXPECT_TRUE(stargen::layout_line_break(Layout::MultilineMultipleComma) ==
              stargen::LineBreak::Multiple);
  EXPECT_TRUE(stargen::layout_line_break(Layout::MultilineCommaTwoAndMore) ==
              stargen::LineBreak::Always);
  EXPECT_TRUE(stargen::layout_trailing_comma(Layout::Multiline) == stargen::TrailingComma::Never);
  EXPECT_TRUE(stargen::layout_trailing_comma(Layout::SingleLineComma) ==
              stargen::TrailingComma::Always);
  EXPECT_TRUE(stargen::layout_trailing_comma(Layout::MultilineMultipleCommaTwoAndMore) ==
              stargen::TrailingComma::TwoAndMore);
}

TEST(layout_empty_never_breaks) {
  for (unsigned v = 0; v < stargen::LAYOUT_COUNT; ++v) {
    LayoutDecision d = decide(static_cast<Layout>(v), 0);
    EXPECT_FALSE(d.break_lines) << "layout " << static_cast<Layout>(v);
    EXPECT_FALSE(d.trailing_comma) << "layout " << static_cast<Layout>(v);
  }
}

TEST(layout_decisions) {
  EXPECT_EQUAL((LayoutDecision{false, false}), decide(Layout::SingleLine, 3));
  EXPECT_EQUAL((LayoutDecision{false, true}), decide(Layout::SingleLineComma, 1));
  EXPECT_EQUAL((LayoutDecision{false, false}), decide(Layout::SingleLineCommaTwoAndMore, 1));
  EXPECT_EQUAL((LayoutDecision{false, true}), decide(Layout::SingleLineCommaTwoAndMore, 2));

  EXPECT_EQUAL((LayoutDecision{false, false}), decide(Layout::MultilineMultiple, 1));
  EXPECT_EQUAL((LayoutDecision{true, false}), decide(Layout::MultilineMultiple, 2));
  EXPECT_EQUAL((LayoutDecision{false, true}), decide(Layout::MultilineMultipleComma, 1));
  EXPECT_EQUAL((LayoutDecision{true, true}), decide(Layout::MultilineMultipleCommaTwoAndMore, 2));

  EXPECT_EQUAL((LayoutDecision{true, false}), decide(Layout::Multiline, 1));
  EXPECT_EQUAL((LayoutDecision{true, true}), decide(Layout::MultilineComma, 1));
  EXPECT_EQUAL((LayoutDecision{true, false}), decide(Layout::MultilineCommaTwoAndMore, 1));
  EXPECT_EQUAL((LayoutDecision{true, true}), decide(Layout::MultilineCommaTwoAndMore, 5));
}

TEST(layout_names) {
  EXPECT_EQUAL("MultilineMultipleCommaTwoAndMore",
               std::string(stargen::layout_string(Layout::MultilineMultipleCommaTwoAndMore)));
  EXPECT_FALSE(stargen::layout_valid(static_cast<Layout>(9)));
  EXPECT_TRUE(stargen::layout_valid(Layout::MultilineCommaTwoAndMore));
}
