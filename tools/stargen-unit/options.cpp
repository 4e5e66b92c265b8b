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

#include "render/options.h"

#include "unit.h"

using stargen::Layout;
using stargen::RenderOptionsBuilder;

TEST(options_defaults) {
  auto opts = RenderOptionsBuilder().build();
  ASSERT_TRUE((bool)opts);
  EXPECT_EQUAL(0, opts->depth);
  EXPECT_EQUAL("    ", opts->indent);
  EXPECT_FALSE(opts->space_eq_binary);
  EXPECT_TRUE(opts->call_layout == Layout::SingleLine);
  EXPECT_TRUE(opts->dict_layout == Layout::SingleLine);
  EXPECT_TRUE(opts->list_layout == Layout::SingleLine);
  EXPECT_TRUE(opts->tuple_layout == Layout::SingleLine);
}

TEST(options_setters) {
  auto opts = RenderOptionsBuilder()
                  .depth(2)
                  .indent("\t")
                  .space_eq_binary(true)
                  .call_layout(Layout::Multiline)
                  .dict_layout(Layout::MultilineComma)
                  .list_layout(Layout::SingleLineComma)
                  .tuple_layout(Layout::MultilineMultiple)
                  .build();
  ASSERT_TRUE((bool)opts);
  EXPECT_EQUAL(2, opts->depth);
  EXPECT_EQUAL("\t", opts->indent);
  EXPECT_TRUE(opts->space_eq_binary);
  EXPECT_TRUE(opts->call_layout == Layout::Multiline);
  EXPECT_TRUE(opts->dict_layout == Layout::MultilineComma);
  EXPECT_TRUE(opts->list_layout == Layout::SingleLineComma);
  EXPECT_TRUE(opts->tuple_layout == Layout::MultilineMultiple);
}

TEST(options_add_depth_copies) {
  auto opts = RenderOptionsBuilder().depth(1).build();
  ASSERT_TRUE((bool)opts);
  stargen::RenderOptions nested = opts->add_depth(1);
  EXPECT_EQUAL(2, nested.depth);
  EXPECT_EQUAL(1, opts->depth);
}

TEST(options_negative_depth) {
  auto opts = RenderOptionsBuilder().depth(-1).build();
  ASSERT_FALSE((bool)opts);
  EXPECT_TRUE(opts.error().kind == stargen::ErrorKind::Config);
  EXPECT_EQUAL("invalid depth value -1, value must be >= 0", opts.error().message);
}

TEST(options_invalid_layout) {
  auto call = RenderOptionsBuilder().call_layout(static_cast<Layout>(9)).build();
  ASSERT_FALSE((bool)call);
  EXPECT_EQUAL("invalid option value 9", call.error().message);

  auto dict = RenderOptionsBuilder().dict_layout(static_cast<Layout>(10)).build();
  ASSERT_FALSE((bool)dict);
  EXPECT_EQUAL("invalid option value 10", dict.error().message);

  auto list = RenderOptionsBuilder().list_layout(static_cast<Layout>(11)).build();
  ASSERT_FALSE((bool)list);
  EXPECT_EQUAL("invalid option value 11", list.error().message);

  auto tuple = RenderOptionsBuilder().tuple_layout(static_cast<Layout>(255)).build();
  ASSERT_FALSE((bool)tuple);
  EXPECT_EQUAL("invalid option value 255", tuple.error().message);
}

TEST(options_first_error_wins) {
  auto opts = RenderOptionsBuilder().depth(-3).call_layout(static_cast<Layout>(20)).build();
  ASSERT_FALSE((bool)opts);
  EXPECT_EQUAL("invalid depth value -3, value must be >= 0", opts.error().message);
}

TEST(options_validate) {
  stargen::RenderOptions good;
  good.depth = 2;
  good.indent = "\t";
  good.dict_layout = Layout::MultilineCommaTwoAndMore;
  auto ok = stargen::validate_options(good);
  ASSERT_TRUE((bool)ok);
  EXPECT_EQUAL(2, ok->depth);
  EXPECT_EQUAL("\t", ok->indent);
  EXPECT_TRUE(ok->dict_layout == Layout::MultilineCommaTwoAndMore);

  stargen::RenderOptions bad;
  bad.depth = -1;
  bad.list_layout = static_cast<Layout>(12);
  auto res = stargen::validate_options(bad);
  ASSERT_FALSE((bool)res);
  EXPECT_TRUE(res.error().kind == stargen::ErrorKind::Config);
  EXPECT_EQUAL("invalid depth value -1, value must be >= 0", res.error().message);
}
