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

#include "helpers.h"
#include "unit.h"

using stargen::quote_string;
using stargen::render_number;

TEST(quote_ascii) {
  EXPECT_EQUAL("\"\"", quote_string(""));
  EXPECT_EQUAL("\"foo bar\"", quote_string("foo bar"));
  EXPECT_EQUAL("\"say \\\"hi\\\"\"", quote_string("say \"hi\""));
  EXPECT_EQUAL("\"C:\\\\dir\"", quote_string("C:\\dir"));
}

TEST(quote_control) {
  EXPECT_EQUAL("\"\\a\\b\\f\\n\\r\\t\\v\"", quote_string("\a\b\f\n\r\t\v"));
  EXPECT_EQUAL("\"\\x00\"", quote_string(std::string(1, '\0')));
  EXPECT_EQUAL("\"\\x01\\x1f\"", quote_string("\x01\x1f"));
  EXPECT_EQUAL("\"\\x7f\"", quote_string("\x7f"));
}

TEST(quote_unicode) {
  // Printable runes are kept as UTF-8
  EXPECT_EQUAL("\"h\xc3\xa9llo\"", quote_string("h\xc3\xa9llo"));
  EXPECT_EQUAL("\"\xf0\x9f\x98\x80\"", quote_string("\xf0\x9f\x98\x80"));

  // no-break space, line separator, private use
  EXPECT_EQUAL("\"\\u00a0\"", quote_string("\xc2\xa0"));
  EXPECT_EQUAL("\"\\u2028\"", quote_string("\xe2\x80\xa8"));
  EXPECT_EQUAL("\"\\ue000\"", quote_string("\xee\x80\x80"));
  EXPECT_EQUAL("\"\\U000f0000\"", quote_string("\xf3\xb0\x80\x80"));
}

TEST(quote_invalid_utf8) {
  EXPECT_EQUAL("\"\\xff\"", quote_string("\xff"));
  EXPECT_EQUAL("\"a\\xc3b\"", quote_string("a\xc3" "b"));
}

TEST(render_numbers) {
  EXPECT_EQUAL("0", render_number(0L));
  EXPECT_EQUAL("-7", render_number(-7L));
  EXPECT_EQUAL("7", render_number(7UL));
  EXPECT_EQUAL("-9000000000", render_number(-9000000000LL));
  EXPECT_EQUAL("9000000000", render_number(9000000000ULL));
}

TEST(render_big_numbers) {
  stargen::syntax::BigInt zero;
  EXPECT_EQUAL("0", render_number(zero));

  stargen::syntax::BigInt small(-12);
  EXPECT_EQUAL("-12", render_number(small));

  stargen::syntax::BigInt big;
  ASSERT_TRUE(big.set("ffffffffffffffffffffffff", 16));
  EXPECT_EQUAL("79228162514264337593543950335", render_number(big));

  stargen::syntax::BigInt bad;
  EXPECT_FALSE(bad.set("12x"));
}

TEST(literal_breadcrumbs) {
  FailingSink sink("\"foo\"", 1);
  std::unique_ptr<stargen::syntax::Expr> node(build::str("foo"));
  auto res = stargen::write_expr(sink, node.get());
  ASSERT_FALSE((bool)res);
  EXPECT_EQUAL(
      "rendering literal string value: AS EXPECTED: \"\\\"foo\\\"\" occurence 1",
      res.error().message);

  FailingSink num_sink("42", 1);
  std::unique_ptr<stargen::syntax::Expr> num(stargen::syntax::Literal::make_uint64(42));
  auto num_res = stargen::write_expr(num_sink, num.get());
  ASSERT_FALSE((bool)num_res);
  EXPECT_EQUAL("rendering literal uint64 value: AS EXPECTED: \"42\" occurence 1",
               num_res.error().message);
}
