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

using namespace build;
using stargen::RenderOptions;

static ExprStmt *doc(const std::string &value) { return new ExprStmt(Position(), str(value)); }

TEST(has_space_prefix) {
  EXPECT_TRUE(stargen::has_space_prefix("foo", 0));
  EXPECT_FALSE(stargen::has_space_prefix("foo", 2));
  EXPECT_TRUE(stargen::has_space_prefix("  foo", 2));
  EXPECT_TRUE(stargen::has_space_prefix("   foo", 2));
  EXPECT_FALSE(stargen::has_space_prefix(" foo", 2));
  EXPECT_FALSE(stargen::has_space_prefix("", 1));
  EXPECT_FALSE(stargen::has_space_prefix("\t\tfoo", 2));
}

TEST(docstring_single_line) {
  auto res = stmt_text(doc("foo bar test"));
  ASSERT_TRUE((bool)res);
  EXPECT_EQUAL("\"\"\"foo bar test\"\"\"\n", *res);
}

TEST(docstring_escapes_triple_quotes) {
  auto res = stmt_text(doc("foo bar test \"\"\""));
  ASSERT_TRUE((bool)res);
  EXPECT_EQUAL("\"\"\"foo bar test \\\"\\\"\\\"\"\"\"\n", *res);
}

TEST(docstring_multi_line) {
  RenderOptions opts;
  opts.depth = 1;
  auto res = stmt_text(doc("foo bar test\ntest foo bar\ntest"), opts);
  ASSERT_TRUE((bool)res);
  EXPECT_EQUAL("    \"\"\"foo bar test\n    test foo bar\n    test\"\"\"\n", *res);
}

TEST(docstring_trailing_newline) {
  auto res = stmt_text(doc("summary\n"));
  ASSERT_TRUE((bool)res);
  EXPECT_EQUAL("\"\"\"summary\n\"\"\"\n", *res);
}

TEST(docstring_parsed_indentation) {
  Literal *lit = str(
      "some comment\n\n\n"
      "                more comment\n"
      "                even more comment\n"
      "                ");
  lit->token_pos = Position(3, 17);

  RenderOptions opts;
  opts.depth = 1;
  auto res = stmt_text(new ExprStmt(Position(3, 17), lit), opts);
  ASSERT_TRUE((bool)res);
  EXPECT_EQUAL(
      "    \"\"\"some comment\n"
      "\n"
      "\n"
      "    more comment\n"
      "    even more comment\n"
      "    \"\"\"\n",
      *res);
}

TEST(docstring_in_def) {
  DefStmt *fn = new DefStmt(Position(), ident("foo"));
  fill(fn->body, {doc("Does foo."), branch(Token::PASS)});
  auto res = stmt_text(fn);
  ASSERT_TRUE((bool)res);
  EXPECT_EQUAL("def foo():\n    \"\"\"Does foo.\"\"\"\n    pass\n", *res);
}

TEST(docstring_nil) {
  stargen::DocSink sink;
  auto res = stargen::render_docstring(sink, nullptr, RenderOptions());
  ASSERT_FALSE((bool)res);
  EXPECT_TRUE(res.error().kind == stargen::ErrorKind::NilInput);
  EXPECT_EQUAL("rendering docstring expression statement: nil input", res.error().message);
}

TEST(docstring_sink_error) {
  FailingSink sink("test", 1);
  Literal *lit = str("foo\ntest\nbar");
  std::unique_ptr<Stmt> node(new ExprStmt(Position(), lit));
  auto res = stargen::write_stmt(sink, node.get());
  ASSERT_FALSE((bool)res);
  EXPECT_EQUAL(
      "rendering docstring expression statement docstring line 2: AS EXPECTED: \"test\" "
      "occurence 1",
      res.error().message);
  EXPECT_EQUAL("\"\"\"foo\n", sink.out);
}

TEST(docstring_trailing_quote) {
  auto res = stmt_text(doc("say \"hi\""));
  ASSERT_TRUE((bool)res);
  EXPECT_EQUAL("\"\"\"say \"hi\\\"\"\"\"\n", *res);

  auto pair = stmt_text(doc("empty \"\""));
  ASSERT_TRUE((bool)pair);
  EXPECT_EQUAL("\"\"\"empty \"\\\"\"\"\"\n", *pair);
}
