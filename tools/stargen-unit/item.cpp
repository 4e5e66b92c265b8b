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

#include "render/item.h"

#include "helpers.h"
#include "unit.h"

using namespace stargen;
using syntax::Token;

static RenderOptions options_at(int depth, const std::string &indent = "    ") {
  RenderOptions opts;
  opts.depth = depth;
  opts.indent = indent;
  return opts;
}

TEST(item_factories) {
  std::unique_ptr<syntax::Ident> foo(build::ident("foo"));
  Item e = expr_item(foo.get(), "test desc");
  EXPECT_TRUE(e.type == ItemType::Expr);
  EXPECT_TRUE(e.expr == foo.get());
  EXPECT_EQUAL(0, e.add_depth);
  EXPECT_EQUAL("test desc", e.desc);

  Item t = text_item("foo", "test desc");
  EXPECT_TRUE(t.type == ItemType::Text);
  EXPECT_EQUAL("foo", t.value);

  Item k = token_item(Token::PASS, "test desc");
  EXPECT_TRUE(k.type == ItemType::Token);
  EXPECT_TRUE(k.token == Token::PASS);

  syntax::StmtList body;
  build::fill(body, {build::branch(Token::PASS)});
  Item flat = stmts_item(body, "no indent", false);
  Item nested = stmts_item(body, "with indent", true);
  EXPECT_TRUE(flat.stmts == &body);
  EXPECT_EQUAL(0, flat.add_depth);
  EXPECT_EQUAL(1, nested.add_depth);
}

TEST(render_empty) {
  DocSink sink;
  auto res = render(sink, "test", RenderOptions(), {});
  ASSERT_TRUE((bool)res);
  EXPECT_EQUAL(size_t(0), *res);
}

TEST(render_null_item) {
  DocSink sink;
  auto res = render(sink, "test nil element in sequence", RenderOptions(),
                    {indent_item(), space_item(), Item(), space_item(), indent_item()});
  ASSERT_FALSE((bool)res);
  EXPECT_TRUE(res.error().kind == ErrorKind::Internal);
  EXPECT_EQUAL("null item in render, prefix: test nil element in sequence", res.error().message);
  // Items before the invalid one were already written
  EXPECT_EQUAL(" ", std::move(sink).build().as_string());
}

TEST(render_indent) {
  {
    DocSink sink;
    auto res = render(sink, "test", options_at(0), {indent_item()});
    ASSERT_TRUE((bool)res);
    EXPECT_EQUAL("", std::move(sink).build().as_string());
  }
  {
    DocSink sink;
    auto res = render(sink, "test", options_at(2, "\t"), {indent_item(), extra_indent_item()});
    ASSERT_TRUE((bool)res);
    EXPECT_EQUAL(size_t(5), *res);
    EXPECT_EQUAL("\t\t\t\t\t", std::move(sink).build().as_string());
  }
}

TEST(render_indent_single_write) {
  FailingSink sink("++++", 1);
  auto res = render(sink, "test", options_at(3, "++++"), {text_item("x", "x"), extra_indent_item()});
  ASSERT_TRUE((bool)res);
  EXPECT_EQUAL("x++++++++++++++++", sink.out);
}

TEST(render_tokens) {
  DocSink sink;
  auto res = render(sink, "test", RenderOptions(),
                    {token_item(Token::NOT_IN, "NOT_IN"), newline_item(),
                     token_item(Token::SLASHSLASH_EQ, "op"), colon_item()});
  ASSERT_TRUE((bool)res);
  EXPECT_EQUAL("not in\n//=:", std::move(sink).build().as_string());
}

TEST(render_unsupported_tokens) {
  const Token unsupported[] = {Token::ILLEGAL, Token::END_OF_FILE, Token::INDENT, Token::OUTDENT,
                               Token::IDENT,   Token::INT,         Token::FLOAT,  Token::STRING,
                               Token::BYTES};
  for (Token token : unsupported) {
    DocSink sink;
    auto res = render(sink, "test", RenderOptions(), {token_item(token, "desc")});
    ASSERT_FALSE((bool)res);
    EXPECT_TRUE(res.error().kind == ErrorKind::Unsupported);
    EXPECT_EQUAL("test desc token: " + std::string(syntax::token_string(token)) + " not supported",
                 res.error().message);
  }

  DocSink sink;
  auto res = render(sink, "test", RenderOptions(), {token_item(Token::ILLEGAL, "desc")});
  ASSERT_FALSE((bool)res);
  EXPECT_EQUAL("test desc token: illegal token not supported", res.error().message);
}

TEST(render_writer_errors) {
  {
    FailingSink sink("    ", 1);
    auto res = render(sink, "test", options_at(1), {indent_item()});
    ASSERT_FALSE((bool)res);
    EXPECT_EQUAL("test indent: AS EXPECTED: \"    \" occurence 1", res.error().message);
    EXPECT_TRUE(res.error().kind == ErrorKind::Sink);
    EXPECT_EQUAL("AS EXPECTED: \"    \" occurence 1", res.error().cause);
  }
  {
    FailingSink sink("foo", 1);
    auto res = render(sink, "test", RenderOptions(), {text_item("foo", "string")});
    ASSERT_FALSE((bool)res);
    EXPECT_EQUAL("test string: AS EXPECTED: \"foo\" occurence 1", res.error().message);
  }
  {
    FailingSink sink("pass", 1);
    auto res = render(sink, "test", RenderOptions(), {token_item(Token::PASS, "PASS")});
    ASSERT_FALSE((bool)res);
    EXPECT_EQUAL("test PASS token: AS EXPECTED: \"pass\" occurence 1", res.error().message);
  }
  {
    FailingSink sink("\n", 1);
    auto res = render(sink, "test", RenderOptions(), {newline_item()});
    ASSERT_FALSE((bool)res);
    EXPECT_EQUAL("test NEWLINE token: AS EXPECTED: \"\\n\" occurence 1", res.error().message);
  }
}

TEST(render_nested) {
  std::unique_ptr<syntax::Ident> foo(build::ident("foo"));
  syntax::StmtList body;
  build::fill(body, {build::branch(Token::PASS), build::branch(Token::BREAK)});

  {
    DocSink sink;
    auto res = render(sink, "test", options_at(0),
                      {expr_item(foo.get(), "X"), newline_item(), stmts_item(body, "Body", true)});
    ASSERT_TRUE((bool)res);
    EXPECT_EQUAL("foo\n    pass\n    break\n", std::move(sink).build().as_string());
  }
  {
    FailingSink sink("break", 1);
    auto res = render(sink, "test", options_at(0), {stmts_item(body, "Body", false)});
    ASSERT_FALSE((bool)res);
    EXPECT_EQUAL(
        "test, rendering Body statement index 1: rendering branch statement Token token: "
        "AS EXPECTED: \"break\" occurence 1",
        res.error().message);
  }
  {
    FailingSink sink("foo", 1);
    auto res = render(sink, "test", options_at(0), {expr_item(foo.get(), "X")});
    ASSERT_FALSE((bool)res);
    EXPECT_EQUAL("test X: rendering ident Name: AS EXPECTED: \"foo\" occurence 1",
                 res.error().message);
  }
}

TEST(render_sequence) {
  syntax::ExprList elems;
  build::fill(elems, {build::ident("a"), build::ident("b")});

  struct Case {
    Layout layout;
    const char *want;
  };
  const Case cases[] = {
      {Layout::SingleLine, "a, b"},
      {Layout::SingleLineComma, "a, b,"},
      {Layout::MultilineMultiple, "\n+a,\n+b\n"},
      {Layout::MultilineComma, "\n+a,\n+b,\n"},
  };

  for (const Case &c : cases) {
    Items items;
    append_sequence(items, elems, c.layout);
    DocSink sink;
    auto res = render(sink, "test", options_at(0, "+"), items);
    ASSERT_TRUE((bool)res);
    EXPECT_EQUAL(c.want, std::move(sink).build().as_string()) << "layout " << c.layout;
  }

  Items items;
  append_sequence(items, elems, Layout::SingleLine, "param");
  EXPECT_EQUAL("param 1", items.back().desc);
}
