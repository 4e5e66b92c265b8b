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
using stargen::ErrorKind;
using stargen::RenderOptions;

static DefStmt *def(const std::string &name, std::initializer_list<Expr *> params,
                    std::initializer_list<Stmt *> body) {
  DefStmt *out = new DefStmt(Position(), ident(name));
  fill(out->params, params);
  fill(out->body, body);
  return out;
}

static IfStmt *if_stmt(Expr *cond, std::initializer_list<Stmt *> true_,
                       std::initializer_list<Stmt *> false_) {
  IfStmt *out = new IfStmt(Position(), cond);
  fill(out->true_, true_);
  fill(out->false_, false_);
  return out;
}

static LoadStmt *load(const std::string &module,
                      std::initializer_list<std::pair<const char *, const char *>> symbols) {
  LoadStmt *out = new LoadStmt(Position(), str(module));
  for (const auto &sym : symbols) {
    out->from.emplace_back(ident(sym.first));
    out->to.emplace_back(sym.second ? ident(sym.second) : nullptr);
  }
  return out;
}

TEST(stmt_nil) {
  auto res = stargen::starlark_stmt(nullptr);
  ASSERT_FALSE((bool)res);
  EXPECT_TRUE(res.error().kind == ErrorKind::NilInput);
  EXPECT_EQUAL("rendering statement: nil input", res.error().message);
}

struct ImportStmt : public Stmt {
  static const TypeDescriptor type;
  ImportStmt() : Stmt(&type, Position()) {}
};

const TypeDescriptor ImportStmt::type("ImportStmt");

TEST(stmt_unsupported) {
  auto res = stmt_text(new ImportStmt());
  ASSERT_FALSE((bool)res);
  EXPECT_TRUE(res.error().kind == ErrorKind::Unsupported);
  EXPECT_EQUAL("type ImportStmt is not supported", res.error().message);
}

TEST(stmt_branch) {
  struct Case {
    Token token;
    const char *want;
  };
  const Case cases[] = {
      {Token::PASS, "pass\n"},
      {Token::BREAK, "break\n"},
      {Token::CONTINUE, "continue\n"},
  };
  for (const Case &c : cases) {
    auto res = stmt_text(branch(c.token));
    ASSERT_TRUE((bool)res);
    EXPECT_EQUAL(c.want, *res);
  }

  auto bad = stmt_text(branch(Token::RETURN));
  ASSERT_FALSE((bool)bad);
  EXPECT_TRUE(bad.error().kind == ErrorKind::Validation);
  EXPECT_EQUAL("rendering branch statement: unsupported token return, expected break, continue or pass",
               bad.error().message);
}

TEST(stmt_assign) {
  auto eq = stmt_text(assign(Token::EQ, ident("foo"), num(2)));
  ASSERT_TRUE((bool)eq);
  EXPECT_EQUAL("foo = 2\n", *eq);

  auto plus = stmt_text(assign(Token::PLUS_EQ, ident("foo"), num(2)));
  ASSERT_TRUE((bool)plus);
  EXPECT_EQUAL("foo += 2\n", *plus);

  auto unpack = stmt_text(assign(Token::EQ, tuple({ident("a"), ident("b")}), call(ident("f"), {})));
  ASSERT_TRUE((bool)unpack);
  EXPECT_EQUAL("a, b = f()\n", *unpack);

  auto bad = stmt_text(assign(Token::SLASH_EQ, ident("foo"), num(2)));
  ASSERT_FALSE((bool)bad);
  EXPECT_TRUE(bad.error().kind == ErrorKind::Validation);
  EXPECT_EQUAL("rendering assign statement: unsupported Op token /=, expected one of: =, +=, -=, *=, %=",
               bad.error().message);
}

TEST(stmt_expr) {
  auto raw = stmt_text(new ExprStmt(Position(), Literal::make_raw("foo bar", Token::STRING)));
  ASSERT_TRUE((bool)raw);
  EXPECT_EQUAL("foo bar\n", *raw);

  RenderOptions opts;
  opts.depth = 2;
  auto nested = stmt_text(new ExprStmt(Position(), call(ident("print"), {str("x")})), opts);
  ASSERT_TRUE((bool)nested);
  EXPECT_EQUAL("        print(\"x\")\n", *nested);
}

TEST(stmt_return) {
  auto bare = stmt_text(ret(nullptr));
  ASSERT_TRUE((bool)bare);
  EXPECT_EQUAL("return\n", *bare);

  auto value = stmt_text(ret(ident("n")));
  ASSERT_TRUE((bool)value);
  EXPECT_EQUAL("return n\n", *value);

  auto pair = stmt_text(ret(tuple({ident("i"), ident("j")})));
  ASSERT_TRUE((bool)pair);
  EXPECT_EQUAL("return i, j\n", *pair);
}

TEST(stmt_def) {
  auto variadic = stmt_text(def("foo",
                                {new UnaryExpr(Position(), Token::STAR, ident("args")),
                                 new UnaryExpr(Position(), Token::STARSTAR, ident("kwargs"))},
                                {branch(Token::PASS)}));
  ASSERT_TRUE((bool)variadic);
  EXPECT_EQUAL("def foo(*args, **kwargs):\n    pass\n", *variadic);

  auto defaults = stmt_text(def("foo",
                                {ident("foo"), ident("bar"),
                                 binary(Token::EQ, ident("foobar"), num(10))},
                                {branch(Token::PASS)}));
  ASSERT_TRUE((bool)defaults);
  EXPECT_EQUAL("def foo(foo, bar, foobar=10):\n    pass\n", *defaults);

  auto keyword_only = stmt_text(def("foo",
                                    {ident("a"), new UnaryExpr(Position(), Token::STAR, nullptr),
                                     ident("b")},
                                    {ret(ident("a"))}));
  ASSERT_TRUE((bool)keyword_only);
  EXPECT_EQUAL("def foo(a, *, b):\n    return a\n", *keyword_only);
}

TEST(stmt_def_ignores_call_layout) {
  auto res = stmt_text(def("foo", {ident("a"), ident("b")}, {branch(Token::PASS)}),
                       with_layouts(stargen::Layout::MultilineComma));
  ASSERT_TRUE((bool)res);
  EXPECT_EQUAL("def foo(a, b):\n    pass\n", *res);
}

TEST(stmt_if) {
  auto plain = stmt_text(if_stmt(ident("x"), {branch(Token::PASS)}, {}));
  ASSERT_TRUE((bool)plain);
  EXPECT_EQUAL("if x:\n    pass\n", *plain);

  auto nested = stmt_text(if_stmt(
      binary(Token::GT, ident("a"), ident("b")), {ret(ident("a"))},
      {if_stmt(binary(Token::GT, ident("b"), ident("c")), {ret(ident("b"))}, {ret(ident("c"))})}));
  ASSERT_TRUE((bool)nested);
  EXPECT_EQUAL(
      "if a > b:\n"
      "    return a\n"
      "else:\n"
      "    if b > c:\n"
      "        return b\n"
      "    else:\n"
      "        return c\n",
      *nested);
}

TEST(stmt_for_while) {
  ForStmt *loop = new ForStmt(Position(), ident("x"), list({num(1), num(2), num(3)}));
  fill(loop->body, {assign(Token::PLUS_EQ, ident("x"), num(1)), ret(ident("x"))});
  auto for_res = stmt_text(loop);
  ASSERT_TRUE((bool)for_res);
  EXPECT_EQUAL("for x in [1, 2, 3]:\n    x += 1\n    return x\n", *for_res);

  WhileStmt *wloop = new WhileStmt(Position(), binary(Token::GT, ident("a"), ident("b")));
  fill(wloop->body, {assign(Token::PLUS_EQ, ident("b"), num(1))});
  auto while_res = stmt_text(wloop);
  ASSERT_TRUE((bool)while_res);
  EXPECT_EQUAL("while a > b:\n    b += 1\n", *while_res);
}

TEST(stmt_load) {
  auto aliased = stmt_text(load("foo.star", {{"foo", "b"}, {"bar", "a"}}));
  ASSERT_TRUE((bool)aliased);
  EXPECT_EQUAL("load(\"foo.star\", b=\"foo\", a=\"bar\")\n", *aliased);

  auto plain = stmt_text(load("foo.star", {{"foo", "foo"}, {"bar", nullptr}}));
  ASSERT_TRUE((bool)plain);
  EXPECT_EQUAL("load(\"foo.star\", \"foo\", \"bar\")\n", *plain);

  RenderOptions spaced;
  spaced.space_eq_binary = true;
  auto mixed = stmt_text(load("foo.star", {{"foo", nullptr}, {"bar", "a"}}), spaced);
  ASSERT_TRUE((bool)mixed);
  EXPECT_EQUAL("load(\"foo.star\", \"foo\", a = \"bar\")\n", *mixed);
}

TEST(stmt_load_mismatch) {
  LoadStmt *stmt = load("foo.star", {{"foo", nullptr}});
  stmt->from.emplace_back(ident("bar"));
  auto res = stmt_text(stmt);
  ASSERT_FALSE((bool)res);
  EXPECT_TRUE(res.error().kind == ErrorKind::Validation);
  EXPECT_EQUAL("rendering load statement, lengths mismatch, From: 2, To: 1", res.error().message);
}

TEST(stmt_nested_error) {
  auto res = stmt_text(def("foo", {ident("a")}, {branch(Token::PASS), branch(Token::DEF)}));
  ASSERT_FALSE((bool)res);
  EXPECT_EQUAL(
      "rendering def statement, rendering Body statement index 1: rendering branch statement: "
      "unsupported token def, expected break, continue or pass",
      res.error().message);
}
