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
using stargen::Layout;
using stargen::RenderOptions;

// Every case fails the sink on one write deep inside the tree and checks
// the full trail of contexts leading to it.
struct BreadcrumbCase {
  const char *name;
  Node *node;
  RenderOptions opts;
  const char *token;
  int fail_on;
  const char *want;
};

static stargen::Result<size_t> render_node(stargen::Sink &sink, const Node *node,
                                           const RenderOptions &opts) {
  if (node->type == &AssignStmt::type || node->type == &BranchStmt::type ||
      node->type == &DefStmt::type || node->type == &ExprStmt::type ||
      node->type == &ForStmt::type || node->type == &IfStmt::type ||
      node->type == &LoadStmt::type || node->type == &ReturnStmt::type ||
      node->type == &WhileStmt::type) {
    return stargen::render_stmt(sink, static_cast<const Stmt *>(node), opts);
  }
  return stargen::render_expr(sink, static_cast<const Expr *>(node), opts);
}

static RenderOptions tuple_layout(Layout layout) {
  RenderOptions opts;
  opts.tuple_layout = layout;
  return opts;
}

TEST(sink_breadcrumbs) {
  IfStmt *nested_if = new IfStmt(Position(), ident("a"));
  fill(nested_if->true_, {branch(Token::PASS)});
  fill(nested_if->false_, {branch(Token::BREAK)});

  DefStmt *fn = new DefStmt(Position(), ident("f"));
  fill(fn->params, {ident("foo")});
  fill(fn->body, {branch(Token::PASS)});

  LoadStmt *ld = new LoadStmt(Position(), str("mod.star"));
  ld->from.emplace_back(ident("sym"));
  ld->to.emplace_back(ident("alias"));

  BreadcrumbCase cases[] = {
      {"tuple indent", tuple({ident("a"), ident("b"), ident("c")}),
       tuple_layout(Layout::MultilineMultipleComma), "    ", 3,
       "rendering tuple expression indent: AS EXPECTED: \"    \" occurence 3"},
      {"else branch indent", nested_if, RenderOptions(), "    ", 2,
       "rendering if statement, rendering False statement index 0: rendering branch statement "
       "indent: AS EXPECTED: \"    \" occurence 2"},
      {"nested list", list({ident("x"), binary(Token::PLUS, ident("y"), list({ident("z"), ident("foo")}))}),
       RenderOptions(), "foo", 1,
       "rendering list expression element 1: rendering binary expression Y: rendering list "
       "expression element 1: rendering ident Name: AS EXPECTED: \"foo\" occurence 1"},
      {"load module", ld, RenderOptions(), "\"mod.star\"", 1,
       "rendering load statement Module: rendering literal string value: AS "
       "EXPECTED: \"\\\"mod.star\\\"\" occurence 1"},
      {"unary operator", new UnaryExpr(Position(), Token::MINUS, ident("x")), RenderOptions(), "-",
       1, "rendering unary expression, writing \"-\" token: AS EXPECTED: \"-\" occurence 1"},
      {"not space", new UnaryExpr(Position(), Token::NOT, ident("x")), RenderOptions(), " ", 1,
       "rendering unary expression space: AS EXPECTED: \" \" occurence 1"},
      {"def param", fn, RenderOptions(), "foo", 1,
       "rendering def statement param 0: rendering ident Name: AS EXPECTED: \"foo\" occurence 1"},
      {"assign op", assign(Token::PLUS_EQ, ident("a"), num(1)), RenderOptions(), "+=", 1,
       "rendering assignment statement Op token: AS EXPECTED: \"+=\" occurence 1"},
      {"call rparen", call(ident("f"), {}), RenderOptions(), ")", 1,
       "rendering call expression RPAREN token: AS EXPECTED: \")\" occurence 1"},
      {"dict colon", dict({entry(str("k"), num(1))}), RenderOptions(), ":", 1,
       "rendering dict expression element 0: rendering dict entry COLON token: AS EXPECTED: "
       "\":\" occurence 1"},
      {"return newline", ret(ident("x")), RenderOptions(), "\n", 1,
       "rendering return statement NEWLINE token: AS EXPECTED: \"\\n\" occurence 1"},
  };

  for (BreadcrumbCase &c : cases) {
    std::unique_ptr<Node> owner(c.node);
    FailingSink sink(c.token, c.fail_on);
    auto res = render_node(sink, c.node, c.opts);
    ASSERT_FALSE((bool)res) << c.name;
    EXPECT_TRUE(res.error().kind == stargen::ErrorKind::Sink) << c.name;
    EXPECT_EQUAL(c.want, res.error().message) << c.name;
  }
}
