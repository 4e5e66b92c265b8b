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

#include <limits>

#include "helpers.h"
#include "unit.h"

using namespace build;
using stargen::ErrorKind;
using stargen::Layout;
using stargen::RenderOptions;

TEST(expr_nil) {
  auto res = stargen::starlark_expr(nullptr);
  ASSERT_FALSE((bool)res);
  EXPECT_TRUE(res.error().kind == ErrorKind::NilInput);
  EXPECT_EQUAL("rendering expression: nil input", res.error().message);

  stargen::DocSink sink;
  auto direct = stargen::render_call_expr(sink, nullptr, RenderOptions());
  ASSERT_FALSE((bool)direct);
  EXPECT_EQUAL("rendering call expression: nil input", direct.error().message);
}

TEST(expr_binary) {
  auto eql = expr_text(binary(Token::EQL, ident("foo"), str("bar")));
  ASSERT_TRUE((bool)eql);
  EXPECT_EQUAL("foo == \"bar\"", *eql);

  auto keyword = expr_text(binary(Token::EQ, ident("foo"), str("bar")));
  ASSERT_TRUE((bool)keyword);
  EXPECT_EQUAL("foo=\"bar\"", *keyword);

  RenderOptions spaced;
  spaced.space_eq_binary = true;
  auto keyword_spaced = expr_text(binary(Token::EQ, ident("foo"), str("bar")), spaced);
  ASSERT_TRUE((bool)keyword_spaced);
  EXPECT_EQUAL("foo = \"bar\"", *keyword_spaced);

  auto nested = expr_text(binary(Token::AND, binary(Token::GT, ident("a"), num(1)),
                                 binary(Token::NOT_IN, ident("b"), ident("c"))));
  ASSERT_TRUE((bool)nested);
  EXPECT_EQUAL("a > 1 and b not in c", *nested);
}

TEST(expr_binary_class_token) {
  auto res = expr_text(binary(Token::STRING, ident("a"), ident("b")));
  ASSERT_FALSE((bool)res);
  EXPECT_TRUE(res.error().kind == ErrorKind::Unsupported);
  EXPECT_EQUAL("rendering binary expression Op token: string literal not supported",
               res.error().message);
}

TEST(expr_call) {
  auto empty = expr_text(call(ident("foo"), {}), with_layouts(Layout::Multiline));
  ASSERT_TRUE((bool)empty);
  EXPECT_EQUAL("foo()", *empty);

  auto kwargs = expr_text(
      call(ident("foo"), {num(1), binary(Token::EQ, ident("bar"), str("baz"))}));
  ASSERT_TRUE((bool)kwargs);
  EXPECT_EQUAL("foo(1, bar=\"baz\")", *kwargs);
}

TEST(expr_call_layouts) {
  struct Case {
    Layout layout;
    const char *one;
    const char *two;
  };
  const Case cases[] = {
      {Layout::SingleLine, "f(a)", "f(a, b)"},
      {Layout::SingleLineComma, "f(a,)", "f(a, b,)"},
      {Layout::SingleLineCommaTwoAndMore, "f(a)", "f(a, b,)"},
      {Layout::MultilineMultiple, "f(a)", "f(\n    a,\n    b\n)"},
      {Layout::MultilineMultipleComma, "f(a,)", "f(\n    a,\n    b,\n)"},
      {Layout::MultilineMultipleCommaTwoAndMore, "f(a)", "f(\n    a,\n    b,\n)"},
      {Layout::Multiline, "f(\n    a\n)", "f(\n    a,\n    b\n)"},
      {Layout::MultilineComma, "f(\n    a,\n)", "f(\n    a,\n    b,\n)"},
      {Layout::MultilineCommaTwoAndMore, "f(\n    a\n)", "f(\n    a,\n    b,\n)"},
  };

  for (const Case &c : cases) {
    RenderOptions opts;
    opts.call_layout = c.layout;

    auto one = expr_text(call(ident("f"), {ident("a")}), opts);
    ASSERT_TRUE((bool)one);
    EXPECT_EQUAL(c.one, *one) << "layout " << c.layout;

    auto two = expr_text(call(ident("f"), {ident("a"), ident("b")}), opts);
    ASSERT_TRUE((bool)two);
    EXPECT_EQUAL(c.two, *two) << "layout " << c.layout;
  }
}

TEST(expr_call_nested_depth) {
  RenderOptions opts = with_layouts(Layout::Multiline);
  opts.depth = 1;
  auto res = expr_text(call(ident("f"), {list({num(1)})}), opts);
  ASSERT_TRUE((bool)res);
  EXPECT_EQUAL("f(\n        [\n            1\n        ]\n    )", *res);
}

TEST(expr_layouts_per_kind) {
  RenderOptions opts;
  opts.list_layout = Layout::MultilineComma;

  auto res = expr_text(call(ident("f"), {list({num(1), num(2)}), tuple({num(3), num(4)})}), opts);
  ASSERT_TRUE((bool)res);
  EXPECT_EQUAL("f([\n    1,\n    2,\n], 3, 4)", *res);
}

TEST(expr_list) {
  auto empty = expr_text(list({}), with_layouts(Layout::MultilineComma));
  ASSERT_TRUE((bool)empty);
  EXPECT_EQUAL("[]", *empty);

  auto flat = expr_text(list({num(1), num(2), num(3)}));
  ASSERT_TRUE((bool)flat);
  EXPECT_EQUAL("[1, 2, 3]", *flat);
}

TEST(expr_dict) {
  auto empty = expr_text(dict({}), with_layouts(Layout::Multiline));
  ASSERT_TRUE((bool)empty);
  EXPECT_EQUAL("{}", *empty);

  auto flat = expr_text(dict({entry(str("a"), num(1)), entry(str("b"), list({}))}));
  ASSERT_TRUE((bool)flat);
  EXPECT_EQUAL("{\"a\": 1, \"b\": []}", *flat);

  auto broken = expr_text(dict({entry(str("a"), num(1))}), with_layouts(Layout::MultilineComma));
  ASSERT_TRUE((bool)broken);
  EXPECT_EQUAL("{\n    \"a\": 1,\n}", *broken);
}

TEST(expr_dict_validation) {
  auto ident_elem = expr_text(dict({entry(str("a"), num(1)), ident("x")}));
  ASSERT_FALSE((bool)ident_elem);
  EXPECT_TRUE(ident_elem.error().kind == ErrorKind::Validation);
  EXPECT_EQUAL("expected DictEntry, got Ident in dict expression", ident_elem.error().message);

  auto nil_elem = expr_text(dict({nullptr}));
  ASSERT_FALSE((bool)nil_elem);
  EXPECT_EQUAL("expected DictEntry, got <nil> in dict expression", nil_elem.error().message);
}

TEST(expr_tuple) {
  auto empty = expr_text(tuple({}));
  ASSERT_TRUE((bool)empty);
  EXPECT_EQUAL("()", *empty);

  auto single = expr_text(tuple({ident("a")}));
  ASSERT_TRUE((bool)single);
  EXPECT_EQUAL("a", *single);

  auto single_comma = expr_text(tuple({ident("a")}), with_layouts(Layout::SingleLineComma));
  ASSERT_TRUE((bool)single_comma);
  EXPECT_EQUAL("a,", *single_comma);

  auto pair = expr_text(tuple({ident("a"), ident("b")}));
  ASSERT_TRUE((bool)pair);
  EXPECT_EQUAL("a, b", *pair);
}

TEST(expr_paren) {
  auto empty = expr_text(new ParenExpr(Position(), tuple({})));
  ASSERT_TRUE((bool)empty);
  EXPECT_EQUAL("()", *empty);

  auto pair = expr_text(new ParenExpr(Position(), tuple({ident("a"), ident("b")})));
  ASSERT_TRUE((bool)pair);
  EXPECT_EQUAL("(a, b)", *pair);

  auto sum = expr_text(binary(Token::STAR, new ParenExpr(Position(), binary(Token::PLUS, num(1), num(2))),
                              num(3)));
  ASSERT_TRUE((bool)sum);
  EXPECT_EQUAL("(1 + 2) * 3", *sum);
}

TEST(expr_comprehension) {
  Comprehension *listcomp = new Comprehension(Position(), false, ident("x"));
  listcomp->clauses.emplace_back(new ForClause(Position(), ident("x"), ident("y")));
  listcomp->clauses.emplace_back(new IfClause(Position(), binary(Token::GT, ident("x"), num(0))));
  auto list_res = expr_text(listcomp);
  ASSERT_TRUE((bool)list_res);
  EXPECT_EQUAL("[x for x in y if x > 0]", *list_res);

  Comprehension *dictcomp = new Comprehension(Position(), true, entry(ident("k"), ident("v")));
  dictcomp->clauses.emplace_back(
      new ForClause(Position(), tuple({ident("k"), ident("v")}),
                    call(new DotExpr(Position(), ident("d"), ident("items")), {})));
  auto dict_res = expr_text(dictcomp);
  ASSERT_TRUE((bool)dict_res);
  EXPECT_EQUAL("{k: v for k, v in d.items()}", *dict_res);
}

TEST(expr_comprehension_bad_clause) {
  Comprehension *nil_clause = new Comprehension(Position(), false, ident("x"));
  nil_clause->clauses.emplace_back(nullptr);
  auto nil_res = expr_text(nil_clause);
  ASSERT_FALSE((bool)nil_res);
  EXPECT_TRUE(nil_res.error().kind == ErrorKind::Validation);
  EXPECT_EQUAL("unexpected clause type <nil> rendering comprehension", nil_res.error().message);

  Comprehension *expr_clause = new Comprehension(Position(), false, ident("x"));
  expr_clause->clauses.emplace_back(ident("y"));
  auto expr_res = expr_text(expr_clause);
  ASSERT_FALSE((bool)expr_res);
  EXPECT_EQUAL("unexpected clause type Ident rendering comprehension", expr_res.error().message);
}

TEST(expr_cond) {
  auto res = expr_text(new CondExpr(Position(), ident("b"), ident("a"), ident("c")));
  ASSERT_TRUE((bool)res);
  EXPECT_EQUAL("a if b else c", *res);
}

TEST(expr_dot_index) {
  auto dot = expr_text(new DotExpr(Position(), new DotExpr(Position(), ident("a"), ident("b")),
                                   ident("c")));
  ASSERT_TRUE((bool)dot);
  EXPECT_EQUAL("a.b.c", *dot);

  auto index = expr_text(new IndexExpr(Position(), ident("foo"), str("key")));
  ASSERT_TRUE((bool)index);
  EXPECT_EQUAL("foo[\"key\"]", *index);
}

TEST(expr_slice) {
  struct Case {
    Expr *node;
    const char *want;
  };
  const Case cases[] = {
      {new SliceExpr(Position(), ident("x"), num(1), num(2), nullptr), "x[1:2]"},
      {new SliceExpr(Position(), ident("x"), nullptr, nullptr, nullptr), "x[:]"},
      {new SliceExpr(Position(), ident("x"), nullptr, num(2), nullptr), "x[:2]"},
      {new SliceExpr(Position(), ident("x"), num(1), nullptr, nullptr), "x[1:]"},
      {new SliceExpr(Position(), ident("x"), nullptr, nullptr, num(-1)), "x[::-1]"},
      {new SliceExpr(Position(), ident("x"), num(1), num(5), num(2)), "x[1:5:2]"},
  };

  for (const Case &c : cases) {
    auto res = expr_text(c.node);
    ASSERT_TRUE((bool)res);
    EXPECT_EQUAL(c.want, *res);
  }
}

TEST(expr_unary) {
  auto neg = expr_text(new UnaryExpr(Position(), Token::MINUS, ident("x")));
  ASSERT_TRUE((bool)neg);
  EXPECT_EQUAL("-x", *neg);

  auto inv = expr_text(new UnaryExpr(Position(), Token::TILDE, ident("x")));
  ASSERT_TRUE((bool)inv);
  EXPECT_EQUAL("~x", *inv);

  auto neg_not = expr_text(new UnaryExpr(Position(), Token::NOT, ident("x")));
  ASSERT_TRUE((bool)neg_not);
  EXPECT_EQUAL("not x", *neg_not);

  auto star = expr_text(new UnaryExpr(Position(), Token::STAR, nullptr));
  ASSERT_TRUE((bool)star);
  EXPECT_EQUAL("*", *star);

  auto kwargs = expr_text(new UnaryExpr(Position(), Token::STARSTAR, ident("kwargs")));
  ASSERT_TRUE((bool)kwargs);
  EXPECT_EQUAL("**kwargs", *kwargs);
}

TEST(expr_unary_nil_operand) {
  auto res = expr_text(new UnaryExpr(Position(), Token::MINUS, nullptr));
  ASSERT_FALSE((bool)res);
  EXPECT_TRUE(res.error().kind == ErrorKind::Validation);
  EXPECT_EQUAL("rendering unary expression, nil X value for \"-\" token", res.error().message);
}

TEST(expr_literals) {
  struct Case {
    Expr *node;
    const char *want;
  };
  std::shared_ptr<BigInt> big = std::make_shared<BigInt>();
  ASSERT_TRUE(big->set("-123456789012345678901234567890"));

  const Case cases[] = {
      {Literal::make_raw("0x1F"), "0x1F"},
      {Literal::make_raw("r'raw'", Token::STRING), "r'raw'"},
      {str("hello \"world\"\n"), "\"hello \\\"world\\\"\\n\""},
      {num(-42), "-42"},
      {Literal::make_uint(42), "42"},
      {Literal::make_int64(std::numeric_limits<int64_t>::min()), "-9223372036854775808"},
      {Literal::make_uint64(std::numeric_limits<uint64_t>::max()), "18446744073709551615"},
      {Literal::make_big(big), "-123456789012345678901234567890"},
  };

  for (const Case &c : cases) {
    auto res = expr_text(c.node);
    ASSERT_TRUE((bool)res);
    EXPECT_EQUAL(c.want, *res);
  }
}

TEST(expr_literal_errors) {
  auto flt = expr_text(Literal::make_float(1.5));
  ASSERT_FALSE((bool)flt);
  EXPECT_TRUE(flt.error().kind == ErrorKind::Unsupported);
  EXPECT_EQUAL(
      "unsupported literal value type float, expected string, int, int64, uint, uint64 or big "
      "integer",
      flt.error().message);

  auto big = expr_text(Literal::make_big(nullptr));
  ASSERT_FALSE((bool)big);
  EXPECT_TRUE(big.error().kind == ErrorKind::Validation);
  EXPECT_EQUAL("nil literal big integer value provided", big.error().message);
}

TEST(expr_unsupported) {
  auto lambda = expr_text(new LambdaExpr(Position(), ident("x")));
  ASSERT_FALSE((bool)lambda);
  EXPECT_TRUE(lambda.error().kind == ErrorKind::Unsupported);
  EXPECT_EQUAL("type LambdaExpr is not supported", lambda.error().message);

  auto nested = expr_text(list({num(1), new LambdaExpr(Position(), ident("x"))}));
  ASSERT_FALSE((bool)nested);
  EXPECT_EQUAL("rendering list expression element 1: type LambdaExpr is not supported",
               nested.error().message);
}

TEST(expr_nil_child) {
  auto res = expr_text(new IndexExpr(Position(), ident("foo"), nullptr));
  ASSERT_FALSE((bool)res);
  EXPECT_TRUE(res.error().kind == ErrorKind::NilInput);
  EXPECT_EQUAL("rendering index expression Y: rendering expression: nil input", res.error().message);
}
