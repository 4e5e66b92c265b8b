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

#include <errno.h>
#include <string.h>
#include <unistd.h>

#include <sstream>

#include "helpers.h"
#include "unit.h"

using namespace build;

TEST(api_string_result) {
  std::unique_ptr<Stmt> node(assign(Token::EQ, ident("foo"), list({num(1), str("two")})));
  auto res = stargen::starlark_stmt(node.get());
  ASSERT_TRUE((bool)res);
  EXPECT_EQUAL("foo = [1, \"two\"]\n", *res);
}

TEST(api_no_partial_text) {
  std::unique_ptr<Expr> node(list({num(1), num(2), new LambdaExpr(Position(), ident("x"))}));
  auto res = stargen::starlark_expr(node.get());
  ASSERT_FALSE((bool)res);
  EXPECT_TRUE(res.error().kind == stargen::ErrorKind::Unsupported);
  EXPECT_EQUAL("rendering list expression element 2: type LambdaExpr is not supported",
               res.error().message);
  EXPECT_EQUAL("type LambdaExpr is not supported", res.error().cause);
}

TEST(api_ostream) {
  std::ostringstream out;
  stargen::OstreamSink sink(out);

  std::unique_ptr<Stmt> first(branch(Token::PASS));
  std::unique_ptr<Stmt> second(ret(ident("x")));
  auto a = stargen::write_stmt(sink, first.get());
  auto b = stargen::write_stmt(sink, second.get());
  ASSERT_TRUE((bool)a);
  ASSERT_TRUE((bool)b);
  EXPECT_EQUAL(size_t(5), *a);
  EXPECT_EQUAL(size_t(9), *b);
  EXPECT_EQUAL("pass\nreturn x\n", out.str());
}

TEST(api_ostream_failure) {
  std::ostringstream out;
  out.setstate(std::ios::badbit);
  stargen::OstreamSink sink(out);

  std::unique_ptr<Expr> node(ident("foo"));
  auto res = stargen::write_expr(sink, node.get());
  ASSERT_FALSE((bool)res);
  EXPECT_TRUE(res.error().kind == stargen::ErrorKind::Sink);
  EXPECT_EQUAL("rendering ident Name: ostream write failed", res.error().message);
}

TEST(api_fd) {
  int fds[2];
  ASSERT_EQUAL(0, pipe(fds));

  stargen::FdSink sink(fds[1]);
  std::unique_ptr<Expr> node(call(ident("f"), {ident("a"), num(1)}));
  auto res = stargen::write_expr(sink, node.get());
  close(fds[1]);
  ASSERT_TRUE((bool)res);
  EXPECT_EQUAL(size_t(7), *res);

  char buffer[64];
  ssize_t n = read(fds[0], buffer, sizeof(buffer));
  close(fds[0]);
  ASSERT_EQUAL(7, (int)n);
  EXPECT_EQUAL("f(a, 1)", std::string(buffer, n));
}

TEST(api_fd_failure) {
  stargen::FdSink sink(-1);
  std::unique_ptr<Expr> node(ident("foo"));
  auto res = stargen::write_expr(sink, node.get());
  ASSERT_FALSE((bool)res);
  EXPECT_TRUE(res.error().kind == stargen::ErrorKind::Sink);
  EXPECT_EQUAL(EBADF, res.error().posix_error);
  EXPECT_EQUAL(std::string("rendering ident Name: write: ") + strerror(EBADF), res.error().message);
}

TEST(api_options_flow) {
  auto opts = stargen::RenderOptionsBuilder()
                  .depth(1)
                  .indent("  ")
                  .call_layout(stargen::Layout::MultilineComma)
                  .build();
  ASSERT_TRUE((bool)opts);

  std::unique_ptr<Stmt> node(new ExprStmt(Position(), call(ident("f"), {ident("a")})));
  auto res = stargen::starlark_stmt(node.get(), *opts);
  ASSERT_TRUE((bool)res);
  EXPECT_EQUAL("  f(\n    a,\n  )\n", *res);
}

TEST(api_rejects_negative_depth) {
  stargen::RenderOptions opts;
  opts.depth = -3;

  std::unique_ptr<Stmt> node(ret(ident("x")));
  auto res = stargen::starlark_stmt(node.get(), opts);
  ASSERT_FALSE((bool)res);
  EXPECT_TRUE(res.error().kind == stargen::ErrorKind::Config);
  EXPECT_EQUAL("invalid depth value -3, value must be >= 0", res.error().message);
}

TEST(api_rejects_invalid_layout) {
  stargen::RenderOptions opts;
  opts.call_layout = static_cast<stargen::Layout>(42);

  std::unique_ptr<Expr> node(call(ident("f"), {ident("a"), ident("b")}));
  auto res = stargen::starlark_expr(node.get(), opts);
  ASSERT_FALSE((bool)res);
  EXPECT_TRUE(res.error().kind == stargen::ErrorKind::Config);
  EXPECT_EQUAL("invalid option value 42", res.error().message);
}

TEST(api_invalid_options_write_nothing) {
  std::ostringstream out;
  stargen::OstreamSink sink(out);

  stargen::RenderOptions opts;
  opts.tuple_layout = static_cast<stargen::Layout>(9);

  std::unique_ptr<Stmt> node(branch(Token::PASS));
  auto res = stargen::write_stmt(sink, node.get(), opts);
  ASSERT_FALSE((bool)res);
  EXPECT_TRUE(res.error().kind == stargen::ErrorKind::Config);
  EXPECT_EQUAL("", out.str());
}
