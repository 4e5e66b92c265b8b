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

#pragma once

#include <initializer_list>
#include <memory>
#include <string>

#include "render/literal.h"
#include "render/render.h"

// Shorthands that build AST fragments for the render tests. Every
// builder returns a freshly allocated node owned by whatever it is
// passed to.
namespace build {

using namespace stargen::syntax;

inline Ident *ident(const std::string &name) { return new Ident(Position(), name); }
inline Literal *str(const std::string &value) { return Literal::make_string(value); }
inline Literal *num(long value) { return Literal::make_int(value); }

inline BinaryExpr *binary(Token op, Expr *x, Expr *y) { return new BinaryExpr(Position(), op, x, y); }

inline void fill(ExprList &list, std::initializer_list<Expr *> elems) {
  for (Expr *e : elems) list.emplace_back(e);
}

inline void fill(StmtList &list, std::initializer_list<Stmt *> elems) {
  for (Stmt *s : elems) list.emplace_back(s);
}

inline CallExpr *call(Expr *fn, std::initializer_list<Expr *> args) {
  CallExpr *out = new CallExpr(Position(), fn);
  fill(out->args, args);
  return out;
}

inline ListExpr *list(std::initializer_list<Expr *> elems) {
  ListExpr *out = new ListExpr(Position());
  fill(out->list, elems);
  return out;
}

inline TupleExpr *tuple(std::initializer_list<Expr *> elems) {
  TupleExpr *out = new TupleExpr(Position());
  fill(out->list, elems);
  return out;
}

inline DictEntry *entry(Expr *key, Expr *value) { return new DictEntry(Position(), key, value); }

inline DictExpr *dict(std::initializer_list<Expr *> elems) {
  DictExpr *out = new DictExpr(Position());
  fill(out->list, elems);
  return out;
}

inline BranchStmt *branch(Token token) { return new BranchStmt(Position(), token); }

inline ReturnStmt *ret(Expr *result) { return new ReturnStmt(Position(), result); }

inline AssignStmt *assign(Token op, Expr *lhs, Expr *rhs) {
  return new AssignStmt(Position(), op, lhs, rhs);
}

}  // namespace build

// Renders a node built by the helpers above and frees it.
inline stargen::Result<std::string> expr_text(
    stargen::syntax::Expr *raw, const stargen::RenderOptions &opts = stargen::RenderOptions()) {
  std::unique_ptr<stargen::syntax::Expr> node(raw);
  return stargen::starlark_expr(node.get(), opts);
}

inline stargen::Result<std::string> stmt_text(
    stargen::syntax::Stmt *raw, const stargen::RenderOptions &opts = stargen::RenderOptions()) {
  std::unique_ptr<stargen::syntax::Stmt> node(raw);
  return stargen::starlark_stmt(node.get(), opts);
}

inline stargen::RenderOptions with_layouts(stargen::Layout layout) {
  stargen::RenderOptions opts;
  opts.call_layout = layout;
  opts.dict_layout = layout;
  opts.list_layout = layout;
  opts.tuple_layout = layout;
  return opts;
}

// A sink that fails the `fail_on`-th time it is asked to write exactly
// `token`. Everything else is collected in `out`.
class FailingSink : public stargen::Sink {
 private:
  std::string token;
  int fail_on;
  int seen = 0;

 public:
  std::string out;

  FailingSink(std::string token_, int fail_on_) : token(std::move(token_)), fail_on(fail_on_) {}

  stargen::Result<size_t> write(const std::string &str) override {
    if (str == token && ++seen == fail_on) {
      return stargen::fail<size_t>(stargen::ErrorKind::Sink,
                                   "AS EXPECTED: " + stargen::quote_string(token) + " occurence " +
                                       std::to_string(fail_on));
    }
    out += str;
    return stargen::result_value<stargen::Error>(str.size());
  }
};
