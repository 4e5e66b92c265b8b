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

#ifndef STARGEN_SYNTAX_SYNTAX_H
#define STARGEN_SYNTAX_SYNTAX_H

#include <gmp.h>
#include <stdint.h>

#include <memory>
#include <ostream>
#include <string>
#include <vector>

#include "syntax/token.h"

namespace stargen {
namespace syntax {

struct TypeDescriptor {
  const char *name;
  explicit TypeDescriptor(const char *name_) : name(name_) {}
};

// 1-based source coordinates, 0 when unknown.
struct Position {
  int32_t line;
  int32_t col;
  Position(int32_t line_ = 0, int32_t col_ = 0) : line(line_), col(col_) {}
};

/* Starlark AST */
struct Node {
  const TypeDescriptor *type;
  Position pos;

  Node(const TypeDescriptor *type_, const Position &pos_) : type(type_), pos(pos_) {}
  virtual ~Node();
};

std::ostream &operator<<(std::ostream &os, const Node *node);

struct Expr : public Node {
  Expr(const TypeDescriptor *type_, const Position &pos_) : Node(type_, pos_) {}
};

struct Stmt : public Node {
  Stmt(const TypeDescriptor *type_, const Position &pos_) : Node(type_, pos_) {}
};

typedef std::vector<std::unique_ptr<Expr>> ExprList;
typedef std::vector<std::unique_ptr<Stmt>> StmtList;

// Arbitrary precision integer owned by a literal.
struct BigInt {
  mpz_t value;
  BigInt() { mpz_init(value); }
  BigInt(long v) { mpz_init_set_si(value, v); }
  ~BigInt() { mpz_clear(value); }
  BigInt(const BigInt &x) = delete;
  BigInt &operator=(const BigInt &x) = delete;

  // False (and zero) when `v` is not a valid integer in `base`.
  bool set(const std::string &v, int base = 10) {
    return mpz_set_str(value, v.c_str(), base) == 0;
  }
};

/* Expressions */

struct BinaryExpr : public Expr {
  Token op;
  std::unique_ptr<Expr> x;
  std::unique_ptr<Expr> y;

  static const TypeDescriptor type;
  BinaryExpr(const Position &pos_, Token op_, Expr *x_, Expr *y_)
      : Expr(&type, pos_), op(op_), x(x_), y(y_) {}
};

struct CallExpr : public Expr {
  std::unique_ptr<Expr> fn;
  ExprList args;

  static const TypeDescriptor type;
  CallExpr(const Position &pos_, Expr *fn_) : Expr(&type, pos_), fn(fn_) {}
};

// `for vars in x` inside a comprehension.
struct ForClause : public Node {
  std::unique_ptr<Expr> vars;
  std::unique_ptr<Expr> x;

  static const TypeDescriptor type;
  ForClause(const Position &pos_, Expr *vars_, Expr *x_)
      : Node(&type, pos_), vars(vars_), x(x_) {}
};

// `if cond` inside a comprehension.
struct IfClause : public Node {
  std::unique_ptr<Expr> cond;

  static const TypeDescriptor type;
  IfClause(const Position &pos_, Expr *cond_) : Node(&type, pos_), cond(cond_) {}
};

struct Comprehension : public Expr {
  bool curly;  // {body for ...} instead of [body for ...]
  std::unique_ptr<Expr> body;
  std::vector<std::unique_ptr<Node>> clauses;

  static const TypeDescriptor type;
  Comprehension(const Position &pos_, bool curly_, Expr *body_)
      : Expr(&type, pos_), curly(curly_), body(body_) {}
};

struct CondExpr : public Expr {
  std::unique_ptr<Expr> cond;
  std::unique_ptr<Expr> true_;
  std::unique_ptr<Expr> false_;

  static const TypeDescriptor type;
  CondExpr(const Position &pos_, Expr *cond_, Expr *true__, Expr *false__)
      : Expr(&type, pos_), cond(cond_), true_(true__), false_(false__) {}
};

struct DictEntry : public Expr {
  std::unique_ptr<Expr> key;
  std::unique_ptr<Expr> value;

  static const TypeDescriptor type;
  DictEntry(const Position &pos_, Expr *key_, Expr *value_)
      : Expr(&type, pos_), key(key_), value(value_) {}
};

// Every element of `list` is expected to be a DictEntry.
struct DictExpr : public Expr {
  ExprList list;

  static const TypeDescriptor type;
  explicit DictExpr(const Position &pos_) : Expr(&type, pos_) {}
};

struct Ident : public Expr {
  std::string name;

  static const TypeDescriptor type;
  Ident(const Position &pos_, const std::string &name_) : Expr(&type, pos_), name(name_) {}
};

struct DotExpr : public Expr {
  std::unique_ptr<Expr> x;
  std::unique_ptr<Ident> name;

  static const TypeDescriptor type;
  DotExpr(const Position &pos_, Expr *x_, Ident *name_) : Expr(&type, pos_), x(x_), name(name_) {}
};

struct IndexExpr : public Expr {
  std::unique_ptr<Expr> x;
  std::unique_ptr<Expr> y;

  static const TypeDescriptor type;
  IndexExpr(const Position &pos_, Expr *x_, Expr *y_) : Expr(&type, pos_), x(x_), y(y_) {}
};

struct LambdaExpr : public Expr {
  ExprList params;
  std::unique_ptr<Expr> body;

  static const TypeDescriptor type;
  LambdaExpr(const Position &pos_, Expr *body_) : Expr(&type, pos_), body(body_) {}
};

struct ListExpr : public Expr {
  ExprList list;

  static const TypeDescriptor type;
  explicit ListExpr(const Position &pos_) : Expr(&type, pos_) {}
};

enum class LiteralKind { None, String, Int, Uint, Int64, Uint64, BigInt, Float };

const char *literal_kind_string(LiteralKind kind);

// A literal carries at most one typed payload, selected by `kind`.
// Without a payload the `raw` source text is used as is.
struct Literal : public Expr {
  Token token;  // STRING, BYTES, INT or FLOAT
  Position token_pos;
  std::string raw;

  LiteralKind kind;
  std::string string_value;
  long int_value;
  unsigned long uint_value;
  int64_t int64_value;
  uint64_t uint64_value;
  std::shared_ptr<BigInt> big_value;
  double float_value;

  static const TypeDescriptor type;
  explicit Literal(const Position &pos_)
      : Expr(&type, pos_),
        token(Token::STRING),
        token_pos(pos_),
        kind(LiteralKind::None),
        int_value(0),
        uint_value(0),
        int64_value(0),
        uint64_value(0),
        float_value(0) {}

  static Literal *make_raw(const std::string &raw, Token token = Token::INT);
  static Literal *make_string(const std::string &value);
  static Literal *make_int(long value);
  static Literal *make_uint(unsigned long value);
  static Literal *make_int64(int64_t value);
  static Literal *make_uint64(uint64_t value);
  static Literal *make_big(std::shared_ptr<BigInt> value);
  static Literal *make_float(double value);
};

struct ParenExpr : public Expr {
  std::unique_ptr<Expr> x;

  static const TypeDescriptor type;
  ParenExpr(const Position &pos_, Expr *x_) : Expr(&type, pos_), x(x_) {}
};

// lo, hi and step may each be absent.
struct SliceExpr : public Expr {
  std::unique_ptr<Expr> x;
  std::unique_ptr<Expr> lo;
  std::unique_ptr<Expr> hi;
  std::unique_ptr<Expr> step;

  static const TypeDescriptor type;
  SliceExpr(const Position &pos_, Expr *x_, Expr *lo_, Expr *hi_, Expr *step_)
      : Expr(&type, pos_), x(x_), lo(lo_), hi(hi_), step(step_) {}
};

struct TupleExpr : public Expr {
  ExprList list;

  static const TypeDescriptor type;
  explicit TupleExpr(const Position &pos_) : Expr(&type, pos_) {}
};

// `x` is absent for the bare `*` of `def f(*, a)`.
struct UnaryExpr : public Expr {
  Token op;
  std::unique_ptr<Expr> x;

  static const TypeDescriptor type;
  UnaryExpr(const Position &pos_, Token op_, Expr *x_) : Expr(&type, pos_), op(op_), x(x_) {}
};

/* Statements */

struct AssignStmt : public Stmt {
  Token op;
  std::unique_ptr<Expr> lhs;
  std::unique_ptr<Expr> rhs;

  static const TypeDescriptor type;
  AssignStmt(const Position &pos_, Token op_, Expr *lhs_, Expr *rhs_)
      : Stmt(&type, pos_), op(op_), lhs(lhs_), rhs(rhs_) {}
};

struct BranchStmt : public Stmt {
  Token token;  // BREAK, CONTINUE or PASS

  static const TypeDescriptor type;
  BranchStmt(const Position &pos_, Token token_) : Stmt(&type, pos_), token(token_) {}
};

struct DefStmt : public Stmt {
  std::unique_ptr<Ident> name;
  ExprList params;
  StmtList body;

  static const TypeDescriptor type;
  DefStmt(const Position &pos_, Ident *name_) : Stmt(&type, pos_), name(name_) {}
};

struct ExprStmt : public Stmt {
  std::unique_ptr<Expr> x;

  static const TypeDescriptor type;
  ExprStmt(const Position &pos_, Expr *x_) : Stmt(&type, pos_), x(x_) {}
};

struct ForStmt : public Stmt {
  std::unique_ptr<Expr> vars;
  std::unique_ptr<Expr> x;
  StmtList body;

  static const TypeDescriptor type;
  ForStmt(const Position &pos_, Expr *vars_, Expr *x_) : Stmt(&type, pos_), vars(vars_), x(x_) {}
};

// An `elif` is an IfStmt as the only element of `false_`.
struct IfStmt : public Stmt {
  std::unique_ptr<Expr> cond;
  StmtList true_;
  StmtList false_;

  static const TypeDescriptor type;
  IfStmt(const Position &pos_, Expr *cond_) : Stmt(&type, pos_), cond(cond_) {}
};

// load(module, to[0]="from[0]", ...). A null or equally named `to`
// entry means the symbol is bound under its own name.
struct LoadStmt : public Stmt {
  std::unique_ptr<Expr> module;
  std::vector<std::unique_ptr<Ident>> from;
  std::vector<std::unique_ptr<Ident>> to;

  static const TypeDescriptor type;
  LoadStmt(const Position &pos_, Expr *module_) : Stmt(&type, pos_), module(module_) {}
};

struct ReturnStmt : public Stmt {
  std::unique_ptr<Expr> result;  // may be null

  static const TypeDescriptor type;
  ReturnStmt(const Position &pos_, Expr *result_) : Stmt(&type, pos_), result(result_) {}
};

struct WhileStmt : public Stmt {
  std::unique_ptr<Expr> cond;
  StmtList body;

  static const TypeDescriptor type;
  WhileStmt(const Position &pos_, Expr *cond_) : Stmt(&type, pos_), cond(cond_) {}
};

}  // namespace syntax
}  // namespace stargen

#endif
