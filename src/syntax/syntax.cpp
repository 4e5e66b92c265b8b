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

#include "syntax/syntax.h"

namespace stargen {
namespace syntax {

const TypeDescriptor BinaryExpr   ::type("BinaryExpr");
const TypeDescriptor CallExpr     ::type("CallExpr");
const TypeDescriptor ForClause    ::type("ForClause");
const TypeDescriptor IfClause     ::type("IfClause");
const TypeDescriptor Comprehension::type("Comprehension");
const TypeDescriptor CondExpr     ::type("CondExpr");
const TypeDescriptor DictEntry    ::type("DictEntry");
const TypeDescriptor DictExpr     ::type("DictExpr");
const TypeDescriptor Ident        ::type("Ident");
const TypeDescriptor DotExpr      ::type("DotExpr");
const TypeDescriptor IndexExpr    ::type("IndexExpr");
const TypeDescriptor LambdaExpr   ::type("LambdaExpr");
const TypeDescriptor ListExpr     ::type("ListExpr");
const TypeDescriptor Literal      ::type("Literal");
const TypeDescriptor ParenExpr    ::type("ParenExpr");
const TypeDescriptor SliceExpr    ::type("SliceExpr");
const TypeDescriptor TupleExpr    ::type("TupleExpr");
const TypeDescriptor UnaryExpr    ::type("UnaryExpr");
const TypeDescriptor AssignStmt   ::type("AssignStmt");
const TypeDescriptor BranchStmt   ::type("BranchStmt");
const TypeDescriptor DefStmt      ::type("DefStmt");
const TypeDescriptor ExprStmt     ::type("ExprStmt");
const TypeDescriptor ForStmt      ::type("ForStmt");
const TypeDescriptor IfStmt       ::type("IfStmt");
const TypeDescriptor LoadStmt     ::type("LoadStmt");
const TypeDescriptor ReturnStmt   ::type("ReturnStmt");
const TypeDescriptor WhileStmt    ::type("WhileStmt");

Node::~Node() {}

std::ostream &operator<<(std::ostream &os, const Node *node) {
  if (!node) return os << "<nil>";
  os << node->type->name;
  if (node->pos.line > 0) os << "@" << node->pos.line << ":" << node->pos.col;
  return os;
}

const char *literal_kind_string(LiteralKind kind) {
  switch (kind) {
    case LiteralKind::None:
      return "raw";
    case LiteralKind::String:
      return "string";
    case LiteralKind::Int:
      return "int";
    case LiteralKind::Uint:
      return "uint";
    case LiteralKind::Int64:
      return "int64";
    case LiteralKind::Uint64:
      return "uint64";
    case LiteralKind::BigInt:
      return "big int";
    case LiteralKind::Float:
      return "float";
  }
  return "unknown";
}

Literal *Literal::make_raw(const std::string &raw, Token token) {
  Literal *out = new Literal(Position());
  out->token = token;
  out->raw = raw;
  return out;
}

Literal *Literal::make_string(const std::string &value) {
  Literal *out = new Literal(Position());
  out->kind = LiteralKind::String;
  out->string_value = value;
  return out;
}

Literal *Literal::make_int(long value) {
  Literal *out = new Literal(Position());
  out->token = Token::INT;
  out->kind = LiteralKind::Int;
  out->int_value = value;
  return out;
}

Literal *Literal::make_uint(unsigned long value) {
  Literal *out = new Literal(Position());
  out->token = Token::INT;
  out->kind = LiteralKind::Uint;
  out->uint_value = value;
  return out;
}

Literal *Literal::make_int64(int64_t value) {
  Literal *out = new Literal(Position());
  out->token = Token::INT;
  out->kind = LiteralKind::Int64;
  out->int64_value = value;
  return out;
}

Literal *Literal::make_uint64(uint64_t value) {
  Literal *out = new Literal(Position());
  out->token = Token::INT;
  out->kind = LiteralKind::Uint64;
  out->uint64_value = value;
  return out;
}

Literal *Literal::make_big(std::shared_ptr<BigInt> value) {
  Literal *out = new Literal(Position());
  out->token = Token::INT;
  out->kind = LiteralKind::BigInt;
  out->big_value = std::move(value);
  return out;
}

Literal *Literal::make_float(double value) {
  Literal *out = new Literal(Position());
  out->token = Token::FLOAT;
  out->kind = LiteralKind::Float;
  out->float_value = value;
  return out;
}

}  // namespace syntax
}  // namespace stargen
