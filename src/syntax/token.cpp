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

#include "syntax/token.h"

namespace stargen {
namespace syntax {

const char *token_string(Token token) {
  switch (token) {
    case Token::ILLEGAL:
      return "illegal token";
    case Token::END_OF_FILE:
      return "end of file";
    case Token::NEWLINE:
      return "newline";
    case Token::INDENT:
      return "indent";
    case Token::OUTDENT:
      return "outdent";
    case Token::IDENT:
      return "identifier";
    case Token::INT:
      return "int literal";
    case Token::FLOAT:
      return "float literal";
    case Token::STRING:
      return "string literal";
    case Token::BYTES:
      return "bytes literal";
    case Token::PLUS:
      return "+";
    case Token::MINUS:
      return "-";
    case Token::STAR:
      return "*";
    case Token::SLASH:
      return "/";
    case Token::SLASHSLASH:
      return "//";
    case Token::PERCENT:
      return "%";
    case Token::AMP:
      return "&";
    case Token::PIPE:
      return "|";
    case Token::CIRCUMFLEX:
      return "^";
    case Token::LTLT:
      return "<<";
    case Token::GTGT:
      return ">>";
    case Token::TILDE:
      return "~";
    case Token::DOT:
      return ".";
    case Token::COMMA:
      return ",";
    case Token::EQ:
      return "=";
    case Token::SEMI:
      return ";";
    case Token::COLON:
      return ":";
    case Token::LPAREN:
      return "(";
    case Token::RPAREN:
      return ")";
    case Token::LBRACK:
      return "[";
    case Token::RBRACK:
      return "]";
    case Token::LBRACE:
      return "{";
    case Token::RBRACE:
      return "}";
    case Token::LT:
      return "<";
    case Token::GT:
      return ">";
    case Token::GE:
      return ">=";
    case Token::LE:
      return "<=";
    case Token::EQL:
      return "==";
    case Token::NEQ:
      return "!=";
    case Token::PLUS_EQ:
      return "+=";
    case Token::MINUS_EQ:
      return "-=";
    case Token::STAR_EQ:
      return "*=";
    case Token::SLASH_EQ:
      return "/=";
    case Token::SLASHSLASH_EQ:
      return "//=";
    case Token::PERCENT_EQ:
      return "%=";
    case Token::AMP_EQ:
      return "&=";
    case Token::PIPE_EQ:
      return "|=";
    case Token::CIRCUMFLEX_EQ:
      return "^=";
    case Token::LTLT_EQ:
      return "<<=";
    case Token::GTGT_EQ:
      return ">>=";
    case Token::STARSTAR:
      return "**";
    case Token::AND:
      return "and";
    case Token::BREAK:
      return "break";
    case Token::CONTINUE:
      return "continue";
    case Token::DEF:
      return "def";
    case Token::ELIF:
      return "elif";
    case Token::ELSE:
      return "else";
    case Token::FOR:
      return "for";
    case Token::IF:
      return "if";
    case Token::IN:
      return "in";
    case Token::LAMBDA:
      return "lambda";
    case Token::LOAD:
      return "load";
    case Token::NOT:
      return "not";
    case Token::NOT_IN:
      return "not in";
    case Token::OR:
      return "or";
    case Token::PASS:
      return "pass";
    case Token::RETURN:
      return "return";
    case Token::WHILE:
      return "while";
    case Token::MAX_TOKEN:
      break;
  }
  return "unknown token";
}

bool token_is_class(Token token) {
  switch (token) {
    case Token::ILLEGAL:
    case Token::END_OF_FILE:
    case Token::INDENT:
    case Token::OUTDENT:
    case Token::IDENT:
    case Token::INT:
    case Token::FLOAT:
    case Token::STRING:
    case Token::BYTES:
    case Token::MAX_TOKEN:
      return true;
    default:
      return false;
  }
}

std::ostream &operator<<(std::ostream &os, Token token) { return os << token_string(token); }

}  // namespace syntax
}  // namespace stargen
