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

#ifndef STARGEN_SYNTAX_TOKEN_H
#define STARGEN_SYNTAX_TOKEN_H

#include <ostream>

namespace stargen {
namespace syntax {

// Lexical tokens of Starlark. The order follows the grammar's own
// listing: token classes first, then punctuation, then keywords.
enum class Token {
  ILLEGAL,
  END_OF_FILE,

  NEWLINE,
  INDENT,
  OUTDENT,

  // Tokens with values
  IDENT,   // x
  INT,     // 123
  FLOAT,   // 1.23e45
  STRING,  // "foo"
  BYTES,   // b"foo"

  // Punctuation
  PLUS,           // +
  MINUS,          // -
  STAR,           // *
  SLASH,          // /
  SLASHSLASH,     // //
  PERCENT,        // %
  AMP,            // &
  PIPE,           // |
  CIRCUMFLEX,     // ^
  LTLT,           // <<
  GTGT,           // >>
  TILDE,          // ~
  DOT,            // .
  COMMA,          // ,
  EQ,             // =
  SEMI,           // ;
  COLON,          // :
  LPAREN,         // (
  RPAREN,         // )
  LBRACK,         // [
  RBRACK,         // ]
  LBRACE,         // {
  RBRACE,         // }
  LT,             // <
  GT,             // >
  GE,             // >=
  LE,             // <=
  EQL,            // ==
  NEQ,            // !=
  PLUS_EQ,        // +=
  MINUS_EQ,       // -=
  STAR_EQ,        // *=
  SLASH_EQ,       // /=
  SLASHSLASH_EQ,  // //=
  PERCENT_EQ,     // %=
  AMP_EQ,         // &=
  PIPE_EQ,        // |=
  CIRCUMFLEX_EQ,  // ^=
  LTLT_EQ,        // <<=
  GTGT_EQ,        // >>=
  STARSTAR,       // **

  // Keywords
  AND,
  BREAK,
  CONTINUE,
  DEF,
  ELIF,
  ELSE,
  FOR,
  IF,
  IN,
  LAMBDA,
  LOAD,
  NOT,
  NOT_IN,  // not in
  OR,
  PASS,
  RETURN,
  WHILE,

  MAX_TOKEN
};

// The source text of punctuation and keywords, a description for the
// token classes ("illegal token", "identifier", ...).
const char *token_string(Token token);

// True for the token classes that have no fixed source text and so can
// not be emitted from a token alone.
bool token_is_class(Token token);

std::ostream &operator<<(std::ostream &os, Token token);

}  // namespace syntax
}  // namespace stargen

#endif
