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

#ifndef STARGEN_RENDER_ITEM_H
#define STARGEN_RENDER_ITEM_H

#include <string>
#include <vector>

#include "render/error.h"
#include "render/layout.h"
#include "render/options.h"
#include "render/sink.h"
#include "syntax/syntax.h"

namespace stargen {

enum class ItemType { None, Expr, Stmts, Indent, ExtraIndent, Token, Text };

// One emission step of a node's rendering. Items borrow the nodes they
// refer to. A default constructed item is invalid and rejected by `render`.
struct Item {
  ItemType type = ItemType::None;
  syntax::Token token = syntax::Token::ILLEGAL;
  const syntax::Expr *expr = nullptr;
  const syntax::StmtList *stmts = nullptr;
  int add_depth = 0;
  std::string value;
  std::string desc;
};

typedef std::vector<Item> Items;

Item expr_item(const syntax::Expr *expr, std::string desc, int add_depth = 0);
Item stmts_item(const syntax::StmtList &stmts, std::string desc, bool add_indent);
Item text_item(std::string value, std::string desc);
Item token_item(syntax::Token token, std::string desc);
Item indent_item();
Item extra_indent_item();

inline Item space_item() { return text_item(" ", "space"); }
inline Item quote_item() { return text_item("\"", "quote"); }
inline Item colon_item() { return token_item(syntax::Token::COLON, "COLON"); }
inline Item newline_item() { return token_item(syntax::Token::NEWLINE, "NEWLINE"); }

// Appends the items of a comma separated sequence laid out by `layout`.
// Elements are described as "`desc` <index>".
void append_sequence(Items &items, const syntax::ExprList &list, Layout layout,
                     const char *desc = "element");

// Writes `items` in order and returns the number of bytes written.
// Failures are reported with `prefix` and the failing item's
// description in front of the cause.
Result<size_t> render(Sink &sink, const std::string &prefix, const RenderOptions &opts,
                      const Items &items);

}  // namespace stargen

#endif
