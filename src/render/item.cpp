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

#include "render/item.h"

#include <utility>

#include "render/render.h"

namespace stargen {

using syntax::Token;

Item expr_item(const syntax::Expr *expr, std::string desc, int add_depth) {
  Item out;
  out.type = ItemType::Expr;
  out.expr = expr;
  out.add_depth = add_depth;
  out.desc = std::move(desc);
  return out;
}

Item stmts_item(const syntax::StmtList &stmts, std::string desc, bool add_indent) {
  Item out;
  out.type = ItemType::Stmts;
  out.stmts = &stmts;
  out.add_depth = add_indent ? 1 : 0;
  out.desc = std::move(desc);
  return out;
}

Item text_item(std::string value, std::string desc) {
  Item out;
  out.type = ItemType::Text;
  out.value = std::move(value);
  out.desc = std::move(desc);
  return out;
}

Item token_item(Token token, std::string desc) {
  Item out;
  out.type = ItemType::Token;
  out.token = token;
  out.desc = std::move(desc);
  return out;
}

Item indent_item() {
  Item out;
  out.type = ItemType::Indent;
  return out;
}

Item extra_indent_item() {
  Item out;
  out.type = ItemType::ExtraIndent;
  return out;
}

void append_sequence(Items &items, const syntax::ExprList &list, Layout layout, const char *desc) {
  LayoutDecision decision = decide(layout, list.size());

  if (decision.break_lines) {
    items.push_back(newline_item());
    items.push_back(extra_indent_item());
  }

  for (size_t i = 0; i < list.size(); ++i) {
    if (i > 0) {
      items.push_back(token_item(Token::COMMA, "COMMA"));
      if (decision.break_lines) {
        items.push_back(newline_item());
        items.push_back(extra_indent_item());
      } else {
        items.push_back(space_item());
      }
    }
    items.push_back(expr_item(list[i].get(), std::string(desc) + " " + std::to_string(i),
                              decision.break_lines ? 1 : 0));
  }

  if (decision.trailing_comma) {
    items.push_back(token_item(Token::COMMA, "COMMA"));
  }

  if (decision.break_lines) {
    items.push_back(newline_item());
    items.push_back(indent_item());
  }
}

static std::string repeat(const std::string &str, int n) {
  std::string out;
  out.reserve(str.size() * (n > 0 ? n : 0));
  for (int i = 0; i < n; ++i) out += str;
  return out;
}

Result<size_t> render(Sink &sink, const std::string &prefix, const RenderOptions &opts,
                      const Items &items) {
  size_t written = 0;

  for (const Item &item : items) {
    switch (item.type) {
      case ItemType::None:
        return fail<size_t>(ErrorKind::Internal, "null item in render, prefix: " + prefix);

      case ItemType::Expr: {
        auto res = render_expr(sink, item.expr, opts.add_depth(item.add_depth));
        if (!res) return propagate<size_t>(res, prefix + " " + item.desc);
        written += *res;
        break;
      }

      case ItemType::Stmts: {
        RenderOptions inner = opts.add_depth(item.add_depth);
        for (size_t i = 0; i < item.stmts->size(); ++i) {
          auto res = render_stmt(sink, (*item.stmts)[i].get(), inner);
          if (!res) {
            return propagate<size_t>(res, prefix + ", rendering " + item.desc +
                                              " statement index " + std::to_string(i));
          }
          written += *res;
        }
        break;
      }

      case ItemType::Indent:
      case ItemType::ExtraIndent: {
        int depth = opts.depth + (item.type == ItemType::ExtraIndent ? 1 : 0);
        auto res = sink.write(repeat(opts.indent, depth));
        if (!res) return propagate<size_t>(res, prefix + " indent");
        written += *res;
        break;
      }

      case ItemType::Text: {
        auto res = sink.write(item.value);
        if (!res) return propagate<size_t>(res, prefix + " " + item.desc);
        written += *res;
        break;
      }

      case ItemType::Token: {
        std::string context = prefix + " " + item.desc + " token";
        if (syntax::token_is_class(item.token)) {
          return result_error<size_t>(with_context(
              Error(ErrorKind::Unsupported,
                    std::string(syntax::token_string(item.token)) + " not supported"),
              context));
        }
        auto res = sink.write(item.token == Token::NEWLINE ? "\n" : syntax::token_string(item.token));
        if (!res) return propagate<size_t>(res, context);
        written += *res;
        break;
      }
    }
  }

  return result_value<Error>(written);
}

}  // namespace stargen
