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

#include <string>
#include <utility>

#include "render/item.h"
#include "render/render.h"

namespace stargen {

using namespace syntax;

static std::string kind_name(const Node *node) { return node ? node->type->name : "<nil>"; }

Result<size_t> render_binary_expr(Sink &sink, const BinaryExpr *input, const RenderOptions &opts) {
  if (!input) return fail<size_t>(ErrorKind::NilInput, "rendering binary expression: nil input");

  // `=` inside a binary expression is a keyword argument or a default value
  bool spaced = input->op != Token::EQ || opts.space_eq_binary;

  Items items;
  items.push_back(expr_item(input->x.get(), "X"));
  if (spaced) items.push_back(space_item());
  items.push_back(token_item(input->op, "Op"));
  if (spaced) items.push_back(space_item());
  items.push_back(expr_item(input->y.get(), "Y"));

  return render(sink, "rendering binary expression", opts, items);
}

Result<size_t> render_call_expr(Sink &sink, const CallExpr *input, const RenderOptions &opts) {
  if (!input) return fail<size_t>(ErrorKind::NilInput, "rendering call expression: nil input");

  Items items;
  items.push_back(expr_item(input->fn.get(), "Fn"));
  items.push_back(token_item(Token::LPAREN, "LPAREN"));
  append_sequence(items, input->args, opts.call_layout);
  items.push_back(token_item(Token::RPAREN, "RPAREN"));

  return render(sink, "rendering call expression", opts, items);
}

Result<size_t> render_comprehension(Sink &sink, const Comprehension *input,
                                    const RenderOptions &opts) {
  if (!input) return fail<size_t>(ErrorKind::NilInput, "rendering comprehension: nil input");

  Items items;
  items.push_back(token_item(input->curly ? Token::LBRACE : Token::LBRACK, "left"));
  items.push_back(expr_item(input->body.get(), "Body"));

  for (const auto &clause : input->clauses) {
    if (clause && clause->type == &ForClause::type) {
      const ForClause *fc = static_cast<const ForClause *>(clause.get());
      items.push_back(space_item());
      items.push_back(token_item(Token::FOR, "FOR"));
      items.push_back(space_item());
      items.push_back(expr_item(fc->vars.get(), "for clause Vars"));
      items.push_back(space_item());
      items.push_back(token_item(Token::IN, "IN"));
      items.push_back(space_item());
      items.push_back(expr_item(fc->x.get(), "for clause X"));
    } else if (clause && clause->type == &IfClause::type) {
      const IfClause *ic = static_cast<const IfClause *>(clause.get());
      items.push_back(space_item());
      items.push_back(token_item(Token::IF, "IF"));
      items.push_back(space_item());
      items.push_back(expr_item(ic->cond.get(), "if clause Cond"));
    } else {
      return fail<size_t>(ErrorKind::Validation, "unexpected clause type " + kind_name(clause.get()) +
                                                      " rendering comprehension");
    }
  }

  items.push_back(token_item(input->curly ? Token::RBRACE : Token::RBRACK, "right"));

  return render(sink, "rendering comprehension", opts, items);
}

Result<size_t> render_cond_expr(Sink &sink, const CondExpr *input, const RenderOptions &opts) {
  if (!input) return fail<size_t>(ErrorKind::NilInput, "rendering condition expression: nil input");

  return render(sink, "rendering condition expression", opts,
                {
                    expr_item(input->true_.get(), "True"),
                    space_item(),
                    token_item(Token::IF, "IF"),
                    space_item(),
                    expr_item(input->cond.get(), "Cond"),
                    space_item(),
                    token_item(Token::ELSE, "ELSE"),
                    space_item(),
                    expr_item(input->false_.get(), "False"),
                });
}

Result<size_t> render_dict_entry(Sink &sink, const DictEntry *input, const RenderOptions &opts) {
  if (!input) return fail<size_t>(ErrorKind::NilInput, "rendering dict entry: nil input");

  return render(sink, "rendering dict entry", opts,
                {
                    expr_item(input->key.get(), "Key"),
                    colon_item(),
                    space_item(),
                    expr_item(input->value.get(), "Value"),
                });
}

Result<size_t> render_dict_expr(Sink &sink, const DictExpr *input, const RenderOptions &opts) {
  if (!input) return fail<size_t>(ErrorKind::NilInput, "rendering dict expression: nil input");

  for (const auto &elem : input->list) {
    if (!elem || elem->type != &DictEntry::type) {
      return fail<size_t>(ErrorKind::Validation,
                          "expected DictEntry, got " + kind_name(elem.get()) + " in dict expression");
    }
  }

  Items items;
  items.push_back(token_item(Token::LBRACE, "LBRACE"));
  append_sequence(items, input->list, opts.dict_layout);
  items.push_back(token_item(Token::RBRACE, "RBRACE"));

  return render(sink, "rendering dict expression", opts, items);
}

Result<size_t> render_dot_expr(Sink &sink, const DotExpr *input, const RenderOptions &opts) {
  if (!input) return fail<size_t>(ErrorKind::NilInput, "rendering dot expression: nil input");

  return render(sink, "rendering dot expression", opts,
                {
                    expr_item(input->x.get(), "X"),
                    token_item(Token::DOT, "DOT"),
                    expr_item(input->name.get(), "Name"),
                });
}

Result<size_t> render_ident(Sink &sink, const Ident *input, const RenderOptions &opts) {
  if (!input) return fail<size_t>(ErrorKind::NilInput, "rendering ident: nil input");

  return render(sink, "rendering ident", opts, {text_item(input->name, "Name")});
}

Result<size_t> render_index_expr(Sink &sink, const IndexExpr *input, const RenderOptions &opts) {
  if (!input) return fail<size_t>(ErrorKind::NilInput, "rendering index expression: nil input");

  return render(sink, "rendering index expression", opts,
                {
                    expr_item(input->x.get(), "X"),
                    token_item(Token::LBRACK, "LBRACK"),
                    expr_item(input->y.get(), "Y"),
                    token_item(Token::RBRACK, "RBRACK"),
                });
}

Result<size_t> render_list_expr(Sink &sink, const ListExpr *input, const RenderOptions &opts) {
  if (!input) return fail<size_t>(ErrorKind::NilInput, "rendering list expression: nil input");

  Items items;
  items.push_back(token_item(Token::LBRACK, "LBRACK"));
  append_sequence(items, input->list, opts.list_layout);
  items.push_back(token_item(Token::RBRACK, "RBRACK"));

  return render(sink, "rendering list expression", opts, items);
}

static bool is_empty_tuple(const Expr *expr) {
  return expr && expr->type == &TupleExpr::type &&
         static_cast<const TupleExpr *>(expr)->list.empty();
}

Result<size_t> render_paren_expr(Sink &sink, const ParenExpr *input, const RenderOptions &opts) {
  if (!input) return fail<size_t>(ErrorKind::NilInput, "rendering paren expression: nil input");

  // An empty tuple already brings its own parentheses
  if (is_empty_tuple(input->x.get())) {
    return render(sink, "rendering paren expression", opts, {expr_item(input->x.get(), "X")});
  }

  return render(sink, "rendering paren expression", opts,
                {
                    token_item(Token::LPAREN, "LPAREN"),
                    expr_item(input->x.get(), "X"),
                    token_item(Token::RPAREN, "RPAREN"),
                });
}

Result<size_t> render_slice_expr(Sink &sink, const SliceExpr *input, const RenderOptions &opts) {
  if (!input) return fail<size_t>(ErrorKind::NilInput, "rendering slice expression: nil input");

  Items items;
  items.push_back(expr_item(input->x.get(), "X"));
  items.push_back(token_item(Token::LBRACK, "LBRACK"));
  if (input->lo) items.push_back(expr_item(input->lo.get(), "Lo"));
  items.push_back(colon_item());
  if (input->hi) items.push_back(expr_item(input->hi.get(), "Hi"));
  if (input->step) {
    items.push_back(colon_item());
    items.push_back(expr_item(input->step.get(), "Step"));
  }
  items.push_back(token_item(Token::RBRACK, "RBRACK"));

  return render(sink, "rendering slice expression", opts, items);
}

Result<size_t> render_tuple_expr(Sink &sink, const TupleExpr *input, const RenderOptions &opts) {
  if (!input) return fail<size_t>(ErrorKind::NilInput, "rendering tuple expression: nil input");

  Items items;
  if (input->list.empty()) {
    items.push_back(token_item(Token::LPAREN, "LPAREN"));
    items.push_back(token_item(Token::RPAREN, "RPAREN"));
  } else {
    append_sequence(items, input->list, opts.tuple_layout);
  }

  return render(sink, "rendering tuple expression", opts, items);
}

Result<size_t> render_unary_expr(Sink &sink, const UnaryExpr *input, const RenderOptions &opts) {
  if (!input) return fail<size_t>(ErrorKind::NilInput, "rendering unary expression: nil input");

  std::string op = token_string(input->op);

  // A bare `*` marks the start of keyword only parameters
  if (!input->x && input->op != Token::STAR) {
    return fail<size_t>(ErrorKind::Validation,
                        "rendering unary expression, nil X value for \"" + op + "\" token");
  }

  auto head = render(sink, "rendering unary expression,", opts,
                     {token_item(input->op, "writing \"" + op + "\"")});
  if (!head) return head;
  if (!input->x) return head;

  Items items;
  if (input->op == Token::NOT) items.push_back(space_item());
  items.push_back(expr_item(input->x.get(), "X"));

  auto tail = render(sink, "rendering unary expression", opts, items);
  if (!tail) return tail;

  return result_value<Error>(*head + *tail);
}

Result<size_t> render_expr(Sink &sink, const Expr *input, const RenderOptions &opts) {
  if (!input) return fail<size_t>(ErrorKind::NilInput, "rendering expression: nil input");

  if (input->type == &BinaryExpr::type) {
    return render_binary_expr(sink, static_cast<const BinaryExpr *>(input), opts);
  } else if (input->type == &CallExpr::type) {
    return render_call_expr(sink, static_cast<const CallExpr *>(input), opts);
  } else if (input->type == &Comprehension::type) {
    return render_comprehension(sink, static_cast<const Comprehension *>(input), opts);
  } else if (input->type == &CondExpr::type) {
    return render_cond_expr(sink, static_cast<const CondExpr *>(input), opts);
  } else if (input->type == &DictEntry::type) {
    return render_dict_entry(sink, static_cast<const DictEntry *>(input), opts);
  } else if (input->type == &DictExpr::type) {
    return render_dict_expr(sink, static_cast<const DictExpr *>(input), opts);
  } else if (input->type == &DotExpr::type) {
    return render_dot_expr(sink, static_cast<const DotExpr *>(input), opts);
  } else if (input->type == &Ident::type) {
    return render_ident(sink, static_cast<const Ident *>(input), opts);
  } else if (input->type == &IndexExpr::type) {
    return render_index_expr(sink, static_cast<const IndexExpr *>(input), opts);
  } else if (input->type == &ListExpr::type) {
    return render_list_expr(sink, static_cast<const ListExpr *>(input), opts);
  } else if (input->type == &Literal::type) {
    return render_literal(sink, static_cast<const Literal *>(input), opts);
  } else if (input->type == &ParenExpr::type) {
    return render_paren_expr(sink, static_cast<const ParenExpr *>(input), opts);
  } else if (input->type == &SliceExpr::type) {
    return render_slice_expr(sink, static_cast<const SliceExpr *>(input), opts);
  } else if (input->type == &TupleExpr::type) {
    return render_tuple_expr(sink, static_cast<const TupleExpr *>(input), opts);
  } else if (input->type == &UnaryExpr::type) {
    return render_unary_expr(sink, static_cast<const UnaryExpr *>(input), opts);
  }

  return fail<size_t>(ErrorKind::Unsupported,
                      std::string("type ") + input->type->name + " is not supported");
}

}  // namespace stargen
