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

#include "render/item.h"
#include "render/render.h"

namespace stargen {

using namespace syntax;

Result<size_t> render_assign_stmt(Sink &sink, const AssignStmt *input, const RenderOptions &opts) {
  if (!input) return fail<size_t>(ErrorKind::NilInput, "rendering assign statement: nil input");

  switch (input->op) {
    case Token::EQ:
    case Token::PLUS_EQ:
    case Token::MINUS_EQ:
    case Token::STAR_EQ:
    case Token::PERCENT_EQ:
      break;
    default:
      return fail<size_t>(ErrorKind::Validation,
                          std::string("rendering assign statement: unsupported Op token ") +
                              token_string(input->op) + ", expected one of: =, +=, -=, *=, %=");
  }

  return render(sink, "rendering assignment statement", opts,
                {
                    indent_item(),
                    expr_item(input->lhs.get(), "LHS"),
                    space_item(),
                    token_item(input->op, "Op"),
                    space_item(),
                    expr_item(input->rhs.get(), "RHS"),
                    newline_item(),
                });
}

Result<size_t> render_branch_stmt(Sink &sink, const BranchStmt *input, const RenderOptions &opts) {
  if (!input) return fail<size_t>(ErrorKind::NilInput, "rendering branch statement: nil input");

  switch (input->token) {
    case Token::BREAK:
    case Token::CONTINUE:
    case Token::PASS:
      break;
    default:
      return fail<size_t>(ErrorKind::Validation,
                          std::string("rendering branch statement: unsupported token ") +
                              token_string(input->token) + ", expected break, continue or pass");
  }

  return render(sink, "rendering branch statement", opts,
                {indent_item(), token_item(input->token, "Token"), newline_item()});
}

Result<size_t> render_def_stmt(Sink &sink, const DefStmt *input, const RenderOptions &opts) {
  if (!input) return fail<size_t>(ErrorKind::NilInput, "rendering def statement: nil input");

  Items items;
  items.push_back(indent_item());
  items.push_back(token_item(Token::DEF, "DEF"));
  items.push_back(space_item());
  items.push_back(expr_item(input->name.get(), "Name"));
  items.push_back(token_item(Token::LPAREN, "LPAREN"));
  append_sequence(items, input->params, Layout::SingleLine, "param");
  items.push_back(token_item(Token::RPAREN, "RPAREN"));
  items.push_back(colon_item());
  items.push_back(newline_item());
  items.push_back(stmts_item(input->body, "Body", true));

  return render(sink, "rendering def statement", opts, items);
}

Result<size_t> render_expr_stmt(Sink &sink, const ExprStmt *input, const RenderOptions &opts) {
  if (!input) return fail<size_t>(ErrorKind::NilInput, "rendering expression statement: nil input");

  const Expr *x = input->x.get();
  if (x && x->type == &Literal::type) {
    const Literal *lit = static_cast<const Literal *>(x);
    if (lit->kind == LiteralKind::String) return render_docstring(sink, lit, opts);
  }

  return render(sink, "rendering expression statement", opts,
                {indent_item(), expr_item(x, "X"), newline_item()});
}

Result<size_t> render_for_stmt(Sink &sink, const ForStmt *input, const RenderOptions &opts) {
  if (!input) return fail<size_t>(ErrorKind::NilInput, "rendering for statement: nil input");

  return render(sink, "rendering for statement", opts,
                {
                    indent_item(),
                    token_item(Token::FOR, "FOR"),
                    space_item(),
                    expr_item(input->vars.get(), "Vars"),
                    space_item(),
                    token_item(Token::IN, "IN"),
                    space_item(),
                    expr_item(input->x.get(), "X"),
                    colon_item(),
                    newline_item(),
                    stmts_item(input->body, "Body", true),
                });
}

Result<size_t> render_if_stmt(Sink &sink, const IfStmt *input, const RenderOptions &opts) {
  if (!input) return fail<size_t>(ErrorKind::NilInput, "rendering if statement: nil input");

  Items items;
  items.push_back(indent_item());
  items.push_back(token_item(Token::IF, "IF"));
  items.push_back(space_item());
  items.push_back(expr_item(input->cond.get(), "Cond"));
  items.push_back(colon_item());
  items.push_back(newline_item());
  items.push_back(stmts_item(input->true_, "True", true));

  // elif chains stay nested in the else branch
  if (!input->false_.empty()) {
    items.push_back(indent_item());
    items.push_back(token_item(Token::ELSE, "ELSE"));
    items.push_back(colon_item());
    items.push_back(newline_item());
    items.push_back(stmts_item(input->false_, "False", true));
  }

  return render(sink, "rendering if statement", opts, items);
}

Result<size_t> render_load_stmt(Sink &sink, const LoadStmt *input, const RenderOptions &opts) {
  if (!input) return fail<size_t>(ErrorKind::NilInput, "rendering load statement: nil input");

  if (input->from.size() != input->to.size()) {
    return fail<size_t>(ErrorKind::Validation, "rendering load statement, lengths mismatch, From: " +
                                                   std::to_string(input->from.size()) +
                                                   ", To: " + std::to_string(input->to.size()));
  }

  Items items;
  items.push_back(indent_item());
  items.push_back(token_item(Token::LOAD, "LOAD"));
  items.push_back(token_item(Token::LPAREN, "LPAREN"));
  items.push_back(expr_item(input->module.get(), "Module"));

  for (size_t i = 0; i < input->from.size(); ++i) {
    const Ident *from = input->from[i].get();
    const Ident *to = input->to[i].get();
    std::string index = "[" + std::to_string(i) + "]";

    items.push_back(token_item(Token::COMMA, "COMMA"));
    items.push_back(space_item());
    if (to && (!from || to->name != from->name)) {
      items.push_back(expr_item(to, "To" + index));
      if (opts.space_eq_binary) {
        items.push_back(space_item());
        items.push_back(token_item(Token::EQ, "EQ"));
        items.push_back(space_item());
      } else {
        items.push_back(token_item(Token::EQ, "EQ"));
      }
    }
    items.push_back(quote_item());
    items.push_back(expr_item(from, "From" + index));
    items.push_back(quote_item());
  }

  items.push_back(token_item(Token::RPAREN, "RPAREN"));
  items.push_back(newline_item());

  return render(sink, "rendering load statement", opts, items);
}

Result<size_t> render_return_stmt(Sink &sink, const ReturnStmt *input, const RenderOptions &opts) {
  if (!input) return fail<size_t>(ErrorKind::NilInput, "rendering return statement: nil input");

  Items items;
  items.push_back(indent_item());
  items.push_back(token_item(Token::RETURN, "RETURN"));
  if (input->result) {
    items.push_back(space_item());
    items.push_back(expr_item(input->result.get(), "Result"));
  }
  items.push_back(newline_item());

  return render(sink, "rendering return statement", opts, items);
}

Result<size_t> render_while_stmt(Sink &sink, const WhileStmt *input, const RenderOptions &opts) {
  if (!input) return fail<size_t>(ErrorKind::NilInput, "rendering while statement: nil input");

  return render(sink, "rendering while statement", opts,
                {
                    indent_item(),
                    token_item(Token::WHILE, "WHILE"),
                    space_item(),
                    expr_item(input->cond.get(), "Cond"),
                    colon_item(),
                    newline_item(),
                    stmts_item(input->body, "Body", true),
                });
}

Result<size_t> render_stmt(Sink &sink, const Stmt *input, const RenderOptions &opts) {
  if (!input) return fail<size_t>(ErrorKind::NilInput, "rendering statement: nil input");

  if (input->type == &AssignStmt::type) {
    return render_assign_stmt(sink, static_cast<const AssignStmt *>(input), opts);
  } else if (input->type == &BranchStmt::type) {
    return render_branch_stmt(sink, static_cast<const BranchStmt *>(input), opts);
  } else if (input->type == &DefStmt::type) {
    return render_def_stmt(sink, static_cast<const DefStmt *>(input), opts);
  } else if (input->type == &ExprStmt::type) {
    return render_expr_stmt(sink, static_cast<const ExprStmt *>(input), opts);
  } else if (input->type == &ForStmt::type) {
    return render_for_stmt(sink, static_cast<const ForStmt *>(input), opts);
  } else if (input->type == &IfStmt::type) {
    return render_if_stmt(sink, static_cast<const IfStmt *>(input), opts);
  } else if (input->type == &LoadStmt::type) {
    return render_load_stmt(sink, static_cast<const LoadStmt *>(input), opts);
  } else if (input->type == &ReturnStmt::type) {
    return render_return_stmt(sink, static_cast<const ReturnStmt *>(input), opts);
  } else if (input->type == &WhileStmt::type) {
    return render_while_stmt(sink, static_cast<const WhileStmt *>(input), opts);
  }

  return fail<size_t>(ErrorKind::Unsupported,
                      std::string("type ") + input->type->name + " is not supported");
}

}  // namespace stargen
