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

#ifndef STARGEN_RENDER_RENDER_H
#define STARGEN_RENDER_RENDER_H

#include <string>

#include "render/error.h"
#include "render/options.h"
#include "render/sink.h"
#include "syntax/syntax.h"

namespace stargen {

/* Expressions: each writes one node to `sink` and returns the bytes written */

Result<size_t> render_binary_expr(Sink &sink, const syntax::BinaryExpr *input,
                                  const RenderOptions &opts);
Result<size_t> render_call_expr(Sink &sink, const syntax::CallExpr *input,
                                const RenderOptions &opts);
Result<size_t> render_comprehension(Sink &sink, const syntax::Comprehension *input,
                                    const RenderOptions &opts);
Result<size_t> render_cond_expr(Sink &sink, const syntax::CondExpr *input,
                                const RenderOptions &opts);
Result<size_t> render_dict_entry(Sink &sink, const syntax::DictEntry *input,
                                 const RenderOptions &opts);
Result<size_t> render_dict_expr(Sink &sink, const syntax::DictExpr *input,
                                const RenderOptions &opts);
Result<size_t> render_dot_expr(Sink &sink, const syntax::DotExpr *input, const RenderOptions &opts);
Result<size_t> render_ident(Sink &sink, const syntax::Ident *input, const RenderOptions &opts);
Result<size_t> render_index_expr(Sink &sink, const syntax::IndexExpr *input,
                                 const RenderOptions &opts);
Result<size_t> render_list_expr(Sink &sink, const syntax::ListExpr *input,
                                const RenderOptions &opts);
Result<size_t> render_literal(Sink &sink, const syntax::Literal *input, const RenderOptions &opts);
Result<size_t> render_paren_expr(Sink &sink, const syntax::ParenExpr *input,
                                 const RenderOptions &opts);
Result<size_t> render_slice_expr(Sink &sink, const syntax::SliceExpr *input,
                                 const RenderOptions &opts);
Result<size_t> render_tuple_expr(Sink &sink, const syntax::TupleExpr *input,
                                 const RenderOptions &opts);
Result<size_t> render_unary_expr(Sink &sink, const syntax::UnaryExpr *input,
                                 const RenderOptions &opts);

// Dispatches on the kind of `input`.
Result<size_t> render_expr(Sink &sink, const syntax::Expr *input, const RenderOptions &opts);

/* Statements: each starts with the indentation of `opts.depth` and ends with a newline */

Result<size_t> render_assign_stmt(Sink &sink, const syntax::AssignStmt *input,
                                  const RenderOptions &opts);
Result<size_t> render_branch_stmt(Sink &sink, const syntax::BranchStmt *input,
                                  const RenderOptions &opts);
Result<size_t> render_def_stmt(Sink &sink, const syntax::DefStmt *input, const RenderOptions &opts);
Result<size_t> render_expr_stmt(Sink &sink, const syntax::ExprStmt *input,
                                const RenderOptions &opts);
Result<size_t> render_for_stmt(Sink &sink, const syntax::ForStmt *input, const RenderOptions &opts);
Result<size_t> render_if_stmt(Sink &sink, const syntax::IfStmt *input, const RenderOptions &opts);
Result<size_t> render_load_stmt(Sink &sink, const syntax::LoadStmt *input,
                                const RenderOptions &opts);
Result<size_t> render_return_stmt(Sink &sink, const syntax::ReturnStmt *input,
                                  const RenderOptions &opts);
Result<size_t> render_while_stmt(Sink &sink, const syntax::WhileStmt *input,
                                 const RenderOptions &opts);

// Dispatches on the kind of `input`.
Result<size_t> render_stmt(Sink &sink, const syntax::Stmt *input, const RenderOptions &opts);

// Triple quoted form of a string literal used as an expression statement.
Result<size_t> render_docstring(Sink &sink, const syntax::Literal *input, const RenderOptions &opts);

// True when `line` starts with at least `n` spaces.
bool has_space_prefix(const std::string &line, size_t n);

/* Entry points: `opts` is checked with `validate_options` before anything
 * is written. The renderers above expect options that already passed it. */

// Renders to a string. On failure no partial text is returned.
Result<std::string> starlark_stmt(const syntax::Stmt *input,
                                  const RenderOptions &opts = RenderOptions());
Result<std::string> starlark_expr(const syntax::Expr *input,
                                  const RenderOptions &opts = RenderOptions());

// Streams to `sink`. On failure the sink may hold partial output.
Result<size_t> write_stmt(Sink &sink, const syntax::Stmt *input,
                          const RenderOptions &opts = RenderOptions());
Result<size_t> write_expr(Sink &sink, const syntax::Expr *input,
                          const RenderOptions &opts = RenderOptions());

}  // namespace stargen

#endif
