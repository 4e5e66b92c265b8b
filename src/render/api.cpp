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

#include "render/render.h"
#include "stargen/tracing.h"

namespace stargen {

static void log_failure(const char *what, const Error &err) {
  log::error("rendering %s failed: %s", what, err.message.c_str())
      .component("render")({{"kind", error_kind_string(err.kind)}});
}

Result<size_t> write_stmt(Sink &sink, const syntax::Stmt *input, const RenderOptions &opts) {
  auto checked = validate_options(opts);
  if (!checked) {
    log_failure("statement", checked.error());
    return propagate_error<size_t>(checked);
  }

  auto res = render_stmt(sink, input, opts);
  if (!res) log_failure("statement", res.error());
  return res;
}

Result<size_t> write_expr(Sink &sink, const syntax::Expr *input, const RenderOptions &opts) {
  auto checked = validate_options(opts);
  if (!checked) {
    log_failure("expression", checked.error());
    return propagate_error<size_t>(checked);
  }

  auto res = render_expr(sink, input, opts);
  if (!res) log_failure("expression", res.error());
  return res;
}

Result<std::string> starlark_stmt(const syntax::Stmt *input, const RenderOptions &opts) {
  DocSink sink;
  auto res = write_stmt(sink, input, opts);
  if (!res) return propagate_error<std::string>(res);
  return result_value<Error>(std::move(sink).build().as_string());
}

Result<std::string> starlark_expr(const syntax::Expr *input, const RenderOptions &opts) {
  DocSink sink;
  auto res = write_expr(sink, input, opts);
  if (!res) return propagate_error<std::string>(res);
  return result_value<Error>(std::move(sink).build().as_string());
}

}  // namespace stargen
