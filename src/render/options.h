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

#ifndef STARGEN_RENDER_OPTIONS_H
#define STARGEN_RENDER_OPTIONS_H

#include <memory>
#include <string>

#include "render/error.h"
#include "render/layout.h"

namespace stargen {

// Formatting configuration threaded by value through every render call.
struct RenderOptions {
  int depth = 0;
  std::string indent = "    ";
  bool space_eq_binary = false;
  Layout call_layout = Layout::SingleLine;
  Layout dict_layout = Layout::SingleLine;
  Layout list_layout = Layout::SingleLine;
  Layout tuple_layout = Layout::SingleLine;

  RenderOptions add_depth(int n) const {
    RenderOptions copy = *this;
    copy.depth += n;
    return copy;
  }
};

// Collects option values and validates them on `build`. Only the first
// invalid value is reported.
//
// ```
// auto opts = RenderOptionsBuilder().depth(1).call_layout(Layout::Multiline).build();
// if (!opts) { ... opts.error().message ... }
// ```
class RenderOptionsBuilder {
 private:
  RenderOptions opts;
  std::unique_ptr<Error> err;

  void invalid(const std::string &message) {
    if (!err) err.reset(new Error(ErrorKind::Config, message));
  }

  RenderOptionsBuilder &layout(Layout RenderOptions::*field, Layout value);

 public:
  RenderOptionsBuilder() = default;
  RenderOptionsBuilder(RenderOptionsBuilder &&) = default;
  RenderOptionsBuilder &operator=(RenderOptionsBuilder &&) = default;

  RenderOptionsBuilder &depth(int value);
  RenderOptionsBuilder &indent(std::string value);
  RenderOptionsBuilder &space_eq_binary(bool value);
  RenderOptionsBuilder &call_layout(Layout value) { return layout(&RenderOptions::call_layout, value); }
  RenderOptionsBuilder &dict_layout(Layout value) { return layout(&RenderOptions::dict_layout, value); }
  RenderOptionsBuilder &list_layout(Layout value) { return layout(&RenderOptions::list_layout, value); }
  RenderOptionsBuilder &tuple_layout(Layout value) {
    return layout(&RenderOptions::tuple_layout, value);
  }

  Result<RenderOptions> build() const;
};

// Runs `opts` through the builder checks. Options assembled by hand are
// rejected here the same way `build` rejects them.
Result<RenderOptions> validate_options(const RenderOptions &opts);

}  // namespace stargen

#endif
