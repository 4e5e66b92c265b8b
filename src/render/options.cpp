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

#include "render/options.h"

#include <utility>

#include "stargen/tracing.h"

namespace stargen {

RenderOptionsBuilder &RenderOptionsBuilder::layout(Layout RenderOptions::*field, Layout value) {
  if (!layout_valid(value)) {
    invalid("invalid option value " + std::to_string(static_cast<unsigned>(value)));
    return *this;
  }
  opts.*field = value;
  return *this;
}

RenderOptionsBuilder &RenderOptionsBuilder::depth(int value) {
  if (value < 0) {
    invalid("invalid depth value " + std::to_string(value) + ", value must be >= 0");
    return *this;
  }
  opts.depth = value;
  return *this;
}

RenderOptionsBuilder &RenderOptionsBuilder::indent(std::string value) {
  opts.indent = std::move(value);
  return *this;
}

RenderOptionsBuilder &RenderOptionsBuilder::space_eq_binary(bool value) {
  opts.space_eq_binary = value;
  return *this;
}

Result<RenderOptions> RenderOptionsBuilder::build() const {
  if (err) {
    log::warning("render options rejected: %s", err->message.c_str()).component("options")();
    return result_error<RenderOptions>(*err);
  }
  return result_value<Error>(opts);
}

Result<RenderOptions> validate_options(const RenderOptions &opts) {
  return RenderOptionsBuilder()
      .depth(opts.depth)
      .indent(opts.indent)
      .space_eq_binary(opts.space_eq_binary)
      .call_layout(opts.call_layout)
      .dict_layout(opts.dict_layout)
      .list_layout(opts.list_layout)
      .tuple_layout(opts.tuple_layout)
      .build();
}

}  // namespace stargen
