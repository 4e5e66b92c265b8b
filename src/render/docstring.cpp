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

static const char triple_quote[] = "\"\"\"";

bool has_space_prefix(const std::string &line, size_t n) {
  if (line.size() < n) return false;
  for (size_t i = 0; i < n; ++i) {
    if (line[i] != ' ') return false;
  }
  return true;
}

static std::string escape_triple_quotes(const std::string &str) {
  std::string out;
  out.reserve(str.size());
  for (size_t i = 0; i < str.size(); ++i) {
    if (str.compare(i, 3, triple_quote) == 0) {
      out += "\\\"\\\"\\\"";
      i += 2;
      continue;
    }
    // A quote right before the closing triple quote would end the string early
    if (str[i] == '"' && i + 1 == str.size()) {
      out += "\\\"";
      continue;
    }
    out += str[i];
  }
  return out;
}

Result<size_t> render_docstring(Sink &sink, const syntax::Literal *input, const RenderOptions &opts) {
  if (!input) {
    return fail<size_t>(ErrorKind::NilInput, "rendering docstring expression statement: nil input");
  }

  // A parsed literal keeps the indentation of its continuation lines,
  // the column of the opening quote tells how much of it to drop.
  size_t strip = 0;
  if (input->token == syntax::Token::STRING && input->token_pos.col > 1) {
    strip = static_cast<size_t>(input->token_pos.col - 1);
  }

  std::string text = escape_triple_quotes(input->string_value);

  Items items;
  items.push_back(indent_item());
  items.push_back(text_item(triple_quote, "triple quote"));

  size_t pos = 0;
  size_t line_num = 0;
  while (pos < text.size()) {
    std::string line;
    size_t nl = text.find('\n', pos);
    if (nl != std::string::npos) {
      line = text.substr(pos, nl - pos);
      pos = nl + 1;
    } else {
      line = text.substr(pos);
      pos = text.size();
    }

    if (line_num == 0) {
      items.push_back(text_item(std::move(line), "docstring line 1"));
      ++line_num;
      continue;
    }

    if (strip > 0 && has_space_prefix(line, strip)) line.erase(0, strip);

    items.push_back(newline_item());
    if (!line.empty() || pos >= text.size()) {
      items.push_back(indent_item());
      items.push_back(text_item(std::move(line), "docstring line " + std::to_string(line_num + 1)));
    }
    ++line_num;
  }

  // Text ending in a newline puts the closing quotes on an indented line of their own
  if (!text.empty() && text.back() == '\n') {
    items.push_back(newline_item());
    items.push_back(indent_item());
  }

  items.push_back(text_item(triple_quote, "triple quote"));
  items.push_back(newline_item());

  return render(sink, "rendering docstring expression statement", opts, items);
}

}  // namespace stargen
