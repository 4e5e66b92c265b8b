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

#include "render/literal.h"

#include <gmp.h>
#include <utf8proc.h>

#include <vector>

#include "render/item.h"
#include "render/render.h"

namespace stargen {

static const char hex_digits[] = "0123456789abcdef";

static void append_hex(std::string &out, uint32_t value, int digits) {
  for (int shift = (digits - 1) * 4; shift >= 0; shift -= 4) {
    out += hex_digits[(value >> shift) & 0xf];
  }
}

static bool is_printable(utf8proc_int32_t rune) {
  if (rune == ' ') return true;
  utf8proc_category_t category = utf8proc_category(rune);
  return category >= UTF8PROC_CATEGORY_LU && category <= UTF8PROC_CATEGORY_SO;
}

std::string quote_string(const std::string &str) {
  std::string out;
  out.reserve(str.size() + 2);
  out += '"';

  const utf8proc_uint8_t *iter = reinterpret_cast<const utf8proc_uint8_t *>(str.data());
  const utf8proc_uint8_t *iter_end = iter + str.size();
  while (iter < iter_end) {
    utf8proc_int32_t rune;
    utf8proc_ssize_t size = utf8proc_iterate(iter, iter_end - iter, &rune);
    if (size <= 0) {
      out += "\\x";
      append_hex(out, *iter, 2);
      ++iter;
      continue;
    }

    if (rune == '"' || rune == '\\') {
      out += '\\';
      out += static_cast<char>(rune);
    } else if (is_printable(rune)) {
      out.append(reinterpret_cast<const char *>(iter), static_cast<size_t>(size));
    } else {
      switch (rune) {
        case '\a':
          out += "\\a";
          break;
        case '\b':
          out += "\\b";
          break;
        case '\f':
          out += "\\f";
          break;
        case '\n':
          out += "\\n";
          break;
        case '\r':
          out += "\\r";
          break;
        case '\t':
          out += "\\t";
          break;
        case '\v':
          out += "\\v";
          break;
        default:
          if (rune < ' ' || rune == 0x7f) {
            out += "\\x";
            append_hex(out, static_cast<uint32_t>(rune), 2);
          } else if (rune < 0x10000) {
            out += "\\u";
            append_hex(out, static_cast<uint32_t>(rune), 4);
          } else {
            out += "\\U";
            append_hex(out, static_cast<uint32_t>(rune), 8);
          }
          break;
      }
    }
    iter += size;
  }

  out += '"';
  return out;
}

std::string render_number(long value) { return std::to_string(value); }
std::string render_number(unsigned long value) { return std::to_string(value); }
std::string render_number(long long value) { return std::to_string(value); }
std::string render_number(unsigned long long value) { return std::to_string(value); }

std::string render_number(const syntax::BigInt &value) {
  std::vector<char> buffer(mpz_sizeinbase(value.value, 10) + 2);
  mpz_get_str(buffer.data(), 10, value.value);
  return std::string(buffer.data());
}

Result<size_t> render_literal(Sink &sink, const syntax::Literal *input, const RenderOptions &opts) {
  using syntax::LiteralKind;

  if (!input) {
    return fail<size_t>(ErrorKind::NilInput, "rendering literal: nil input");
  }

  std::string text;
  switch (input->kind) {
    case LiteralKind::None:
      text = input->raw;
      break;
    case LiteralKind::String:
      text = quote_string(input->string_value);
      break;
    case LiteralKind::Int:
      text = render_number(input->int_value);
      break;
    case LiteralKind::Uint:
      text = render_number(input->uint_value);
      break;
    case LiteralKind::Int64:
      text = render_number(static_cast<long long>(input->int64_value));
      break;
    case LiteralKind::Uint64:
      text = render_number(static_cast<unsigned long long>(input->uint64_value));
      break;
    case LiteralKind::BigInt:
      if (!input->big_value) {
        return fail<size_t>(ErrorKind::Validation, "nil literal big integer value provided");
      }
      text = render_number(*input->big_value);
      break;
    default:
      return fail<size_t>(ErrorKind::Unsupported,
                          std::string("unsupported literal value type ") +
                              syntax::literal_kind_string(input->kind) +
                              ", expected string, int, int64, uint, uint64 or big integer");
  }

  std::string kind = syntax::literal_kind_string(input->kind);
  return render(sink, "rendering literal", opts, {text_item(std::move(text), kind + " value")});
}

}  // namespace stargen
