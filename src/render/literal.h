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

#ifndef STARGEN_RENDER_LITERAL_H
#define STARGEN_RENDER_LITERAL_H

#include <stdint.h>

#include <string>

#include "syntax/syntax.h"

namespace stargen {

// Double quoted Starlark string literal for `str`. Printable runes are
// kept, the rest is escaped. Bytes that are not valid UTF-8 become \xHH.
std::string quote_string(const std::string &str);

// Decimal text of an integer literal payload.
std::string render_number(long value);
std::string render_number(unsigned long value);
std::string render_number(long long value);
std::string render_number(unsigned long long value);
std::string render_number(const syntax::BigInt &value);

}  // namespace stargen

#endif
