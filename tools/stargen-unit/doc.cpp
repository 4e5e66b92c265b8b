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

#include "stargen/doc.h"

#include <sstream>

#include "unit.h"

TEST(doc_basic) {
  stargen::doc_builder builder;
  builder.append("load");
  builder.append("(");
  builder.append("\"mod\"");

  {
    stargen::doc_builder other;
    other.append(", ");
    other.append("\"foo\"");
    stargen::doc d = std::move(other).build();
    builder.append(d);
  }
  builder.append(")");

  stargen::doc d = std::move(builder).build();
  EXPECT_EQUAL("load(\"mod\", \"foo\")", d.as_string());
}

TEST(doc_empty) {
  stargen::doc_builder builder;
  stargen::doc d = std::move(builder).build();
  EXPECT_EQUAL("", d.as_string());
}

TEST(doc_concat_write) {
  stargen::doc d = stargen::doc::lit("if x:\n").concat(stargen::doc::lit("    pass\n"));
  std::ostringstream out;
  d.write(out);
  EXPECT_EQUAL("if x:\n    pass\n", out.str());
}

TEST(doc_raw_bytes) {
  stargen::doc d = stargen::doc::lit("a\xff" "b");
  EXPECT_EQUAL("a\xff" "b", d.as_string());
}
