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

#include "stargen/result.h"

#include <memory>
#include <string>

#include "render/error.h"
#include "unit.h"

TEST(result_err_is_err) {
  stargen::result<int, int> err = stargen::result_error<int>(10);
  EXPECT_FALSE((bool)err);
  EXPECT_EQUAL(10, err.error());
}

TEST(result_value) {
  stargen::result<int, int> value = stargen::result_value<int>(10);
  ASSERT_TRUE((bool)value);
  EXPECT_EQUAL(10, *value);
}

TEST(result_inplace_error) {
  stargen::result<int, std::pair<int, int>> pair =
      stargen::make_error<int, std::pair<int, int>>(10, 10);
  ASSERT_FALSE((bool)pair);
  EXPECT_EQUAL(std::make_pair(10, 10), pair.error());
}

TEST(result_copy_assign) {
  stargen::result<std::string, int> a = stargen::result_value<int>(std::string("foo"));
  stargen::result<std::string, int> b = stargen::result_error<std::string>(3);
  b = a;
  ASSERT_TRUE((bool)b);
  EXPECT_EQUAL("foo", *b);
  a = a;
  ASSERT_TRUE((bool)a);
  EXPECT_EQUAL("foo", *a);
}

TEST(result_move_only) {
  stargen::result<std::unique_ptr<int>, int> move_only1(stargen::in_place_t{},
                                                        std::unique_ptr<int>(new int(10)));
  stargen::result<std::unique_ptr<int>, int> move_only2(std::move(move_only1));
  EXPECT_TRUE((bool)move_only1);
  ASSERT_TRUE((bool)move_only2);
  EXPECT_EQUAL(10, *move_only2->get());
  EXPECT_TRUE(move_only1->get() == nullptr);
}

TEST(result_errno) {
  errno = ENOENT;
  auto res = stargen::make_errno<int>();
  ASSERT_FALSE((bool)res);
  EXPECT_EQUAL(ENOENT, res.error());
}

TEST(result_error_context) {
  stargen::Error err(stargen::ErrorKind::Sink, "disk full", 28);
  stargen::Error wrapped = stargen::with_context(stargen::with_context(err, "inner"), "outer");
  EXPECT_EQUAL("outer: inner: disk full", wrapped.message);
  EXPECT_EQUAL("disk full", wrapped.cause);
  EXPECT_EQUAL(28, wrapped.posix_error);
  EXPECT_TRUE(wrapped.kind == stargen::ErrorKind::Sink);
  EXPECT_EQUAL("sink", std::string(stargen::error_kind_string(wrapped.kind)));
}
