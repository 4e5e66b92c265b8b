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

#include <sstream>

#include "stargen/tracing.h"
#include "unit.h"

using namespace stargen;

TEST(tracing_event_items) {
  log::Event e = log::warning("value %d of %s", 3, "options").component("options");
  ASSERT_TRUE(e.get(log::LOG_MESSAGE) != nullptr);
  EXPECT_EQUAL("value 3 of options", *e.get(log::LOG_MESSAGE));
  EXPECT_EQUAL("warning", *e.get(log::LOG_LEVEL));
  EXPECT_EQUAL("options", *e.get(log::LOG_COMPONENT));
  EXPECT_TRUE(e.get(log::LOG_PID) != nullptr);
  EXPECT_TRUE(e.get(log::LOG_TIME) != nullptr);
  EXPECT_TRUE(e.get("missing") == nullptr);
}

TEST(tracing_simple_format) {
  std::stringbuf buf;
  log::SimpleFormatSubscriber sub(&buf);

  sub.receive(log::error("rendering %s failed", "statement"));
  sub.receive(log::event());
  EXPECT_EQUAL("[error]: rendering statement failed\n<empty message>\n", buf.str());
}

TEST(tracing_format) {
  std::stringbuf buf;
  log::FormatSubscriber sub(&buf);

  log::Event e = log::event().component("render");
  e.items["kind"] = "sink";
  e.items[log::LOG_MESSAGE] = "write failed";
  sub.receive(e);

  std::string line = buf.str();
  EXPECT_TRUE(line.find("component=render") != std::string::npos) << line;
  EXPECT_TRUE(line.find("kind=sink") != std::string::npos) << line;
  EXPECT_TRUE(line.find("] write failed\n") != std::string::npos) << line;
}

TEST(tracing_filter) {
  std::stringbuf buf;
  log::FilterSubscriber sub(
      std::unique_ptr<log::Subscriber>(new log::SimpleFormatSubscriber(&buf)),
      [](const log::Event &e) {
        const std::string *component = e.get(log::LOG_COMPONENT);
        return component && *component == "render";
      });

  sub.receive(log::info("kept").component("render"));
  sub.receive(log::info("dropped").component("options"));
  sub.receive(log::info("dropped"));
  EXPECT_EQUAL("[info]: kept\n", buf.str());
}
