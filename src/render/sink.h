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

#ifndef STARGEN_RENDER_SINK_H
#define STARGEN_RENDER_SINK_H

#include <ostream>
#include <string>

#include "render/error.h"
#include "stargen/doc.h"

namespace stargen {

// Destination of rendered text. Writes happen strictly in order, an error
// returned from `write` stops the render and becomes its result.
class Sink {
 public:
  virtual Result<size_t> write(const std::string &str) = 0;
  virtual ~Sink() {}
};

// Accumulates everything written into a doc.
class DocSink : public Sink {
 private:
  doc_builder builder;

 public:
  Result<size_t> write(const std::string &str) override;

  doc build() && { return std::move(builder).build(); }
};

class OstreamSink : public Sink {
 private:
  std::ostream &os;

 public:
  explicit OstreamSink(std::ostream &os_) : os(os_) {}
  Result<size_t> write(const std::string &str) override;
};

// Writes to a file descriptor the caller keeps ownership of. A failed
// write(2) is reported with its errno.
class FdSink : public Sink {
 private:
  int fd;

 public:
  explicit FdSink(int fd_) : fd(fd_) {}
  Result<size_t> write(const std::string &str) override;
};

}  // namespace stargen

#endif
