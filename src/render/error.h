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

#ifndef STARGEN_RENDER_ERROR_H
#define STARGEN_RENDER_ERROR_H

#include <ostream>
#include <string>
#include <utility>

#include "stargen/result.h"

namespace stargen {

enum class ErrorKind {
  Config,       // invalid option value, found before rendering
  NilInput,     // a required node is absent
  Validation,   // a node has a shape that can not be rendered
  Unsupported,  // a node kind, payload or token without a rendering
  Sink,         // the sink rejected a write
  Internal,     // a malformed item list
};

const char *error_kind_string(ErrorKind kind);

// A rendering failure. `message` is the full breadcrumb trail, `cause`
// the innermost message that started it. `posix_error` is only set by
// sinks that write to a file descriptor.
struct Error {
  ErrorKind kind;
  std::string message;
  std::string cause;
  posix_error_t posix_error;

  Error(ErrorKind kind_, const std::string &message_, posix_error_t posix_error_ = 0)
      : kind(kind_), message(message_), cause(message_), posix_error(posix_error_) {}

  const char *what() const { return message.c_str(); }
};

std::ostream &operator<<(std::ostream &os, const Error &err);

// Returns `err` with "`context`: " in front of its message.
Error with_context(Error err, const std::string &context);

template <class T>
using Result = result<T, Error>;

template <class T>
Result<T> fail(ErrorKind kind, const std::string &message) {
  return make_error<T, Error>(kind, message);
}

// Forwards the error of `res`, a failed render of another type, with
// `context` in front.
template <class T, class U>
Result<T> propagate(Result<U> &res, const std::string &context) {
  return result_error<T>(with_context(std::move(res.error()), context));
}

// Forwards the error of `res` unchanged.
template <class T, class U>
Result<T> propagate_error(Result<U> &res) {
  return result_error<T>(std::move(res.error()));
}

}  // namespace stargen

#endif
