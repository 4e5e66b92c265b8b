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

#include "render/error.h"

#include <utility>

namespace stargen {

const char *error_kind_string(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::Config:
      return "config";
    case ErrorKind::NilInput:
      return "nil input";
    case ErrorKind::Validation:
      return "validation";
    case ErrorKind::Unsupported:
      return "unsupported";
    case ErrorKind::Sink:
      return "sink";
    case ErrorKind::Internal:
      return "internal";
  }
  return "unknown";
}

std::ostream &operator<<(std::ostream &os, const Error &err) { return os << err.message; }

Error with_context(Error err, const std::string &context) {
  err.message = context + ": " + err.message;
  return err;
}

}  // namespace stargen
