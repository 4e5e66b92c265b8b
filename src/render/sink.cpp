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

#include "render/sink.h"

#include <errno.h>
#include <string.h>
#include <unistd.h>

namespace stargen {

Result<size_t> DocSink::write(const std::string &str) {
  builder.append(str);
  return result_value<Error>(str.size());
}

Result<size_t> OstreamSink::write(const std::string &str) {
  os.write(str.data(), str.size());
  if (!os) {
    return fail<size_t>(ErrorKind::Sink, "ostream write failed");
  }
  return result_value<Error>(str.size());
}

Result<size_t> FdSink::write(const std::string &str) {
  const char *data = str.data();
  size_t remaining = str.size();
  while (remaining > 0) {
    ssize_t n = ::write(fd, data, remaining);
    if (n < 0) {
      if (errno == EINTR) continue;
      posix_error_t err = errno;
      return make_error<size_t, Error>(ErrorKind::Sink, std::string("write: ") + strerror(err),
                                       err);
    }
    data += n;
    remaining -= static_cast<size_t>(n);
  }
  return result_value<Error>(str.size());
}

}  // namespace stargen
