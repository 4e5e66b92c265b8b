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

#pragma once

#include <errno.h>

#include <cstddef>
#include <cstdint>
#include <new>
#include <type_traits>
#include <utility>

namespace stargen {

// Names an errno value returned by a posix call.
using posix_error_t = int;

// Tags that select which side of a `result` is constructed.
struct in_place_t {
  explicit in_place_t() = default;
};
struct in_place_error_t {
  explicit in_place_error_t() = default;
};

static constexpr size_t max_align(size_t a, size_t b) { return (a < b) ? b : a; }

// `result<T, E>` holds either a value or an error, never neither.
// Both sides must be movable. A result is copyable when both sides are,
// copying a result whose side is not copyable fails to compile at the
// point of use.
//
// A moved-from result keeps its side, the held object is left in
// whatever state its own move constructor leaves it.
template <class T, class E>
class alignas(max_align(alignof(T), alignof(E))) result {
 private:
  union {
    T value_;
    E error_;
  };
  bool is_error;

  void destroy() {
    if (is_error) {
      error_.~E();
    } else {
      value_.~T();
    }
  }

 public:
  template <class... Args>
  result(in_place_t, Args&&... args) : value_(std::forward<Args>(args)...), is_error(false) {}

  template <class... Args>
  result(in_place_error_t, Args&&... args) : error_(std::forward<Args>(args)...), is_error(true) {}

  result() = delete;

  result(const result& other) : is_error(other.is_error) {
    if (is_error) {
      new (&error_) E(other.error_);
    } else {
      new (&value_) T(other.value_);
    }
  }

  result(result&& other) : is_error(other.is_error) {
    if (is_error) {
      new (&error_) E(std::move(other.error_));
    } else {
      new (&value_) T(std::move(other.value_));
    }
  }

  ~result() { destroy(); }

  result& operator=(const result& other) {
    if (this == &other) return *this;
    destroy();
    is_error = other.is_error;
    if (is_error) {
      new (&error_) E(other.error_);
    } else {
      new (&value_) T(other.value_);
    }
    return *this;
  }

  result& operator=(result&& other) {
    if (this == &other) return *this;
    destroy();
    is_error = other.is_error;
    if (is_error) {
      new (&error_) E(std::move(other.error_));
    } else {
      new (&value_) T(std::move(other.value_));
    }
    return *this;
  }

  explicit operator bool() const { return !is_error; }

  T& operator*() { return value_; }
  const T& operator*() const { return value_; }

  T* operator->() { return &value_; }
  const T* operator->() const { return &value_; }

  E& error() { return error_; }
  const E& error() const { return error_; }
};

// Wraps an existing value. Only the error type has to be named:
// result_value<Error>(std::string("x")) is a result<std::string, Error>.
template <class E, class T>
result<typename std::decay<T>::type, E> result_value(T&& x) {
  return result<typename std::decay<T>::type, E>{in_place_t{}, std::forward<T>(x)};
}

// Constructs the value in place from any of its constructors.
template <class T, class E, class... Args>
result<T, E> make_result(Args&&... args) {
  return result<T, E>{in_place_t{}, std::forward<Args>(args)...};
}

// Wraps an existing error. Only the value type has to be named.
template <class T, class E>
result<T, typename std::decay<E>::type> result_error(E&& err) {
  return result<T, typename std::decay<E>::type>{in_place_error_t{}, std::forward<E>(err)};
}

// Constructs the error in place from any of its constructors.
template <class T, class E, class... Args>
result<T, E> make_error(Args&&... args) {
  return result<T, E>{in_place_error_t{}, std::forward<Args>(args)...};
}

// Captures the current errno as the error of a result.
template <class T>
result<T, posix_error_t> make_errno() {
  return result<T, posix_error_t>{in_place_error_t{}, errno};
}

}  // namespace stargen
