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

#include <memory>
#include <ostream>
#include <sstream>
#include <string>
#include <vector>

namespace stargen {

class doc_impl_base {
 public:
  virtual ~doc_impl_base() = default;

  virtual void write(std::ostream&) const = 0;
};

class doc_impl_string : public doc_impl_base {
 private:
  std::string str;

 public:
  explicit doc_impl_string(std::string str_) : str(std::move(str_)) {}
  void write(std::ostream& ostream) const override { ostream << str; }
};

class doc_impl_pair : public doc_impl_base {
 private:
  std::shared_ptr<doc_impl_base> left;
  std::shared_ptr<doc_impl_base> right;

 public:
  doc_impl_pair(std::shared_ptr<doc_impl_base> left_, std::shared_ptr<doc_impl_base> right_)
      : left(std::move(left_)), right(std::move(right_)) {}

  void write(std::ostream& ostream) const override {
    left->write(ostream);
    right->write(ostream);
  }
};

// `doc` is an immutable rope of rendered text. Concatenation is O(1),
// converting to a string is O(n).
//
// ```
// doc d = doc::lit("def").concat(doc::lit(" foo"));
// d.as_string() -> "def foo"
// ```
class doc {
 private:
  std::shared_ptr<doc_impl_base> impl;

  explicit doc(std::shared_ptr<doc_impl_base> impl_) : impl(std::move(impl_)) {}

 public:
  doc(const doc& other) = default;
  doc(doc&& other) = default;
  doc& operator=(const doc& other) = default;
  doc& operator=(doc&& other) = default;

  static doc lit(std::string str) {
    return doc(std::make_shared<doc_impl_string>(std::move(str)));
  }

  doc concat(const doc& r) const { return doc(std::make_shared<doc_impl_pair>(impl, r.impl)); }

  std::string as_string() const {
    std::stringstream ss;
    impl->write(ss);
    return ss.str();
  }

  void write(std::ostream& ostream) const { impl->write(ostream); }
};

// Collects the pieces written by a render and joins them into a
// balanced rope on `build`.
//
// ```
// doc_builder b;
// b.append("load");
// b.append("(");
// doc d = std::move(b).build();
// d.as_string() -> "load("
// ```
class doc_builder {
 private:
  std::vector<doc> docs;

  doc merge(size_t start, size_t end) const {
    if (start == end) {
      return docs[start];
    }

    size_t middle = start + (end - start) / 2;
    return merge(start, middle).concat(merge(middle + 1, end));
  }

 public:
  void append(std::string str) { docs.push_back(doc::lit(std::move(str))); }

  void append(doc other) { docs.push_back(std::move(other)); }

  doc build() && {
    doc out = docs.empty() ? doc::lit("") : merge(0, docs.size() - 1);
    docs.clear();
    return out;
  }
};

}  // namespace stargen
