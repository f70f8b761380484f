/* vim:set ts=2 sw=2 sts=2 et: */
/**
 * \author     Marcus Holland-Moritz (github@mhxnet.de)
 * \copyright  Copyright (c) Marcus Holland-Moritz
 *
 * This file is part of dirsplit.
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the “Software”), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in
 * all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED “AS IS”, WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 *
 * SPDX-License-Identifier: MIT
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include <fmt/format.h>

#include <dirsplit/conv.h>
#include <dirsplit/error.h>

namespace dirsplit {

// Options given as `key=value` lines. Blank lines and lines starting with
// `#` are skipped. Every getter consumes its key; report() throws if any
// key was never consumed.
class option_map {
 public:
  explicit option_map(std::string_view text);
  explicit option_map(std::istream& is);

  bool has_options() const { return !opt_.empty(); }

  template <typename T>
  T get(std::string const& key, T const& default_value = T()) {
    return get_optional<T>(key).value_or(default_value);
  }

  template <typename T>
  std::optional<T> get_optional(std::string const& key) {
    auto i = opt_.find(key);

    if (i != opt_.end()) {
      std::string val = i->second;
      opt_.erase(i);
      if (auto v = try_to<T>(val)) {
        return v;
      }
      DIRSPLIT_THROW(runtime_error,
                     fmt::format("invalid value for option {}: '{}'", key, val));
    }

    return std::nullopt;
  }

  size_t get_size(std::string const& key, size_t default_value = 0);
  std::chrono::milliseconds
  get_time(std::string const& key, std::chrono::milliseconds default_value);

  void report();

 private:
  void parse(std::string_view text);

  std::unordered_map<std::string, std::string> opt_;
};

} // namespace dirsplit
