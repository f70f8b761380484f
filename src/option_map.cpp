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

#include <algorithm>
#include <istream>
#include <iterator>
#include <sstream>
#include <vector>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <dirsplit/error.h>
#include <dirsplit/option_map.h>
#include <dirsplit/string.h>
#include <dirsplit/util.h>

namespace dirsplit {

option_map::option_map(std::string_view text) { parse(text); }

option_map::option_map(std::istream& is) {
  std::ostringstream oss;
  oss << is.rdbuf();
  parse(oss.str());
}

void option_map::parse(std::string_view text) {
  auto lines = split_to<std::vector<std::string_view>>(text, '\n');

  for (size_t lineno = 1; auto raw : lines) {
    auto line = trim(raw);

    if (!line.empty() && line.front() != '#') {
      auto eqpos = line.find('=');

      if (eqpos == std::string_view::npos) {
        DIRSPLIT_THROW(runtime_error,
                       fmt::format("line {}: expected key=value, got '{}'",
                                   lineno, line));
      }

      std::string key(trim(line.substr(0, eqpos)));
      std::string val(trim(line.substr(eqpos + 1)));

      if (key.empty()) {
        DIRSPLIT_THROW(runtime_error,
                       fmt::format("line {}: empty option name", lineno));
      }

      if (!opt_.emplace(key, val).second) {
        DIRSPLIT_THROW(runtime_error,
                       fmt::format("line {}: duplicate option {}", lineno, key));
      }
    }

    ++lineno;
  }
}

size_t option_map::get_size(std::string const& key, size_t default_value) {
  auto i = opt_.find(key);

  if (i != opt_.end()) {
    std::string val = i->second;
    opt_.erase(i);
    return parse_size_with_unit(val);
  }

  return default_value;
}

std::chrono::milliseconds
option_map::get_time(std::string const& key,
                     std::chrono::milliseconds default_value) {
  auto i = opt_.find(key);

  if (i != opt_.end()) {
    std::string val = i->second;
    opt_.erase(i);
    return parse_time_with_unit(val);
  }

  return default_value;
}

void option_map::report() {
  if (!opt_.empty()) {
    std::vector<std::string> invalid;
    std::ranges::transform(opt_, std::back_inserter(invalid),
                           [](auto const& p) { return p.first; });
    std::ranges::sort(invalid);
    DIRSPLIT_THROW(runtime_error, fmt::format("unknown option(s): {}",
                                              fmt::join(invalid, ", ")));
  }
}

} // namespace dirsplit
