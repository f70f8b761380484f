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

#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#include <dirsplit/logger.h>
#include <dirsplit/util.h>

namespace dirsplit::test {

class test_logger : public ::dirsplit::logger {
 public:
  struct log_entry {
    log_entry(level_type level, std::string_view output, source_location loc)
        : level{level}
        , output{output}
        , loc{loc} {}

    level_type level;
    std::string output;
    source_location loc;
  };

  test_logger(std::optional<level_type> threshold = std::nullopt)
      : threshold_{threshold ? *threshold : default_threshold()}
      , output_threshold_{output_threshold(default_threshold())}
      , output_{::dirsplit::getenv_is_enabled("DIRSPLIT_TEST_LOGGER_OUTPUT")} {
    if (threshold_ >= level_type::DEBUG ||
        (output_ && output_threshold_ >= level_type::DEBUG)) {
      set_policy<debug_logger_policy>();
    } else {
      set_policy<prod_logger_policy>();
    }
  }

  level_type threshold() const override {
    return output_ ? std::max(threshold_, output_threshold_) : threshold_;
  }

  void write(level_type level, std::string_view output,
             source_location loc) override {
    if (output_ && level <= output_threshold_) {
      auto const t = get_current_time_string();
      std::lock_guard lock(mx_);
      std::cerr << level_char(level) << ' ' << t << " ["
                << basename(loc.file_name()) << ":" << loc.line() << "] "
                << output << "\n";
    }

    if (level <= threshold_) {
      std::lock_guard lock(mx_);
      log_.emplace_back(level, output, loc);
    }
  }

  std::vector<log_entry> get_log() const {
    std::lock_guard lock(mx_);
    return log_;
  }

  // number of entries at `level` whose message contains `needle`
  size_t count(level_type level, std::string_view needle = {}) const {
    std::lock_guard lock(mx_);
    return std::ranges::count_if(log_, [&](auto const& e) {
      return e.level == level &&
             e.output.find(needle) != std::string::npos;
    });
  }

  std::string as_string() const {
    std::lock_guard lock(mx_);
    std::ostringstream oss;
    for (auto const& entry : log_) {
      oss << level_char(entry.level) << " [" << basename(entry.loc.file_name())
          << ":" << entry.loc.line() << "] " << entry.output << "\n";
    }
    return oss.str();
  }

  bool empty() const {
    std::lock_guard lock(mx_);
    return log_.empty();
  }

  void clear() {
    std::lock_guard lock(mx_);
    log_.clear();
  }

  friend std::ostream& operator<<(std::ostream& os, test_logger const& logger) {
    os << logger.as_string();
    return os;
  }

 private:
  static level_type default_threshold() { return level_type::INFO; }

  static level_type output_threshold(level_type default_level) {
    if (auto var = std::getenv("DIRSPLIT_TEST_LOGGER_LEVEL")) {
      return ::dirsplit::logger::parse_level(var);
    }
    return default_level;
  }

  std::mutex mutable mx_;
  std::vector<log_entry> log_;
  level_type const threshold_;
  level_type const output_threshold_;
  bool const output_;
};

} // namespace dirsplit::test
