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

#include <istream>
#include <regex>
#include <vector>

#include <fmt/format.h>

#include <dirsplit/error.h>
#include <dirsplit/file_splitter_options.h>
#include <dirsplit/option_map.h>
#include <dirsplit/string.h>

namespace dirsplit {

namespace {

file_splitter_options parse_options(option_map& om) {
  file_splitter_options opts;
  auto& sc = opts.scanner;
  auto& sp = opts.splitter;

  if (auto roots = om.get_optional<std::string>("root_paths")) {
    for (auto part : split_to<std::vector<std::string_view>>(*roots, ',')) {
      if (auto root = trim(part); !root.empty()) {
        sc.root_paths.emplace_back(root);
      }
    }
  }

  sc.name_pattern = om.get_optional<std::string>("name_pattern");
  sc.scan_interval = om.get_time("scan_interval", sc.scan_interval);
  sc.manual_trigger = om.get<bool>("manual_trigger", sc.manual_trigger);
  sc.recursive = om.get<bool>("recursive", sc.recursive);
  sc.report_directories =
      om.get<bool>("report_directories", sc.report_directories);

  sp.block_size = om.get_size("block_size", sp.block_size);
  sp.blocks_threshold = om.get_optional<size_t>("blocks_threshold");

  om.report();
  opts.validate();

  return opts;
}

} // namespace

void file_splitter_options::validate() const {
  if (scanner.root_paths.empty()) {
    DIRSPLIT_THROW(runtime_error, "no root paths configured");
  }

  for (auto const& root : scanner.root_paths) {
    if (root.empty()) {
      DIRSPLIT_THROW(runtime_error, "empty root path");
    }
  }

  if (scanner.name_pattern) {
    try {
      std::regex re(*scanner.name_pattern, std::regex::ECMAScript);
    } catch (std::regex_error const& e) {
      DIRSPLIT_THROW(runtime_error,
                     fmt::format("invalid name pattern '{}': {}",
                                 *scanner.name_pattern, e.what()));
    }
  }

  if (scanner.scan_interval.count() < 0) {
    DIRSPLIT_THROW(runtime_error, "scan interval must not be negative");
  }

  if (splitter.block_size == 0) {
    DIRSPLIT_THROW(runtime_error, "block size must be greater than zero");
  }

  if (splitter.blocks_threshold && *splitter.blocks_threshold == 0) {
    DIRSPLIT_THROW(runtime_error,
                   "blocks threshold must be greater than zero");
  }
}

file_splitter_options parse_file_splitter_options(std::string_view text) {
  option_map om(text);
  return parse_options(om);
}

file_splitter_options parse_file_splitter_options(std::istream& is) {
  option_map om(is);
  return parse_options(om);
}

} // namespace dirsplit
