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

#include <cstdint>
#include <iosfwd>
#include <string>
#include <variant>

#include <dirsplit/types.h>

namespace dirsplit {

struct file_metadata {
  uint64_t file_id{0};
  std::string file_path;
  std::string file_name;
  // relative to the parent of the discovery root
  std::string relative_path;
  file_size_t file_length{0};
  bool is_directory{false};
  int64_t mtime_ns{0};
  int64_t discovery_time_ns{0};
  uint64_t num_blocks{0};
  size_t root_index{0};

  bool operator==(file_metadata const&) const = default;
};

struct block_metadata {
  uint64_t block_id{0};
  uint64_t file_id{0};
  std::string file_path;
  file_off_t offset{0};
  file_size_t length{0};
  bool is_last_block{false};

  bool operator==(block_metadata const&) const = default;
};

using split_record = std::variant<file_metadata, block_metadata>;

uint64_t num_blocks_for(file_size_t length, file_size_t block_size);

std::ostream& operator<<(std::ostream& os, file_metadata const& fm);
std::ostream& operator<<(std::ostream& os, block_metadata const& bm);
std::ostream& operator<<(std::ostream& os, split_record const& rec);

} // namespace dirsplit
