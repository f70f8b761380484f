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

#include <ostream>

#include <fmt/format.h>

#include <dirsplit/scan_entry.h>
#include <dirsplit/split_metadata.h>

namespace dirsplit {

uint64_t num_blocks_for(file_size_t length, file_size_t block_size) {
  return (length + block_size - 1) / block_size;
}

std::ostream& operator<<(std::ostream& os, scan_entry const& e) {
  return os << fmt::format("{}{} (root #{}, mtime={})", e.path,
                           e.is_directory ? "/" : "", e.root_index,
                           e.mtime_ns);
}

std::ostream& operator<<(std::ostream& os, scan_signature const& s) {
  return os << fmt::format("[{}] {}@{}", s.root_index, s.path, s.mtime_ns);
}

std::ostream& operator<<(std::ostream& os, file_metadata const& fm) {
  return os << fmt::format("file #{} {} ({}, {} bytes, {} blocks)", fm.file_id,
                           fm.file_path, fm.is_directory ? "dir" : "file",
                           fm.file_length, fm.num_blocks);
}

std::ostream& operator<<(std::ostream& os, block_metadata const& bm) {
  return os << fmt::format("block {}/#{} {} [{}, +{}){}", bm.file_id,
                           bm.block_id, bm.file_path, bm.offset, bm.length,
                           bm.is_last_block ? " last" : "");
}

std::ostream& operator<<(std::ostream& os, split_record const& rec) {
  std::visit([&os](auto const& r) { os << r; }, rec);
  return os;
}

} // namespace dirsplit
