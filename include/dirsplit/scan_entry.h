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

#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <iosfwd>
#include <string>
#include <utility>

#include <folly/hash/Hash.h>

namespace dirsplit {

// A path reported by the directory scanner. Never modified after creation.
struct scan_entry {
  std::string path;
  int64_t mtime_ns{0};
  bool is_directory{false};
  size_t root_index{0};
  std::string root_path;

  bool operator==(scan_entry const&) const = default;
};

// Dedup key. Entries from different roots never collide.
struct scan_signature {
  size_t root_index{0};
  std::string path;
  int64_t mtime_ns{0};

  scan_signature() = default;

  scan_signature(size_t root, std::string p, int64_t mtime)
      : root_index{root}
      , path{std::move(p)}
      , mtime_ns{mtime} {}

  explicit scan_signature(scan_entry const& e)
      : root_index{e.root_index}
      , path{e.path}
      , mtime_ns{e.mtime_ns} {}

  auto operator<=>(scan_signature const&) const = default;

  size_t hash() const {
    return folly::hash::hash_combine(root_index, path, mtime_ns);
  }
};

std::ostream& operator<<(std::ostream& os, scan_entry const& e);
std::ostream& operator<<(std::ostream& os, scan_signature const& s);

} // namespace dirsplit

template <>
struct std::hash<dirsplit::scan_signature> {
  size_t operator()(dirsplit::scan_signature const& s) const noexcept {
    return s.hash();
  }
};
