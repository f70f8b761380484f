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

#include <cerrno>

#include <sys/stat.h>
#include <sys/types.h>

#include <fmt/format.h>

#include <dirsplit/error.h>
#include <dirsplit/file_stat.h>

namespace dirsplit {

namespace fs = std::filesystem;

std::string_view posix_file_type::name(value type) {
  switch (type) {
  case regular:
    return "file";
  case directory:
    return "directory";
  case symlink:
    return "symlink";
  case block:
    return "block device";
  case character:
    return "character device";
  case fifo:
    return "fifo";
  case socket:
    return "socket";
  }
  return "unknown";
}

file_stat::file_stat() = default;

file_stat::file_stat(fs::path const& path) {
  struct ::stat st;

  if (::lstat(path.c_str(), &st) != 0) {
    exception_ = std::make_exception_ptr(
        system_error(fmt::format("lstat: {}", path.string()), errno,
                     DIRSPLIT_CURRENT_SOURCE_LOCATION));
    return;
  }

  valid_fields_ = all_valid;
  mode_ = st.st_mode;
  size_ = st.st_size;
  mtime_ns_ = static_cast<time_type>(st.st_mtim.tv_sec) * 1'000'000'000 +
              st.st_mtim.tv_nsec;
}

void file_stat::ensure_valid(valid_fields_type fields) const {
  if ((valid_fields_ & fields) != fields) {
    if (exception_) {
      std::rethrow_exception(exception_);
    } else {
      DIRSPLIT_THROW(runtime_error,
                     fmt::format("missing stat fields: {:#x} (have: {:#x})",
                                 fields, valid_fields_));
    }
  }
}

posix_file_type::value file_stat::type() const {
  ensure_valid(mode_valid);
  return posix_file_type::from_mode(mode_);
}

file_stat::mode_type file_stat::mode() const {
  ensure_valid(mode_valid);
  return mode_;
}

void file_stat::set_mode(mode_type mode) {
  valid_fields_ |= mode_valid;
  mode_ = mode;
}

file_stat::off_type file_stat::size() const {
  ensure_valid(size_valid);
  return size_;
}

void file_stat::set_size(off_type size) {
  valid_fields_ |= size_valid;
  size_ = size;
}

file_stat::time_type file_stat::mtime_ns() const {
  ensure_valid(mtime_valid);
  return mtime_ns_;
}

void file_stat::set_mtime_ns(time_type mtime) {
  valid_fields_ |= mtime_valid;
  mtime_ns_ = mtime;
}

bool file_stat::is_directory() const {
  return type() == posix_file_type::directory;
}

bool file_stat::is_regular_file() const {
  return type() == posix_file_type::regular;
}

bool file_stat::is_symlink() const {
  return type() == posix_file_type::symlink;
}

} // namespace dirsplit
