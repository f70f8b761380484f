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

#include <system_error>

#include <fmt/format.h>

#include <dirsplit/error.h>
#include <dirsplit/os_access_generic.h>

namespace dirsplit {

namespace fs = std::filesystem;

namespace {

class generic_dir_reader final : public dir_reader {
 public:
  explicit generic_dir_reader(fs::path const& path) {
    std::error_code ec;
    it_ = fs::directory_iterator(path, ec);
    if (ec) {
      DIRSPLIT_THROW(system_error,
                     fmt::format("opendir: {}", path.string()), ec);
    }
  }

  bool read(fs::path& name) override {
    if (it_ == fs::directory_iterator()) {
      return false;
    }

    name.assign(it_->path());

    std::error_code ec;
    it_.increment(ec);
    if (ec) {
      DIRSPLIT_THROW(system_error,
                     fmt::format("readdir: {}", name.parent_path().string()),
                     ec);
    }

    return true;
  }

 private:
  fs::directory_iterator it_;
};

} // namespace

std::unique_ptr<dir_reader>
os_access_generic::opendir(fs::path const& path) const {
  return std::make_unique<generic_dir_reader>(path);
}

file_stat os_access_generic::symlink_info(fs::path const& path) const {
  return file_stat(path);
}

fs::path os_access_generic::canonical(fs::path const& path) const {
  std::error_code ec;
  auto p = fs::canonical(path, ec);
  if (ec) {
    DIRSPLIT_THROW(system_error,
                   fmt::format("canonical: {}", path.string()), ec);
  }
  return p;
}

} // namespace dirsplit
