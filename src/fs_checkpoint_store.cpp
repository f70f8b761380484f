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
#include <cerrno>
#include <system_error>
#include <utility>

#include <fmt/format.h>

#include <dirsplit/conv.h>
#include <dirsplit/error.h>
#include <dirsplit/file_util.h>
#include <dirsplit/fs_checkpoint_store.h>

namespace dirsplit {

namespace fs = std::filesystem;

namespace {

constexpr std::string_view window_extension{".window"};

} // namespace

fs_checkpoint_store::fs_checkpoint_store(fs::path dir)
    : dir_{std::move(dir)} {
  std::error_code ec;
  fs::create_directories(dir_, ec);
  if (ec) {
    DIRSPLIT_THROW(system_error,
                   fmt::format("cannot create checkpoint directory {}",
                               dir_.string()),
                   ec);
  }
}

fs::path fs_checkpoint_store::window_path(window_id_t window) const {
  return dir_ / fmt::format("{:020}{}", window, window_extension);
}

void fs_checkpoint_store::save(window_id_t window, std::string_view data) {
  write_file_atomic(window_path(window), data);
}

std::optional<std::string>
fs_checkpoint_store::load(window_id_t window) const {
  std::error_code ec;
  auto content = read_file(window_path(window), ec);

  if (ec) {
    if (ec == std::errc::no_such_file_or_directory) {
      return std::nullopt;
    }
    DIRSPLIT_THROW(system_error,
                   fmt::format("cannot load window {}", window), ec);
  }

  return content;
}

std::optional<window_id_t> fs_checkpoint_store::committed_window() const {
  auto ids = window_ids();
  if (ids.empty()) {
    return std::nullopt;
  }
  return ids.back();
}

std::vector<window_id_t> fs_checkpoint_store::window_ids() const {
  std::vector<window_id_t> ids;
  std::error_code ec;

  for (fs::directory_iterator it(dir_, ec), end; !ec && it != end;
       it.increment(ec)) {
    auto const& p = it->path();

    if (p.extension() != window_extension) {
      continue;
    }

    if (auto id = try_to<window_id_t>(p.stem().string())) {
      ids.push_back(*id);
    }
  }

  if (ec) {
    DIRSPLIT_THROW(system_error,
                   fmt::format("cannot list checkpoint directory {}",
                               dir_.string()),
                   ec);
  }

  std::ranges::sort(ids);

  return ids;
}

} // namespace dirsplit
