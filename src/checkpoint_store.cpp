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

#include <dirsplit/checkpoint_store.h>

namespace dirsplit {

void memory_checkpoint_store::save(window_id_t window, std::string_view data) {
  windows_.wlock()->insert_or_assign(window, std::string(data));
}

std::optional<std::string>
memory_checkpoint_store::load(window_id_t window) const {
  auto windows = windows_.rlock();
  if (auto it = windows->find(window); it != windows->end()) {
    return it->second;
  }
  return std::nullopt;
}

std::optional<window_id_t> memory_checkpoint_store::committed_window() const {
  auto windows = windows_.rlock();
  if (windows->empty()) {
    return std::nullopt;
  }
  return windows->rbegin()->first;
}

std::vector<window_id_t> memory_checkpoint_store::window_ids() const {
  auto windows = windows_.rlock();
  std::vector<window_id_t> ids;
  ids.reserve(windows->size());
  for (auto const& [id, _] : *windows) {
    ids.push_back(id);
  }
  return ids;
}

void memory_checkpoint_store::erase(window_id_t window) {
  windows_.wlock()->erase(window);
}

} // namespace dirsplit
