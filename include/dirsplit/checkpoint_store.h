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

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <folly/Synchronized.h>

#include <dirsplit/types.h>

namespace dirsplit {

// Window-addressed log of opaque payloads. committed_window() is the
// checkpoint boundary: every window up to and including it is durable and
// must be replayed verbatim after a restart.
class checkpoint_store {
 public:
  virtual ~checkpoint_store() = default;

  virtual void save(window_id_t window, std::string_view data) = 0;
  virtual std::optional<std::string> load(window_id_t window) const = 0;
  virtual std::optional<window_id_t> committed_window() const = 0;
  virtual std::vector<window_id_t> window_ids() const = 0;
};

class memory_checkpoint_store : public checkpoint_store {
 public:
  void save(window_id_t window, std::string_view data) override;
  std::optional<std::string> load(window_id_t window) const override;
  std::optional<window_id_t> committed_window() const override;
  std::vector<window_id_t> window_ids() const override;

  void erase(window_id_t window);

 private:
  folly::Synchronized<std::map<window_id_t, std::string>> windows_;
};

} // namespace dirsplit
