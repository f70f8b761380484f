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

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>

#include <dirsplit/block_splitter_options.h>
#include <dirsplit/scan_entry.h>
#include <dirsplit/split_metadata.h>

namespace dirsplit {

class logger;
class os_access;

class split_output {
 public:
  virtual ~split_output() = default;

  virtual void emit(file_metadata const& fm) = 0;
  virtual void emit(block_metadata const& bm) = 0;
};

// Turns scanned entries into file metadata and cuts files into fixed size
// blocks. Files are split strictly in the order they were added; a file whose
// blocks did not fit into the current window's budget is continued in the
// next window before any later file is started.
class block_splitter {
 public:
  block_splitter(logger& lgr, os_access const& os,
                 block_splitter_options const& options);
  ~block_splitter();

  void begin_window() { impl_->begin_window(); }

  void add(scan_entry const& entry, split_output& out) {
    impl_->add(entry, out);
  }

  size_t emit_blocks(split_output& out) { return impl_->emit_blocks(out); }

  void restore(file_metadata const& fm) { impl_->restore(fm); }
  void restore(block_metadata const& bm) { impl_->restore(bm); }

  size_t pending_files() const { return impl_->pending_files(); }

  std::optional<size_t> remaining_budget() const {
    return impl_->remaining_budget();
  }

  uint64_t next_file_id() const { return impl_->next_file_id(); }

  class impl {
   public:
    virtual ~impl() = default;

    virtual void begin_window() = 0;
    virtual void add(scan_entry const& entry, split_output& out) = 0;
    virtual size_t emit_blocks(split_output& out) = 0;
    virtual void restore(file_metadata const& fm) = 0;
    virtual void restore(block_metadata const& bm) = 0;
    virtual size_t pending_files() const = 0;
    virtual std::optional<size_t> remaining_budget() const = 0;
    virtual uint64_t next_file_id() const = 0;
  };

 private:
  std::unique_ptr<impl> impl_;
};

} // namespace dirsplit
