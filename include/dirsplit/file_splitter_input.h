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

#include <functional>
#include <iosfwd>
#include <memory>
#include <optional>
#include <string_view>
#include <utility>

#include <dirsplit/file_splitter_options.h>
#include <dirsplit/split_metadata.h>
#include <dirsplit/types.h>

namespace dirsplit {

class block_splitter;
class checkpoint_store;
class directory_scanner;
class logger;
class os_access;

enum class window_phase { pending, replaying, live, complete };

std::string_view window_phase_name(window_phase phase);
std::ostream& operator<<(std::ostream& os, window_phase phase);

/**
 * Input operator that discovers files and emits file and block metadata
 * once per engine window.
 *
 * Windows up to the checkpoint boundary of the store are replayed verbatim
 * from the store without touching the file system. Later windows are driven
 * by the directory scanner and block splitter, and their output is saved to
 * the store in end_window(). State needed to continue after a restart is
 * rebuilt by applying all stored windows in order.
 */
class file_splitter_input {
 public:
  using file_metadata_sink = std::function<void(file_metadata const&)>;
  using block_metadata_sink = std::function<void(block_metadata const&)>;

  file_splitter_input(logger& lgr, std::shared_ptr<os_access const> os,
                      file_splitter_options const& options,
                      std::shared_ptr<checkpoint_store> store = nullptr);
  ~file_splitter_input();

  void set_file_metadata_sink(file_metadata_sink sink) {
    impl_->set_file_metadata_sink(std::move(sink));
  }

  void set_block_metadata_sink(block_metadata_sink sink) {
    impl_->set_block_metadata_sink(std::move(sink));
  }

  void setup() { impl_->setup(); }
  void begin_window(window_id_t window) { impl_->begin_window(window); }
  void emit_tuples() { impl_->emit_tuples(); }
  void end_window() { impl_->end_window(); }
  void teardown() { impl_->teardown(); }

  window_phase phase() const { return impl_->phase(); }

  std::optional<window_id_t> current_window() const {
    return impl_->current_window();
  }

  // checkpoint boundary as read during setup()
  std::optional<window_id_t> committed_window() const {
    return impl_->committed_window();
  }

  directory_scanner& scanner() { return impl_->scanner(); }
  block_splitter const& splitter() const { return impl_->splitter(); }

  class impl {
   public:
    virtual ~impl() = default;

    virtual void set_file_metadata_sink(file_metadata_sink sink) = 0;
    virtual void set_block_metadata_sink(block_metadata_sink sink) = 0;
    virtual void setup() = 0;
    virtual void begin_window(window_id_t window) = 0;
    virtual void emit_tuples() = 0;
    virtual void end_window() = 0;
    virtual void teardown() = 0;
    virtual window_phase phase() const = 0;
    virtual std::optional<window_id_t> current_window() const = 0;
    virtual std::optional<window_id_t> committed_window() const = 0;
    virtual directory_scanner& scanner() = 0;
    virtual block_splitter const& splitter() const = 0;
  };

 private:
  std::unique_ptr<impl> impl_;
};

} // namespace dirsplit
