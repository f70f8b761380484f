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
#include <exception>
#include <memory>
#include <utility>
#include <vector>

#include <dirsplit/directory_scanner_options.h>
#include <dirsplit/scan_entry.h>

namespace dirsplit {

class logger;
class os_access;

class scan_observer {
 public:
  virtual ~scan_observer() = default;

  // called after each scan iteration, possibly from the scanner thread
  virtual void on_scan_complete(size_t num_discovered) = 0;
};

// Walks the configured roots and queues every entry whose signature has not
// been seen before. Runs either in its own thread (start/stop) or driven by
// the caller (scan_once). Recorded signatures are kept for the lifetime of
// the object.
class directory_scanner {
 public:
  directory_scanner(logger& lgr, os_access const& os,
                    directory_scanner_options const& options);
  ~directory_scanner();

  void start() { impl_->start(); }
  void stop() { impl_->stop(); }
  bool running() const { return impl_->running(); }
  void trigger() { impl_->trigger(); }

  size_t scan_once() { return impl_->scan_once(); }

  void drain(std::vector<scan_entry>& out) { impl_->drain(out); }

  bool restore(scan_signature const& sig) { return impl_->restore(sig); }

  void add_observer(std::shared_ptr<scan_observer> obs) {
    impl_->add_observer(std::move(obs));
  }

  size_t num_signatures() const { return impl_->num_signatures(); }

  // error that escaped the scanner thread, if any; clears it
  std::exception_ptr take_error() { return impl_->take_error(); }

  class impl {
   public:
    virtual ~impl() = default;

    virtual void start() = 0;
    virtual void stop() = 0;
    virtual bool running() const = 0;
    virtual void trigger() = 0;
    virtual size_t scan_once() = 0;
    virtual void drain(std::vector<scan_entry>& out) = 0;
    virtual bool restore(scan_signature const& sig) = 0;
    virtual void add_observer(std::shared_ptr<scan_observer> obs) = 0;
    virtual size_t num_signatures() const = 0;
    virtual std::exception_ptr take_error() = 0;
  };

 private:
  std::unique_ptr<impl> impl_;
};

} // namespace dirsplit
