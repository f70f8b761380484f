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
#include <memory>
#include <ostream>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include <fmt/format.h>

#include <dirsplit/block_splitter.h>
#include <dirsplit/checkpoint_store.h>
#include <dirsplit/directory_scanner.h>
#include <dirsplit/error.h>
#include <dirsplit/file_splitter_input.h>
#include <dirsplit/logger.h>
#include <dirsplit/os_access.h>

#include <dirsplit/internal/record_codec.h>

namespace dirsplit {

std::string_view window_phase_name(window_phase phase) {
  switch (phase) {
  case window_phase::pending:
    return "pending";
  case window_phase::replaying:
    return "replaying";
  case window_phase::live:
    return "live";
  case window_phase::complete:
    return "complete";
  }
  return "unknown";
}

std::ostream& operator<<(std::ostream& os, window_phase phase) {
  return os << window_phase_name(phase);
}

namespace internal {

template <typename LoggerPolicy>
class file_splitter_input_ final : public file_splitter_input::impl {
 public:
  file_splitter_input_(logger& lgr, std::shared_ptr<os_access const> os,
                       file_splitter_options const& options,
                       std::shared_ptr<checkpoint_store> store)
      : LOG_PROXY_INIT(lgr)
      , os_{std::move(os)}
      , options_{options}
      , store_{std::move(store)} {
    DIRSPLIT_CHECK(os_, "os_access must not be null");
  }

  ~file_splitter_input_() override { teardown(); }

  void set_file_metadata_sink(
      file_splitter_input::file_metadata_sink sink) override {
    file_sink_ = std::move(sink);
  }

  void set_block_metadata_sink(
      file_splitter_input::block_metadata_sink sink) override {
    block_sink_ = std::move(sink);
  }

  void setup() override;
  void begin_window(window_id_t window) override;
  void emit_tuples() override;
  void end_window() override;

  void teardown() override {
    torn_down_ = true;
    if (scanner_ && scanner_->running()) {
      LOG_DEBUG << "stopping scanner";
      scanner_->stop();
    }
  }

  window_phase phase() const override { return phase_; }

  std::optional<window_id_t> current_window() const override {
    return current_window_;
  }

  std::optional<window_id_t> committed_window() const override {
    return boundary_;
  }

  directory_scanner& scanner() override {
    ensure_setup();
    return *scanner_;
  }

  block_splitter const& splitter() const override {
    ensure_setup();
    return *splitter_;
  }

 private:
  // collects everything emitted in a live window and forwards it to the sinks
  class window_output final : public split_output {
   public:
    explicit window_output(file_splitter_input_& self)
        : self_{self} {}

    void emit(file_metadata const& fm) override {
      self_.records_.emplace_back(fm);
      self_.send(fm);
    }

    void emit(block_metadata const& bm) override {
      self_.records_.emplace_back(bm);
      self_.send(bm);
    }

   private:
    file_splitter_input_& self_;
  };

  void ensure_setup() const {
    if (!scanner_) {
      DIRSPLIT_THROW(runtime_error, "file splitter input is not set up");
    }
  }

  // entries discarded by teardown() are only recovered by a new instance
  void ensure_active(std::string_view what) const {
    if (torn_down_) {
      DIRSPLIT_THROW(runtime_error,
                     fmt::format("{} after teardown()", what));
    }
  }

  void send(file_metadata const& fm) const {
    if (file_sink_) {
      file_sink_(fm);
    }
  }

  void send(block_metadata const& bm) const {
    if (block_sink_) {
      block_sink_(bm);
    }
  }

  void catch_up(window_id_t window);
  void replay(window_id_t window);
  void apply(std::vector<split_record> const& records, bool emit);

  LOG_PROXY_DECL(LoggerPolicy);
  std::shared_ptr<os_access const> os_;
  file_splitter_options const options_;
  std::shared_ptr<checkpoint_store> store_;
  std::unique_ptr<directory_scanner> scanner_;
  std::unique_ptr<block_splitter> splitter_;
  file_splitter_input::file_metadata_sink file_sink_;
  file_splitter_input::block_metadata_sink block_sink_;
  window_phase phase_{window_phase::pending};
  bool torn_down_{false};
  std::optional<window_id_t> current_window_;
  std::optional<window_id_t> boundary_;
  std::optional<window_id_t> last_applied_;
  std::vector<split_record> records_;
};

template <typename LoggerPolicy>
void file_splitter_input_<LoggerPolicy>::setup() {
  if (scanner_) {
    DIRSPLIT_THROW(runtime_error, "file splitter input is already set up");
  }

  options_.validate();

  auto scanner =
      std::make_unique<directory_scanner>(LOG_GET_LOGGER, *os_, options_.scanner);
  auto splitter =
      std::make_unique<block_splitter>(LOG_GET_LOGGER, *os_, options_.splitter);

  if (store_) {
    boundary_ = store_->committed_window();
  }

  scanner_ = std::move(scanner);
  splitter_ = std::move(splitter);

  if (boundary_) {
    LOG_INFO << "checkpoint boundary is window " << *boundary_
             << ", earlier windows will be replayed";
  } else {
    LOG_VERBOSE << "no committed windows, starting live";
  }
}

template <typename LoggerPolicy>
void file_splitter_input_<LoggerPolicy>::begin_window(window_id_t window) {
  ensure_setup();
  ensure_active("begin_window()");

  if (phase_ == window_phase::live || phase_ == window_phase::replaying) {
    DIRSPLIT_THROW(runtime_error,
                   fmt::format("cannot begin window {}, window {} is still {}",
                               window, current_window_.value(),
                               window_phase_name(phase_)));
  }

  if (current_window_ && window <= *current_window_) {
    DIRSPLIT_THROW(runtime_error,
                   fmt::format("window ids must increase: {} after {}", window,
                               *current_window_));
  }

  records_.clear();

  // a store failure leaves the window unopened, so it can be retried
  catch_up(window);

  if (boundary_ && window <= *boundary_) {
    replay(window);
    current_window_ = window;
    phase_ = window_phase::replaying;
    return;
  }

  current_window_ = window;
  phase_ = window_phase::live;
  last_applied_ = window;
  splitter_->begin_window();

  if (!scanner_->running()) {
    LOG_VERBOSE << "window " << window << " is live, starting scanner";
    scanner_->start();
  }
}

template <typename LoggerPolicy>
void file_splitter_input_<LoggerPolicy>::emit_tuples() {
  ensure_active("emit_tuples()");

  if (phase_ != window_phase::live) {
    return;
  }

  if (auto err = scanner_->take_error()) {
    std::rethrow_exception(err);
  }

  std::vector<scan_entry> entries;
  scanner_->drain(entries);

  window_output out(*this);

  for (auto const& e : entries) {
    splitter_->add(e, out);
  }

  auto blocks = splitter_->emit_blocks(out);

  if (!entries.empty() || blocks > 0) {
    LOG_DEBUG << "window " << *current_window_ << ": " << entries.size()
              << " new entries, " << blocks << " blocks";
  }
}

template <typename LoggerPolicy>
void file_splitter_input_<LoggerPolicy>::end_window() {
  if (phase_ != window_phase::live && phase_ != window_phase::replaying) {
    DIRSPLIT_THROW(runtime_error, "end_window() without an open window");
  }

  auto const window = current_window_.value();

  if (phase_ == window_phase::live) {
    if (store_) {
      store_->save(window, encode_window(window, records_));
    }

    auto const nblocks = static_cast<size_t>(
        std::ranges::count_if(records_, [](auto const& r) {
          return std::holds_alternative<block_metadata>(r);
        }));

    LOG_VERBOSE << "window " << window << " complete: "
                << records_.size() - nblocks << " file records, " << nblocks
                << " block records, " << splitter_->pending_files()
                << " file(s) pending";
  }

  records_.clear();
  phase_ = window_phase::complete;
}

template <typename LoggerPolicy>
void file_splitter_input_<LoggerPolicy>::catch_up(window_id_t window) {
  if (!store_ || !boundary_) {
    return;
  }

  auto const limit = std::min(window, *boundary_ + 1);

  if (last_applied_ && *last_applied_ + 1 >= limit) {
    return;
  }

  size_t applied = 0;

  for (auto id : store_->window_ids()) {
    if (id >= limit) {
      break;
    }

    if (last_applied_ && id <= *last_applied_) {
      continue;
    }

    if (auto data = store_->load(id)) {
      apply(decode_window(id, *data), false);
      ++applied;
    }

    last_applied_ = id;
  }

  if (applied > 0) {
    LOG_VERBOSE << "restored state from " << applied
                << " stored window(s) before window " << window;
  }
}

template <typename LoggerPolicy>
void file_splitter_input_<LoggerPolicy>::replay(window_id_t window) {
  if (auto data = store_->load(window)) {
    auto records = decode_window(window, *data);
    apply(records, true);
    LOG_DEBUG << "replayed window " << window << " (" << records.size()
              << " records)";
  } else {
    LOG_WARN << "window " << window
             << " is not in the checkpoint store, replaying as empty";
  }

  last_applied_ = window;
}

template <typename LoggerPolicy>
void file_splitter_input_<LoggerPolicy>::apply(
    std::vector<split_record> const& records, bool emit) {
  for (auto const& rec : records) {
    if (auto fm = std::get_if<file_metadata>(&rec)) {
      scanner_->restore(
          scan_signature(fm->root_index, fm->file_path, fm->mtime_ns));
      splitter_->restore(*fm);
      if (emit) {
        send(*fm);
      }
    } else {
      auto const& bm = std::get<block_metadata>(rec);
      splitter_->restore(bm);
      if (emit) {
        send(bm);
      }
    }
  }
}

} // namespace internal

file_splitter_input::file_splitter_input(logger& lgr,
                                         std::shared_ptr<os_access const> os,
                                         file_splitter_options const& options,
                                         std::shared_ptr<checkpoint_store> store)
    : impl_{make_unique_logging_object<impl, internal::file_splitter_input_,
                                       logger_policies>(
          lgr, std::move(os), options, std::move(store))} {}

file_splitter_input::~file_splitter_input() = default;

} // namespace dirsplit
