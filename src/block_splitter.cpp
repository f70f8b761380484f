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
#include <chrono>
#include <deque>
#include <filesystem>

#include <fmt/format.h>

#include <dirsplit/block_splitter.h>
#include <dirsplit/error.h>
#include <dirsplit/logger.h>
#include <dirsplit/os_access.h>
#include <dirsplit/util.h>

namespace dirsplit {

namespace fs = std::filesystem;

namespace internal {

namespace {

struct split_cursor {
  file_metadata file;
  file_off_t next_offset{0};
  uint64_t blocks_emitted{0};
  // splitter window in which this cursor was last checked
  uint64_t checked_window{0};
};

std::string relative_to_root_parent(std::string const& path,
                                    std::string const& root) {
  auto base = fs::path(root).parent_path();
  return fs::path(path).lexically_relative(base).string();
}

int64_t now_ns() {
  return std::chrono::duration_cast<std::chrono::nanoseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

} // namespace

template <typename LoggerPolicy>
class block_splitter_ final : public block_splitter::impl {
 public:
  block_splitter_(logger& lgr, os_access const& os,
                  block_splitter_options const& options)
      : LOG_PROXY_INIT(lgr)
      , os_{os}
      , options_{options}
      , budget_{options.blocks_threshold} {
    if (options_.block_size == 0) {
      DIRSPLIT_THROW(runtime_error, "block size must be greater than zero");
    }
    if (options_.blocks_threshold && *options_.blocks_threshold == 0) {
      DIRSPLIT_THROW(runtime_error,
                     "blocks threshold must be greater than zero");
    }
  }

  void begin_window() override {
    ++window_;
    budget_ = options_.blocks_threshold;
  }

  void add(scan_entry const& entry, split_output& out) override;
  size_t emit_blocks(split_output& out) override;
  void restore(file_metadata const& fm) override;
  void restore(block_metadata const& bm) override;

  size_t pending_files() const override { return cursors_.size(); }

  std::optional<size_t> remaining_budget() const override { return budget_; }

  uint64_t next_file_id() const override { return next_file_id_; }

 private:
  bool budget_exhausted() const { return budget_ && *budget_ == 0; }

  bool still_splittable(split_cursor const& c) const;
  block_metadata next_block(split_cursor const& c) const;

  static void advance(split_cursor& c, block_metadata const& bm) {
    c.next_offset += static_cast<file_off_t>(bm.length);
    ++c.blocks_emitted;
  }

  LOG_PROXY_DECL(LoggerPolicy);
  os_access const& os_;
  block_splitter_options const options_;
  std::deque<split_cursor> cursors_;
  std::optional<size_t> budget_;
  uint64_t next_file_id_{0};
  uint64_t window_{0};
};

template <typename LoggerPolicy>
void block_splitter_<LoggerPolicy>::add(scan_entry const& entry,
                                        split_output& out) {
  file_metadata fm;

  fm.file_id = next_file_id_++;
  fm.file_path = entry.path;
  fm.file_name = fs::path(entry.path).filename().string();
  fm.relative_path = relative_to_root_parent(entry.path, entry.root_path);
  fm.mtime_ns = entry.mtime_ns;
  fm.discovery_time_ns = now_ns();
  fm.root_index = entry.root_index;
  fm.is_directory = entry.is_directory;

  auto st = os_.symlink_info(entry.path);

  try {
    fm.is_directory = st.is_directory();
    if (!fm.is_directory) {
      fm.file_length = static_cast<file_size_t>(st.size());
    }
  } catch (system_error const& e) {
    LOG_WARN << "cannot stat '" << entry.path
             << "', treating as empty: " << exception_str(e);
    fm.file_length = 0;
  }

  if (!fm.is_directory) {
    fm.num_blocks = num_blocks_for(fm.file_length, options_.block_size);
  }

  LOG_DEBUG << "sighting: " << fm;

  out.emit(fm);

  if (fm.num_blocks > 0) {
    cursors_.push_back(split_cursor{std::move(fm), 0, 0, window_});
  }
}

template <typename LoggerPolicy>
size_t block_splitter_<LoggerPolicy>::emit_blocks(split_output& out) {
  size_t emitted = 0;

  while (!cursors_.empty() && !budget_exhausted()) {
    auto& c = cursors_.front();

    if (c.checked_window != window_) {
      c.checked_window = window_;

      if (!still_splittable(c)) {
        cursors_.pop_front();
        continue;
      }
    }

    auto bm = next_block(c);
    out.emit(bm);
    advance(c, bm);
    ++emitted;

    if (budget_) {
      --*budget_;
    }

    if (bm.is_last_block) {
      LOG_TRACE << "finished splitting " << c.file.file_path;
      cursors_.pop_front();
    }
  }

  if (budget_exhausted() && !cursors_.empty()) {
    LOG_DEBUG << "block budget exhausted, " << cursors_.size()
              << " file(s) carried over";
  }

  return emitted;
}

template <typename LoggerPolicy>
void block_splitter_<LoggerPolicy>::restore(file_metadata const& fm) {
  next_file_id_ = std::max(next_file_id_, fm.file_id + 1);

  if (fm.num_blocks > 0) {
    cursors_.push_back(split_cursor{fm, 0, 0, window_});
  }
}

template <typename LoggerPolicy>
void block_splitter_<LoggerPolicy>::restore(block_metadata const& bm) {
  // files dropped while live have no further blocks in the record stream
  while (!cursors_.empty() && cursors_.front().file.file_id < bm.file_id) {
    LOG_DEBUG << "dropping cursor for " << cursors_.front().file.file_path
              << " during restore";
    cursors_.pop_front();
  }

  if (cursors_.empty()) {
    DIRSPLIT_THROW(runtime_error,
                   fmt::format("replay inconsistency: block {} of file #{} "
                               "has no matching file record",
                               bm.block_id, bm.file_id));
  }

  auto& c = cursors_.front();

  if (c.file.file_id != bm.file_id || c.next_offset != bm.offset ||
      c.blocks_emitted != bm.block_id) {
    DIRSPLIT_THROW(
        runtime_error,
        fmt::format("replay inconsistency: expected block {} of file #{} at "
                    "offset {}, got block {} of file #{} at offset {}",
                    c.blocks_emitted, c.file.file_id, c.next_offset,
                    bm.block_id, bm.file_id, bm.offset));
  }

  advance(c, bm);

  if (bm.is_last_block) {
    cursors_.pop_front();
  }
}

template <typename LoggerPolicy>
bool block_splitter_<LoggerPolicy>::still_splittable(
    split_cursor const& c) const {
  auto st = os_.symlink_info(c.file.file_path);

  try {
    if (st.is_regular_file()) {
      return true;
    }
    LOG_WARN << "'" << c.file.file_path << "' is no longer a regular file, "
             << "skipping remaining "
             << c.file.num_blocks - c.blocks_emitted << " block(s)";
  } catch (system_error const& e) {
    LOG_WARN << "'" << c.file.file_path << "' vanished, skipping remaining "
             << c.file.num_blocks - c.blocks_emitted
             << " block(s): " << exception_str(e);
  }

  return false;
}

template <typename LoggerPolicy>
block_metadata
block_splitter_<LoggerPolicy>::next_block(split_cursor const& c) const {
  block_metadata bm;

  bm.block_id = c.blocks_emitted;
  bm.file_id = c.file.file_id;
  bm.file_path = c.file.file_path;
  bm.offset = c.next_offset;
  bm.length = std::min<file_size_t>(
      options_.block_size,
      c.file.file_length - static_cast<file_size_t>(c.next_offset));
  bm.is_last_block = bm.block_id + 1 == c.file.num_blocks;

  return bm;
}

} // namespace internal

block_splitter::block_splitter(logger& lgr, os_access const& os,
                               block_splitter_options const& options)
    : impl_{make_unique_logging_object<impl, internal::block_splitter_,
                                       logger_policies>(lgr, os, options)} {}

block_splitter::~block_splitter() = default;

} // namespace dirsplit
