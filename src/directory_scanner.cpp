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
#include <atomic>
#include <condition_variable>
#include <deque>
#include <iterator>
#include <mutex>
#include <optional>
#include <regex>
#include <thread>
#include <unordered_set>
#include <utility>

#include <folly/Synchronized.h>
#include <folly/system/ThreadName.h>

#include <fmt/format.h>

#include <dirsplit/directory_scanner.h>
#include <dirsplit/error.h>
#include <dirsplit/logger.h>
#include <dirsplit/os_access.h>
#include <dirsplit/util.h>

namespace dirsplit {

namespace fs = std::filesystem;

namespace internal {

namespace {

fs::path normalize_root(fs::path const& p) {
  auto norm = fs::absolute(p).lexically_normal();
  if (!norm.has_filename() && norm.has_relative_path()) {
    norm = norm.parent_path();
  }
  return norm;
}

std::optional<std::regex>
compile_pattern(std::optional<std::string> const& pattern) {
  if (!pattern) {
    return std::nullopt;
  }
  try {
    return std::regex(*pattern, std::regex::ECMAScript);
  } catch (std::regex_error const& e) {
    DIRSPLIT_THROW(runtime_error, fmt::format("invalid name pattern '{}': {}",
                                              *pattern, e.what()));
  }
}

} // namespace

template <typename LoggerPolicy>
class directory_scanner_ final : public directory_scanner::impl {
 public:
  directory_scanner_(logger& lgr, os_access const& os,
                     directory_scanner_options const& options)
      : LOG_PROXY_INIT(lgr)
      , os_{os}
      , options_{options}
      , pattern_{compile_pattern(options.name_pattern)}
      , trigger_{options.manual_trigger} {
    std::ranges::transform(options.root_paths, std::back_inserter(roots_),
                           normalize_root);
  }

  ~directory_scanner_() override { stop(); }

  void start() override {
    std::lock_guard lock(mx_);
    if (!running_.load()) {
      LOG_DEBUG << "starting scanner thread for " << roots_.size()
                << " root(s)";
      running_.store(true);
      thread_.emplace(&directory_scanner_::run, this);
    }
  }

  void stop() override {
    std::unique_lock lock(mx_);
    if (running_.load()) {
      running_.store(false);
      stop_requested_.store(true);
      lock.unlock();
      cv_.notify_all();
      thread_->join();
      thread_.reset();
      stop_requested_.store(false);

      auto discarded = std::exchange(*queue_.wlock(), {});
      LOG_DEBUG << "scanner thread stopped, discarded " << discarded.size()
                << " queued entries";
    }
  }

  bool running() const override { return running_.load(); }

  void trigger() override {
    {
      std::lock_guard lock(mx_);
      trigger_ = true;
    }
    cv_.notify_all();
  }

  size_t scan_once() override;

  void drain(std::vector<scan_entry>& out) override {
    auto q = queue_.wlock();
    std::ranges::move(*q, std::back_inserter(out));
    q->clear();
  }

  bool restore(scan_signature const& sig) override {
    return signatures_.wlock()->insert(sig).second;
  }

  void add_observer(std::shared_ptr<scan_observer> obs) override {
    observers_.wlock()->push_back(std::move(obs));
  }

  size_t num_signatures() const override { return signatures_.rlock()->size(); }

  std::exception_ptr take_error() override {
    return std::exchange(*error_.wlock(), nullptr);
  }

 private:
  using dir_item = std::pair<fs::path, int64_t>;

  void run();
  size_t scan_root(size_t root_index, fs::path const& configured);
  size_t scan_tree(size_t root_index, fs::path const& root, int64_t mtime);
  size_t offer(size_t root_index, fs::path const& root, fs::path const& path,
               int64_t mtime, bool is_dir);

  bool name_matches(fs::path const& path) const {
    return !pattern_ || std::regex_match(path.filename().string(), *pattern_);
  }

  LOG_PROXY_DECL(LoggerPolicy);
  os_access const& os_;
  directory_scanner_options const options_;
  std::optional<std::regex> const pattern_;
  std::vector<fs::path> roots_;

  std::mutex scan_mx_;
  folly::Synchronized<std::unordered_set<scan_signature>> signatures_;
  folly::Synchronized<std::deque<scan_entry>> queue_;
  folly::Synchronized<std::vector<std::shared_ptr<scan_observer>>> observers_;
  folly::Synchronized<std::exception_ptr> error_;

  std::mutex mx_;
  std::condition_variable cv_;
  std::atomic<bool> running_{false};
  std::atomic<bool> stop_requested_{false};
  bool trigger_;
  std::optional<std::thread> thread_;
};

template <typename LoggerPolicy>
void directory_scanner_<LoggerPolicy>::run() {
  folly::setThreadName("dirscan");

  std::unique_lock lock(mx_);

  while (running_.load()) {
    trigger_ = false;
    lock.unlock();

    try {
      scan_once();
    } catch (std::exception const& e) {
      *error_.wlock() = std::current_exception();
      LOG_ERROR << "scan iteration failed: " << exception_str(e);
    }

    lock.lock();
    cv_.wait_for(lock, options_.scan_interval,
                 [this] { return !running_.load() || trigger_; });
  }
}

template <typename LoggerPolicy>
size_t directory_scanner_<LoggerPolicy>::scan_once() {
  std::lock_guard scan_lock(scan_mx_);
  auto ti = LOG_TIMED_VERBOSE;
  size_t discovered = 0;

  for (size_t i = 0; i < roots_.size() && !stop_requested_.load(); ++i) {
    discovered += scan_root(i, roots_[i]);
  }

  ti << "scan iteration discovered " << discovered << " new entries";

  auto observers = *observers_.rlock();

  for (auto const& obs : observers) {
    obs->on_scan_complete(discovered);
  }

  return discovered;
}

template <typename LoggerPolicy>
size_t directory_scanner_<LoggerPolicy>::scan_root(size_t root_index,
                                                   fs::path const& configured) {
  auto root = configured;
  auto st = os_.symlink_info(root);

  try {
    // roots are followed, entries below them are not
    if (st.is_symlink()) {
      root = os_.canonical(configured);
      LOG_DEBUG << "root '" << configured.string() << "' resolves to '"
                << root.string() << "'";
      st = os_.symlink_info(root);
    }

    if (st.is_regular_file()) {
      if (name_matches(root)) {
        return offer(root_index, root, root, st.mtime_ns(), false);
      }
      return 0;
    }

    if (!st.is_directory()) {
      LOG_WARN << "skipping root '" << configured.string() << "': "
               << posix_file_type::name(st.type())
               << " is not a file or directory";
      return 0;
    }

    return scan_tree(root_index, root, st.mtime_ns());
  } catch (system_error const& e) {
    LOG_ERROR << "cannot access root '" << configured.string()
              << "': " << exception_str(e);
  }

  return 0;
}

template <typename LoggerPolicy>
size_t directory_scanner_<LoggerPolicy>::scan_tree(size_t root_index,
                                                   fs::path const& root,
                                                   int64_t mtime) {
  std::deque<dir_item> queue{dir_item{root, mtime}};
  size_t discovered = 0;

  while (!queue.empty() && !stop_requested_.load()) {
    auto [dir, dir_mtime] = std::move(queue.front());
    queue.pop_front();

    try {
      auto d = os_.opendir(dir);
      fs::path name;
      std::vector<fs::path> children;

      while (d->read(name)) {
        children.push_back(name);
      }

      std::ranges::sort(children);

      if (children.empty()) {
        discovered += offer(root_index, root, dir, dir_mtime, true);
        continue;
      }

      if (options_.report_directories && dir != root) {
        discovered += offer(root_index, root, dir, dir_mtime, true);
      }

      std::vector<dir_item> subdirs;

      for (auto const& child : children) {
        auto cst = os_.symlink_info(child);

        try {
          switch (cst.type()) {
          case posix_file_type::regular:
            if (name_matches(child)) {
              discovered +=
                  offer(root_index, root, child, cst.mtime_ns(), false);
            }
            break;

          case posix_file_type::directory:
            if (options_.recursive) {
              subdirs.emplace_back(child, cst.mtime_ns());
            } else if (options_.report_directories) {
              discovered +=
                  offer(root_index, root, child, cst.mtime_ns(), true);
            }
            break;

          default:
            LOG_DEBUG << "skipping " << posix_file_type::name(cst.type())
                      << " '" << child.string() << "'";
            break;
          }
        } catch (system_error const& e) {
          LOG_ERROR << "cannot stat '" << child.string()
                    << "': " << exception_str(e);
        }
      }

      queue.insert(queue.begin(), subdirs.begin(), subdirs.end());
    } catch (system_error const& e) {
      LOG_ERROR << "cannot read directory '" << dir.string()
                << "': " << exception_str(e);
    }
  }

  return discovered;
}

template <typename LoggerPolicy>
size_t directory_scanner_<LoggerPolicy>::offer(size_t root_index,
                                               fs::path const& root,
                                               fs::path const& path,
                                               int64_t mtime, bool is_dir) {
  scan_signature sig(root_index, path.string(), mtime);

  if (!signatures_.wlock()->insert(sig).second) {
    LOG_TRACE << "already seen: " << sig;
    return 0;
  }

  scan_entry e{path.string(), mtime, is_dir, root_index, root.string()};
  LOG_DEBUG << "discovered " << e;
  queue_.wlock()->push_back(std::move(e));

  return 1;
}

} // namespace internal

directory_scanner::directory_scanner(logger& lgr, os_access const& os,
                                     directory_scanner_options const& options)
    : impl_{make_unique_logging_object<impl, internal::directory_scanner_,
                                       logger_policies>(lgr, os, options)} {}

directory_scanner::~directory_scanner() = default;

} // namespace dirsplit
