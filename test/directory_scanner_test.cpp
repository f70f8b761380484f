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
#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <dirsplit/directory_scanner.h>
#include <dirsplit/error.h>

#include "test_helpers.h"
#include "test_logger.h"

using namespace dirsplit;
using namespace std::chrono_literals;
using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::UnorderedElementsAre;

namespace {

std::vector<std::string> paths(std::vector<scan_entry> const& entries) {
  std::vector<std::string> rv;
  std::ranges::transform(entries, std::back_inserter(rv),
                         [](auto const& e) { return e.path; });
  return rv;
}

class directory_scanner_test : public ::testing::Test {
 protected:
  void SetUp() override {
    opts.root_paths = {"/data"};
    opts.scan_interval = 1h;
  }

  std::vector<scan_entry> scan(directory_scanner& ds) {
    ds.scan_once();
    std::vector<scan_entry> out;
    ds.drain(out);
    return out;
  }

  test::test_logger lgr;
  test::os_access_mock os;
  directory_scanner_options opts;
};

} // namespace

TEST_F(directory_scanner_test, discovers_files_in_sorted_order) {
  os.add_file("/data/b.txt", 3);
  os.add_file("/data/a.txt", 5);
  os.add_file("/data/c.log", 1);

  directory_scanner ds(lgr, os, opts);
  auto entries = scan(ds);

  EXPECT_THAT(paths(entries),
              ElementsAre("/data/a.txt", "/data/b.txt", "/data/c.log"));

  for (auto const& e : entries) {
    EXPECT_FALSE(e.is_directory);
    EXPECT_EQ(0, e.root_index);
    EXPECT_EQ("/data", e.root_path);
  }

  EXPECT_EQ(3, ds.num_signatures());
}

TEST_F(directory_scanner_test, entries_are_reported_once) {
  test::create_data(os, "/data");

  directory_scanner ds(lgr, os, opts);

  EXPECT_EQ(test::default_file_count, scan(ds).size());
  EXPECT_TRUE(scan(ds).empty());
  EXPECT_TRUE(scan(ds).empty());
}

TEST_F(directory_scanner_test, modified_file_is_reported_again) {
  test::create_data(os, "/data", 3);

  directory_scanner ds(lgr, os, opts);
  EXPECT_EQ(3, scan(ds).size());

  os.touch("/data/file1.txt");

  auto entries = scan(ds);
  ASSERT_EQ(1, entries.size());
  EXPECT_EQ("/data/file1.txt", entries[0].path);
  EXPECT_EQ(4, ds.num_signatures());
}

TEST_F(directory_scanner_test, unchanged_mtime_is_not_reported) {
  test::create_data(os, "/data", 3);

  directory_scanner ds(lgr, os, opts);
  EXPECT_EQ(3, scan(ds).size());

  auto st = os.symlink_info("/data/file0.txt");
  os.touch("/data/file0.txt", st.mtime_ns());

  EXPECT_TRUE(scan(ds).empty());
}

TEST_F(directory_scanner_test, recursive_walk) {
  os.add_file("/data/top.txt", 1);
  os.add_file("/data/sub/inner.txt", 1);
  os.add_file("/data/sub/deeper/leaf.txt", 1);
  os.add_dir("/data/sub/empty");

  directory_scanner ds(lgr, os, opts);
  auto entries = scan(ds);

  EXPECT_THAT(paths(entries),
              UnorderedElementsAre("/data/top.txt", "/data/sub/inner.txt",
                                   "/data/sub/deeper/leaf.txt",
                                   "/data/sub/empty"));

  auto empty = std::ranges::find(entries, std::string("/data/sub/empty"),
                                 &scan_entry::path);
  ASSERT_NE(entries.end(), empty);
  EXPECT_TRUE(empty->is_directory);
}

TEST_F(directory_scanner_test, subdirectories_are_walked_depth_first) {
  os.add_file("/data/a/x.txt", 1);
  os.add_file("/data/a/b/y.txt", 1);
  os.add_file("/data/c/z.txt", 1);
  os.add_file("/data/d.txt", 1);

  directory_scanner ds(lgr, os, opts);

  EXPECT_THAT(paths(scan(ds)),
              ElementsAre("/data/d.txt", "/data/a/x.txt", "/data/a/b/y.txt",
                          "/data/c/z.txt"));
}

TEST_F(directory_scanner_test, report_directories) {
  os.add_file("/data/top.txt", 1);
  os.add_file("/data/sub/inner.txt", 1);

  opts.report_directories = true;

  directory_scanner ds(lgr, os, opts);
  auto entries = scan(ds);

  EXPECT_THAT(paths(entries),
              UnorderedElementsAre("/data/top.txt", "/data/sub",
                                   "/data/sub/inner.txt"));
}

TEST_F(directory_scanner_test, non_recursive) {
  os.add_file("/data/top.txt", 1);
  os.add_file("/data/sub/inner.txt", 1);

  opts.recursive = false;

  {
    directory_scanner ds(lgr, os, opts);
    EXPECT_THAT(paths(scan(ds)), ElementsAre("/data/top.txt"));
  }

  opts.report_directories = true;

  {
    directory_scanner ds(lgr, os, opts);
    EXPECT_THAT(paths(scan(ds)), ElementsAre("/data/sub", "/data/top.txt"));
  }
}

TEST_F(directory_scanner_test, name_pattern) {
  test::create_data(os, "/data", 3);
  os.add_file("/data/notes.md", 1);
  os.add_file("/data/sub/file.txt", 1);
  os.add_file("/data/sub/file.txt.bak", 1);

  opts.name_pattern = ".*[.]txt";

  directory_scanner ds(lgr, os, opts);

  EXPECT_THAT(paths(scan(ds)),
              UnorderedElementsAre("/data/file0.txt", "/data/file1.txt",
                                   "/data/file2.txt", "/data/sub/file.txt"));
}

TEST_F(directory_scanner_test, invalid_pattern) {
  opts.name_pattern = "(unclosed";

  EXPECT_THAT([&] { directory_scanner ds(lgr, os, opts); },
              ::testing::ThrowsMessage<runtime_error>(
                  HasSubstr("invalid name pattern")));
}

TEST_F(directory_scanner_test, file_root) {
  os.add_file("/data/single.txt", 10);
  opts.root_paths = {"/data/single.txt"};

  directory_scanner ds(lgr, os, opts);
  auto entries = scan(ds);

  ASSERT_EQ(1, entries.size());
  EXPECT_EQ("/data/single.txt", entries[0].path);
  EXPECT_EQ("/data/single.txt", entries[0].root_path);
  EXPECT_FALSE(entries[0].is_directory);
}

TEST_F(directory_scanner_test, empty_directory_root) {
  os.add_dir("/data/empty");
  opts.root_paths = {"/data/empty/"};

  directory_scanner ds(lgr, os, opts);
  auto entries = scan(ds);

  ASSERT_EQ(1, entries.size());
  EXPECT_EQ("/data/empty", entries[0].path);
  EXPECT_TRUE(entries[0].is_directory);
}

TEST_F(directory_scanner_test, multiple_roots_do_not_collide) {
  test::create_data(os, "/data", 2);
  os.add_file("/other/file.txt", 1);

  opts.root_paths = {"/data", "/other", "/other/file.txt"};

  directory_scanner ds(lgr, os, opts);
  auto entries = scan(ds);

  ASSERT_EQ(4, entries.size());
  EXPECT_EQ(0, entries[0].root_index);
  EXPECT_EQ(0, entries[1].root_index);
  EXPECT_EQ("/other/file.txt", entries[2].path);
  EXPECT_EQ(1, entries[2].root_index);
  EXPECT_EQ("/other/file.txt", entries[3].path);
  EXPECT_EQ(2, entries[3].root_index);
}

TEST_F(directory_scanner_test, special_files_are_skipped) {
  os.add_file("/data/file.txt", 1);
  os.add("/data/link", {posix_file_type::symlink, 10, 0});
  os.add("/data/pipe", {posix_file_type::fifo, 0, 0});

  directory_scanner ds(lgr, os, opts);

  EXPECT_THAT(paths(scan(ds)), ElementsAre("/data/file.txt"));
}

TEST_F(directory_scanner_test, missing_root_is_logged) {
  test::create_data(os, "/data", 1);
  opts.root_paths = {"/missing", "/data"};

  directory_scanner ds(lgr, os, opts);

  EXPECT_THAT(paths(scan(ds)), ElementsAre("/data/file0.txt"));
  EXPECT_EQ(1, lgr.count(logger::ERROR, "cannot access root '/missing'"));
}

TEST_F(directory_scanner_test, symlinked_roots_are_followed) {
  test::create_data(os, "/mnt/vol", 2);
  os.add_file("/mnt/single.txt", 4);
  os.add_symlink("/data", "/mnt/vol");
  os.add_symlink("/links/file", "../mnt/single.txt");
  os.add_symlink("/links/vol", "/data");
  os.add_symlink("/mnt/vol/inner", "/mnt/single.txt");

  opts.root_paths = {"/data", "/links/file", "/links/vol"};

  directory_scanner ds(lgr, os, opts);
  auto entries = scan(ds);

  ASSERT_EQ(5, entries.size());
  EXPECT_EQ("/mnt/vol/file0.txt", entries[0].path);
  EXPECT_EQ("/mnt/vol", entries[0].root_path);
  EXPECT_EQ(0, entries[0].root_index);
  EXPECT_EQ("/mnt/vol/file1.txt", entries[1].path);
  EXPECT_EQ("/mnt/single.txt", entries[2].path);
  EXPECT_EQ("/mnt/single.txt", entries[2].root_path);
  EXPECT_EQ(1, entries[2].root_index);
  EXPECT_EQ("/mnt/vol/file0.txt", entries[3].path);
  EXPECT_EQ(2, entries[3].root_index);
  EXPECT_EQ("/mnt/vol/file1.txt", entries[4].path);

  EXPECT_EQ(0, lgr.count(logger::WARN, "skipping root"));
}

TEST_F(directory_scanner_test, dangling_symlink_root_is_logged) {
  test::create_data(os, "/data", 1);
  os.add_symlink("/gone", "/nowhere");
  opts.root_paths = {"/gone", "/data"};

  directory_scanner ds(lgr, os, opts);

  EXPECT_THAT(paths(scan(ds)), ElementsAre("/data/file0.txt"));
  EXPECT_EQ(1, lgr.count(logger::ERROR, "cannot access root '/gone'"));
}

TEST_F(directory_scanner_test, unsupported_root_type_is_skipped) {
  os.add("/dev/thing", {posix_file_type::character, 0, 0});
  opts.root_paths = {"/dev/thing"};

  directory_scanner ds(lgr, os, opts);

  EXPECT_TRUE(scan(ds).empty());
  EXPECT_EQ(1, lgr.count(logger::WARN, "skipping root '/dev/thing'"));
}

TEST_F(directory_scanner_test, unreadable_directory_does_not_stop_walk) {
  os.add_file("/data/a/x.txt", 1);
  os.add_file("/data/b/y.txt", 1);
  os.set_opendir_error("/data/a", EACCES);

  directory_scanner ds(lgr, os, opts);

  EXPECT_THAT(paths(scan(ds)), ElementsAre("/data/b/y.txt"));
  EXPECT_EQ(1, lgr.count(logger::ERROR, "cannot read directory '/data/a'"));

  os.set_opendir_error("/data/a", std::nullopt);

  EXPECT_THAT(paths(scan(ds)), ElementsAre("/data/a/x.txt"));
}

TEST_F(directory_scanner_test, stat_failure_skips_entry) {
  test::create_data(os, "/data", 2);
  os.set_stat_error("/data/file0.txt", EIO);

  directory_scanner ds(lgr, os, opts);

  EXPECT_THAT(paths(scan(ds)), ElementsAre("/data/file1.txt"));
  EXPECT_EQ(1, lgr.count(logger::ERROR, "cannot stat '/data/file0.txt'"));
}

TEST_F(directory_scanner_test, restored_signatures_are_not_reported) {
  test::create_data(os, "/data", 3);

  directory_scanner ds(lgr, os, opts);

  auto st = os.symlink_info("/data/file1.txt");
  EXPECT_TRUE(ds.restore({0, "/data/file1.txt", st.mtime_ns()}));
  EXPECT_FALSE(ds.restore({0, "/data/file1.txt", st.mtime_ns()}));

  EXPECT_THAT(paths(scan(ds)),
              ElementsAre("/data/file0.txt", "/data/file2.txt"));
}

TEST_F(directory_scanner_test, background_thread_and_trigger) {
  test::create_data(os, "/data", 2);

  auto waiter = std::make_shared<test::scan_waiter>();
  directory_scanner ds(lgr, os, opts);
  ds.add_observer(waiter);

  EXPECT_FALSE(ds.running());
  ds.start();
  EXPECT_TRUE(ds.running());

  ASSERT_TRUE(waiter->wait_for_iterations(1));

  std::vector<scan_entry> out;
  ds.drain(out);
  EXPECT_EQ(2, out.size());

  os.add_file("/data/late.txt", 4);
  ds.trigger();

  ASSERT_TRUE(waiter->wait_for_iterations(2));

  out.clear();
  ds.drain(out);
  EXPECT_THAT(paths(out), ElementsAre("/data/late.txt"));

  ds.stop();
  EXPECT_FALSE(ds.running());
  EXPECT_EQ(2, waiter->iterations());
}

TEST_F(directory_scanner_test, interval_rescan) {
  opts.scan_interval = 10ms;

  auto waiter = std::make_shared<test::scan_waiter>();
  directory_scanner ds(lgr, os, opts);
  ds.add_observer(waiter);

  os.add_dir("/data");
  ds.start();

  ASSERT_TRUE(waiter->wait_for_iterations(1));

  os.add_file("/data/new.txt", 1);

  ASSERT_TRUE(waiter->wait_for_discovered(2));

  ds.stop();

  std::vector<scan_entry> out;
  ds.drain(out);
  EXPECT_TRUE(out.empty());
}

TEST_F(directory_scanner_test, stop_discards_queue_and_restart_works) {
  test::create_data(os, "/data", 3);

  auto waiter = std::make_shared<test::scan_waiter>();
  directory_scanner ds(lgr, os, opts);
  ds.add_observer(waiter);

  ds.start();
  ASSERT_TRUE(waiter->wait_for_iterations(1));
  ds.stop();

  std::vector<scan_entry> out;
  ds.drain(out);
  EXPECT_TRUE(out.empty());

  os.add_file("/data/after.txt", 1);

  ds.start();
  ASSERT_TRUE(waiter->wait_for_iterations(2));
  ds.stop();

  EXPECT_EQ(4, ds.num_signatures());
}
