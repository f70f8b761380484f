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

#include <sstream>
#include <string>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <dirsplit/error.h>
#include <dirsplit/logger.h>

#include "test_logger.h"

using namespace dirsplit;
using ::testing::HasSubstr;
using ::testing::MatchesRegex;
using ::testing::Not;

namespace {

template <typename LoggerPolicy>
class log_emitter {
 public:
  explicit log_emitter(logger& lgr)
      : LOG_PROXY_INIT(lgr) {}

  void emit_all() {
    LOG_ERROR << "error message";
    LOG_WARN << "warn message";
    LOG_INFO << "info message";
    LOG_VERBOSE << "verbose message";
    LOG_DEBUG << "debug message";
    LOG_TRACE << "trace message";
  }

  void emit_timed() {
    auto ti = LOG_TIMED_INFO;
    ti << "timed operation";
  }

  void emit_multiline() { LOG_WARN << "first line\nsecond line\n"; }

 private:
  LOG_PROXY_DECL(LoggerPolicy);
};

} // namespace

TEST(logger, parse_level) {
  EXPECT_EQ(logger::ERROR, logger::parse_level("error"));
  EXPECT_EQ(logger::TRACE, logger::parse_level("trace"));
  EXPECT_EQ("verbose", logger::level_name(logger::VERBOSE));
  EXPECT_EQ("error, warn, info, verbose, debug, trace",
            logger::all_level_names());

  EXPECT_THAT([] { logger::parse_level("loud"); },
              ::testing::ThrowsMessage<runtime_error>(
                  HasSubstr("invalid logger level: loud")));

  std::istringstream is("debug");
  logger::level_type lvl;
  is >> lvl;
  EXPECT_EQ(logger::DEBUG, lvl);
}

TEST(logger, stream_logger_threshold) {
  std::ostringstream oss;
  stream_logger lgr(oss, {.threshold = logger::INFO, .with_context = false});

  EXPECT_EQ("prod", lgr.policy_name());

  log_emitter<prod_logger_policy>(lgr).emit_all();

  auto out = oss.str();
  EXPECT_THAT(out, HasSubstr("E "));
  EXPECT_THAT(out, HasSubstr("error message"));
  EXPECT_THAT(out, HasSubstr("warn message"));
  EXPECT_THAT(out, HasSubstr("info message"));
  EXPECT_THAT(out, Not(HasSubstr("verbose message")));
  EXPECT_THAT(out, Not(HasSubstr("debug message")));
  EXPECT_THAT(out, Not(HasSubstr("[logger_test.cpp:")));
}

TEST(logger, stream_logger_debug_policy_and_context) {
  std::ostringstream oss;
  stream_logger lgr(oss, {.threshold = logger::TRACE});

  EXPECT_EQ("debug", lgr.policy_name());

  log_emitter<debug_logger_policy>(lgr).emit_all();

  auto out = oss.str();
  EXPECT_THAT(out, HasSubstr("trace message"));
  EXPECT_THAT(out, HasSubstr("[logger_test.cpp:"));
}

TEST(logger, prod_policy_compiles_out_debug) {
  test::test_logger lgr(logger::TRACE);

  log_emitter<prod_logger_policy>(lgr).emit_all();

  EXPECT_EQ(1, lgr.count(logger::VERBOSE));
  EXPECT_EQ(0, lgr.count(logger::DEBUG));
  EXPECT_EQ(0, lgr.count(logger::TRACE));
}

TEST(logger, multiline_messages) {
  std::ostringstream oss;
  stream_logger lgr(oss, {.threshold = logger::WARN, .with_context = false});

  log_emitter<prod_logger_policy>(lgr).emit_multiline();

  auto out = oss.str();
  EXPECT_THAT(out, MatchesRegex("W [0-9:.]+ first line\nW [.]+ second line\n"));
}

TEST(logger, timed_entry) {
  test::test_logger lgr(logger::INFO);

  log_emitter<prod_logger_policy>(lgr).emit_timed();

  auto log = lgr.get_log();
  ASSERT_EQ(1, log.size());
  EXPECT_THAT(log[0].output, HasSubstr("timed operation ["));
}

TEST(logger, null_logger) {
  null_logger lgr;

  EXPECT_EQ(logger::FATAL, lgr.threshold());
  log_emitter<prod_logger_policy>(lgr).emit_all();
}
