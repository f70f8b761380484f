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

#include <nlohmann/json.hpp>

#include <fmt/format.h>

#include <dirsplit/error.h>

#include <dirsplit/internal/record_codec.h>

namespace dirsplit::internal {

namespace {

nlohmann::json to_json(file_metadata const& fm) {
  return {
      {"type", "file"},
      {"file_id", fm.file_id},
      {"path", fm.file_path},
      {"name", fm.file_name},
      {"relative_path", fm.relative_path},
      {"length", fm.file_length},
      {"is_directory", fm.is_directory},
      {"mtime_ns", fm.mtime_ns},
      {"discovery_time_ns", fm.discovery_time_ns},
      {"num_blocks", fm.num_blocks},
      {"root_index", fm.root_index},
  };
}

nlohmann::json to_json(block_metadata const& bm) {
  return {
      {"type", "block"},
      {"block_id", bm.block_id},
      {"file_id", bm.file_id},
      {"path", bm.file_path},
      {"offset", bm.offset},
      {"length", bm.length},
      {"is_last", bm.is_last_block},
  };
}

file_metadata file_from_json(nlohmann::json const& j) {
  file_metadata fm;
  j.at("file_id").get_to(fm.file_id);
  j.at("path").get_to(fm.file_path);
  j.at("name").get_to(fm.file_name);
  j.at("relative_path").get_to(fm.relative_path);
  j.at("length").get_to(fm.file_length);
  j.at("is_directory").get_to(fm.is_directory);
  j.at("mtime_ns").get_to(fm.mtime_ns);
  j.at("discovery_time_ns").get_to(fm.discovery_time_ns);
  j.at("num_blocks").get_to(fm.num_blocks);
  j.at("root_index").get_to(fm.root_index);
  return fm;
}

block_metadata block_from_json(nlohmann::json const& j) {
  block_metadata bm;
  j.at("block_id").get_to(bm.block_id);
  j.at("file_id").get_to(bm.file_id);
  j.at("path").get_to(bm.file_path);
  j.at("offset").get_to(bm.offset);
  j.at("length").get_to(bm.length);
  j.at("is_last").get_to(bm.is_last_block);
  return bm;
}

} // namespace

std::string
encode_window(window_id_t window, std::span<split_record const> records) {
  nlohmann::json doc;

  doc["version"] = record_format_version;
  doc["window"] = window;

  auto& recs = doc["records"] = nlohmann::json::array();

  for (auto const& rec : records) {
    std::visit([&recs](auto const& r) { recs.push_back(to_json(r)); }, rec);
  }

  try {
    auto bytes = nlohmann::json::to_cbor(doc);
    return {bytes.begin(), bytes.end()};
  } catch (nlohmann::json::exception const& e) {
    DIRSPLIT_THROW(runtime_error,
                   fmt::format("window {}: cannot encode records: {}", window,
                               e.what()));
  }
}

std::vector<split_record> decode_window(window_id_t window,
                                        std::string_view data) {
  std::vector<split_record> records;

  try {
    auto doc = nlohmann::json::from_cbor(data.begin(), data.end());

    if (auto version = doc.at("version").get<int>();
        version != record_format_version) {
      DIRSPLIT_THROW(runtime_error,
                     fmt::format("window {}: unsupported record format "
                                 "version {}",
                                 window, version));
    }

    if (auto stored = doc.at("window").get<window_id_t>(); stored != window) {
      DIRSPLIT_THROW(runtime_error,
                     fmt::format("window {}: payload belongs to window {}",
                                 window, stored));
    }

    auto const& recs = doc.at("records");
    records.reserve(recs.size());

    for (auto const& j : recs) {
      auto type = j.at("type").get<std::string>();

      if (type == "file") {
        records.emplace_back(file_from_json(j));
      } else if (type == "block") {
        records.emplace_back(block_from_json(j));
      } else {
        DIRSPLIT_THROW(runtime_error,
                       fmt::format("window {}: unknown record type '{}'",
                                   window, type));
      }
    }
  } catch (nlohmann::json::exception const& e) {
    DIRSPLIT_THROW(runtime_error,
                   fmt::format("window {}: malformed checkpoint data: {}",
                               window, e.what()));
  }

  return records;
}

} // namespace dirsplit::internal
