// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef VIDUP_FILE_SINK_HPP
#define VIDUP_FILE_SINK_HPP

#include <boost/log/sinks/async_frontend.hpp>
#include <boost/log/sinks/bounded_fifo_queue.hpp>
#include <boost/log/sinks/drop_on_overflow.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/smart_ptr/shared_ptr.hpp>

#include <cstdint>
#include <string>

#include "vidup_log_severity.hpp"

namespace vidup {
namespace logging {

constexpr unsigned kFileQueueSize = 5000;

typedef boost::log::sinks::asynchronous_sink<
  boost::log::sinks::text_file_backend,
  boost::log::sinks::bounded_fifo_queue<kFileQueueSize, boost::log::sinks::drop_on_overflow>>
  async_file_sink_t;

struct FileSinkConfig {
  std::string directory = "/tmp/vidup";
  std::string file_pattern = "vidup_%Y%m%d_%H%M%S.log";
  uint64_t rotation_size_mb = 50;
  bool rotate_at_midnight = true;
  int max_files = 10;        // Kept by the collector, oldest removed first
  bool format_json = false;  // JSON lines, otherwise text
};

/**
 * Create an async rotating file sink.
 * Falls back to /tmp when the configured directory cannot be created.
 */
boost::shared_ptr<async_file_sink_t> create_file_sink(
  const FileSinkConfig& config, severity_level min_level = severity_level::debug
);

}  // namespace logging
}  // namespace vidup

#endif  // VIDUP_FILE_SINK_HPP
