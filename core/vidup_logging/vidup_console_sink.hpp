// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef VIDUP_CONSOLE_SINK_HPP
#define VIDUP_CONSOLE_SINK_HPP

#include <boost/log/sinks/async_frontend.hpp>
#include <boost/log/sinks/bounded_fifo_queue.hpp>
#include <boost/log/sinks/drop_on_overflow.hpp>
#include <boost/log/sinks/text_ostream_backend.hpp>
#include <boost/smart_ptr/shared_ptr.hpp>

#include "vidup_log_severity.hpp"

namespace vidup {
namespace logging {

// Chunk workers log from several threads at once; records beyond the queue
// bound are dropped rather than stalling an upload on stderr.
constexpr unsigned kConsoleQueueSize = 1000;

typedef boost::log::sinks::asynchronous_sink<
  boost::log::sinks::text_ostream_backend,
  boost::log::sinks::bounded_fifo_queue<kConsoleQueueSize, boost::log::sinks::drop_on_overflow>>
  async_console_sink_t;

/**
 * Async console sink on std::clog, text format.
 *
 * std::clog keeps log records off stdout, where the CLI prints progress.
 */
boost::shared_ptr<async_console_sink_t> create_console_sink(
  severity_level min_level = severity_level::info, bool use_colors = true
);

}  // namespace logging
}  // namespace vidup

#endif  // VIDUP_CONSOLE_SINK_HPP
