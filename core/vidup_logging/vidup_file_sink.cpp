// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "vidup_file_sink.hpp"

#include <boost/filesystem.hpp>
#include <boost/log/expressions.hpp>
#include <boost/make_shared.hpp>

#include <iostream>

#include "vidup_log_format.hpp"

namespace vidup {
namespace logging {

namespace keywords = boost::log::keywords;
namespace sinks = boost::log::sinks;

namespace {

constexpr const char* kFallbackLogDirectory = "/tmp";

// Returns the directory records will actually be written to
std::string prepare_log_directory(const std::string& requested) {
  boost::filesystem::path dir(requested);
  boost::system::error_code ec;
  if (boost::filesystem::is_directory(dir, ec)) {
    return requested;
  }

  boost::filesystem::create_directories(dir, ec);
  if (!ec) {
    return requested;
  }

  // Logging is not up yet
  std::cerr << "[vidup_logging] Cannot create log directory '" << requested
            << "': " << ec.message() << ", using " << kFallbackLogDirectory << "\n";
  return kFallbackLogDirectory;
}

}  // namespace

boost::shared_ptr<async_file_sink_t> create_file_sink(
  const FileSinkConfig& config, severity_level min_level
) {
  const std::string directory = prepare_log_directory(config.directory);

  auto backend = boost::make_shared<sinks::text_file_backend>(
    keywords::file_name = directory + "/" + config.file_pattern,
    keywords::rotation_size = config.rotation_size_mb * 1024 * 1024,
    keywords::auto_flush = true
  );
  if (config.rotate_at_midnight) {
    backend->set_time_based_rotation(sinks::file::rotation_at_time_point(0, 0, 0));
  }
  backend->set_file_collector(
    sinks::file::make_collector(keywords::target = directory, keywords::max_files = config.max_files)
  );
  backend->scan_for_files();

  auto sink = boost::make_shared<async_file_sink_t>(backend);
  sink->set_filter(severity >= min_level);
  if (config.format_json) {
    sink->set_formatter(&format_json);
  } else {
    sink->set_formatter(
      [](boost::log::record_view const& rec, boost::log::formatting_ostream& strm) {
        format_text(rec, strm, false);
      }
    );
  }
  return sink;
}

}  // namespace logging
}  // namespace vidup
