// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include <atomic>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <memory>
#include <string>

#include <byte_source.hpp>
#include <http_client.hpp>
#include <movie_api.hpp>
#include <status_monitor.hpp>
#include <upload_errors.hpp>
#include <upload_session.hpp>

#include "config_parser.hpp"
#include "upload_runner.hpp"

#define VIDUP_LOG_COMPONENT "vidup_upload"
#include <vidup_log_init.hpp>
#include <vidup_log_macros.hpp>

namespace vidup {
namespace upload {

namespace {

constexpr int kExitSuccess = 0;
constexpr int kExitUsage = 1;
constexpr int kExitUploadFailed = 2;
constexpr int kExitProcessingFailed = 3;

using vidup::logging::kv;
using namespace vidup::uploader;

// Set from the signal handler, acted on by CancelWatcher and run_upload
std::atomic<bool> g_cancel_requested(false);

void signal_handler(int signal) {
  if (signal == SIGINT || signal == SIGTERM) {
    g_cancel_requested.store(true);
  }
}

/**
 * Prints transfer progress on one console line.
 */
class ConsoleProgressObserver : public UploadObserver {
public:
  explicit ConsoleProgressObserver(uint64_t total_chunks)
      : total_chunks_(total_chunks) {}

  void onChunkUploaded(uint64_t chunk_index, int progress) override {
    ++uploaded_;
    std::cout << "\rUploaded chunk " << (chunk_index + 1) << " (" << uploaded_ << "/"
              << total_chunks_ << ", " << progress << "%)   " << std::flush;
  }

  void onChunkRetry(uint64_t chunk_index, int attempt, const std::exception& error) override {
    std::cout << "\nChunk " << (chunk_index + 1) << " attempt " << attempt
              << " failed: " << error.what() << ", retrying" << std::endl;
  }

  void onProgress(int progress) override {
    VIDUP_LOG_INFO_THROTTLE(5.0, "Upload progress" << kv("progress", progress));
  }

private:
  uint64_t total_chunks_;
  uint64_t uploaded_ = 0;
};

void print_usage(const char* program_name) {
  std::cout
    << "Usage: " << program_name << " [OPTIONS] FILE\n"
    << "\n"
    << "vidup_upload - Chunked video upload client for the movie service\n"
    << "\n"
    << "Options:\n"
    << "  --config PATH            Path to YAML configuration file\n"
    << "  --base-url URL           Movie service base URL (default: http://localhost:8080)\n"
    << "  --title TITLE            Create a new movie with this title\n"
    << "  --description TEXT       Description for the new movie\n"
    << "  --movie-id ID            Attach the upload to an existing movie\n"
    << "  --mime TYPE              Declared media type (default: from file extension)\n"
    << "  --monitor                Wait for server-side processing to finish\n"
    << "  --monitor-attempts N     Status polls before giving up (default: 30)\n"
    << "  --monitor-interval SEC   Seconds between status polls (default: 10)\n"
    << "  --help                   Show this help message\n"
    << "\n"
    << "Exactly one of --title or --movie-id is required.\n"
    << "Command-line arguments OVERRIDE config file values; VIDUP_BASE_URL overrides\n"
    << "server.base_url from the config file.\n"
    << "\n"
    << "Exit codes:\n"
    << "  0  Upload (and processing, with --monitor) succeeded\n"
    << "  1  Usage or configuration error\n"
    << "  2  Upload failed or was cancelled\n"
    << "  3  Processing failed or monitoring timed out\n"
    << "\n"
    << "Examples:\n"
    << "  " << program_name << " --title \"Holiday\" holiday.mp4\n"
    << "  " << program_name << " --config config/default_config.yaml \\\n"
    << "    --movie-id 42 --monitor episode1.mkv\n"
    << std::endl;
}

bool parse_positive_int(const char* text, int& value) {
  char* end = nullptr;
  long parsed = std::strtol(text, &end, 10);
  if (end == text || *end != '\0' || parsed <= 0 || parsed > 1000000) {
    return false;
  }
  value = static_cast<int>(parsed);
  return true;
}

}  // namespace

}  // namespace upload
}  // namespace vidup

int main(int argc, char* argv[]) {
  using namespace vidup::upload;
  using namespace vidup::uploader;
  using vidup::logging::kv;

  // Check for help flag
  for (int i = 1; i < argc; ++i) {
    if (strcmp(argv[i], "--help") == 0 || strcmp(argv[i], "-h") == 0) {
      print_usage(argv[0]);
      return kExitSuccess;
    }
  }

  // Step 1: Parse command line arguments
  std::string config_file;
  std::string cli_base_url;
  std::string title;
  std::string description;
  std::string movie_id;
  std::string mime_type;
  std::string file_path;
  bool has_title = false;
  bool monitor = false;
  int cli_monitor_attempts = 0;
  int cli_monitor_interval = 0;

  for (int i = 1; i < argc; ++i) {
    const bool has_value = i + 1 < argc;
    if (strcmp(argv[i], "--config") == 0) {
      if (!has_value) {
        std::cerr << "Error: --config requires a file argument" << std::endl;
        return kExitUsage;
      }
      config_file = argv[++i];
    } else if (strcmp(argv[i], "--base-url") == 0) {
      if (!has_value) {
        std::cerr << "Error: --base-url requires a URL argument" << std::endl;
        return kExitUsage;
      }
      cli_base_url = argv[++i];
    } else if (strcmp(argv[i], "--title") == 0) {
      if (!has_value) {
        std::cerr << "Error: --title requires a title argument" << std::endl;
        return kExitUsage;
      }
      title = argv[++i];
      has_title = true;
    } else if (strcmp(argv[i], "--description") == 0) {
      if (!has_value) {
        std::cerr << "Error: --description requires a text argument" << std::endl;
        return kExitUsage;
      }
      description = argv[++i];
    } else if (strcmp(argv[i], "--movie-id") == 0) {
      if (!has_value) {
        std::cerr << "Error: --movie-id requires an id argument" << std::endl;
        return kExitUsage;
      }
      movie_id = argv[++i];
    } else if (strcmp(argv[i], "--mime") == 0) {
      if (!has_value) {
        std::cerr << "Error: --mime requires a media type argument" << std::endl;
        return kExitUsage;
      }
      mime_type = argv[++i];
    } else if (strcmp(argv[i], "--monitor") == 0) {
      monitor = true;
    } else if (strcmp(argv[i], "--monitor-attempts") == 0) {
      if (!has_value || !parse_positive_int(argv[i + 1], cli_monitor_attempts)) {
        std::cerr << "Error: --monitor-attempts requires a positive number" << std::endl;
        return kExitUsage;
      }
      ++i;
    } else if (strcmp(argv[i], "--monitor-interval") == 0) {
      if (!has_value || !parse_positive_int(argv[i + 1], cli_monitor_interval)) {
        std::cerr << "Error: --monitor-interval requires a positive number of seconds"
                  << std::endl;
        return kExitUsage;
      }
      ++i;
    } else if (argv[i][0] == '-' && argv[i][1] == '-') {
      std::cerr << "Error: Unknown argument: " << argv[i] << std::endl;
      print_usage(argv[0]);
      return kExitUsage;
    } else if (file_path.empty()) {
      file_path = argv[i];
    } else {
      std::cerr << "Error: Only one FILE may be given" << std::endl;
      return kExitUsage;
    }
  }

  if (file_path.empty()) {
    std::cerr << "Error: FILE is required" << std::endl;
    print_usage(argv[0]);
    return kExitUsage;
  }
  if (has_title == !movie_id.empty()) {
    std::cerr << "Error: Exactly one of --title or --movie-id is required" << std::endl;
    return kExitUsage;
  }
  if (!has_title && !description.empty()) {
    std::cerr << "Error: --description only applies with --title" << std::endl;
    return kExitUsage;
  }

  // Step 2: Load configuration file if specified
  UploaderConfig config;
  if (!config_file.empty()) {
    ConfigParser parser;
    if (!parser.load_from_file(config_file, config)) {
      std::cerr << "Error: Failed to load config file '" << config_file
                << "': " << parser.get_last_error() << std::endl;
      return kExitUsage;
    }
  }
  ConfigParser::apply_env_overrides(config);

  // Step 3: Apply CLI argument overrides (CLI takes precedence over config file)
  if (!cli_base_url.empty()) {
    config.server.base_url = cli_base_url;
  }
  if (cli_monitor_attempts > 0) {
    config.monitor.max_attempts = cli_monitor_attempts;
  }
  if (cli_monitor_interval > 0) {
    config.monitor.interval_sec = cli_monitor_interval;
  }

  std::string error_msg;
  if (!ConfigParser::validate(config, error_msg)) {
    std::cerr << "Error: Invalid configuration: " << error_msg << std::endl;
    return kExitUsage;
  }

  // Step 4: Initialize logging
  vidup::logging::LoggingConfig log_config;
  convert_logging_config(config.logging, log_config);
  vidup::logging::apply_env_overrides(log_config);
  vidup::logging::init_logging(log_config);

  std::signal(SIGINT, signal_handler);
  std::signal(SIGTERM, signal_handler);

  int exit_code = kExitSuccess;
  try {
    SourceFile file = SourceFile::fromPath(file_path, mime_type);

    auto http = std::make_shared<BeastHttpClient>(to_http_config(config));
    auto api = std::make_shared<MovieApiClient>(http, config.server.api_base_path);
    auto session_config = to_session_config(config);
    auto observer = std::make_shared<ConsoleProgressObserver>(
      chunkCount(file.size(), session_config.chunk_size)
    );
    UploadSession session(api, session_config, observer);

    std::cout << "vidup_upload Configuration:\n"
              << "  Server:      " << config.server.base_url << config.server.api_base_path << "\n"
              << "  File:        " << file_path << " (" << formatFileSize(file.size()) << ")\n"
              << "  Chunk size:  " << formatFileSize(session_config.chunk_size) << "\n"
              << "  Concurrency: " << session_config.max_concurrent_chunks << "\n"
              << std::endl;

    UploadMetadata metadata;
    if (has_title) {
      metadata = NewMovieMetadata{title, description};
    } else {
      metadata = ExistingMovieTarget{movie_id};
    }

    CompletionResult result = run_upload(session, file, metadata, g_cancel_requested, std::cout);
    std::cout << "Upload complete: movie " << result.movie_id << " (" << result.status << ")"
              << std::endl;

    if (monitor) {
      auto sleeper = std::make_shared<CancellableSleeper>();
      StatusMonitor status_monitor(api, sleeper, to_monitor_config(config));
      CancelWatcher watcher(g_cancel_requested, [sleeper]() {
        sleeper->cancel();
      });

      std::cout << "Waiting for processing..." << std::endl;
      try {
        auto info = status_monitor.monitor(
          result.movie_id,
          [](const ProcessingStatus& status, int attempt) {
            std::cout << "  [" << attempt << "] " << toString(status.state) << std::endl;
          }
        );
        if (info) {
          std::cout << "Movie " << info->movie_id << " is " << info->status;
          if (!info->title.empty()) {
            std::cout << ": " << info->title;
          }
          std::cout << std::endl;
        } else {
          std::cerr << "Processing did not finish within " << config.monitor.max_attempts
                    << " status checks" << std::endl;
          exit_code = kExitProcessingFailed;
        }
      } catch (const UploadError& e) {
        if (e.kind() != ErrorKind::kProcessingFailed) {
          throw;
        }
        std::cerr << "Processing failed: " << e.what() << std::endl;
        exit_code = kExitProcessingFailed;
      }
    }
  } catch (const UploadError& e) {
    std::cerr << "\nError (" << toString(e.kind()) << "): " << e.what() << std::endl;
    VIDUP_LOG_ERROR(
      "Upload failed" << kv("kind", toString(e.kind())) << kv("error", std::string(e.what()))
    );
    exit_code = kExitUploadFailed;
  }

  vidup::logging::shutdown_logging();
  return exit_code;
}
