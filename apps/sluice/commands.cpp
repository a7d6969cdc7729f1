// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "commands.hpp"

#include <unistd.h>

#include <config_parser.hpp>
#include <transfer_error.hpp>
#include <transfer_planner.hpp>

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>

#define SLUICE_LOG_COMPONENT "sluice_cli"
#include <sluice_log_init.hpp>
#include <sluice_log_macros.hpp>

namespace sluice {
namespace cli {

using ::sluice::logging::kv;
using transfer::TransferError;

namespace {

bool parse_positive(const std::string& text, uint64_t& value) {
  try {
    size_t consumed = 0;
    unsigned long long parsed = std::stoull(text, &consumed);
    if (consumed != text.size() || parsed == 0) {
      return false;
    }
    value = parsed;
    return true;
  } catch (const std::logic_error&) {
    return false;
  }
}

void print_error(const TransferError& e) {
  std::cerr << "Error: " << e.what() << std::endl;
  if (!e.completedParts().empty()) {
    std::cerr << "Completed parts are saved (" << e.completedParts().size()
              << "). Re-run with --resume to upload only the remaining parts." << std::endl;
  }
}

}  // namespace

Commands::Commands(ClientFactory factory)
    : factory_(std::move(factory))
    , verbose_(false) {}

int Commands::execute(int argc, char* argv[]) {
  std::string command;
  std::vector<std::string> positional;
  UploadFlags flags;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    auto next_value = [&](std::string& out) {
      if (i + 1 >= argc) {
        std::cerr << "Error: " << arg << " requires a value" << std::endl;
        return false;
      }
      out = argv[++i];
      return true;
    };

    if (arg == "--help" || arg == "-h") {
      print_usage();
      return 0;
    } else if (arg == "--verbose" || arg == "-v") {
      verbose_ = true;
    } else if (arg == "--config" || arg == "-c") {
      if (!next_value(config_path_)) {
        return 1;
      }
    } else if (arg == "--resume") {
      flags.resume = true;
    } else if (arg == "--concurrency" || arg == "--chunk-size-mb") {
      std::string text;
      uint64_t value = 0;
      if (!next_value(text)) {
        return 1;
      }
      if (!parse_positive(text, value)) {
        std::cerr << "Error: " << arg << " expects a positive integer, got '" << text << "'"
                  << std::endl;
        return 1;
      }
      if (arg == "--concurrency") {
        flags.concurrency = static_cast<int>(std::min<uint64_t>(value, 1000));
      } else {
        flags.chunk_size_mb = value;
      }
    } else if (!arg.empty() && arg[0] == '-') {
      std::cerr << "Error: Unknown option '" << arg << "'" << std::endl;
      return 1;
    } else if (command.empty()) {
      command = arg;
    } else {
      positional.push_back(arg);
    }
  }

  if (command.empty() || command == "help") {
    print_usage();
    return 0;
  }

  if (command == "upload") {
    return upload(positional, flags);
  } else if (command == "download") {
    return download(positional);
  } else {
    std::cerr << "Error: Unknown command '" << command << "'" << std::endl;
    print_usage();
    return 1;
  }
}

bool Commands::load_config(const UploadFlags* flags, transfer::TransferConfig& config) {
  transfer::ConfigParser parser;
  if (!config_path_.empty() && !parser.load_from_file(config_path_, config)) {
    std::cerr << "Error: " << parser.get_last_error() << std::endl;
    return false;
  }

  transfer::ConfigParser::apply_env_overrides(config);

  // Command line flags win over environment and file
  if (flags) {
    if (flags->concurrency > 0) {
      config.upload.concurrency = flags->concurrency;
    }
    if (flags->chunk_size_mb > 0) {
      config.upload.chunk_size_mb = flags->chunk_size_mb;
    }
  }

  std::string error_msg;
  if (!transfer::ConfigParser::validate(config, error_msg)) {
    std::cerr << "Error: Invalid configuration: " << error_msg << std::endl;
    return false;
  }

  auto log_config = config.loggingConfig();
  if (verbose_) {
    log_config.console.level = logging::severity_level::debug;
  }
  // Log lines share stderr with the progress meter
  const bool terminal = ::isatty(STDERR_FILENO) != 0;
  log_config.console.colors = log_config.console.colors && terminal;
  log_config.console.clear_progress_line = terminal;
  logging::init_logging(log_config);

  SLUICE_LOG_DEBUG(
    "Configuration loaded" << kv("config_file", config_path_.empty() ? "<none>" : config_path_)
                           << kv("base_url", config.api.base_url)
                           << kv("state_dir", config.state_dir)
                           << kv("chunk_size_mb", config.upload.chunk_size_mb)
                           << kv("concurrency", config.upload.concurrency)
  );
  return true;
}

std::unique_ptr<transfer::TransferClient> Commands::make_client(
  const transfer::TransferConfig& config
) {
  if (factory_) {
    return factory_(config);
  }
  return std::make_unique<transfer::TransferClient>(config);
}

int Commands::upload(const std::vector<std::string>& args, const UploadFlags& flags) {
  if (args.size() != 3) {
    std::cerr << "Error: upload expects <bucket> <object> <file>" << std::endl;
    print_usage();
    return 1;
  }
  const std::string& bucket = args[0];
  const std::string& object = args[1];
  const std::string& file = args[2];

  transfer::TransferConfig config;
  if (!load_config(&flags, config)) {
    return 1;
  }

  try {
    auto client = make_client(config);
    auto options = client->defaultUploadOptions();
    options.resume = flags.resume;
    options.on_progress = make_progress_printer("Uploading");

    auto info = client->upload(bucket, object, file, options);

    std::cout << "Uploaded " << info.bucket_key << "/" << info.object_key << std::endl;
    std::cout << "  Object ID: " << info.object_id << std::endl;
    std::cout << "  Size: " << format_size(info.size) << std::endl;
    if (info.sha1) {
      std::cout << "  SHA-1: " << *info.sha1 << std::endl;
    }
    return 0;
  } catch (const TransferError& e) {
    print_error(e);
    return 1;
  }
}

int Commands::download(const std::vector<std::string>& args) {
  if (args.size() != 3) {
    std::cerr << "Error: download expects <bucket> <object> <output>" << std::endl;
    print_usage();
    return 1;
  }
  const std::string& bucket = args[0];
  const std::string& object = args[1];
  const std::string& output = args[2];

  transfer::TransferConfig config;
  if (!load_config(nullptr, config)) {
    return 1;
  }

  try {
    auto client = make_client(config);
    uint64_t written = client->download(bucket, object, output, make_progress_printer("Downloading"));
    std::cout << "Downloaded " << bucket << "/" << object << " to " << output << " ("
              << format_size(written) << ")" << std::endl;
    return 0;
  } catch (const TransferError& e) {
    print_error(e);
    return 1;
  }
}

transfer::ProgressCallback Commands::make_progress_printer(const std::string& verb) {
  auto last_percent = std::make_shared<int>(-1);
  return [verb, last_percent](uint64_t done, uint64_t total) {
    if (total == 0) {
      return;
    }
    int percent = static_cast<int>(done * 100 / total);
    if (percent == *last_percent) {
      return;
    }
    *last_percent = percent;
    std::cerr << "\r" << verb << " " << std::setw(3) << percent << "% (" << format_size(done)
              << " / " << format_size(total) << ")";
    if (done >= total) {
      std::cerr << std::endl;
    }
  };
}

std::string Commands::format_size(uint64_t size) {
  const char* units[] = {"B", "KB", "MB", "GB", "TB"};
  int unit_index = 0;
  double size_d = static_cast<double>(size);

  while (size_d >= 1024.0 && unit_index < 4) {
    size_d /= 1024.0;
    unit_index++;
  }

  std::ostringstream oss;
  if (unit_index == 0) {
    oss << size << " " << units[unit_index];
  } else {
    oss << std::fixed << std::setprecision(1) << size_d << " " << units[unit_index];
  }
  return oss.str();
}

void Commands::print_usage() {
  std::cout << "Usage: sluice [--config FILE] [--verbose] <command> [options]" << std::endl;
  std::cout << std::endl;
  std::cout << "Commands:" << std::endl;
  std::cout << "  upload <bucket> <object> <file>       Upload a file" << std::endl;
  std::cout << "  download <bucket> <object> <output>   Download an object" << std::endl;
  std::cout << "  help                                  Show this help message" << std::endl;
  std::cout << std::endl;
  std::cout << "Options:" << std::endl;
  std::cout << "  --config, -c FILE     YAML configuration file" << std::endl;
  std::cout << "  --verbose, -v         Debug logging on the console" << std::endl;
  std::cout << "  --resume              Continue an interrupted multipart upload" << std::endl;
  std::cout << "  --concurrency N       Parts uploaded in parallel (1-16)" << std::endl;
  std::cout << "  --chunk-size-mb N     Multipart chunk size in MiB (5-100)" << std::endl;
  std::cout << std::endl;
  std::cout << "Environment:" << std::endl;
  std::cout << "  SLUICE_BASE_URL, SLUICE_TOKEN, SLUICE_TIMEOUT (seconds), SLUICE_STATE_DIR"
            << std::endl;
}

}  // namespace cli
}  // namespace sluice
