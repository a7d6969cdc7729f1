// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef SLUICE_COMMANDS_HPP
#define SLUICE_COMMANDS_HPP

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include <transfer_client.hpp>
#include <transfer_config.hpp>

namespace sluice {
namespace cli {

/**
 * Command handler for the sluice CLI
 */
class Commands {
public:
  using ClientFactory = std::function<std::unique_ptr<transfer::TransferClient>(
    const transfer::TransferConfig& config
  )>;

  /**
   * @param factory Builds the transfer client once configuration is loaded.
   *                nullptr uses the production TransferClient.
   */
  explicit Commands(ClientFactory factory = nullptr);
  ~Commands() = default;

  // Non-copyable
  Commands(const Commands&) = delete;
  Commands& operator=(const Commands&) = delete;

  /**
   * Parse and execute command line
   *
   * @return Process exit code, 0 on success and 1 on any error
   */
  int execute(int argc, char* argv[]);

private:
  struct UploadFlags {
    bool resume = false;
    int concurrency = 0;       // 0 keeps the configured value
    uint64_t chunk_size_mb = 0;
  };

  /**
   * Execute upload command
   */
  int upload(const std::vector<std::string>& args, const UploadFlags& flags);

  /**
   * Execute download command
   */
  int download(const std::vector<std::string>& args);

  /**
   * Load file, environment and flag settings, validate them and start logging
   */
  bool load_config(const UploadFlags* flags, transfer::TransferConfig& config);

  std::unique_ptr<transfer::TransferClient> make_client(const transfer::TransferConfig& config);

  /**
   * Print usage message
   */
  void print_usage();

  /**
   * Format size for human readable output
   */
  static std::string format_size(uint64_t size);

  /**
   * Progress line on stderr, redrawn when the percentage changes
   */
  static transfer::ProgressCallback make_progress_printer(const std::string& verb);

  ClientFactory factory_;
  std::string config_path_;
  bool verbose_;
};

}  // namespace cli
}  // namespace sluice

#endif  // SLUICE_COMMANDS_HPP
