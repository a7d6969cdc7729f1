// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

// sluice - resumable chunked transfer through pre-signed URLs

#include <exception>
#include <iostream>

#include <sluice_log_init.hpp>

#include "commands.hpp"

/**
 * Main entry point for sluice
 */
int main(int argc, char* argv[]) {
  sluice::cli::Commands commands;

  int exit_code = 1;
  try {
    exit_code = commands.execute(argc, argv);
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    exit_code = 1;
  } catch (...) {
    std::cerr << "Error: Unknown exception occurred" << std::endl;
    exit_code = 1;
  }

  sluice::logging::shutdown_logging();
  return exit_code;
}
