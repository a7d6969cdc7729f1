// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef SLUICE_TRANSFER_INTERFACES_HPP
#define SLUICE_TRANSFER_INTERFACES_HPP

#include <cstdint>
#include <functional>
#include <ios>
#include <memory>
#include <optional>
#include <string>

#include "transfer_state.hpp"

namespace sluice {
namespace transfer {

/**
 * Progress report: bytes confirmed so far and the total (0 when unknown)
 */
using ProgressCallback = std::function<void(uint64_t bytes_transferred, uint64_t total_bytes)>;

/**
 * File system operations used by the engines, mockable in tests
 */
class IFileSystem {
public:
  virtual ~IFileSystem() = default;

  /**
   * Current (size, mtime) of a regular file, or std::nullopt when it cannot be stat'ed
   */
  virtual std::optional<Fingerprint> fingerprint(const std::string& path) const = 0;

  virtual bool create_directories(const std::string& path) const = 0;
};

/**
 * Read-only binary stream over a local file
 */
class IFileStream {
public:
  virtual ~IFileStream() = default;

  virtual IFileStream& read(char* buffer, std::streamsize size) = 0;
  virtual IFileStream& seekg(std::streamoff offset, std::ios_base::seekdir origin) = 0;
  virtual std::streamsize gcount() const = 0;
  virtual bool good() const = 0;
  virtual bool fail() const = 0;
};

/**
 * Opens IFileStream instances
 */
class IFileStreamFactory {
public:
  virtual ~IFileStreamFactory() = default;

  /**
   * @return The stream, or nullptr when the file cannot be opened
   */
  virtual std::unique_ptr<IFileStream> create_file_stream(
    const std::string& path, std::ios_base::openmode mode
  ) = 0;
};

}  // namespace transfer
}  // namespace sluice

#endif  // SLUICE_TRANSFER_INTERFACES_HPP
