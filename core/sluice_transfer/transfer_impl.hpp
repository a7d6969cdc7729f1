// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef SLUICE_TRANSFER_IMPL_HPP
#define SLUICE_TRANSFER_IMPL_HPP

#include <sys/stat.h>

#include <filesystem>
#include <fstream>
#include <memory>

#include "transfer_interfaces.hpp"

namespace sluice {
namespace transfer {

/**
 * Default implementation of IFileSystem using std::filesystem and stat(2)
 */
class FileSystemImpl : public IFileSystem {
public:
  std::optional<Fingerprint> fingerprint(const std::string& path) const override {
    struct stat st;
    if (::stat(path.c_str(), &st) != 0 || !S_ISREG(st.st_mode)) {
      return std::nullopt;
    }
    return Fingerprint{static_cast<uint64_t>(st.st_size), static_cast<int64_t>(st.st_mtime)};
  }

  bool create_directories(const std::string& path) const override {
    std::error_code ec;
    std::filesystem::create_directories(path, ec);  // LCOV_EXCL_BR_LINE
    return !ec;
  }
};

/**
 * Default implementation of IFileStream using std::ifstream
 */
class FileStreamImpl : public IFileStream {
public:
  explicit FileStreamImpl(const std::string& path, std::ios_base::openmode mode)
      : stream_(path, mode) {}  // LCOV_EXCL_BR_LINE

  IFileStream& read(char* buffer, std::streamsize size) override {
    stream_.read(buffer, size);
    return *this;
  }

  IFileStream& seekg(std::streamoff offset, std::ios_base::seekdir origin) override {
    stream_.seekg(offset, origin);
    return *this;
  }

  std::streamsize gcount() const override {
    return stream_.gcount();
  }

  bool good() const override {
    return stream_.good();
  }

  bool fail() const override {
    return stream_.fail();
  }

private:
  std::ifstream stream_;
};

/**
 * Default implementation of IFileStreamFactory
 */
class FileStreamFactoryImpl : public IFileStreamFactory {
public:
  std::unique_ptr<IFileStream> create_file_stream(
    const std::string& path, std::ios_base::openmode mode
  ) override {
    auto stream = std::make_unique<FileStreamImpl>(path, mode);
    if (!stream->good()) {
      return nullptr;
    }
    return stream;
  }
};

}  // namespace transfer
}  // namespace sluice

#endif  // SLUICE_TRANSFER_IMPL_HPP
