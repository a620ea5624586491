// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef DIRPUSH_UPLOADER_IMPL_HPP
#define DIRPUSH_UPLOADER_IMPL_HPP

#include <filesystem>
#include <fstream>
#include <memory>
#include <system_error>
#include <vector>

#include "uploader_interfaces.hpp"

namespace dirpush {
namespace uploader {

/**
 * Default implementation of IFileSystem using std::filesystem
 */
class FileSystemImpl : public IFileSystem {
public:
  bool exists(const std::filesystem::path& path) const override {
    std::error_code ec;
    return std::filesystem::exists(path, ec);
  }

  bool is_directory(const std::filesystem::path& path) const override {
    std::error_code ec;
    return std::filesystem::is_directory(path, ec);
  }

  uint64_t file_size(const std::filesystem::path& path) const override {
    return static_cast<uint64_t>(std::filesystem::file_size(path));
  }

  std::vector<std::filesystem::path> list_files(
    const std::filesystem::path& dir, bool recursive
  ) const override {
    std::vector<std::filesystem::path> files;
    if (recursive) {
      for (const auto& entry : std::filesystem::recursive_directory_iterator(
             dir, std::filesystem::directory_options::skip_permission_denied
           )) {
        if (entry.is_regular_file()) {
          files.push_back(entry.path());
        }
      }
    } else {
      for (const auto& entry : std::filesystem::directory_iterator(dir)) {
        if (entry.is_regular_file()) {
          files.push_back(entry.path());
        }
      }
    }
    return files;
  }
};

/**
 * Default implementation of IFileStream using std::ifstream
 */
class FileStreamImpl : public IFileStream {
public:
  explicit FileStreamImpl(const std::filesystem::path& path)
      : stream_(path, std::ios::in | std::ios::binary) {}

  IFileStream& read(char* buffer, std::streamsize size) override {
    stream_.read(buffer, size);
    return *this;
  }

  std::streamsize gcount() const override {
    return stream_.gcount();
  }

  bool bad() const override {
    return stream_.bad();
  }

  bool is_open() const {
    return stream_.is_open();
  }

private:
  std::ifstream stream_;
};

/**
 * Default implementation of IFileStreamFactory
 */
class FileStreamFactoryImpl : public IFileStreamFactory {
public:
  std::unique_ptr<IFileStream> open_for_read(const std::filesystem::path& path) override {
    auto stream = std::make_unique<FileStreamImpl>(path);
    if (!stream->is_open()) {
      return nullptr;
    }
    return stream;
  }
};

}  // namespace uploader
}  // namespace dirpush

#endif  // DIRPUSH_UPLOADER_IMPL_HPP
