/*
 * This file is part of the YAPP Transfer Engine.
 * (C) 2025 Ignacio Santolin
 */
#ifndef YAPP_POSIX_FILE_STORE_H
#define YAPP_POSIX_FILE_STORE_H

#include "FileStore.h"

namespace yapp {

// FileStore over open(2)/read(2)/write(2). Handles are file descriptors.
class PosixFileStore : public FileStore {
 public:
  etl::expected<ReadableFile, StorageError> openRead(etl::string_view path) override;
  etl::expected<FileHandle, StorageError> openWrite(etl::string_view path) override;
  etl::expected<size_t, StorageError> readChunk(FileHandle handle,
                                                etl::span<uint8_t> out) override;
  etl::expected<size_t, StorageError> writeChunk(FileHandle handle,
                                                 etl::span<const uint8_t> data) override;
  bool rewind(FileHandle handle) override;
  void close(FileHandle handle) override;
  etl::expected<bool, StorageError> prepareDirectory(etl::string_view path) override;

  static StorageError fromErrno(int err);
};

}  // namespace yapp

#endif  // YAPP_POSIX_FILE_STORE_H
