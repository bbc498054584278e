/*
 * This file is part of the YAPP Transfer Engine.
 * (C) 2025 Ignacio Santolin
 */
#ifndef YAPP_FILE_STORE_H
#define YAPP_FILE_STORE_H

#include <stddef.h>
#include <stdint.h>

#include <etl/expected.h>
#include <etl/span.h>
#include <etl/string_view.h>

namespace yapp {

using FileHandle = int;
constexpr FileHandle kInvalidFileHandle = -1;

enum class StorageError : uint8_t {
  NOT_FOUND,
  ACCESS_DENIED,
  ALREADY_EXISTS,
  NO_SPACE,
  NAME_TOO_LONG,
  NOT_A_DIRECTORY,
  IS_A_DIRECTORY,
  BAD_HANDLE,
  IO_ERROR
};

const char* storage_error_message(StorageError error);

struct ReadableFile {
  FileHandle handle;
  uint32_t size;
};

/**
 * @brief Host file system as seen by the transfer engine.
 *
 * Handles are exclusively owned by the engine between open and close.
 */
class FileStore {
 public:
  virtual ~FileStore() {}

  virtual etl::expected<ReadableFile, StorageError> openRead(etl::string_view path) = 0;
  // Creates or truncates.
  virtual etl::expected<FileHandle, StorageError> openWrite(etl::string_view path) = 0;

  // Returns 0 at end of file.
  virtual etl::expected<size_t, StorageError> readChunk(FileHandle handle,
                                                        etl::span<uint8_t> out) = 0;
  virtual etl::expected<size_t, StorageError> writeChunk(FileHandle handle,
                                                         etl::span<const uint8_t> data) = 0;
  virtual bool rewind(FileHandle handle) = 0;
  virtual void close(FileHandle handle) = 0;

  // Ensures a receive directory exists (creating it if needed).
  virtual etl::expected<bool, StorageError> prepareDirectory(etl::string_view path) = 0;
};

}  // namespace yapp

#endif  // YAPP_FILE_STORE_H
