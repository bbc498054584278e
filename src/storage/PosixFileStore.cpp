/*
 * This file is part of the YAPP Transfer Engine.
 * (C) 2025 Ignacio Santolin
 */
#include "PosixFileStore.h"

#include <errno.h>
#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

#include <etl/string.h>

#include "protocol/yapp_protocol.h"

namespace yapp {

namespace {

using PathString = etl::string<kMaxPathLength>;

bool to_path(etl::string_view view, PathString& out) {
  if (view.empty() || view.size() > out.capacity()) {
    return false;
  }
  out.assign(view.begin(), view.end());
  return true;
}

bool is_directory(const char* path) {
  struct stat st;
  return ::stat(path, &st) == 0 && S_ISDIR(st.st_mode);
}

}  // namespace

const char* storage_error_message(StorageError error) {
  switch (error) {
    case StorageError::NOT_FOUND:       return "No such file or directory";
    case StorageError::ACCESS_DENIED:   return "Permission denied";
    case StorageError::ALREADY_EXISTS:  return "File exists";
    case StorageError::NO_SPACE:        return "No space left on device";
    case StorageError::NAME_TOO_LONG:   return "File name too long";
    case StorageError::NOT_A_DIRECTORY: return "Not a directory";
    case StorageError::IS_A_DIRECTORY:  return "Is a directory";
    case StorageError::BAD_HANDLE:      return "Bad file handle";
    case StorageError::IO_ERROR:        return "Input/output error";
  }
  return "Unknown storage error";
}

StorageError PosixFileStore::fromErrno(int err) {
  switch (err) {
    case ENOENT:       return StorageError::NOT_FOUND;
    case EACCES:
    case EPERM:
    case EROFS:        return StorageError::ACCESS_DENIED;
    case EEXIST:       return StorageError::ALREADY_EXISTS;
    case ENOSPC:
    case EDQUOT:       return StorageError::NO_SPACE;
    case ENAMETOOLONG: return StorageError::NAME_TOO_LONG;
    case ENOTDIR:      return StorageError::NOT_A_DIRECTORY;
    case EISDIR:       return StorageError::IS_A_DIRECTORY;
    case EBADF:        return StorageError::BAD_HANDLE;
    default:           return StorageError::IO_ERROR;
  }
}

etl::expected<ReadableFile, StorageError> PosixFileStore::openRead(etl::string_view path) {
  PathString p;
  if (!to_path(path, p)) {
    return etl::unexpected<StorageError>(StorageError::NAME_TOO_LONG);
  }
  const int fd = ::open(p.c_str(), O_RDONLY);
  if (fd < 0) {
    return etl::unexpected<StorageError>(fromErrno(errno));
  }
  struct stat st;
  if (::fstat(fd, &st) != 0) {
    const int err = errno;
    ::close(fd);
    return etl::unexpected<StorageError>(fromErrno(err));
  }
  if (S_ISDIR(st.st_mode)) {
    ::close(fd);
    return etl::unexpected<StorageError>(StorageError::IS_A_DIRECTORY);
  }
  if (st.st_size < 0 || static_cast<uint64_t>(st.st_size) > UINT32_MAX) {
    ::close(fd);
    return etl::unexpected<StorageError>(StorageError::IO_ERROR);
  }
  ReadableFile file;
  file.handle = fd;
  file.size = static_cast<uint32_t>(st.st_size);
  return file;
}

etl::expected<FileHandle, StorageError> PosixFileStore::openWrite(etl::string_view path) {
  PathString p;
  if (!to_path(path, p)) {
    return etl::unexpected<StorageError>(StorageError::NAME_TOO_LONG);
  }
  const int fd = ::open(p.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
  if (fd < 0) {
    return etl::unexpected<StorageError>(fromErrno(errno));
  }
  return FileHandle(fd);
}

etl::expected<size_t, StorageError> PosixFileStore::readChunk(FileHandle handle,
                                                              etl::span<uint8_t> out) {
  for (;;) {
    const ssize_t n = ::read(handle, out.data(), out.size());
    if (n >= 0) {
      return static_cast<size_t>(n);
    }
    if (errno != EINTR) {
      return etl::unexpected<StorageError>(fromErrno(errno));
    }
  }
}

etl::expected<size_t, StorageError> PosixFileStore::writeChunk(FileHandle handle,
                                                               etl::span<const uint8_t> data) {
  size_t written = 0;
  while (written < data.size()) {
    const ssize_t n = ::write(handle, data.data() + written, data.size() - written);
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      return etl::unexpected<StorageError>(fromErrno(errno));
    }
    written += static_cast<size_t>(n);
  }
  return written;
}

bool PosixFileStore::rewind(FileHandle handle) {
  return ::lseek(handle, 0, SEEK_SET) == 0;
}

void PosixFileStore::close(FileHandle handle) {
  if (handle != kInvalidFileHandle) {
    ::close(handle);
  }
}

etl::expected<bool, StorageError> PosixFileStore::prepareDirectory(etl::string_view path) {
  PathString p;
  if (!to_path(path, p)) {
    return etl::unexpected<StorageError>(StorageError::NAME_TOO_LONG);
  }
  if (is_directory(p.c_str())) {
    return true;
  }

  // mkdir -p: create each missing component in turn.
  for (size_t i = 1; i <= p.size(); ++i) {
    if (i != p.size() && p[i] != '/') {
      continue;
    }
    const char saved = (i < p.size()) ? p[i] : '\0';
    if (i < p.size()) {
      p[i] = '\0';
    }
    if (::mkdir(p.c_str(), 0755) != 0 && errno != EEXIST) {
      const int err = errno;
      if (i < p.size()) {
        p[i] = saved;
      }
      return etl::unexpected<StorageError>(fromErrno(err));
    }
    if (i < p.size()) {
      p[i] = saved;
    }
  }
  if (!is_directory(p.c_str())) {
    return etl::unexpected<StorageError>(StorageError::NOT_A_DIRECTORY);
  }
  return true;
}

}  // namespace yapp
