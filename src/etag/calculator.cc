/*
 * etag/calculator.cc
 * -------------------------------------------------------------------------
 * Computes S3-compatible ETags for local files (implementation).
 * -------------------------------------------------------------------------
 *
 * Copyright (c) 2012, Tarick Bedeir.
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *   http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#include "etag/calculator.h"

#include <errno.h>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <algorithm>
#include <limits>
#include <stdexcept>
#include <system_error>

#include "base/logger.h"
#include "base/size.h"
#include "crypto/hash.h"
#include "crypto/hash_list.h"
#include "crypto/hex.h"
#include "crypto/md5.h"
#include "etag/file_access_error.h"

namespace s3etag {
namespace etag {

namespace {
class FileHandle {
 public:
  explicit FileHandle(const std::string &path)
      : fd_(open(path.c_str(), O_RDONLY | O_CLOEXEC)) {
    if (fd_ == -1) {
      const int error = errno;
      throw FileAccessError(path, "open", error);
    }
  }

  ~FileHandle() { close(fd_); }

  FileHandle(const FileHandle &) = delete;
  FileHandle &operator=(const FileHandle &) = delete;

  inline int fd() const { return fd_; }

 private:
  int fd_;
};

uint64_t GetFileSize(const FileHandle &file, const std::string &path) {
  struct stat s;

  if (fstat(file.fd(), &s)) {
    const int error = errno;
    throw FileAccessError(path, "stat", error);
  }

  return s.st_size;
}
}  // namespace

Calculator::Calculator(uint64_t threshold, uint64_t chunk_size)
    : threshold_(threshold), chunk_size_(chunk_size) {
  if (chunk_size_ == 0)
    throw std::invalid_argument("chunk size must be greater than zero.");
}

std::string Calculator::Compute(const std::string &path) const {
  FileHandle file(path);
  const uint64_t size = GetFileSize(file, path);

  S3ETAG_LOG(LOG_DEBUG, "Calculator::Compute",
             "[%s] is %" PRIu64 " bytes, threshold is %" PRIu64 ".\n",
             path.c_str(), size, threshold_);

  try {
    return Compute(file.fd(), size);
  } catch (const std::system_error &e) {
    S3ETAG_LOG(LOG_DEBUG, "Calculator::Compute", "error reading [%s]: %s\n",
               path.c_str(), e.what());
    throw FileAccessError(path, "read", e.code().value());
  }
}

std::string Calculator::Compute(int fd, uint64_t file_size) const {
  return (file_size <= threshold_) ? ComputeSinglePart(fd)
                                   : ComputeMultipart(fd);
}

std::string Calculator::ComputeSinglePart(int fd) const {
  return crypto::Hash::Compute<crypto::Md5, crypto::Hex>(fd);
}

std::string Calculator::ComputeMultipart(int fd) const {
  const size_t part_size = static_cast<size_t>(std::min<uint64_t>(
      chunk_size_, std::numeric_limits<size_t>::max()));

  crypto::HashList<crypto::Md5> parts;
  off_t offset = 0;

  while (true) {
    uint8_t part_hash[crypto::Md5::HASH_LEN];
    const size_t read_count =
        crypto::Hash::Compute<crypto::Md5>(fd, offset, part_size, part_hash);

    if (read_count == 0) break;

    parts.AddPartHash(part_hash);
    offset += read_count;
  }

  if (base::Logger::IsEnabled(LOG_DEBUG))
    S3ETAG_LOG(LOG_DEBUG, "Calculator::ComputeMultipart",
               "hashed %zu part(s) of %s.\n", parts.part_count(),
               base::Size::ToString(chunk_size_).c_str());

  // a single part is reported the way S3 reports a single-request upload
  if (parts.part_count() == 1) return parts.GetPartHash<crypto::Hex>(0);

  // the file shrank to nothing after it was sized, so this is the hash of
  // no content
  if (parts.part_count() == 0) return parts.GetRootHash<crypto::Hex>();

  return parts.GetRootHash<crypto::Hex>() + "-" +
         std::to_string(parts.part_count());
}

}  // namespace etag
}  // namespace s3etag
