/*
 * crypto/md5.h
 * -------------------------------------------------------------------------
 * MD5 hasher.
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

#ifndef S3ETAG_CRYPTO_MD5_H
#define S3ETAG_CRYPTO_MD5_H

#include <sys/types.h>

#include <cstdint>
#include <string>

namespace s3etag {
namespace crypto {
class Hash;

class Md5 {
 public:
  static constexpr int HASH_LEN = 128 / 8;

  inline static bool IsValidHexHash(const std::string &hash) {
    if (hash.size() != 2 * HASH_LEN)  // *2 for hex encoding
      return false;

    for (const char c : hash)
      if ((c < '0' || c > '9') && (c < 'a' || c > 'f')) return false;

    return true;
  }

 private:
  friend class Hash;

  static void Compute(const uint8_t *input, size_t size, uint8_t *hash);

  // reads until end of file. read errors throw std::system_error.
  static void Compute(int fd, uint8_t *hash);

  // reads at most max_size bytes starting at offset, and returns the number
  // of bytes hashed (zero at end of file). a descriptor that can't seek (a
  // pipe, say) is read from its current position instead. read errors throw
  // std::system_error.
  static size_t Compute(int fd, off_t offset, size_t max_size, uint8_t *hash);
};
}  // namespace crypto
}  // namespace s3etag

#endif
