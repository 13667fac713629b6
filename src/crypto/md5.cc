/*
 * crypto/md5.cc
 * -------------------------------------------------------------------------
 * MD5 hasher (implementation).
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

#include "crypto/md5.h"

#include <errno.h>
#include <openssl/evp.h>
#include <unistd.h>

#include <algorithm>
#include <limits>
#include <memory>
#include <stdexcept>
#include <system_error>

namespace s3etag {
namespace crypto {

namespace {
using DigestContext = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

DigestContext NewContext() {
  DigestContext ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);

  if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_md5(), nullptr) != 1)
    throw std::runtime_error("failed to initialize md5 context.");

  return ctx;
}

// pipes and FIFOs can't be positioned, so they're read in sequence and
// |offset| is taken to be the number of bytes already consumed
ssize_t ReadAt(int fd, uint8_t *buf, size_t size, off_t offset) {
  const ssize_t r = pread(fd, buf, size, offset);

  if (r == -1 && errno == ESPIPE) return read(fd, buf, size);

  return r;
}
}  // namespace

void Md5::Compute(const uint8_t *input, size_t size, uint8_t *hash) {
  if (EVP_Digest(input, size, hash, nullptr, EVP_md5(), nullptr) != 1)
    throw std::runtime_error("failed to compute md5.");
}

void Md5::Compute(int fd, uint8_t *hash) {
  Compute(fd, 0, std::numeric_limits<size_t>::max(), hash);
}

size_t Md5::Compute(int fd, off_t offset, size_t max_size, uint8_t *hash) {
  constexpr size_t BUF_LEN = 64 * 1024;

  uint8_t buf[BUF_LEN];
  size_t total = 0;
  auto ctx = NewContext();

  while (total < max_size) {
    const size_t want = std::min(BUF_LEN, max_size - total);
    const ssize_t read_count =
        ReadAt(fd, buf, want, offset + static_cast<off_t>(total));

    if (read_count == -1) {
      if (errno == EINTR) continue;

      throw std::system_error(errno, std::generic_category(),
                              "error while computing md5, in read()");
    }

    if (read_count == 0) break;

    if (EVP_DigestUpdate(ctx.get(), buf, read_count) != 1)
      throw std::runtime_error("failed to update md5.");

    total += read_count;
  }

  if (EVP_DigestFinal_ex(ctx.get(), hash, nullptr) != 1)
    throw std::runtime_error("failed to finalize md5.");

  return total;
}

}  // namespace crypto
}  // namespace s3etag
