/*
 * etag/calculator.h
 * -------------------------------------------------------------------------
 * Computes S3-compatible ETags for local files.
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

#ifndef S3ETAG_ETAG_CALCULATOR_H
#define S3ETAG_ETAG_CALCULATOR_H

#include <cstdint>
#include <string>

namespace s3etag {
namespace etag {
// Files no larger than the threshold get the plain MD5 of their content, as
// S3 reports for single-request uploads. Larger files are split into
// chunk_size parts and get "<md5 of concatenated part md5s>-<part count>",
// which is what S3 reports for a multipart upload with that part size. A
// multipart file that turns out to have only one part gets that part's MD5,
// without a suffix.
class Calculator {
 public:
  // throws std::invalid_argument if chunk_size is zero
  Calculator(uint64_t threshold, uint64_t chunk_size);

  // opens, sizes and reads path. throws FileAccessError.
  std::string Compute(const std::string &path) const;

  // file_size selects the mode. the descriptor is read from offset zero (or,
  // for pipes, from wherever it stands) until end of file, and is not
  // closed. read errors throw std::system_error.
  std::string Compute(int fd, uint64_t file_size) const;

  inline uint64_t threshold() const { return threshold_; }
  inline uint64_t chunk_size() const { return chunk_size_; }

 private:
  std::string ComputeSinglePart(int fd) const;
  std::string ComputeMultipart(int fd) const;

  uint64_t threshold_;
  uint64_t chunk_size_;
};
}  // namespace etag
}  // namespace s3etag

#endif
