/*
 * base/size.h
 * -------------------------------------------------------------------------
 * Byte counts with binary unit suffixes (KB, MB, GB, TB).
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

#ifndef S3ETAG_BASE_SIZE_H
#define S3ETAG_BASE_SIZE_H

#include <cstdint>
#include <stdexcept>
#include <string>

namespace s3etag {
namespace base {
class InvalidSizeFormat : public std::runtime_error {
 public:
  explicit InvalidSizeFormat(const std::string &input);

  inline const std::string &input() const { return input_; }

 private:
  std::string input_;
};

class Size {
 public:
  // accepts "<digits>" or "<digits>KB", "MB", "GB", "TB" (powers of 1024),
  // case-sensitive and without whitespace. throws InvalidSizeFormat.
  static uint64_t Parse(const std::string &text);

  // largest suffix that divides bytes exactly, so that
  // Parse(ToString(x)) == x
  static std::string ToString(uint64_t bytes);
};
}  // namespace base
}  // namespace s3etag

#endif
