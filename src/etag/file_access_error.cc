/*
 * etag/file_access_error.cc
 * -------------------------------------------------------------------------
 * Error raised when a file cannot be opened, stat-ed or read
 * (implementation).
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

#include "etag/file_access_error.h"

namespace s3etag {
namespace etag {

FileAccessError::FileAccessError(const std::string &path,
                                 const std::string &operation, int error)
    : std::system_error(error, std::generic_category(),
                        operation + " failed for [" + path + "]"),
      path_(path),
      operation_(operation) {}

std::string FileAccessError::Describe() const {
  return "[Errno " + std::to_string(code().value()) + "] " +
         code().message() + ": '" + path_ + "'";
}

}  // namespace etag
}  // namespace s3etag
