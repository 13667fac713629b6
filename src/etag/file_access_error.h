/*
 * etag/file_access_error.h
 * -------------------------------------------------------------------------
 * Error raised when a file cannot be opened, stat-ed or read.
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

#ifndef S3ETAG_ETAG_FILE_ACCESS_ERROR_H
#define S3ETAG_ETAG_FILE_ACCESS_ERROR_H

#include <string>
#include <system_error>

namespace s3etag {
namespace etag {
class FileAccessError : public std::system_error {
 public:
  // error is an errno value
  FileAccessError(const std::string &path, const std::string &operation,
                  int error);

  inline const std::string &path() const { return path_; }
  inline const std::string &operation() const { return operation_; }

  // "[Errno 2] No such file or directory: 'path'"
  std::string Describe() const;

 private:
  std::string path_;
  std::string operation_;
};
}  // namespace etag
}  // namespace s3etag

#endif
