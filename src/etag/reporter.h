/*
 * etag/reporter.h
 * -------------------------------------------------------------------------
 * Writes one ETag line per file, isolating per-file failures.
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

#ifndef S3ETAG_ETAG_REPORTER_H
#define S3ETAG_ETAG_REPORTER_H

#include <functional>
#include <iosfwd>
#include <string>

namespace s3etag {
namespace etag {
class Calculator;

class Reporter {
 public:
  using ComputeEtag = std::function<std::string(const std::string &)>;

  static constexpr int ETAG_COLUMN_WIDTH = 39;

  Reporter(const Calculator &calculator, std::ostream &out,
           std::ostream &err);
  Reporter(const ComputeEtag &compute, std::ostream &out, std::ostream &err);

  // writes "<etag, padded> <path>" to out. on failure, writes "ERROR: ..."
  // to err and puts the errno value (or "ERROR", if there isn't one) in
  // place of the ETag. returns false on failure; never throws for a
  // per-file error.
  bool Print(const std::string &path);

  inline int failure_count() const { return failure_count_; }

 private:
  void PrintLine(const std::string &etag, const std::string &path);

  ComputeEtag compute_;
  std::ostream &out_;
  std::ostream &err_;
  int failure_count_ = 0;
};
}  // namespace etag
}  // namespace s3etag

#endif
