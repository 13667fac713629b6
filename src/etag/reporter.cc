/*
 * etag/reporter.cc
 * -------------------------------------------------------------------------
 * Writes one ETag line per file, isolating per-file failures
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

#include "etag/reporter.h"

#include <iomanip>
#include <ostream>
#include <stdexcept>

#include "base/logger.h"
#include "etag/calculator.h"
#include "etag/file_access_error.h"

namespace s3etag {
namespace etag {

constexpr int Reporter::ETAG_COLUMN_WIDTH;

Reporter::Reporter(const Calculator &calculator, std::ostream &out,
                   std::ostream &err)
    : Reporter(
          [&calculator](const std::string &path) {
            return calculator.Compute(path);
          },
          out, err) {}

Reporter::Reporter(const ComputeEtag &compute, std::ostream &out,
                   std::ostream &err)
    : compute_(compute), out_(out), err_(err) {}

bool Reporter::Print(const std::string &path) {
  std::string etag;
  bool ok = false;

  try {
    etag = compute_(path);
    ok = true;
  } catch (const FileAccessError &e) {
    err_ << "ERROR: " << e.Describe() << std::endl;
    etag = std::to_string(e.code().value());
  } catch (const std::exception &e) {
    S3ETAG_LOG(LOG_DEBUG, "Reporter::Print", "caught exception for [%s]: %s\n",
               path.c_str(), e.what());

    err_ << "ERROR: " << e.what() << ": '" << path << "'" << std::endl;
    etag = "ERROR";
  }

  if (!ok) failure_count_++;

  PrintLine(etag, path);

  return ok;
}

void Reporter::PrintLine(const std::string &etag, const std::string &path) {
  out_ << std::left << std::setw(ETAG_COLUMN_WIDTH) << etag << " " << path
       << std::endl;
}

}  // namespace etag
}  // namespace s3etag
