/*
 * s3etag.cc
 * -------------------------------------------------------------------------
 * Prints the S3 ETag of each file named on the command line.
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

#include <getopt.h>

#include <algorithm>
#include <cstring>
#include <iostream>
#include <string>

#include "base/config.h"
#include "base/logger.h"
#include "base/size.h"
#include "etag/calculator.h"
#include "etag/reporter.h"

namespace s3etag {
namespace {
constexpr char SHORT_OPTIONS[] = "t:c:v::shV";

constexpr option LONG_OPTIONS[] = {
    {"threshold", required_argument, nullptr, 't'},
    {"threshhold", required_argument, nullptr, 't'},
    {"chunksize", required_argument, nullptr, 'c'},
    {"verbose", optional_argument, nullptr, 'v'},
    {"syslog", no_argument, nullptr, 's'},
    {"help", no_argument, nullptr, 'h'},
    {"version", no_argument, nullptr, 'V'},
    {nullptr, 0, nullptr, '\0'}};

constexpr int EXIT_FILE_ERROR = 1;
constexpr int EXIT_USAGE = 2;

const char *GetBaseName(const char *arg0) {
  const char *base_name = std::strrchr(arg0, '/');
  return base_name ? base_name + 1 : arg0;
}

void PrintUsage(const char *arg0, std::ostream &out) {
  out << "Usage: " << GetBaseName(arg0)
      << " [options] <file>...\n"
         "\n"
         "Computes the ETag S3 reports for each <file> once uploaded.\n"
         "\n"
         "Options:\n"
         "  -t, --threshold <size>  use a multipart ETag for files larger "
         "than <size>\n"
         "                          (default: "
      << base::Size::ToString(base::Config::threshold())
      << ")\n"
         "  -c, --chunksize <size>  multipart chunk size used for the upload\n"
         "                          (default: "
      << base::Size::ToString(base::Config::chunk_size())
      << ")\n"
         "  -v, --verbose           log to stderr (can be repeated for more "
         "verbosity)\n"
         "  -vN, --verbose=N        set verbosity to N (0 to 7)\n"
         "  -s, --syslog            log to syslog instead of stderr\n"
         "  -h, --help              print this help message and exit\n"
         "  -V, --version           print version and exit\n"
         "\n"
         "<size> is a byte count, optionally followed by KB, MB, GB or TB "
         "(powers of 1024).\n"
      << std::endl;
}

void PrintVersion() {
  std::cout << PACKAGE_NAME << ", " << PACKAGE_VERSION << ", "
            << "compute AWS S3 ETags for local files" << std::endl;
}

void IncreaseVerbosity() {
  base::Config::Set(
      "verbosity",
      std::to_string(std::min(base::Config::verbosity() + 1, LOG_DEBUG)));
}
}  // namespace
}  // namespace s3etag

int main(int argc, char **argv) {
  using s3etag::base::Config;
  using s3etag::base::Logger;

  int opt = 0;

  try {
    while ((opt = getopt_long(argc, argv, s3etag::SHORT_OPTIONS,
                              s3etag::LONG_OPTIONS, nullptr)) != -1) {
      switch (opt) {
        case 't':
          Config::Set("threshold", optarg);
          break;

        case 'c':
          Config::Set("chunk_size", optarg);
          break;

        case 'v':
          if (optarg)
            Config::Set("verbosity", optarg);
          else
            s3etag::IncreaseVerbosity();
          break;

        case 's':
          Config::Set("log_to_syslog", "true");
          break;

        case 'h':
          s3etag::PrintUsage(argv[0], std::cout);
          return 0;

        case 'V':
          s3etag::PrintVersion();
          return 0;

        default:
          s3etag::PrintUsage(argv[0], std::cerr);
          return s3etag::EXIT_USAGE;
      }
    }

    Config::Validate();
  } catch (const std::exception &e) {
    std::cerr << s3etag::GetBaseName(argv[0]) << ": " << e.what()
              << std::endl;
    return s3etag::EXIT_USAGE;
  }

  if (optind >= argc) {
    s3etag::PrintUsage(argv[0], std::cerr);
    return s3etag::EXIT_USAGE;
  }

  Logger::Init(
      Config::log_to_syslog() ? Logger::Mode::SYSLOG : Logger::Mode::STDERR,
      Config::verbosity());

  const s3etag::etag::Calculator calculator(Config::threshold(),
                                            Config::chunk_size());
  s3etag::etag::Reporter reporter(calculator, std::cout, std::cerr);

  for (int i = optind; i < argc; i++) reporter.Print(argv[i]);

  return reporter.failure_count() ? s3etag::EXIT_FILE_ERROR : 0;
}
