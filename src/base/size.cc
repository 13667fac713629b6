/*
 * base/size.cc
 * -------------------------------------------------------------------------
 * Byte count parsing and formatting (implementation).
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

#include "base/size.h"

#include <boost/lexical_cast.hpp>
#include <limits>
#include <regex>

namespace s3etag {
namespace base {

namespace {
struct Unit {
  const char *suffix;
  uint64_t multiplier;
};

// largest first, for ToString()
constexpr Unit UNITS[] = {{"TB", uint64_t(1) << 40},
                          {"GB", uint64_t(1) << 30},
                          {"MB", uint64_t(1) << 20},
                          {"KB", uint64_t(1) << 10}};

uint64_t GetMultiplier(const std::string &suffix) {
  if (suffix.empty()) return 1;

  for (const auto &unit : UNITS)
    if (suffix == unit.suffix) return unit.multiplier;

  // the expression only lets known suffixes through
  throw std::logic_error("unhandled size suffix");
}
}  // namespace

InvalidSizeFormat::InvalidSizeFormat(const std::string &input)
    : std::runtime_error("invalid size value: '" + input + "'"),
      input_(input) {}

uint64_t Size::Parse(const std::string &text) {
  static const std::regex EXPR("([0-9]+)(KB|MB|GB|TB)?");

  std::smatch match;
  if (!std::regex_match(text, match, EXPR)) throw InvalidSizeFormat(text);

  uint64_t count = 0;
  try {
    count = boost::lexical_cast<uint64_t>(match[1].str());
  } catch (const boost::bad_lexical_cast &) {
    // too many digits for 64 bits
    throw InvalidSizeFormat(text);
  }

  const uint64_t multiplier = GetMultiplier(match[2].str());
  if (count > std::numeric_limits<uint64_t>::max() / multiplier)
    throw InvalidSizeFormat(text);

  return count * multiplier;
}

std::string Size::ToString(uint64_t bytes) {
  if (bytes != 0) {
    for (const auto &unit : UNITS)
      if (bytes % unit.multiplier == 0)
        return std::to_string(bytes / unit.multiplier) + unit.suffix;
  }

  return std::to_string(bytes);
}

}  // namespace base
}  // namespace s3etag
