/*
 * base/config.h
 * -------------------------------------------------------------------------
 * Configuration options, with defaults and command-line overrides.
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

#ifndef S3ETAG_BASE_CONFIG_H
#define S3ETAG_BASE_CONFIG_H

#include <syslog.h>

#include <cstdint>
#include <string>

namespace s3etag {
namespace base {
class Config {
 public:
  // parses value according to the type of key. throws std::runtime_error
  // for unknown keys or bad values (InvalidSizeFormat for byte counts).
  static void Set(const std::string &key, const std::string &value);

  // throws std::runtime_error if any constraint in config.inc fails
  static void Validate();

  static void Reset();

#define CONFIG(type, name, def, desc) \
 private:                             \
  static type s_##name;               \
                                      \
 public:                              \
  inline static const type &name() { return s_##name; }

#define CONFIG_CONSTRAINT(x, y)
#define CONFIG_KEY(x)

#include "base/config.inc"

#undef CONFIG
#undef CONFIG_CONSTRAINT
#undef CONFIG_KEY
};
}  // namespace base
}  // namespace s3etag

#endif
