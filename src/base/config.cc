/*
 * base/config.cc
 * -------------------------------------------------------------------------
 * Configuration option storage, parsing and validation.
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

#include "base/config.h"

#include <strings.h>

#include <boost/lexical_cast.hpp>
#include <stdexcept>

#include "base/logger.h"
#include "base/size.h"

namespace s3etag {
namespace base {

namespace {
template <typename T>
class OptionParserWorker {
 public:
  static void Parse(const std::string &str, T *out) {
    try {
      *out = boost::lexical_cast<T>(str);
    } catch (const boost::bad_lexical_cast &) {
      throw std::runtime_error("cannot parse [" + str + "].");
    }
  }
};

// every 64-bit option is a byte count
template <>
class OptionParserWorker<uint64_t> {
 public:
  static void Parse(const std::string &str, uint64_t *out) {
    *out = Size::Parse(str);
  }
};

template <>
class OptionParserWorker<bool> {
 public:
  static void Parse(const std::string &str, bool *out) {
    const char *s = str.c_str();

    if (!strcasecmp(s, "yes") || !strcasecmp(s, "true") ||
        !strcasecmp(s, "1") || !strcasecmp(s, "on")) {
      *out = true;
      return;
    }

    if (!strcasecmp(s, "no") || !strcasecmp(s, "false") ||
        !strcasecmp(s, "0") || !strcasecmp(s, "off")) {
      *out = false;
      return;
    }

    throw std::runtime_error("cannot parse [" + str + "] as a boolean.");
  }
};

template <typename T>
class OptionParser {
 public:
  static void Parse(const char *key, const char *type, const std::string &str,
                    T *out) {
    try {
      OptionParserWorker<T>::Parse(str, out);
    } catch (const std::exception &e) {
      S3ETAG_LOG(LOG_DEBUG, "Config::Set",
                 "cannot parse [%s] for key [%s] of type %s: %s\n",
                 str.c_str(), key, type, e.what());
      throw;
    }
  }
};
}  // namespace

#define CONFIG(type, name, def, desc) type Config::s_##name = (def);
#define CONFIG_CONSTRAINT(x, y)
#define CONFIG_KEY(x)

#include "base/config.inc"

#undef CONFIG
#undef CONFIG_CONSTRAINT
#undef CONFIG_KEY

void Config::Set(const std::string &key, const std::string &value) {
#define CONFIG(type, name, def, desc)                           \
  if (key == #name) {                                           \
    OptionParser<type>::Parse(#name, #type, value, &s_##name);  \
    S3ETAG_LOG(LOG_DEBUG, "Config::Set", "%s = [%s]\n", #name, \
               value.c_str());                                  \
    return;                                                     \
  }

#define CONFIG_CONSTRAINT(x, y)
#define CONFIG_KEY(x)

#include "base/config.inc"

#undef CONFIG
#undef CONFIG_CONSTRAINT
#undef CONFIG_KEY

  throw std::runtime_error("unknown configuration key: " + key);
}

void Config::Validate() {
#define CONFIG(type, name, def, desc)

#define CONFIG_CONSTRAINT(test, message)                      \
  if (!(test)) {                                              \
    S3ETAG_LOG(LOG_ERR, "Config::Validate", "%s\n", message); \
    throw std::runtime_error("invalid configuration");        \
  }

#define CONFIG_KEY(key) s_##key

#include "base/config.inc"

#undef CONFIG
#undef CONFIG_CONSTRAINT
#undef CONFIG_KEY
}

void Config::Reset() {
#define CONFIG(type, name, def, desc) s_##name = (def);
#define CONFIG_CONSTRAINT(x, y)
#define CONFIG_KEY(x)

#include "base/config.inc"

#undef CONFIG
#undef CONFIG_CONSTRAINT
#undef CONFIG_KEY
}

}  // namespace base
}  // namespace s3etag
