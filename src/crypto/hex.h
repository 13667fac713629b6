/*
 * crypto/hex.h
 * -------------------------------------------------------------------------
 * Lowercase hex encoder.
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

#ifndef S3ETAG_CRYPTO_HEX_H
#define S3ETAG_CRYPTO_HEX_H

#include <cstdint>
#include <string>
#include <vector>

namespace s3etag {
namespace crypto {
class Encoder;

class Hex {
 private:
  friend class Encoder;

  static std::string Encode(const uint8_t *input, size_t size);

  // accepts either case. throws std::runtime_error on odd lengths or
  // non-hex characters.
  static std::vector<uint8_t> Decode(const std::string &input);
};
}  // namespace crypto
}  // namespace s3etag

#endif
