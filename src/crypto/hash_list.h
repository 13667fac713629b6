/*
 * crypto/hash_list.h
 * -------------------------------------------------------------------------
 * Templated list of part hashes, with a root hash over the raw part hashes.
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

#ifndef S3ETAG_CRYPTO_HASH_LIST_H
#define S3ETAG_CRYPTO_HASH_LIST_H

#include <stdexcept>
#include <string>
#include <vector>

#include "crypto/encoder.h"
#include "crypto/hash.h"

namespace s3etag {
namespace crypto {
// parts must be added in order. this is the scheme S3 uses for the ETag of
// a multipart upload: hash(hash(part 1) || hash(part 2) || ...).
template <class HashType>
class HashList {
 public:
  inline void AddPartHash(const uint8_t *hash) {
    hashes_.insert(hashes_.end(), hash, hash + HashType::HASH_LEN);
  }

  inline void AddPart(const uint8_t *data, size_t size) {
    uint8_t hash[HashType::HASH_LEN];
    Hash::Compute<HashType>(data, size, hash);
    AddPartHash(hash);
  }

  inline size_t part_count() const {
    return hashes_.size() / HashType::HASH_LEN;
  }

  template <class EncoderType>
  inline std::string GetPartHash(size_t part) const {
    if (part >= part_count())
      throw std::out_of_range("part index out of range.");

    return Encoder::Encode<EncoderType>(&hashes_[part * HashType::HASH_LEN],
                                        HashType::HASH_LEN);
  }

  template <class EncoderType>
  inline std::string GetRootHash() const {
    uint8_t root_hash[HashType::HASH_LEN];
    Hash::Compute<HashType>(hashes_, root_hash);
    return Encoder::Encode<EncoderType>(root_hash, HashType::HASH_LEN);
  }

 private:
  std::vector<uint8_t> hashes_;
};
}  // namespace crypto
}  // namespace s3etag

#endif
