// Licensed to the Apache Software Foundation (ASF) under one
// or more contributor license agreements.  See the NOTICE file
// distributed with this work for additional information
// regarding copyright ownership.  The ASF licenses this file
// to you under the Apache License, Version 2.0 (the
// "License"); you may not use this file except in compliance
// with the License.  You may obtain a copy of the License at
//
//   http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing,
// software distributed under the License is distributed on an
// "AS IS" BASIS, WITHOUT WARRANTIES OR CONDITIONS OF ANY
// KIND, either express or implied.  See the License for the
// specific language governing permissions and limitations
// under the License.


#ifndef STRATA_UTIL_HASH_UTIL_H
#define STRATA_UTIL_HASH_UTIL_H

#include <cstdint>

#include "common/compiler-util.h"

namespace strata {

// Utility class to compute hash values.
class HashUtil {
 public:
  // default values recommended by http://isthe.com/chongo/tech/comp/fnv/
  static const uint32_t FNV_PRIME = 0x01000193; //   16777619
  static const uint32_t FNV_SEED = 0x811C9DC5; // 2166136261

  // Implementation of the Fowler-Noll-Vo hash function. For ints, identity hashes can
  // be pathological. For example, if the data is <1000, 2000, 3000, 4000, ..> and then
  // the mod of 1000 is taken on the hash, all values will collide to the same bucket.
  static uint32_t FnvHash(const void* data, int32_t bytes, uint32_t hash) {
    const uint8_t* ptr = reinterpret_cast<const uint8_t*>(data);
    while (bytes--) {
      hash = (*ptr ^ hash) * FNV_PRIME;
      ++ptr;
    }
    return hash;
  }

  // Computes the hash value for data.
  static uint32_t Hash(const void* data, int32_t bytes, uint32_t seed) {
    return FnvHash(data, bytes, seed);
  }
};

}

#endif
