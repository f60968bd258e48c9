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

#ifndef STRATA_UTIL_ENCODING_TEST_UTIL_H
#define STRATA_UTIL_ENCODING_TEST_UTIL_H

#include <climits>
#include <cstdint>
#include <random>
#include <vector>

namespace strata {

/// Generates a sequence that contains repeated and literal runs with random lengths.
/// Run lengths are at most 'max_run_length'. It only generates values that can be
/// represented with 'bit_width' bits.
template<typename RandomEngine>
std::vector<uint64_t> MakeRandomSequence(RandomEngine& random_eng, int total_length,
    int max_run_length, int bit_width) {
  std::uniform_int_distribution<int> run_length_dist(1, max_run_length);
  std::uniform_int_distribution<int> coin(0, 1);
  const uint64_t mask = bit_width == 64 ? ~0UL : (1UL << bit_width) - 1;

  std::vector<uint64_t> ret;
  uint64_t val = 0;
  while (ret.size() < total_length) {
    int run_length = run_length_dist(random_eng);
    bool is_repeated = coin(random_eng) == 0;
    val = (val + 1) & mask;
    for (int i = 0; i < run_length && ret.size() < total_length; ++i) {
      ret.push_back(val);
      if (!is_repeated) val = (val + 1) & mask;
    }
  }
  return ret;
}

}

#endif
