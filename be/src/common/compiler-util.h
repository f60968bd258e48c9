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


#ifndef STRATA_COMMON_COMPILER_UTIL_H
#define STRATA_COMMON_COMPILER_UTIL_H

/// Compiler hint that this branch is likely or unlikely to
/// be taken.
/// example: if (LIKELY(size > 0)) { ... }
/// example: if (UNLIKELY(!status.ok())) { ... }
#ifdef LIKELY
#undef LIKELY
#endif

#ifdef UNLIKELY
#undef UNLIKELY
#endif

#define LIKELY(expr) __builtin_expect(!!(expr), 1)
#define UNLIKELY(expr) __builtin_expect(!!(expr), 0)

/// Force inlining. The 'inline' keyword is treated by most compilers as a hint,
/// not a command. This should be used sparingly for small functions on the
/// encode/decode hot paths.
#define ALWAYS_INLINE __attribute__((always_inline))

/// Clang is pedantic about __restrict__, just disable it there.
#ifdef __clang__
#define RESTRICT
#else
#define RESTRICT __restrict__
#endif

#define WARN_UNUSED_RESULT __attribute__((warn_unused_result))

#endif
