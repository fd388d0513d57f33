// Licensed to the Apache Software Foundation (ASF) under one
// or more contributor license agreements.  See the NOTICE file
// distributed with this work for additional information
// regarding copyright ownership.  The ASF licenses this file
// to you under the Apache License, Version 2.0 (the
// "License"); you may not use this file except in compliance
// with the License.  You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#ifndef __TOKENS_CLEANUP_HPP__
#define __TOKENS_CLEANUP_HPP__

#include <stdint.h>

#include <string>

#include <warden/state/tree.hpp>

#include <process/time.hpp>

namespace warden {
namespace internal {
namespace tokens {

// Samples about one in eight issued tokens, based on the first (hex)
// character of the token.
bool shouldRunCleanup(const std::string& token);


// Removes the tokens below 'container' that expired before 'issuedAt',
// the issuance time of 'token'. Nothing happens unless 'threshold' is
// positive, 'token' is sampled, and the container holds at least
// 'threshold' tokens. All removals are committed at once; on conflict
// or failure the pass is abandoned and 'root' refreshed.
//
// Returns the number of tokens removed.
size_t cleanupExpired(
    warden::state::Root* root,
    const warden::state::Tree& container,
    int64_t threshold,
    const process::Time& issuedAt,
    const std::string& token);

} // namespace tokens {
} // namespace internal {
} // namespace warden {

#endif // __TOKENS_CLEANUP_HPP__
