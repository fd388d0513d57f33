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

#ifndef __TOKENS_EXPIRATION_HPP__
#define __TOKENS_EXPIRATION_HPP__

#include <stdint.h>

#include <warden/state/tree.hpp>

#include <process/time.hpp>

#include <stout/duration.hpp>
#include <stout/nothing.hpp>
#include <stout/option.hpp>
#include <stout/try.hpp>

namespace warden {
namespace internal {
namespace tokens {

// Returns 'creation' plus 'ttl', or the latest representable time if
// that would overflow.
process::Time expirationTime(const process::Time& creation, const Duration& ttl);

// A token is still valid at the exact instant it expires.
bool isExpired(const process::Time& expiresAt, const process::Time& now);

// Returns true once at most half of 'ttl' is left before 'expiresAt'.
bool shouldRefresh(
    const process::Time& expiresAt,
    const process::Time& now,
    const Duration& ttl);

// Expiration times are persisted as milliseconds since the epoch.
int64_t toMillis(const process::Time& time);
Option<process::Time> fromMillis(int64_t millis);

// Returns none if the node has no (or a malformed) expiration time.
Option<process::Time> readExpiration(const warden::state::Tree& tree);

Try<Nothing> writeExpiration(warden::state::Tree* tree, const process::Time& expiresAt);

} // namespace tokens {
} // namespace internal {
} // namespace warden {

#endif // __TOKENS_EXPIRATION_HPP__
