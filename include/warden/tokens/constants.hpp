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

#ifndef __WARDEN_TOKENS_CONSTANTS_HPP__
#define __WARDEN_TOKENS_CONSTANTS_HPP__

#include <stdint.h>

#include <stout/duration.hpp>

namespace warden {
namespace tokens {

// Credentials attribute requesting a new login token when present
// with an empty value, and carrying the token once issued. Token
// attributes whose name starts with it are mandatory: a login with
// the token only succeeds if the credentials carry the same value.
constexpr char TOKEN_ATTRIBUTE[] = ".token";

// Properties of a token node holding the salted hash of the secret
// and the expiration time.
constexpr char TOKEN_ATTRIBUTE_KEY[] = "warden:token.key";
constexpr char TOKEN_ATTRIBUTE_EXPIRY[] = "warden:token.exp";

// Attribute overriding the expiration (in milliseconds) of a single
// token at issuance.
constexpr char TOKEN_EXPIRATION_ATTRIBUTE[] = "tokenExpiration";

// Name and kind of the per-identity node holding its tokens, and
// kind of the token nodes themselves.
constexpr char TOKENS_NODE_NAME[] = ".tokens";
constexpr char TOKENS_NODE_TYPE[] = "warden:Tokens";
constexpr char TOKEN_NODE_TYPE[] = "warden:Token";

// Separates the node identifier from the secret in a token string.
constexpr char TOKEN_DELIMITER = '_';

constexpr Duration DEFAULT_TOKEN_EXPIRATION = Hours(2);

// Number of random bytes in the secret of a token.
constexpr int DEFAULT_TOKEN_LENGTH = 8;

// Number of token nodes below which expired tokens are never cleaned
// up; zero disables the cleanup.
constexpr int64_t DEFAULT_TOKEN_CLEANUP_THRESHOLD = 0;

constexpr char DEFAULT_HASH_ALGORITHM[] = "SHA-256";
constexpr int DEFAULT_HASH_ITERATIONS = 1000;
constexpr int DEFAULT_HASH_SALT_SIZE = 8;

} // namespace tokens {
} // namespace warden {

#endif // __WARDEN_TOKENS_CONSTANTS_HPP__
