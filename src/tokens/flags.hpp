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

#ifndef __TOKENS_FLAGS_HPP__
#define __TOKENS_FLAGS_HPP__

#include <stdint.h>

#include <string>

#include <warden/tokens/constants.hpp>

#include <stout/duration.hpp>
#include <stout/flags.hpp>

namespace warden {
namespace internal {
namespace tokens {

class Flags : public virtual flags::FlagsBase
{
public:
  Flags()
  {
    add(&Flags::token_expiration,
        "tokenExpiration",
        "How long (in milliseconds) a login token stays valid after it\n"
        "is issued or refreshed, unless overridden when the token is\n"
        "issued.",
        warden::tokens::DEFAULT_TOKEN_EXPIRATION.ns() / Milliseconds(1).ns());

    add(&Flags::token_length,
        "tokenLength",
        "Number of random bytes in the secret part of a login token.",
        warden::tokens::DEFAULT_TOKEN_LENGTH);

    add(&Flags::token_cleanup_threshold,
        "tokenCleanupThreshold",
        "Number of tokens an identity must hold before expired tokens\n"
        "are removed when a new one is issued. Zero disables the cleanup.",
        warden::tokens::DEFAULT_TOKEN_CLEANUP_THRESHOLD);

    add(&Flags::token_refresh,
        "tokenRefresh",
        "Whether the expiration of a token is extended when it is used\n"
        "in the second half of its lifetime.",
        true);

    add(&Flags::hash_algorithm,
        "hashAlgorithm",
        "Algorithm used to hash token secrets: an OpenSSL digest name\n"
        "(e.g. 'SHA-256') or 'PBKDF2-' followed by one.",
        warden::tokens::DEFAULT_HASH_ALGORITHM);

    add(&Flags::hash_iterations,
        "hashIterations",
        "Number of hash iterations applied to token secrets.",
        warden::tokens::DEFAULT_HASH_ITERATIONS);

    add(&Flags::hash_salt_size,
        "hashSaltSize",
        "Number of random salt bytes used when hashing token secrets.",
        warden::tokens::DEFAULT_HASH_SALT_SIZE);
  }

  int64_t token_expiration;
  int token_length;
  int64_t token_cleanup_threshold;
  bool token_refresh;
  std::string hash_algorithm;
  int hash_iterations;
  int hash_salt_size;
};

} // namespace tokens {
} // namespace internal {
} // namespace warden {

#endif // __TOKENS_FLAGS_HPP__
