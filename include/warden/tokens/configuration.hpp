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

#ifndef __WARDEN_TOKENS_CONFIGURATION_HPP__
#define __WARDEN_TOKENS_CONFIGURATION_HPP__

#include <stdint.h>

#include <map>
#include <string>

#include <warden/tokens/constants.hpp>

#include <stout/duration.hpp>

namespace warden {
namespace tokens {

// How secrets are hashed before being stored. Hashes embed these
// parameters, so changing them does not invalidate issued tokens.
struct HashParameters
{
  HashParameters()
    : algorithm(DEFAULT_HASH_ALGORITHM),
      iterations(DEFAULT_HASH_ITERATIONS),
      saltSize(DEFAULT_HASH_SALT_SIZE) {}

  // An OpenSSL digest name (e.g. 'SHA-256'), or 'PBKDF2-' followed by
  // one (e.g. 'PBKDF2-SHA512').
  std::string algorithm;
  int iterations;
  int saltSize;
};


struct Configuration
{
  Configuration()
    : expiration(DEFAULT_TOKEN_EXPIRATION),
      length(DEFAULT_TOKEN_LENGTH),
      cleanupThreshold(DEFAULT_TOKEN_CLEANUP_THRESHOLD),
      refresh(true) {}

  // Builds a configuration from string options: 'tokenExpiration' (in
  // milliseconds), 'tokenLength', 'tokenCleanupThreshold',
  // 'tokenRefresh', 'hashAlgorithm', 'hashIterations' and
  // 'hashSaltSize'. An option that cannot be parsed or is out of range
  // keeps its default and a warning is logged, so this never fails.
  static Configuration create(const std::map<std::string, std::string>& options);

  Duration expiration;
  int length;
  int64_t cleanupThreshold;
  bool refresh;
  HashParameters hash;
};

} // namespace tokens {
} // namespace warden {

#endif // __WARDEN_TOKENS_CONFIGURATION_HPP__
