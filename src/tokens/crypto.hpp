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

#ifndef __TOKENS_CRYPTO_HPP__
#define __TOKENS_CRYPTO_HPP__

#include <string>

#include <warden/tokens/configuration.hpp>

#include <stout/try.hpp>

namespace warden {
namespace internal {
namespace tokens {
namespace crypto {

// Returns 'length' cryptographically secure random bytes, hex encoded
// (i.e. a string of 2 * 'length' lowercase hex digits).
Try<std::string> generateSecret(size_t length);


// Returns a salted one-way hash of 'material' of the form
//
//   {<algorithm>}<salt>-<iterations>-<digest>
//
// where salt and digest are hex encoded. The parameters are embedded
// so that 'verify' does not depend on the current configuration.
Try<std::string> hash(
    const std::string& material,
    const warden::tokens::HashParameters& parameters);


// Returns true if 'candidate' hashes to 'hash' using the algorithm,
// salt and iterations embedded in 'hash'. The digests are compared in
// constant time. Malformed hashes never verify.
bool verify(const std::string& hash, const std::string& candidate);


// Returns true if 'algorithm' names a supported hash algorithm.
bool isSupported(const std::string& algorithm);

} // namespace crypto {
} // namespace tokens {
} // namespace internal {
} // namespace warden {

#endif // __TOKENS_CRYPTO_HPP__
