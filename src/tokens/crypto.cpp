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

#include <string.h>

#include <limits>
#include <string>
#include <vector>

#include <openssl/crypto.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/rand.h>

#include <stout/error.hpp>
#include <stout/numify.hpp>
#include <stout/stringify.hpp>
#include <stout/strings.hpp>
#include <stout/try.hpp>

#include "tokens/crypto.hpp"

using std::string;
using std::vector;

using warden::tokens::HashParameters;

namespace warden {
namespace internal {
namespace tokens {
namespace crypto {

// Prefix of algorithms deriving the digest with PBKDF2-HMAC instead
// of iterating a plain message digest.
constexpr char PBKDF2_PREFIX[] = "PBKDF2-";


static string lastError()
{
  unsigned long code = ERR_get_error();
  if (code == 0) {
    return "unknown error";
  }

  char buffer[256];
  ERR_error_string_n(code, buffer, sizeof(buffer));
  return buffer;
}


static string toHex(const unsigned char* data, size_t size)
{
  static const char table[] = "0123456789abcdef";

  string result;
  result.reserve(size * 2);
  for (size_t i = 0; i < size; i++) {
    result.push_back(table[(data[i] >> 4) & 0x0f]);
    result.push_back(table[data[i] & 0x0f]);
  }
  return result;
}


static Try<string> fromHex(const string& hex)
{
  if (hex.size() % 2 != 0) {
    return Error("Odd number of hex digits");
  }

  string result;
  result.reserve(hex.size() / 2);
  for (size_t i = 0; i < hex.size(); i += 2) {
    Try<unsigned int> byte = numify<unsigned int>("0x" + hex.substr(i, 2));
    if (byte.isError()) {
      return Error("Invalid hex digits '" + hex.substr(i, 2) + "'");
    }
    result.push_back(static_cast<char>(byte.get()));
  }
  return result;
}


// Resolves a digest name; 'SHA-256' style names are accepted along
// with the names OpenSSL uses ('SHA256', 'sha256').
static const EVP_MD* digest(const string& name)
{
  const EVP_MD* md = EVP_get_digestbyname(name.c_str());
  if (md == nullptr && strings::startsWith(name, "SHA-")) {
    md = EVP_get_digestbyname(("SHA" + name.substr(4)).c_str());
  }
  return md;
}


static Try<string> digest(const EVP_MD* md, const string& data)
{
  unsigned char buffer[EVP_MAX_MD_SIZE];
  unsigned int size = 0;

  EVP_MD_CTX* context = EVP_MD_CTX_new();
  if (context == nullptr) {
    return Error("Failed to allocate digest context: " + lastError());
  }

  const bool success =
    EVP_DigestInit_ex(context, md, nullptr) == 1 &&
    EVP_DigestUpdate(context, data.data(), data.size()) == 1 &&
    EVP_DigestFinal_ex(context, buffer, &size) == 1;

  EVP_MD_CTX_free(context);

  if (!success) {
    return Error("Failed to compute digest: " + lastError());
  }

  return string(reinterpret_cast<const char*>(buffer), size);
}


// Computes the raw digest of 'material' for the given parameters.
static Try<string> compute(
    const string& algorithm,
    const string& salt,
    int iterations,
    const string& material)
{
  if (iterations < 1) {
    return Error("Invalid number of iterations " + stringify(iterations));
  }

  if (strings::startsWith(algorithm, PBKDF2_PREFIX)) {
    const EVP_MD* md = digest(algorithm.substr(strlen(PBKDF2_PREFIX)));
    if (md == nullptr) {
      return Error("Unknown hash algorithm '" + algorithm + "'");
    }

    vector<unsigned char> output(EVP_MD_size(md));

    if (PKCS5_PBKDF2_HMAC(
            material.data(),
            static_cast<int>(material.size()),
            reinterpret_cast<const unsigned char*>(salt.data()),
            static_cast<int>(salt.size()),
            iterations,
            md,
            static_cast<int>(output.size()),
            output.data()) != 1) {
      return Error("Failed to derive key: " + lastError());
    }

    return string(output.begin(), output.end());
  }

  const EVP_MD* md = digest(algorithm);
  if (md == nullptr) {
    return Error("Unknown hash algorithm '" + algorithm + "'");
  }

  Try<string> result = digest(md, salt + material);
  for (int i = 1; i < iterations && result.isSome(); i++) {
    result = digest(md, result.get());
  }

  return result;
}


Try<string> generateSecret(size_t length)
{
  if (length > static_cast<size_t>(std::numeric_limits<int>::max())) {
    return Error("Secret length " + stringify(length) + " is too large");
  }

  vector<unsigned char> bytes(length);

  if (length > 0 &&
      RAND_bytes(bytes.data(), static_cast<int>(length)) != 1) {
    return Error("Failed to generate random bytes: " + lastError());
  }

  return toHex(bytes.data(), bytes.size());
}


Try<string> hash(const string& material, const HashParameters& parameters)
{
  if (parameters.saltSize <= 0) {
    return Error("Invalid salt size " + stringify(parameters.saltSize));
  }

  Try<string> salt = generateSecret(parameters.saltSize);
  if (salt.isError()) {
    return Error("Failed to generate salt: " + salt.error());
  }

  Try<string> rawSalt = fromHex(salt.get());
  if (rawSalt.isError()) {
    return Error(rawSalt.error());
  }

  Try<string> digest = compute(
      parameters.algorithm,
      rawSalt.get(),
      parameters.iterations,
      material);

  if (digest.isError()) {
    return Error(digest.error());
  }

  const string& raw = digest.get();

  return "{" + parameters.algorithm + "}" + salt.get() + "-" +
         stringify(parameters.iterations) + "-" +
         toHex(reinterpret_cast<const unsigned char*>(raw.data()), raw.size());
}


bool verify(const string& hash, const string& candidate)
{
  if (!strings::startsWith(hash, "{")) {
    return false;
  }

  const size_t end = hash.find('}');
  if (end == string::npos) {
    return false;
  }

  const string algorithm = hash.substr(1, end - 1);

  // Salt, iterations and digest; the salt may be empty.
  const vector<string> parts = strings::split(hash.substr(end + 1), "-");
  if (parts.size() != 3) {
    return false;
  }

  Try<string> salt = fromHex(parts[0]);
  if (salt.isError()) {
    return false;
  }

  Try<int> iterations = numify<int>(parts[1]);
  if (iterations.isError()) {
    return false;
  }

  Try<string> expected = fromHex(parts[2]);
  if (expected.isError() || expected->empty()) {
    return false;
  }

  Try<string> actual =
    compute(algorithm, salt.get(), iterations.get(), candidate);

  if (actual.isError() || actual->size() != expected->size()) {
    return false;
  }

  return CRYPTO_memcmp(
      actual->data(), expected->data(), expected->size()) == 0;
}


bool isSupported(const string& algorithm)
{
  if (strings::startsWith(algorithm, PBKDF2_PREFIX)) {
    return digest(algorithm.substr(strlen(PBKDF2_PREFIX))) != nullptr;
  }
  return digest(algorithm) != nullptr;
}

} // namespace crypto {
} // namespace tokens {
} // namespace internal {
} // namespace warden {
