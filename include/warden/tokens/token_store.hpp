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

#ifndef __WARDEN_TOKENS_TOKEN_STORE_HPP__
#define __WARDEN_TOKENS_TOKEN_STORE_HPP__

#include <string>

#include <warden/identity/directory.hpp>

#include <warden/state/tree.hpp>

#include <warden/tokens/configuration.hpp>
#include <warden/tokens/credentials.hpp>

#include <process/time.hpp>

#include <stout/error.hpp>
#include <stout/hashmap.hpp>
#include <stout/option.hpp>
#include <stout/try.hpp>

namespace warden {
namespace tokens {

// Represents the ways issuing a token can fail.
class TokenError : public Error
{
public:
  enum Type
  {
    IDENTITY_NOT_FOUND, // Absent, a group, or disabled.
    STORAGE_FAILURE     // Storage error, including exhausted retries.
  };

  TokenError(Type _type, const std::string& _message)
    : Error(_message), type(_type) {}

  Type type;
};


// A login token together with the state of its node, as seen when it
// was issued or resolved. Instances refer to the root and must not
// outlive it.
class TokenInfo
{
public:
  // The full token string, '<id>_<secret>'.
  const std::string& token() const { return token_; }

  const std::string& userId() const { return userId_; }

  // Stable identifier of the token node.
  const std::string& id() const { return id_; }

  const process::Time& expiresAt() const { return expiresAt_; }

  // Attributes that must be presented along with the token.
  const hashmap<std::string, std::string>& privateAttributes() const
  {
    return mandatory;
  }

  // Attributes copied to the credentials on a successful match.
  const hashmap<std::string, std::string>& publicAttributes() const
  {
    return informational;
  }

  bool isExpired(const process::Time& now) const;

  // Returns true if the secret in the presented token and every
  // private attribute match. Public attributes are then added to
  // 'credentials' unless already set.
  bool matches(TokenCredentials* credentials) const;

  // Extends the expiration to 'now' plus the configured expiration
  // once less than half of it is left. Returns true only if the new
  // expiration was committed.
  bool refreshExpiration(const process::Time& now);

  // Removes the token. Returns false if it no longer exists or the
  // removal could not be committed.
  bool revoke();

private:
  friend class TokenStore;

  TokenInfo(
      state::Root* root,
      const Configuration& configuration,
      const state::Tree& tree,
      const std::string& token,
      const std::string& userId);

  state::Root* root;
  Configuration configuration;

  std::string path;
  std::string token_;
  std::string userId_;
  std::string id_;
  process::Time expiresAt_;
  std::string keyHash;

  hashmap<std::string, std::string> mandatory;
  hashmap<std::string, std::string> informational;
};


// Issues and resolves login tokens stored below the node of each
// identity. All modifications go through 'root' and are committed
// optimistically; a store (like its root) is used by one thread at a
// time, while any number of stores may share the same storage.
class TokenStore
{
public:
  TokenStore(
      state::Root* _root,
      identity::Directory* _directory,
      const Configuration& _configuration)
    : root(_root),
      directory(_directory),
      configuration(_configuration) {}

  // Returns true if 'credentials' ask for a new token by carrying an
  // empty token attribute.
  bool shouldIssueToken(const Credentials& credentials) const;

  // Issues a token for the identity of 'credentials' and sets the
  // token attribute of 'credentials' to it.
  Option<TokenInfo> issueToken(Credentials* credentials);

  Try<TokenInfo, TokenError> issueToken(
      const std::string& userId,
      const hashmap<std::string, std::string>& attributes);

  // Returns none if the token does not refer to a valid token node
  // of an identity that can log in.
  Option<TokenInfo> resolveToken(const std::string& token);

private:
  Option<state::Tree> getTokenContainer(const identity::Identity& identity);

  Try<TokenInfo> createToken(
      state::Tree* container,
      const process::Time& expiresAt,
      const std::string& userId,
      const hashmap<std::string, std::string>& attributes);

  // Expiration of a token issued at 'creation', honoring an
  // expiration given in the attributes.
  process::Time expiration(
      const process::Time& creation,
      const hashmap<std::string, std::string>& attributes) const;

  state::Root* root;
  identity::Directory* directory;
  const Configuration configuration;
};

} // namespace tokens {
} // namespace warden {

#endif // __WARDEN_TOKENS_TOKEN_STORE_HPP__
