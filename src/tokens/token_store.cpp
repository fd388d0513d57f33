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

#include <string>

#include <glog/logging.h>

#include <warden/identity/directory.hpp>

#include <warden/state/state.pb.h>
#include <warden/state/storage.hpp>
#include <warden/state/tree.hpp>

#include <warden/tokens/commit_marker.hpp>
#include <warden/tokens/constants.hpp>
#include <warden/tokens/credentials.hpp>
#include <warden/tokens/token_store.hpp>

#include <process/clock.hpp>
#include <process/time.hpp>

#include <stout/duration.hpp>
#include <stout/foreach.hpp>
#include <stout/hashmap.hpp>
#include <stout/none.hpp>
#include <stout/numify.hpp>
#include <stout/option.hpp>
#include <stout/result.hpp>
#include <stout/try.hpp>
#include <stout/uuid.hpp>

#include "tokens/attributes.hpp"
#include "tokens/cleanup.hpp"
#include "tokens/crypto.hpp"
#include "tokens/expiration.hpp"

namespace crypto = warden::internal::tokens::crypto;

using std::string;

using process::Clock;
using process::Time;

using warden::identity::Identity;

using warden::internal::state::Property;

using warden::internal::tokens::TokenAttributes;

using warden::state::IDENTIFIER;
using warden::state::Tree;

namespace warden {
namespace tokens {

// Returns the secret part of 'token', i.e. everything after the last
// delimiter (the whole token if there is none).
static string secretOf(const string& token)
{
  const size_t delimiter = token.rfind(TOKEN_DELIMITER);
  return delimiter == string::npos ? token : token.substr(delimiter + 1);
}


// Returns the identifier part of 'token', i.e. everything before the
// first delimiter (the whole token if there is none).
static string identifierOf(const string& token)
{
  const size_t delimiter = token.find(TOKEN_DELIMITER);
  return delimiter == string::npos ? token : token.substr(0, delimiter);
}


static bool isValidTokenTree(const Tree& tree)
{
  return tree.exists() &&
         tree.parent().name() == TOKENS_NODE_NAME &&
         tree.primaryType() == TOKEN_NODE_TYPE;
}


static bool canLogin(const Identity& identity)
{
  return !identity.isGroup() && !identity.isDisabled();
}


// Token decisions are made on the credentials being impersonated.
static const SimpleCredentials* extract(const Credentials& credentials)
{
  const ImpersonationCredentials* impersonation =
    dynamic_cast<const ImpersonationCredentials*>(&credentials);

  if (impersonation != nullptr) {
    if (impersonation->baseCredentials() == nullptr) {
      return nullptr;
    }
    return dynamic_cast<const SimpleCredentials*>(
        impersonation->baseCredentials());
  }

  return dynamic_cast<const SimpleCredentials*>(&credentials);
}


static SimpleCredentials* extract(Credentials* credentials)
{
  ImpersonationCredentials* impersonation =
    dynamic_cast<ImpersonationCredentials*>(credentials);

  if (impersonation != nullptr) {
    return dynamic_cast<SimpleCredentials*>(impersonation->baseCredentials());
  }

  return dynamic_cast<SimpleCredentials*>(credentials);
}


static void refresh(state::Root* root)
{
  Try<Nothing> refresh = root->refresh();
  if (refresh.isError()) {
    LOG(WARNING) << "Failed to refresh the token root: " << refresh.error();
  }
}


TokenInfo::TokenInfo(
    state::Root* _root,
    const Configuration& _configuration,
    const Tree& tree,
    const string& _token,
    const string& _userId)
  : root(_root),
    configuration(_configuration),
    path(tree.path()),
    token_(_token),
    userId_(_userId)
{
  Option<Property> identifier = tree.property(IDENTIFIER);
  if (identifier.isSome()) {
    id_ = identifier->value();
  }

  // A token without a (valid) expiration has always been expired.
  expiresAt_ = internal::tokens::readExpiration(tree).getOrElse(Time::epoch());

  Option<Property> key = tree.property(TOKEN_ATTRIBUTE_KEY);
  if (key.isSome()) {
    keyHash = key->value();
  }

  TokenAttributes attributes =
    internal::tokens::partition(tree.properties());

  mandatory = attributes.mandatory;
  informational = attributes.informational;
}


bool TokenInfo::isExpired(const Time& now) const
{
  return internal::tokens::isExpired(expiresAt_, now);
}


bool TokenInfo::matches(TokenCredentials* credentials) const
{
  if (!crypto::verify(keyHash, secretOf(credentials->token()) + userId_)) {
    VLOG(1) << "Secret of token " << id_ << " does not match";
    return false;
  }

  foreachpair (const string& name, const string& value, mandatory) {
    if (credentials->attribute(name) != value) {
      VLOG(1) << "Attribute '" << name << "' of token " << id_
              << " does not match";
      return false;
    }
  }

  foreachpair (const string& name, const string& value, informational) {
    if (!credentials->hasAttribute(name)) {
      credentials->setAttribute(name, value);
    }
  }

  return true;
}


bool TokenInfo::refreshExpiration(const Time& now)
{
  if (!configuration.refresh) {
    return false;
  }

  Tree tree = root->getTree(path);
  if (!tree.exists()) {
    return false;
  }

  if (isExpired(now)) {
    VLOG(1) << "Not refreshing expired token " << id_;
    return false;
  }

  if (!internal::tokens::shouldRefresh(
          expiresAt_, now, configuration.expiration)) {
    return false;
  }

  const Time expiresAt =
    internal::tokens::expirationTime(now, configuration.expiration);

  Try<Nothing> write = internal::tokens::writeExpiration(&tree, expiresAt);
  if (write.isError()) {
    VLOG(1) << "Failed to refresh token " << id_ << ": " << write.error();
    refresh(root);
    return false;
  }

  Try<bool> commit = root->commit(CommitMarker::asCommitAttributes());
  if (commit.isError() || !commit.get()) {
    VLOG(1) << "Failed to refresh token " << id_ << ": "
            << (commit.isError() ? commit.error() : "commit conflict");
    refresh(root);
    return false;
  }

  VLOG(1) << "Refreshed token " << id_ << " to expire in "
          << (expiresAt - now);

  expiresAt_ = expiresAt;
  return true;
}


bool TokenInfo::revoke()
{
  Tree tree = root->getTree(path);
  if (!tree.remove()) {
    return false;
  }

  Try<bool> commit = root->commit(CommitMarker::asCommitAttributes());
  if (commit.isError() || !commit.get()) {
    VLOG(1) << "Failed to remove token " << id_ << ": "
            << (commit.isError() ? commit.error() : "commit conflict");
    refresh(root);
    return false;
  }

  return true;
}


bool TokenStore::shouldIssueToken(const Credentials& credentials) const
{
  const SimpleCredentials* simple = extract(credentials);
  if (simple == nullptr) {
    return false;
  }

  Option<string> token = simple->attribute(TOKEN_ATTRIBUTE);
  return token.isSome() && token->empty();
}


Option<TokenInfo> TokenStore::issueToken(Credentials* credentials)
{
  SimpleCredentials* simple = extract(credentials);
  if (simple == nullptr) {
    VLOG(1) << "Unsupported credentials, cannot issue a token";
    return None();
  }

  Try<TokenInfo, TokenError> info =
    issueToken(simple->userId(), simple->attributes());

  if (info.isError()) {
    VLOG(1) << "Failed to issue a token for '" << simple->userId() << "': "
            << info.error().message;
    return None();
  }

  simple->setAttribute(TOKEN_ATTRIBUTE, info->token());

  return info.get();
}


Try<TokenInfo, TokenError> TokenStore::issueToken(
    const string& userId,
    const hashmap<string, string>& attributes)
{
  Result<Identity> identity = directory->find(userId);

  if (identity.isError()) {
    LOG(ERROR) << "Failed to look up identity '" << userId << "': "
               << identity.error();
    return TokenError(
        TokenError::STORAGE_FAILURE,
        "Failed to look up identity '" + userId + "': " + identity.error());
  }

  if (identity.isNone() || !canLogin(identity.get())) {
    VLOG(1) << "Not issuing a token for unknown or disabled identity '"
            << userId << "'";
    return TokenError(
        TokenError::IDENTITY_NOT_FOUND,
        "Unknown or disabled identity '" + userId + "'");
  }

  Option<Tree> container = getTokenContainer(identity.get());
  if (container.isNone()) {
    LOG(ERROR) << "Unable to get or create the token container of '"
               << userId << "'";
    return TokenError(
        TokenError::STORAGE_FAILURE,
        "Unable to get or create the token container of '" + userId + "'");
  }

  const Time creation = Clock::now();
  const Time expiresAt = expiration(creation, attributes);

  // A conflict is retried once, with a new node.
  Option<string> failure;
  for (int attempt = 0; attempt < 2; attempt++) {
    Try<TokenInfo> info =
      createToken(&container.get(), expiresAt, identity->id, attributes);

    if (info.isError()) {
      failure = "Failed to create the token: " + info.error();
      refresh(root);
      break;
    }

    Try<bool> commit = root->commit(CommitMarker::asCommitAttributes());

    if (commit.isError()) {
      failure = "Failed to commit the token: " + commit.error();
      refresh(root);
      break;
    }

    if (commit.get()) {
      internal::tokens::cleanupExpired(
          root,
          container.get(),
          configuration.cleanupThreshold,
          creation,
          info->token());

      return info.get();
    }

    VLOG(1) << "Conflict while committing a token for '" << userId << "'";

    failure = "Too many conflicts while committing the token";
    refresh(root);
  }

  LOG(ERROR) << "Failed to issue a token for '" << userId << "': "
             << failure.get();

  return TokenError(TokenError::STORAGE_FAILURE, failure.get());
}


Option<TokenInfo> TokenStore::resolveToken(const string& token)
{
  Option<Tree> tree = root->getTreeByIdentifier(identifierOf(token));

  if (tree.isNone() || !isValidTokenTree(tree.get())) {
    VLOG(1) << "Token does not refer to a valid token node";
    return None();
  }

  const string owner = tree->parent().parent().path();

  Result<Identity> identity = directory->findByPath(owner);

  if (identity.isError()) {
    VLOG(1) << "Cannot determine the owner of a token at '" << owner
            << "': " << identity.error();
    return None();
  }

  if (identity.isNone() || !canLogin(identity.get())) {
    VLOG(1) << "Token at '" << owner << "' belongs to an unknown or"
            << " disabled identity";
    return None();
  }

  return TokenInfo(root, configuration, tree.get(), token, identity->id);
}


Option<Tree> TokenStore::getTokenContainer(const Identity& identity)
{
  Tree node = root->getTree(identity.path);
  if (!node.exists()) {
    VLOG(1) << "No node for identity '" << identity.id << "' at '"
            << identity.path << "'";
    return None();
  }

  Try<Tree> container = node.getOrAddChild(TOKENS_NODE_NAME, TOKENS_NODE_TYPE);
  if (container.isError()) {
    VLOG(1) << "Failed to add the token container of '" << identity.id
            << "': " << container.error();
    refresh(root);
    return None();
  }

  if (!root->hasPendingChanges()) {
    return container.get();
  }

  Try<bool> commit = root->commit(CommitMarker::asCommitAttributes());

  if (commit.isError()) {
    VLOG(1) << "Failed to commit the token container of '" << identity.id
            << "': " << commit.error();
    refresh(root);
    return None();
  }

  if (!commit.get()) {
    // Most likely created concurrently, see if it exists now.
    VLOG(1) << "Conflict while creating the token container of '"
            << identity.id << "'";

    refresh(root);

    Tree existing = root->getTree(container->path());
    if (!existing.exists()) {
      return None();
    }
    return existing;
  }

  return container.get();
}


Try<TokenInfo> TokenStore::createToken(
    Tree* container,
    const Time& expiresAt,
    const string& userId,
    const hashmap<string, string>& attributes)
{
  const string identifier = id::UUID::random().toString();

  Try<Tree> node = container->addChild(identifier, TOKEN_NODE_TYPE);
  if (node.isError()) {
    return Error(node.error());
  }

  Try<Nothing> write = node->setProperty(IDENTIFIER, identifier);
  if (write.isError()) {
    return Error(write.error());
  }

  Try<string> secret = crypto::generateSecret(configuration.length);
  if (secret.isError()) {
    return Error(secret.error());
  }

  Try<string> keyHash =
    crypto::hash(secret.get() + userId, configuration.hash);

  if (keyHash.isError()) {
    return Error(keyHash.error());
  }

  write = node->setProperty(TOKEN_ATTRIBUTE_KEY, keyHash.get());
  if (write.isError()) {
    return Error(write.error());
  }

  write = internal::tokens::writeExpiration(&node.get(), expiresAt);
  if (write.isError()) {
    return Error(write.error());
  }

  foreachpair (const string& name, const string& value, attributes) {
    if (internal::tokens::isReservedAttribute(name)) {
      continue;
    }

    write = node->setProperty(name, value);
    if (write.isError()) {
      return Error(write.error());
    }
  }

  const string token = identifier + TOKEN_DELIMITER + secret.get();

  return TokenInfo(root, configuration, node.get(), token, userId);
}


Time TokenStore::expiration(
    const Time& creation,
    const hashmap<string, string>& attributes) const
{
  Duration ttl = configuration.expiration;

  Option<string> value = attributes.get(TOKEN_EXPIRATION_ATTRIBUTE);
  if (value.isSome()) {
    Try<int64_t> millis = numify<int64_t>(value.get());

    if (millis.isSome() &&
        millis.get() > 0 &&
        millis.get() <= Duration::max().ns() / Milliseconds(1).ns()) {
      ttl = Milliseconds(millis.get());
    } else {
      LOG(WARNING) << "Invalid token expiration '" << value.get()
                   << "', using the default of " << ttl;
    }
  }

  return internal::tokens::expirationTime(creation, ttl);
}

} // namespace tokens {
} // namespace warden {
