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

#ifndef __WARDEN_TOKENS_CREDENTIALS_HPP__
#define __WARDEN_TOKENS_CREDENTIALS_HPP__

#include <string>

#include <stout/hashmap.hpp>
#include <stout/option.hpp>

namespace warden {
namespace tokens {

// Base of everything a caller can present to log in. Credentials may
// carry arbitrary string attributes; some of them are interpreted by
// the token store (see 'TOKEN_ATTRIBUTE').
class Credentials
{
public:
  virtual ~Credentials() {}

  Option<std::string> attribute(const std::string& name) const
  {
    return attributes_.get(name);
  }

  void setAttribute(const std::string& name, const std::string& value)
  {
    attributes_[name] = value;
  }

  void removeAttribute(const std::string& name)
  {
    attributes_.erase(name);
  }

  bool hasAttribute(const std::string& name) const
  {
    return attributes_.contains(name);
  }

  const hashmap<std::string, std::string>& attributes() const
  {
    return attributes_;
  }

private:
  hashmap<std::string, std::string> attributes_;
};


// A user id and password.
class SimpleCredentials : public Credentials
{
public:
  SimpleCredentials(const std::string& _userId, const std::string& _password)
    : userId_(_userId), password_(_password) {}

  const std::string& userId() const { return userId_; }
  const std::string& password() const { return password_; }

private:
  std::string userId_;
  std::string password_;
};


// A previously issued login token.
class TokenCredentials : public Credentials
{
public:
  explicit TokenCredentials(const std::string& _token) : token_(_token) {}

  const std::string& token() const { return token_; }

private:
  std::string token_;
};


// Credentials of one identity presented on behalf of another. Only the
// wrapped credentials are relevant for tokens. The wrapped credentials
// are not owned and must outlive this object.
class ImpersonationCredentials : public Credentials
{
public:
  ImpersonationCredentials(Credentials* _base, const std::string& _impersonator)
    : base(_base), impersonator_(_impersonator) {}

  Credentials* baseCredentials() const { return base; }
  const std::string& impersonator() const { return impersonator_; }

private:
  Credentials* base;
  std::string impersonator_;
};

} // namespace tokens {
} // namespace warden {

#endif // __WARDEN_TOKENS_CREDENTIALS_HPP__
