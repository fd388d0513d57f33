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

#ifndef __WARDEN_IDENTITY_DIRECTORY_HPP__
#define __WARDEN_IDENTITY_DIRECTORY_HPP__

#include <string>

#include <stout/result.hpp>

namespace warden {
namespace identity {

// An identity as known to the directory: a user that can log in, or a
// group that cannot.
struct Identity
{
  Identity() : group(false), disabled(false) {}

  Identity(
      const std::string& _id,
      const std::string& _path,
      bool _group = false,
      bool _disabled = false)
    : id(_id), path(_path), group(_group), disabled(_disabled) {}

  bool isGroup() const { return group; }
  bool isDisabled() const { return disabled; }

  std::string id;

  // Path of the identity's node in the tree; per-identity data (such
  // as login tokens) is stored below it.
  std::string path;

  bool group;
  bool disabled;
};


// Resolves identities. Lookups return none if no such identity exists
// and an error if the directory could not be consulted.
class Directory
{
public:
  virtual ~Directory() {}

  virtual Result<Identity> find(const std::string& id) = 0;
  virtual Result<Identity> findByPath(const std::string& path) = 0;
};

} // namespace identity {
} // namespace warden {

#endif // __WARDEN_IDENTITY_DIRECTORY_HPP__
