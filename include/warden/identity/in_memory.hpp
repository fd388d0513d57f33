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

#ifndef __WARDEN_IDENTITY_IN_MEMORY_HPP__
#define __WARDEN_IDENTITY_IN_MEMORY_HPP__

#include <mutex>
#include <string>

#include <warden/identity/directory.hpp>

#include <stout/hashmap.hpp>
#include <stout/nothing.hpp>
#include <stout/result.hpp>
#include <stout/try.hpp>

namespace warden {
namespace identity {

// A directory keeping identities in memory. Safe to share between
// threads.
class InMemoryDirectory : public Directory
{
public:
  // Fails if an identity with the same id or path already exists.
  Try<Nothing> add(const Identity& identity);

  // Replaces the disabled state of an existing identity.
  Try<Nothing> setDisabled(const std::string& id, bool disabled);

  Result<Identity> find(const std::string& id) override;
  Result<Identity> findByPath(const std::string& path) override;

private:
  std::mutex mutex;
  hashmap<std::string, Identity> identities;
  hashmap<std::string, std::string> paths;
};

} // namespace identity {
} // namespace warden {

#endif // __WARDEN_IDENTITY_IN_MEMORY_HPP__
