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

#include <mutex>
#include <string>

#include <warden/identity/in_memory.hpp>

#include <stout/error.hpp>
#include <stout/none.hpp>
#include <stout/nothing.hpp>
#include <stout/option.hpp>
#include <stout/result.hpp>
#include <stout/synchronized.hpp>
#include <stout/try.hpp>

using std::string;

namespace warden {
namespace identity {

Try<Nothing> InMemoryDirectory::add(const Identity& identity)
{
  synchronized (mutex) {
    if (identities.contains(identity.id)) {
      return Error("Identity '" + identity.id + "' already exists");
    }

    if (paths.contains(identity.path)) {
      return Error("Path '" + identity.path + "' is already in use");
    }

    identities.put(identity.id, identity);
    paths.put(identity.path, identity.id);
  }

  return Nothing();
}


Try<Nothing> InMemoryDirectory::setDisabled(const string& id, bool disabled)
{
  synchronized (mutex) {
    if (!identities.contains(id)) {
      return Error("Unknown identity '" + id + "'");
    }

    identities.at(id).disabled = disabled;
  }

  return Nothing();
}


Result<Identity> InMemoryDirectory::find(const string& id)
{
  synchronized (mutex) {
    const Option<Identity> identity = identities.get(id);
    if (identity.isNone()) {
      return None();
    }
    return identity.get();
  }
}


Result<Identity> InMemoryDirectory::findByPath(const string& path)
{
  synchronized (mutex) {
    const Option<string> id = paths.get(path);
    if (id.isNone()) {
      return None();
    }
    return identities.at(id.get());
  }
}

} // namespace identity {
} // namespace warden {
