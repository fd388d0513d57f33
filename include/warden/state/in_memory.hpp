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

#ifndef __WARDEN_STATE_IN_MEMORY_HPP__
#define __WARDEN_STATE_IN_MEMORY_HPP__

#include <mutex>

#include <warden/state/hook.hpp>
#include <warden/state/storage.hpp>

#include <process/owned.hpp>
#include <process/shared.hpp>

#include <stout/try.hpp>

namespace warden {
namespace state {

// A storage keeping every revision in memory. Revisions are
// immutable, so readers never block writers; new revisions are
// published one at a time.
class InMemoryStorage : public Storage
{
public:
  InMemoryStorage();
  explicit InMemoryStorage(process::Owned<CommitHook> hook);
  ~InMemoryStorage() override;

  // Storage implementation.
  Try<process::Shared<Revision>> head() override;
  Try<bool> commit(
      const process::Shared<Revision>& base,
      const Changes& changes,
      const CommitInfo& info) override;

private:
  std::mutex mutex;
  process::Shared<Revision> current;
  process::Owned<CommitHook> hook;
};

} // namespace state {
} // namespace warden {

#endif // __WARDEN_STATE_IN_MEMORY_HPP__
