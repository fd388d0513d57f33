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

#ifndef __TESTS_MOCK_STORAGE_HPP__
#define __TESTS_MOCK_STORAGE_HPP__

#include <gmock/gmock.h>

#include <warden/state/hook.hpp>
#include <warden/state/in_memory.hpp>
#include <warden/state/storage.hpp>

#include <process/owned.hpp>
#include <process/shared.hpp>

#include <stout/try.hpp>

namespace warden {
namespace internal {
namespace tests {

// An in-memory storage whose operations can be intercepted, e.g., to
// inject conflicts or failures. By default operations are passed on
// to the in-memory storage.
class MockStorage : public warden::state::InMemoryStorage
{
public:
  MockStorage();
  explicit MockStorage(process::Owned<warden::state::CommitHook> hook);

  ~MockStorage() override;

  MOCK_METHOD0(head, Try<process::Shared<warden::state::Revision>>());

  MOCK_METHOD3(
      commit,
      Try<bool>(
          const process::Shared<warden::state::Revision>& base,
          const warden::state::Changes& changes,
          const warden::state::CommitInfo& info));

  Try<process::Shared<warden::state::Revision>> unmocked_head();

  Try<bool> unmocked_commit(
      const process::Shared<warden::state::Revision>& base,
      const warden::state::Changes& changes,
      const warden::state::CommitInfo& info);

private:
  void setDefaults();
};

} // namespace tests {
} // namespace internal {
} // namespace warden {

#endif // __TESTS_MOCK_STORAGE_HPP__
