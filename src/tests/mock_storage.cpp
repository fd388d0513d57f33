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

#include <gmock/gmock.h>

#include <warden/state/hook.hpp>
#include <warden/state/in_memory.hpp>
#include <warden/state/storage.hpp>

#include <process/owned.hpp>
#include <process/shared.hpp>

#include <stout/try.hpp>

#include "tests/mock_storage.hpp"

using testing::_;
using testing::DoDefault;
using testing::Invoke;

using process::Owned;
using process::Shared;

using warden::state::Changes;
using warden::state::CommitHook;
using warden::state::CommitInfo;
using warden::state::InMemoryStorage;
using warden::state::Revision;

namespace warden {
namespace internal {
namespace tests {

MockStorage::MockStorage()
{
  setDefaults();
}


MockStorage::MockStorage(Owned<CommitHook> hook)
  : InMemoryStorage(hook)
{
  setDefaults();
}


MockStorage::~MockStorage() {}


void MockStorage::setDefaults()
{
  // The default behavior is to call the original methods.
  ON_CALL(*this, head())
    .WillByDefault(Invoke(this, &MockStorage::unmocked_head));
  EXPECT_CALL(*this, head())
    .WillRepeatedly(DoDefault());

  ON_CALL(*this, commit(_, _, _))
    .WillByDefault(Invoke(this, &MockStorage::unmocked_commit));
  EXPECT_CALL(*this, commit(_, _, _))
    .WillRepeatedly(DoDefault());
}


Try<Shared<Revision>> MockStorage::unmocked_head()
{
  return InMemoryStorage::head();
}


Try<bool> MockStorage::unmocked_commit(
    const Shared<Revision>& base,
    const Changes& changes,
    const CommitInfo& info)
{
  return InMemoryStorage::commit(base, changes, info);
}

} // namespace tests {
} // namespace internal {
} // namespace warden {
