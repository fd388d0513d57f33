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

#include <utility>
#include <vector>

#include <warden/state/hook.hpp>

#include <process/owned.hpp>

#include <stout/error.hpp>
#include <stout/foreach.hpp>
#include <stout/nothing.hpp>
#include <stout/try.hpp>

using std::vector;

using process::Owned;

namespace warden {
namespace state {

namespace {

class EmptyHook : public CommitHook
{
public:
  Try<Nothing> processCommit(
      const Revision& before,
      Nodes* after,
      const CommitInfo& info) override
  {
    return Nothing();
  }
};

} // namespace {


Owned<CommitHook> CompositeHook::compose(vector<Owned<CommitHook>> hooks)
{
  switch (hooks.size()) {
    case 0:
      return Owned<CommitHook>(new EmptyHook());
    case 1:
      return hooks.front();
    default:
      return Owned<CommitHook>(new CompositeHook(std::move(hooks)));
  }
}


CompositeHook::CompositeHook(vector<Owned<CommitHook>> _hooks)
  : hooks(std::move(_hooks)) {}


Try<Nothing> CompositeHook::processCommit(
    const Revision& before,
    Nodes* after,
    const CommitInfo& info)
{
  foreach (const Owned<CommitHook>& hook, hooks) {
    Try<Nothing> result = hook->processCommit(before, after, info);
    if (result.isError()) {
      return Error(result.error());
    }
  }

  return Nothing();
}

} // namespace state {
} // namespace warden {
