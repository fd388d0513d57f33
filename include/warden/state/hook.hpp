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

#ifndef __WARDEN_STATE_HOOK_HPP__
#define __WARDEN_STATE_HOOK_HPP__

#include <vector>

#include <warden/state/storage.hpp>

#include <process/owned.hpp>

#include <stout/nothing.hpp>
#include <stout/try.hpp>

namespace warden {
namespace state {

// A commit hook is run by the storage on every commit, after conflict
// detection and before the new revision becomes visible. It sees the
// revision the commit is applied to ('before') and the nodes the
// commit is about to produce ('after'), which it may transform in
// place. Returning an error rejects the commit.
//
// Hooks are run without holding any storage lock, so they may read
// from (or commit to) the storage. A hook can therefore run more than
// once for a single commit, when another commit lands while it runs.
class CommitHook
{
public:
  virtual ~CommitHook() {}

  virtual Try<Nothing> processCommit(
      const Revision& before,
      Nodes* after,
      const CommitInfo& info) = 0;
};


// Runs a sequence of hooks, each one seeing the output of the
// previous one. Stops at the first hook that rejects the commit.
class CompositeHook : public CommitHook
{
public:
  // Returns a single hook equivalent to running all 'hooks' in order:
  // a no-op hook if there are none, the hook itself if there is one.
  static process::Owned<CommitHook> compose(
      std::vector<process::Owned<CommitHook>> hooks);

  explicit CompositeHook(std::vector<process::Owned<CommitHook>> _hooks);

  Try<Nothing> processCommit(
      const Revision& before,
      Nodes* after,
      const CommitInfo& info) override;

private:
  std::vector<process::Owned<CommitHook>> hooks;
};

} // namespace state {
} // namespace warden {

#endif // __WARDEN_STATE_HOOK_HPP__
