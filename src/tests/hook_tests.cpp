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

#include <stdint.h>

#include <string>
#include <vector>

#include <gmock/gmock.h>

#include <warden/state/hook.hpp>
#include <warden/state/in_memory.hpp>
#include <warden/state/state.pb.h>
#include <warden/state/storage.hpp>
#include <warden/state/tree.hpp>

#include <warden/tokens/commit_marker.hpp>

#include <process/owned.hpp>

#include <stout/error.hpp>
#include <stout/foreach.hpp>
#include <stout/gtest.hpp>
#include <stout/nothing.hpp>
#include <stout/try.hpp>

using process::Owned;

using std::string;
using std::vector;

using warden::internal::state::Node;
using warden::internal::state::Property;

using warden::state::CommitHook;
using warden::state::CommitInfo;
using warden::state::CompositeHook;
using warden::state::InMemoryStorage;
using warden::state::Nodes;
using warden::state::Revision;
using warden::state::Root;
using warden::state::Tree;

using warden::tokens::CommitMarker;

namespace warden {
namespace internal {
namespace tests {

// Appends its name to the 'trail' property of every changed node
// below the root.
class TrailHook : public CommitHook
{
public:
  TrailHook(const string& _name, vector<string>* _calls)
    : name(_name), calls(_calls) {}

  Try<Nothing> processCommit(
      const Revision& before,
      Nodes* after,
      const CommitInfo& info) override
  {
    calls->push_back(name);

    foreachpair (const string& path, Node& node, *after) {
      if (path == "/") {
        continue;
      }

      Property* trail = nullptr;
      for (int i = 0; i < node.properties_size(); i++) {
        if (node.properties(i).name() == "trail") {
          trail = node.mutable_properties(i);
        }
      }

      if (trail == nullptr) {
        trail = node.add_properties();
        trail->set_name("trail");
        trail->set_type(Property::STRING);
      }

      trail->set_value(trail->value() + name);
    }

    return Nothing();
  }

private:
  const string name;
  vector<string>* calls;
};


class RejectingHook : public CommitHook
{
public:
  Try<Nothing> processCommit(
      const Revision& before,
      Nodes* after,
      const CommitInfo& info) override
  {
    if (CommitMarker::isTokenCommit(info)) {
      return Nothing();
    }
    return Error("Only token commits are allowed");
  }
};


// Commits another node through its own root the first time it runs,
// as if a concurrent commit landed while the hook was running.
class InterleavingHook : public CommitHook
{
public:
  InterleavingHook() : storage(nullptr), calls(0), revisions() {}

  Try<Nothing> processCommit(
      const Revision& before,
      Nodes* after,
      const CommitInfo& info) override
  {
    calls++;
    revisions.push_back(before.number);

    if (calls > 1) {
      return Nothing();
    }

    Try<Owned<Root>> root = Root::create(storage);
    if (root.isError()) {
      return Error(root.error());
    }

    Try<Tree> other =
      root.get()->getTree("/").addChild("other", "warden:Folder");
    if (other.isError()) {
      return Error(other.error());
    }

    Try<bool> commit = root.get()->commit();
    if (commit.isError()) {
      return Error(commit.error());
    }

    if (!commit.get()) {
      return Error("Interleaved commit conflicted");
    }

    return Nothing();
  }

  InMemoryStorage* storage;
  int calls;
  vector<uint64_t> revisions;
};


TEST(HookTest, Compose)
{
  vector<string> calls;

  vector<Owned<CommitHook>> hooks;
  hooks.push_back(Owned<CommitHook>(new TrailHook("a", &calls)));
  hooks.push_back(Owned<CommitHook>(new TrailHook("b", &calls)));

  InMemoryStorage storage(CompositeHook::compose(hooks));

  Try<Owned<Root>> root = Root::create(&storage);
  ASSERT_SOME(root);

  ASSERT_SOME(root.get()->getTree("/").addChild("node", "warden:Folder"));
  ASSERT_SOME_TRUE(root.get()->commit());

  // Hooks run in order, each one on the output of the previous one.
  EXPECT_EQ((vector<string>{"a", "b"}), calls);

  Option<Property> trail = root.get()->getTree("/node").property("trail");
  ASSERT_SOME(trail);
  EXPECT_EQ("ab", trail->value());
}


TEST(HookTest, ComposeNone)
{
  InMemoryStorage storage(CompositeHook::compose({}));

  Try<Owned<Root>> root = Root::create(&storage);
  ASSERT_SOME(root);

  ASSERT_SOME(root.get()->getTree("/").addChild("node", "warden:Folder"));
  EXPECT_SOME_TRUE(root.get()->commit());
}


TEST(HookTest, Reject)
{
  vector<Owned<CommitHook>> hooks;
  hooks.push_back(Owned<CommitHook>(new RejectingHook()));

  InMemoryStorage storage(CompositeHook::compose(hooks));

  Try<Owned<Root>> root = Root::create(&storage);
  ASSERT_SOME(root);

  ASSERT_SOME(root.get()->getTree("/").addChild("node", "warden:Folder"));
  EXPECT_ERROR(root.get()->commit());
  EXPECT_TRUE(root.get()->hasPendingChanges());

  EXPECT_SOME_TRUE(root.get()->commit(CommitMarker::asCommitAttributes()));
  EXPECT_TRUE(root.get()->getTree("/node").exists());
}


TEST(HookTest, CommitMarker)
{
  EXPECT_TRUE(CommitMarker::isTokenCommit(CommitMarker::asCommitAttributes()));
  EXPECT_FALSE(CommitMarker::isTokenCommit(CommitInfo()));
}

TEST(HookTest, HookCanUseStorage)
{
  InterleavingHook* hook = new InterleavingHook();

  InMemoryStorage storage{Owned<CommitHook>(hook)};
  hook->storage = &storage;

  Try<Owned<Root>> root = Root::create(&storage);
  ASSERT_SOME(root);

  ASSERT_SOME(root.get()->getTree("/").addChild("node", "warden:Folder"));
  ASSERT_SOME_TRUE(root.get()->commit());

  // The hook ran for the interleaved commit, and again for the first
  // commit once it was validated against the new head.
  EXPECT_EQ(3, hook->calls);
  EXPECT_EQ((vector<uint64_t>{0, 0, 1}), hook->revisions);
  EXPECT_EQ(2u, root.get()->revision());

  EXPECT_TRUE(root.get()->getTree("/node").exists());
  EXPECT_TRUE(root.get()->getTree("/other").exists());
}


TEST(HookTest, InterleavedConflict)
{
  InterleavingHook* hook = new InterleavingHook();

  InMemoryStorage storage{Owned<CommitHook>(hook)};
  hook->storage = &storage;

  Try<Owned<Root>> root = Root::create(&storage);
  ASSERT_SOME(root);

  // Both add the same node, so the interleaved commit wins.
  ASSERT_SOME(root.get()->getTree("/").addChild("other", "warden:Folder"));
  ASSERT_SOME_FALSE(root.get()->commit());

  EXPECT_EQ(2, hook->calls);
}


} // namespace tests {
} // namespace internal {
} // namespace warden {
