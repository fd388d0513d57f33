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

#include <string>
#include <vector>

#include <gmock/gmock.h>

#include <warden/state/in_memory.hpp>
#include <warden/state/state.pb.h>
#include <warden/state/storage.hpp>
#include <warden/state/tree.hpp>

#include <process/owned.hpp>
#include <process/shared.hpp>

#include <stout/gtest.hpp>
#include <stout/option.hpp>
#include <stout/stringify.hpp>
#include <stout/try.hpp>

using process::Owned;
using process::Shared;

using std::string;
using std::vector;

using warden::internal::state::Node;
using warden::internal::state::Property;

using warden::state::IDENTIFIER;
using warden::state::InMemoryStorage;
using warden::state::PRIMARY_TYPE;
using warden::state::Revision;
using warden::state::Root;
using warden::state::Tree;

namespace warden {
namespace internal {
namespace tests {

class StateTest : public ::testing::Test
{
protected:
  void SetUp() override
  {
    Try<Owned<Root>> create = Root::create(&storage);
    ASSERT_SOME(create);
    root = create.get();
  }

  InMemoryStorage storage;
  Owned<Root> root;
};


TEST_F(StateTest, EmptyTree)
{
  Tree tree = root->getTree("/");

  EXPECT_TRUE(tree.exists());
  EXPECT_EQ("", tree.name());
  EXPECT_EQ("/", tree.parent().path());
  EXPECT_TRUE(tree.children().empty());
  EXPECT_EQ(0u, root->revision());
  EXPECT_FALSE(root->hasPendingChanges());

  // Nothing to commit.
  EXPECT_SOME_TRUE(root->commit());
  EXPECT_EQ(0u, root->revision());

  EXPECT_FALSE(root->getTree("/missing").exists());
  EXPECT_FALSE(tree.remove());
}


TEST_F(StateTest, AddChildAndProperties)
{
  Try<Tree> child = root->getTree("/").addChild("a", "warden:Folder");
  ASSERT_SOME(child);

  EXPECT_EQ("/a", child->path());
  EXPECT_EQ("a", child->name());
  EXPECT_SOME_EQ("warden:Folder", child->primaryType());
  EXPECT_TRUE(root->hasPendingChanges());

  ASSERT_SOME(child->setProperty("label", "value"));
  ASSERT_SOME(child->setProperty("count", "3", Property::LONG));

  Option<Property> count = child->property("count");
  ASSERT_SOME(count);
  EXPECT_EQ(Property::LONG, count->type());
  EXPECT_EQ("3", count->value());

  // Replaces the existing value.
  ASSERT_SOME(child->setProperty("label", "other"));
  EXPECT_EQ("other", child->property("label")->value());
  EXPECT_EQ(3u, child->properties().size());

  EXPECT_ERROR(root->getTree("/").addChild("a", "warden:Folder"));
  EXPECT_ERROR(root->getTree("/").addChild("", "warden:Folder"));
  EXPECT_ERROR(root->getTree("/").addChild("b/c", "warden:Folder"));
  EXPECT_ERROR(root->getTree("/missing").addChild("b", "warden:Folder"));
  EXPECT_ERROR(root->getTree("/missing").setProperty("label", "value"));

  Try<Tree> existing = root->getTree("/").getOrAddChild("a", "other:Type");
  ASSERT_SOME(existing);
  EXPECT_SOME_EQ("warden:Folder", existing->primaryType());

  // Staged changes are not visible to other roots until committed.
  Try<Owned<Root>> other = Root::create(&storage);
  ASSERT_SOME(other);
  EXPECT_FALSE(other.get()->getTree("/a").exists());

  ASSERT_SOME_TRUE(root->commit());
  EXPECT_FALSE(root->hasPendingChanges());
  EXPECT_EQ(1u, root->revision());

  EXPECT_FALSE(other.get()->getTree("/a").exists());
  ASSERT_SOME(other.get()->refresh());
  EXPECT_TRUE(other.get()->getTree("/a").exists());
  EXPECT_EQ("other", other.get()->getTree("/a").property("label")->value());
}


TEST_F(StateTest, Children)
{
  Tree tree = root->getTree("/");

  ASSERT_SOME(tree.addChild("a", "warden:Folder"));
  ASSERT_SOME(tree.addChild("b", "warden:Folder"));
  ASSERT_SOME(root->getTree("/a").addChild("c", "warden:Folder"));
  ASSERT_SOME_TRUE(root->commit());

  ASSERT_SOME(tree.addChild("d", "warden:Folder"));

  vector<Tree> children = tree.children();
  ASSERT_EQ(3u, children.size());
  EXPECT_EQ("/a", children[0].path());
  EXPECT_EQ("/b", children[1].path());
  EXPECT_EQ("/d", children[2].path());

  EXPECT_EQ(3u, tree.childrenCount(10));
  EXPECT_EQ(2u, tree.childrenCount(2));
  EXPECT_EQ(0u, tree.childrenCount(0));
  EXPECT_EQ(1u, root->getTree("/a").childrenCount(10));

  EXPECT_TRUE(root->getTree("/b").remove());
  EXPECT_EQ(2u, tree.childrenCount(10));
}


// Descendants of children sort between them and are skipped, which
// must not skip siblings whose names sort next to them.
TEST_F(StateTest, ChildrenCountSkipsDescendants)
{
  Tree tree = root->getTree("/");

  ASSERT_SOME(tree.addChild("a", "warden:Folder"));
  ASSERT_SOME(tree.addChild("a-b", "warden:Folder"));
  ASSERT_SOME(tree.addChild("a0", "warden:Folder"));

  for (int i = 0; i < 20; i++) {
    ASSERT_SOME(root->getTree("/a").addChild(
        "child" + stringify(i), "warden:Folder"));
  }

  ASSERT_SOME(root->getTree("/a/child1").addChild("c", "warden:Folder"));

  // Staged and not yet committed.
  EXPECT_EQ(3u, tree.childrenCount(10));
  EXPECT_EQ(20u, root->getTree("/a").childrenCount(100));

  ASSERT_SOME_TRUE(root->commit());

  EXPECT_EQ(3u, tree.childrenCount(10));
  EXPECT_EQ(2u, tree.childrenCount(2));
  EXPECT_EQ(20u, root->getTree("/a").childrenCount(100));
  EXPECT_EQ(5u, root->getTree("/a").childrenCount(5));

  // Staged below a committed child.
  ASSERT_SOME(root->getTree("/a-b").addChild("d", "warden:Folder"));
  ASSERT_SOME(tree.addChild("a.c", "warden:Folder"));

  EXPECT_EQ(4u, tree.childrenCount(10));
}


TEST_F(StateTest, Remove)
{
  Tree tree = root->getTree("/");

  ASSERT_SOME(tree.addChild("a", "warden:Folder"));
  ASSERT_SOME(root->getTree("/a").addChild("b", "warden:Folder"));
  ASSERT_SOME(root->getTree("/a/b").addChild("c", "warden:Folder"));
  ASSERT_SOME_TRUE(root->commit());

  EXPECT_TRUE(root->getTree("/a").remove());
  EXPECT_FALSE(root->getTree("/a").exists());
  EXPECT_FALSE(root->getTree("/a/b/c").exists());
  EXPECT_FALSE(root->getTree("/a").remove());

  ASSERT_SOME_TRUE(root->commit());

  EXPECT_TRUE(tree.children().empty());

  // Removing a node that was never committed leaves nothing behind.
  ASSERT_SOME(tree.addChild("e", "warden:Folder"));
  EXPECT_TRUE(root->getTree("/e").remove());
  EXPECT_FALSE(root->hasPendingChanges());
}


TEST_F(StateTest, Identifiers)
{
  Try<Tree> child = root->getTree("/").addChild("a", "warden:Folder");
  ASSERT_SOME(child);
  ASSERT_SOME(child->setProperty(IDENTIFIER, "1234"));

  // Staged nodes can be found.
  Option<Tree> found = root->getTreeByIdentifier("1234");
  ASSERT_SOME(found);
  EXPECT_EQ("/a", found->path());

  ASSERT_SOME_TRUE(root->commit());

  found = root->getTreeByIdentifier("1234");
  ASSERT_SOME(found);
  EXPECT_EQ("/a", found->path());

  EXPECT_NONE(root->getTreeByIdentifier("5678"));

  // Staged removals hide the node.
  EXPECT_TRUE(root->getTree("/a").remove());
  EXPECT_NONE(root->getTreeByIdentifier("1234"));
}


TEST_F(StateTest, Conflict)
{
  ASSERT_SOME(root->getTree("/").addChild("a", "warden:Folder"));
  ASSERT_SOME_TRUE(root->commit());

  Try<Owned<Root>> other = Root::create(&storage);
  ASSERT_SOME(other);

  ASSERT_SOME(root->getTree("/a").setProperty("label", "first"));
  ASSERT_SOME(other.get()->getTree("/a").setProperty("label", "second"));

  ASSERT_SOME_TRUE(root->commit());

  // Modified since the other root's revision.
  EXPECT_SOME_FALSE(other.get()->commit());
  EXPECT_TRUE(other.get()->hasPendingChanges());

  ASSERT_SOME(other.get()->refresh());
  EXPECT_FALSE(other.get()->hasPendingChanges());
  EXPECT_EQ("first", other.get()->getTree("/a").property("label")->value());

  ASSERT_SOME(other.get()->getTree("/a").setProperty("label", "second"));
  EXPECT_SOME_TRUE(other.get()->commit());
}


TEST_F(StateTest, ConcurrentAdd)
{
  Try<Owned<Root>> other = Root::create(&storage);
  ASSERT_SOME(other);

  ASSERT_SOME(root->getTree("/").addChild("a", "warden:Folder"));
  ASSERT_SOME(other.get()->getTree("/").addChild("a", "warden:Folder"));

  ASSERT_SOME_TRUE(root->commit());
  EXPECT_SOME_FALSE(other.get()->commit());

  // Disjoint changes do not conflict.
  ASSERT_SOME(other.get()->refresh());
  ASSERT_SOME(root->getTree("/").addChild("b", "warden:Folder"));
  ASSERT_SOME(other.get()->getTree("/").addChild("c", "warden:Folder"));

  EXPECT_SOME_TRUE(root->commit());
  EXPECT_SOME_TRUE(other.get()->commit());

  EXPECT_EQ(3u, root->getTree("/").children().size());
}


TEST_F(StateTest, NoOrphans)
{
  ASSERT_SOME(root->getTree("/").addChild("a", "warden:Folder"));
  ASSERT_SOME_TRUE(root->commit());

  Try<Owned<Root>> other = Root::create(&storage);
  ASSERT_SOME(other);

  EXPECT_TRUE(root->getTree("/a").remove());
  ASSERT_SOME(other.get()->getTree("/a").addChild("b", "warden:Folder"));

  ASSERT_SOME_TRUE(root->commit());

  // The parent was removed concurrently.
  EXPECT_SOME_FALSE(other.get()->commit());
}


TEST_F(StateTest, RevisionStamps)
{
  ASSERT_SOME(root->getTree("/").addChild("a", "warden:Folder"));
  ASSERT_SOME(root->getTree("/").addChild("b", "warden:Folder"));
  ASSERT_SOME_TRUE(root->commit());

  Try<Shared<Revision>> first = storage.head();
  ASSERT_SOME(first);

  const Node a = first.get()->nodes.at("/a");
  const Node b = first.get()->nodes.at("/b");
  EXPECT_FALSE(a.uuid().empty());

  ASSERT_SOME(root->getTree("/a").setProperty("label", "value"));
  ASSERT_SOME_TRUE(root->commit());

  Try<Shared<Revision>> second = storage.head();
  ASSERT_SOME(second);

  EXPECT_EQ(first.get()->number + 1, second.get()->number);
  EXPECT_NE(a.uuid(), second.get()->nodes.at("/a").uuid());
  EXPECT_EQ(b.uuid(), second.get()->nodes.at("/b").uuid());

  // Older revisions are immutable.
  EXPECT_EQ(a.SerializeAsString(), first.get()->nodes.at("/a").SerializeAsString());
}

} // namespace tests {
} // namespace internal {
} // namespace warden {
