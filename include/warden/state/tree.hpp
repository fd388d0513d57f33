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

#ifndef __WARDEN_STATE_TREE_HPP__
#define __WARDEN_STATE_TREE_HPP__

#include <string>
#include <vector>

#include <warden/state/state.pb.h>
#include <warden/state/storage.hpp>

#include <process/owned.hpp>
#include <process/shared.hpp>

#include <stout/nothing.hpp>
#include <stout/option.hpp>
#include <stout/try.hpp>

namespace warden {
namespace state {

// Forward declaration.
class Root;


// A handle to the node at a path, as seen by a 'Root'. A tree is
// cheap to copy and does not need to exist; reads of a non-existent
// tree return nothing and writes fail. A tree must not outlive the
// root it was obtained from.
class Tree
{
public:
  bool exists() const;

  const std::string& path() const { return path_; }

  // Last segment of the path; empty for the root node.
  std::string name() const;

  // The root node is its own parent.
  Tree parent() const;

  Option<std::string> primaryType() const;

  Option<internal::state::Property> property(const std::string& name) const;
  std::vector<internal::state::Property> properties() const;

  Try<Nothing> setProperty(
      const std::string& name,
      const std::string& value,
      internal::state::Property::Type type =
        internal::state::Property::STRING);

  // Fails if a child with this name already exists.
  Try<Tree> addChild(const std::string& name, const std::string& primaryType);

  // Returns the existing child, or adds one of the given kind.
  Try<Tree> getOrAddChild(
      const std::string& name,
      const std::string& primaryType);

  std::vector<Tree> children() const;

  // Counts children but stops as soon as 'max' have been seen. The
  // descendants of each child are skipped, so the cost is bounded by
  // 'max' rather than by the size of the subtree.
  size_t childrenCount(size_t max) const;

  // Removes this node and everything below it. Returns false if the
  // node does not exist or is the root node.
  bool remove();

private:
  friend class Root;

  Tree(Root* _root, const std::string& _path)
    : root(_root), path_(_path) {}

  std::string child(const std::string& name) const;

  Root* root;
  std::string path_;
};


// A session on a storage. A root reads from the revision it was
// created with (or last refreshed to) and stages all modifications
// privately until they are committed. Roots are not thread safe;
// concurrent callers use one root each.
class Root
{
public:
  static Try<process::Owned<Root>> create(Storage* storage);

  Tree getTree(const std::string& path);

  // Looks up a node by its stable identifier (see 'IDENTIFIER').
  Option<Tree> getTreeByIdentifier(const std::string& identifier);

  bool hasPendingChanges() const;

  // Tries to commit all staged changes. Returns true if committed (the
  // root then sees the new revision), false on conflict (the staged
  // changes are kept until 'refresh'), or an error.
  Try<bool> commit(const CommitInfo& info = CommitInfo());

  // Drops all staged changes and moves to the latest revision.
  Try<Nothing> refresh();

  // Number of the revision this root reads from.
  uint64_t revision() const { return base->number; }

private:
  friend class Tree;

  Root(Storage* _storage, const process::Shared<Revision>& _base)
    : storage(_storage), base(_base) {}

  Option<internal::state::Node> node(const std::string& path) const;
  void put(const std::string& path, const internal::state::Node& node);
  void erase(const std::string& path);
  std::vector<std::string> children(const std::string& path) const;

  Storage* storage;
  process::Shared<Revision> base;
  Changes changes;
};

} // namespace state {
} // namespace warden {

#endif // __WARDEN_STATE_TREE_HPP__
