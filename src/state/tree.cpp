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

#include <set>
#include <string>
#include <vector>

#include <warden/state/storage.hpp>
#include <warden/state/tree.hpp>

#include <glog/logging.h>

#include <process/owned.hpp>
#include <process/shared.hpp>

#include <stout/error.hpp>
#include <stout/foreach.hpp>
#include <stout/none.hpp>
#include <stout/nothing.hpp>
#include <stout/option.hpp>
#include <stout/path.hpp>
#include <stout/some.hpp>
#include <stout/strings.hpp>
#include <stout/try.hpp>

using std::set;
using std::string;
using std::vector;

using process::Owned;
using process::Shared;

using warden::internal::state::Node;
using warden::internal::state::Property;

namespace warden {
namespace state {

// Returns the prefix shared by all descendants of 'path'.
static string descendantsOf(const string& path)
{
  return path == "/" ? path : path + "/";
}


// Returns true if 'candidate' is a direct child of the node whose
// descendants all start with 'prefix'.
static bool isChild(const string& prefix, const string& candidate)
{
  return candidate.size() > prefix.size() &&
         strings::startsWith(candidate, prefix) &&
         candidate.find('/', prefix.size()) == string::npos;
}


// Returns the first path sorting after every descendant of the child
// that 'descendant' lies below, '0' being the character after '/'.
static string pastSubtree(const string& prefix, const string& descendant)
{
  return descendant.substr(0, descendant.find('/', prefix.size())) + "0";
}


static Option<string> identifierOf(const Node& node)
{
  foreach (const Property& property, node.properties()) {
    if (property.name() == IDENTIFIER) {
      return property.value();
    }
  }
  return None();
}


bool Tree::exists() const
{
  return root->node(path_).isSome();
}


string Tree::name() const
{
  if (path_ == "/") {
    return "";
  }
  return path_.substr(path_.rfind('/') + 1);
}


Tree Tree::parent() const
{
  if (path_ == "/") {
    return *this;
  }
  return Tree(root, Path(path_).dirname());
}


Option<string> Tree::primaryType() const
{
  const Option<Property> type = property(PRIMARY_TYPE);
  if (type.isNone()) {
    return None();
  }
  return type->value();
}


Option<Property> Tree::property(const string& name) const
{
  const Option<Node> node = root->node(path_);
  if (node.isNone()) {
    return None();
  }

  foreach (const Property& property, node->properties()) {
    if (property.name() == name) {
      return property;
    }
  }

  return None();
}


vector<Property> Tree::properties() const
{
  const Option<Node> node = root->node(path_);
  if (node.isNone()) {
    return vector<Property>();
  }

  return vector<Property>(
      node->properties().begin(),
      node->properties().end());
}


Try<Nothing> Tree::setProperty(
    const string& name,
    const string& value,
    Property::Type type)
{
  Option<Node> node = root->node(path_);
  if (node.isNone()) {
    return Error("Node '" + path_ + "' does not exist");
  }

  Property* property = nullptr;
  for (int i = 0; i < node->properties_size(); i++) {
    if (node->properties(i).name() == name) {
      property = node->mutable_properties(i);
      break;
    }
  }

  if (property == nullptr) {
    property = node->add_properties();
    property->set_name(name);
  }

  property->set_type(type);
  property->set_value(value);

  root->put(path_, node.get());

  return Nothing();
}


Try<Tree> Tree::addChild(const string& name, const string& primaryType)
{
  if (name.empty() || strings::contains(name, "/")) {
    return Error("Invalid node name '" + name + "'");
  }

  if (!exists()) {
    return Error("Parent node '" + path_ + "' does not exist");
  }

  const string path = child(name);

  if (root->node(path).isSome()) {
    return Error("Node '" + path + "' already exists");
  }

  Node node;
  node.set_name(name);
  node.set_uuid("");

  Property* type = node.add_properties();
  type->set_name(PRIMARY_TYPE);
  type->set_type(Property::STRING);
  type->set_value(primaryType);

  root->put(path, node);

  return Tree(root, path);
}


Try<Tree> Tree::getOrAddChild(const string& name, const string& primaryType)
{
  Tree tree(root, child(name));
  if (tree.exists()) {
    return tree;
  }

  return addChild(name, primaryType);
}


vector<Tree> Tree::children() const
{
  vector<Tree> result;
  foreach (const string& path, root->children(path_)) {
    result.push_back(Tree(root, path));
  }
  return result;
}


size_t Tree::childrenCount(size_t max) const
{
  const string prefix = descendantsOf(path_);

  size_t count = 0;

  // Children staged by this root that the base revision does not know.
  Changes::const_iterator change = root->changes.lower_bound(prefix);
  while (change != root->changes.end() && count < max) {
    if (!strings::startsWith(change->first, prefix)) {
      break;
    }

    if (change->first.size() > prefix.size() &&
        !isChild(prefix, change->first)) {
      change = root->changes.lower_bound(pastSubtree(prefix, change->first));
      continue;
    }

    if (isChild(prefix, change->first) &&
        change->second.isSome() &&
        root->base->nodes.count(change->first) == 0) {
      count++;
    }

    ++change;
  }

  Nodes::const_iterator node = root->base->nodes.lower_bound(prefix);
  while (node != root->base->nodes.end() && count < max) {
    if (!strings::startsWith(node->first, prefix)) {
      break;
    }

    if (node->first.size() > prefix.size() &&
        !isChild(prefix, node->first)) {
      node = root->base->nodes.lower_bound(pastSubtree(prefix, node->first));
      continue;
    }

    if (isChild(prefix, node->first) && root->node(node->first).isSome()) {
      count++;
    }

    ++node;
  }

  return count;
}


bool Tree::remove()
{
  if (path_ == "/" || !exists()) {
    return false;
  }

  // Children first, so that nothing is ever staged without a parent.
  foreach (const string& path, root->children(path_)) {
    Tree(root, path).remove();
  }

  root->erase(path_);

  return true;
}


string Tree::child(const string& name) const
{
  return descendantsOf(path_) + name;
}


Try<Owned<Root>> Root::create(Storage* storage)
{
  Try<Shared<Revision>> head = storage->head();
  if (head.isError()) {
    return Error("Failed to read the latest revision: " + head.error());
  }

  return Owned<Root>(new Root(storage, head.get()));
}


Tree Root::getTree(const string& path)
{
  return Tree(this, path);
}


Option<Tree> Root::getTreeByIdentifier(const string& identifier)
{
  // Staged nodes take precedence over the base revision.
  foreachpair (const string& path, const Option<Node>& change, changes) {
    if (change.isSome() && identifierOf(change.get()) == identifier) {
      return Tree(this, path);
    }
  }

  const Option<string> path = base->lookup(identifier);
  if (path.isNone()) {
    return None();
  }

  const Option<Node> current = node(path.get());
  if (current.isNone() || identifierOf(current.get()) != identifier) {
    return None();
  }

  return Tree(this, path.get());
}


bool Root::hasPendingChanges() const
{
  return !changes.empty();
}


Try<bool> Root::commit(const CommitInfo& info)
{
  if (changes.empty()) {
    return true;
  }

  Try<bool> committed = storage->commit(base, changes, info);
  if (committed.isError()) {
    return Error(committed.error());
  }

  if (!committed.get()) {
    return false;
  }

  changes.clear();

  Try<Shared<Revision>> head = storage->head();
  if (head.isError()) {
    LOG(WARNING) << "Committed changes but failed to read the new revision: "
                 << head.error();
  } else {
    base = head.get();
  }

  return true;
}


Try<Nothing> Root::refresh()
{
  Try<Shared<Revision>> head = storage->head();
  if (head.isError()) {
    return Error("Failed to refresh: " + head.error());
  }

  changes.clear();
  base = head.get();

  return Nothing();
}


Option<Node> Root::node(const string& path) const
{
  Changes::const_iterator change = changes.find(path);
  if (change != changes.end()) {
    return change->second;
  }

  Nodes::const_iterator node = base->nodes.find(path);
  if (node == base->nodes.end()) {
    return None();
  }

  return node->second;
}


void Root::put(const string& path, const Node& node)
{
  changes[path] = node;
}


void Root::erase(const string& path)
{
  if (base->nodes.count(path) == 0) {
    // Never committed, nothing to remove from the storage.
    changes.erase(path);
  } else {
    changes[path] = None();
  }
}


vector<string> Root::children(const string& path) const
{
  const string prefix = descendantsOf(path);

  set<string> candidates;

  Nodes::const_iterator node = base->nodes.lower_bound(prefix);
  for (; node != base->nodes.end(); ++node) {
    if (!strings::startsWith(node->first, prefix)) {
      break;
    }
    if (isChild(prefix, node->first)) {
      candidates.insert(node->first);
    }
  }

  Changes::const_iterator change = changes.lower_bound(prefix);
  for (; change != changes.end(); ++change) {
    if (!strings::startsWith(change->first, prefix)) {
      break;
    }
    if (isChild(prefix, change->first)) {
      candidates.insert(change->first);
    }
  }

  vector<string> result;
  foreach (const string& candidate, candidates) {
    if (this->node(candidate).isSome()) {
      result.push_back(candidate);
    }
  }

  return result;
}

} // namespace state {
} // namespace warden {
