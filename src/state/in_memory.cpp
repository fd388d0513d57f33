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
#include <vector>

#include <warden/state/hook.hpp>
#include <warden/state/in_memory.hpp>
#include <warden/state/storage.hpp>

#include <glog/logging.h>

#include <process/owned.hpp>
#include <process/shared.hpp>

#include <stout/error.hpp>
#include <stout/foreach.hpp>
#include <stout/option.hpp>
#include <stout/path.hpp>
#include <stout/strings.hpp>
#include <stout/synchronized.hpp>
#include <stout/uuid.hpp>

using std::string;
using std::vector;

using process::Owned;
using process::Shared;

using warden::internal::state::Node;

namespace warden {
namespace state {

static Option<Node> find(const Nodes& nodes, const string& path)
{
  Nodes::const_iterator iterator = nodes.find(path);
  if (iterator == nodes.end()) {
    return None();
  }
  return iterator->second;
}


// Returns true if any node is stored below 'path'.
static bool hasDescendants(const Nodes& nodes, const string& path)
{
  const string prefix = path == "/" ? path : path + "/";

  Nodes::const_iterator iterator = nodes.lower_bound(prefix);
  return iterator != nodes.end() &&
         strings::startsWith(iterator->first, prefix);
}


static Nodes initial()
{
  Node root;
  root.set_name("");
  root.set_uuid(id::UUID::random().toBytes());

  Nodes nodes;
  nodes["/"] = root;
  return nodes;
}


InMemoryStorage::InMemoryStorage()
  : InMemoryStorage(CompositeHook::compose({})) {}


InMemoryStorage::InMemoryStorage(Owned<CommitHook> _hook)
  : current(new Revision(0, initial())),
    hook(_hook) {}


InMemoryStorage::~InMemoryStorage() {}


Try<Shared<Revision>> InMemoryStorage::head()
{
  synchronized (mutex) {
    return current;
  }
}


// Returns the nodes resulting from applying 'changes' to 'head', or
// none if they conflict with what the committer saw in 'base'.
static Option<Nodes> apply(
    const Revision& base,
    const Revision& head,
    const Changes& changes)
{
  // Every touched node must be exactly as the committer saw it:
  // still absent if it was absent, or present with the same stamp.
  foreachpair (const string& path, const Option<Node>& change, changes) {
    const Option<Node> seen = find(base.nodes, path);
    const Option<Node> latest = find(head.nodes, path);

    if (seen.isSome() != latest.isSome() ||
        (seen.isSome() && seen->uuid() != latest->uuid())) {
      VLOG(1) << "Commit based on revision " << base.number
              << " conflicts at '" << path << "' with revision "
              << head.number;
      return None();
    }
  }

  Nodes after = head.nodes;

  foreachpair (const string& path, const Option<Node>& change, changes) {
    if (change.isSome()) {
      after[path] = change.get();
    } else {
      after.erase(path);
    }
  }

  // Reject changes that would leave orphans behind, e.g., a child
  // added below a node that a concurrent commit removed.
  foreachpair (const string& path, const Option<Node>& change, changes) {
    if (change.isSome() && path != "/") {
      if (after.count(Path(path).dirname()) == 0) {
        return None();
      }
    } else if (change.isNone() && hasDescendants(after, path)) {
      return None();
    }
  }

  return after;
}


// Stamps every node that the commit (or a hook) added or changed.
static void stamp(const Nodes& before, Nodes* after)
{
  foreachpair (const string& path, Node& node, *after) {
    const Option<Node> previous = find(before, path);
    if (previous.isNone() ||
        previous->SerializeAsString() != node.SerializeAsString()) {
      node.set_uuid(id::UUID::random().toBytes());
    }
  }
}


Try<bool> InMemoryStorage::commit(
    const Shared<Revision>& base,
    const Changes& changes,
    const CommitInfo& info)
{
  // The hook runs without holding the lock. If another commit lands
  // meanwhile, the changes are validated and the hook run again
  // against the new head.
  while (true) {
    Shared<Revision> head;
    synchronized (mutex) {
      head = current;
    }

    Option<Nodes> after = apply(*base, *head, changes);
    if (after.isNone()) {
      return false;
    }

    Try<Nothing> processed = hook->processCommit(*head, &after.get(), info);
    if (processed.isError()) {
      return Error("Commit rejected by hook: " + processed.error());
    }

    stamp(head->nodes, &after.get());

    synchronized (mutex) {
      if (current.get() == head.get()) {
        current =
          Shared<Revision>(new Revision(head->number + 1, after.get()));

        VLOG(1) << "Committed revision " << current->number << " with "
                << changes.size() << " changes";

        return true;
      }
    }

    VLOG(1) << "Revision " << head->number << " was superseded while"
            << " running the commit hook";
  }
}

} // namespace state {
} // namespace warden {
