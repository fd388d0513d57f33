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

#ifndef __WARDEN_STATE_STORAGE_HPP__
#define __WARDEN_STATE_STORAGE_HPP__

#include <map>
#include <string>

#include <warden/state/state.pb.h>

#include <process/shared.hpp>

#include <stout/hashmap.hpp>
#include <stout/option.hpp>
#include <stout/try.hpp>

namespace warden {
namespace state {

// Name of the property holding a node's kind.
constexpr char PRIMARY_TYPE[] = "sys:primaryType";

// Name of the property holding a node's stable identifier. Unlike its
// path, the identifier does not change when the tree is restructured.
constexpr char IDENTIFIER[] = "sys:uuid";


// Nodes of a revision keyed by absolute path. The map is ordered so
// that all descendants of a path are stored contiguously after it.
typedef std::map<std::string, internal::state::Node> Nodes;


// Staged modifications keyed by absolute path: some node adds or
// replaces the node at that path, none removes it.
typedef std::map<std::string, Option<internal::state::Node>> Changes;


// An immutable, consistent view of the whole tree as of one commit.
class Revision
{
public:
  Revision(uint64_t _number, const Nodes& _nodes);

  // Returns the path of the node carrying the given identifier.
  Option<std::string> lookup(const std::string& identifier) const;

  const uint64_t number;
  const Nodes nodes;

private:
  hashmap<std::string, std::string> identifiers;
};


// Metadata travelling with a commit. Hooks may inspect it to decide
// how much work a commit deserves.
struct CommitInfo
{
  CommitInfo() {}

  explicit CommitInfo(const hashmap<std::string, std::string>& _info)
    : info(_info) {}

  hashmap<std::string, std::string> info;
};


// The shared, versioned backend. Any number of sessions (see 'Root')
// may stage changes against revisions obtained from 'head' and try to
// commit them concurrently. Note that 'commit' acts like a
// "test-and-set": it only succeeds if none of the nodes touched by
// the changes have been modified since 'base'.
class Storage
{
public:
  Storage() {}
  virtual ~Storage() {}

  // Returns the most recently committed revision.
  virtual Try<process::Shared<Revision>> head() = 0;

  // Returns true if the changes were committed, false if they
  // conflict with a commit that happened after 'base', or an error
  // if the commit failed for any other reason (including a commit
  // hook rejecting it).
  virtual Try<bool> commit(
      const process::Shared<Revision>& base,
      const Changes& changes,
      const CommitInfo& info) = 0;
};

} // namespace state {
} // namespace warden {

#endif // __WARDEN_STATE_STORAGE_HPP__
