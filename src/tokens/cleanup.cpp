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

#include <glog/logging.h>

#include <warden/state/tree.hpp>

#include <warden/tokens/commit_marker.hpp>

#include <process/time.hpp>

#include <stout/foreach.hpp>
#include <stout/option.hpp>
#include <stout/stopwatch.hpp>
#include <stout/try.hpp>

#include "tokens/cleanup.hpp"
#include "tokens/expiration.hpp"

using std::string;
using std::vector;

using process::Time;

using warden::state::Root;
using warden::state::Tree;

using warden::tokens::CommitMarker;

namespace warden {
namespace internal {
namespace tokens {

bool shouldRunCleanup(const string& token)
{
  return !token.empty() && token[0] < '2';
}


size_t cleanupExpired(
    Root* root,
    const Tree& container,
    int64_t threshold,
    const Time& issuedAt,
    const string& token)
{
  if (threshold <= 0 || !shouldRunCleanup(token)) {
    return 0;
  }

  if (container.childrenCount(threshold) < static_cast<size_t>(threshold)) {
    return 0;
  }

  Stopwatch stopwatch;
  stopwatch.start();

  size_t total = 0;
  size_t removed = 0;

  foreach (Tree child, container.children()) {
    total++;

    Option<Time> expiresAt = readExpiration(child);
    if (expiresAt.isNone() || expiresAt.get() < issuedAt) {
      if (child.remove()) {
        removed++;
      }
    }
  }

  if (removed > 0) {
    Try<bool> commit = root->commit(CommitMarker::asCommitAttributes());

    if (commit.isError() || !commit.get()) {
      VLOG(1) << "Abandoning token cleanup below '" << container.path()
              << "': "
              << (commit.isError() ? commit.error() : "commit conflict");

      Try<Nothing> refresh = root->refresh();
      if (refresh.isError()) {
        LOG(WARNING) << "Failed to refresh after token cleanup: "
                     << refresh.error();
      }

      return 0;
    }
  }

  VLOG(1) << "Token cleanup below '" << container.path() << "' took "
          << stopwatch.elapsed() << ", removed " << removed << " of "
          << total << " tokens";

  return removed;
}

} // namespace tokens {
} // namespace internal {
} // namespace warden {
