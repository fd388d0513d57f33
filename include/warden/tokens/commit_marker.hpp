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

#ifndef __WARDEN_TOKENS_COMMIT_MARKER_HPP__
#define __WARDEN_TOKENS_COMMIT_MARKER_HPP__

#include <string>

#include <warden/state/storage.hpp>

#include <stout/hashmap.hpp>

namespace warden {
namespace tokens {

// Tags commits that only maintain login tokens, so that commit hooks
// can skip work that does not apply to them.
class CommitMarker
{
public:
  static state::CommitInfo asCommitAttributes()
  {
    hashmap<std::string, std::string> info;
    info.put(key(), "true");
    return state::CommitInfo(info);
  }

  static bool isTokenCommit(const state::CommitInfo& info)
  {
    return info.info.contains(key());
  }

private:
  static std::string key() { return "warden.tokens.commit-marker"; }
};

} // namespace tokens {
} // namespace warden {

#endif // __WARDEN_TOKENS_COMMIT_MARKER_HPP__
