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

#include <warden/state/storage.hpp>

#include <stout/foreach.hpp>

using std::string;

using warden::internal::state::Node;
using warden::internal::state::Property;

namespace warden {
namespace state {

Revision::Revision(uint64_t _number, const Nodes& _nodes)
  : number(_number),
    nodes(_nodes)
{
  foreachpair (const string& path, const Node& node, nodes) {
    foreach (const Property& property, node.properties()) {
      if (property.name() == IDENTIFIER) {
        identifiers.put(property.value(), path);
        break;
      }
    }
  }
}


Option<string> Revision::lookup(const string& identifier) const
{
  return identifiers.get(identifier);
}

} // namespace state {
} // namespace warden {
