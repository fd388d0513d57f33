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

#ifndef __TOKENS_ATTRIBUTES_HPP__
#define __TOKENS_ATTRIBUTES_HPP__

#include <string>
#include <vector>

#include <warden/state/state.pb.h>

#include <stout/hashmap.hpp>

namespace warden {
namespace internal {
namespace tokens {

enum class AttributeKind
{
  MANDATORY,
  PUBLIC,
  INTERNAL,
};


// Attributes that callers can never set on a token node.
bool isReservedAttribute(const std::string& name);

AttributeKind classify(const std::string& name);


struct TokenAttributes
{
  // Must be presented unchanged with the token.
  hashmap<std::string, std::string> mandatory;

  // Handed back to the caller on a successful match.
  hashmap<std::string, std::string> informational;
};


TokenAttributes partition(
    const std::vector<internal::state::Property>& properties);

} // namespace tokens {
} // namespace internal {
} // namespace warden {

#endif // __TOKENS_ATTRIBUTES_HPP__
