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

#include <warden/tokens/constants.hpp>

#include <stout/foreach.hpp>
#include <stout/strings.hpp>

#include "tokens/attributes.hpp"

using std::string;
using std::vector;

using warden::internal::state::Property;

namespace warden {
namespace internal {
namespace tokens {

// Namespaces of properties maintained by the store or by this library.
static const char* const RESERVED_NAMESPACES[] = {"sys", "warden", "xml"};


bool isReservedAttribute(const string& name)
{
  return name == warden::tokens::TOKEN_ATTRIBUTE ||
         name == warden::tokens::TOKEN_ATTRIBUTE_KEY ||
         name == warden::tokens::TOKEN_ATTRIBUTE_EXPIRY;
}


AttributeKind classify(const string& name)
{
  if (isReservedAttribute(name)) {
    return AttributeKind::INTERNAL;
  }

  if (strings::startsWith(name, warden::tokens::TOKEN_ATTRIBUTE)) {
    return AttributeKind::MANDATORY;
  }

  const size_t colon = name.find(':');
  if (colon == string::npos) {
    return AttributeKind::PUBLIC;
  }

  const string prefix = name.substr(0, colon);
  foreach (const char* reserved, RESERVED_NAMESPACES) {
    if (prefix == reserved) {
      return AttributeKind::INTERNAL;
    }
  }

  return AttributeKind::PUBLIC;
}


TokenAttributes partition(const vector<Property>& properties)
{
  TokenAttributes attributes;

  foreach (const Property& property, properties) {
    switch (classify(property.name())) {
      case AttributeKind::MANDATORY:
        attributes.mandatory[property.name()] = property.value();
        break;
      case AttributeKind::PUBLIC:
        attributes.informational[property.name()] = property.value();
        break;
      case AttributeKind::INTERNAL:
        break;
    }
  }

  return attributes;
}

} // namespace tokens {
} // namespace internal {
} // namespace warden {
