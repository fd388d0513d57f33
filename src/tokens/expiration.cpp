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

#include <warden/state/state.pb.h>
#include <warden/state/tree.hpp>

#include <warden/tokens/constants.hpp>

#include <process/time.hpp>

#include <stout/duration.hpp>
#include <stout/numify.hpp>
#include <stout/stringify.hpp>

#include "tokens/expiration.hpp"

using std::string;

using process::Time;

using warden::internal::state::Property;

using warden::tokens::TOKEN_ATTRIBUTE_EXPIRY;

namespace warden {
namespace internal {
namespace tokens {

Time expirationTime(const Time& creation, const Duration& ttl)
{
  // Saturates at the latest representable time.
  if (ttl > Time::max() - creation) {
    return Time::max();
  }

  return creation + ttl;
}


bool isExpired(const Time& expiresAt, const Time& now)
{
  return now > expiresAt;
}


bool shouldRefresh(const Time& expiresAt, const Time& now, const Duration& ttl)
{
  return expiresAt - now <= ttl / 2;
}


int64_t toMillis(const Time& time)
{
  return time.duration().ns() / Milliseconds(1).ns();
}


Option<Time> fromMillis(int64_t millis)
{
  if (millis < 0 || millis > Duration::max().ns() / Milliseconds(1).ns()) {
    return None();
  }

  return Time::epoch() + Milliseconds(millis);
}


Option<Time> readExpiration(const warden::state::Tree& tree)
{
  Option<Property> property = tree.property(TOKEN_ATTRIBUTE_EXPIRY);
  if (property.isNone() || property->type() != Property::DATE) {
    return None();
  }

  Try<int64_t> millis = numify<int64_t>(property->value());
  if (millis.isError()) {
    return None();
  }

  return fromMillis(millis.get());
}


Try<Nothing> writeExpiration(warden::state::Tree* tree, const Time& expiresAt)
{
  return tree->setProperty(
      TOKEN_ATTRIBUTE_EXPIRY,
      stringify(toMillis(expiresAt)),
      Property::DATE);
}

} // namespace tokens {
} // namespace internal {
} // namespace warden {
