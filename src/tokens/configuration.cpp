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

#include <map>
#include <string>

#include <glog/logging.h>

#include <warden/tokens/configuration.hpp>

#include <stout/duration.hpp>
#include <stout/flags.hpp>
#include <stout/foreach.hpp>
#include <stout/try.hpp>

#include "tokens/crypto.hpp"
#include "tokens/flags.hpp"

using std::map;
using std::string;

namespace warden {
namespace tokens {

// Loads a single option into 'flags'. On failure the flag keeps the
// value it had, which is its default.
static void load(
    internal::tokens::Flags* flags,
    const string& name,
    const string& value)
{
  Try<flags::Warnings> load = flags->load(map<string, string>{{name, value}});

  if (load.isError()) {
    LOG(WARNING) << "Ignoring token option '" << name << "="
                 << value << "': " << load.error();
    return;
  }

  foreach (const flags::Warning& warning, load->warnings) {
    LOG(WARNING) << warning.message;
  }
}


Configuration Configuration::create(const map<string, string>& options)
{
  internal::tokens::Flags flags;

  foreachpair (const string& name, const string& value, options) {
    load(&flags, name, value);
  }

  Configuration configuration;

  if (flags.token_expiration > 0 &&
      flags.token_expiration <= Duration::max().ns() / Milliseconds(1).ns()) {
    configuration.expiration = Milliseconds(flags.token_expiration);
  } else {
    LOG(WARNING) << "Invalid token expiration " << flags.token_expiration
                 << "ms, using the default of " << configuration.expiration;
  }

  if (flags.token_length > 0) {
    configuration.length = flags.token_length;
  } else {
    LOG(WARNING) << "Invalid token length " << flags.token_length
                 << ", using the default of " << configuration.length;
  }

  if (flags.token_cleanup_threshold >= 0) {
    configuration.cleanupThreshold = flags.token_cleanup_threshold;
  } else {
    LOG(WARNING) << "Invalid token cleanup threshold "
                 << flags.token_cleanup_threshold
                 << ", using the default of "
                 << configuration.cleanupThreshold;
  }

  configuration.refresh = flags.token_refresh;

  if (internal::tokens::crypto::isSupported(flags.hash_algorithm)) {
    configuration.hash.algorithm = flags.hash_algorithm;
  } else {
    LOG(WARNING) << "Unsupported hash algorithm '" << flags.hash_algorithm
                 << "', using the default of '"
                 << configuration.hash.algorithm << "'";
  }

  if (flags.hash_iterations > 0) {
    configuration.hash.iterations = flags.hash_iterations;
  } else {
    LOG(WARNING) << "Invalid number of hash iterations "
                 << flags.hash_iterations << ", using the default of "
                 << configuration.hash.iterations;
  }

  if (flags.hash_salt_size > 0) {
    configuration.hash.saltSize = flags.hash_salt_size;
  } else {
    LOG(WARNING) << "Invalid hash salt size " << flags.hash_salt_size
                 << ", using the default of " << configuration.hash.saltSize;
  }

  return configuration;
}

} // namespace tokens {
} // namespace warden {
