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

#include <glog/logging.h>

#include <mutex>
#include <string>

#include <stout/error.hpp>
#include <stout/nothing.hpp>
#include <stout/os.hpp>
#include <stout/synchronized.hpp>
#include <stout/try.hpp>

#include "logging/logging.hpp"

#ifdef __linux__
// Declare FLAGS_drop_log_memory flag for glog. This declaration is based on the
// the DECLARE_XXX macros from glog/logging.h.
namespace fLB {
  extern GOOGLE_GLOG_DLL_DECL bool FLAGS_drop_log_memory;
}
using fLB::FLAGS_drop_log_memory;
#endif

using std::string;

namespace warden {
namespace internal {
namespace logging {

// Persistent copy of argv0 since InitGoogleLogging requires the
// string we pass to it to be accessible indefinitely.
string argv0;

std::mutex mutex;
bool initialized = false;


google::LogSeverity getLogSeverity(const string& logging_level)
{
  if (logging_level == "INFO") {
    return google::INFO;
  } else if (logging_level == "WARNING") {
    return google::WARNING;
  } else if (logging_level == "ERROR") {
    return google::ERROR;
  } else {
    return google::INFO;
  }
}


Try<Nothing> initialize(const string& _argv0, const Flags& flags)
{
  if (flags.logging_level != "INFO" &&
      flags.logging_level != "WARNING" &&
      flags.logging_level != "ERROR") {
    return Error(
        "'" + flags.logging_level + "' is not a valid logging level."
        " Possible values for 'logging_level' flag are:"
        " 'INFO', 'WARNING', 'ERROR'.");
  }

  synchronized (mutex) {
    if (initialized) {
      return Nothing();
    }

    argv0 = _argv0;

    FLAGS_minloglevel = getLogSeverity(flags.logging_level);
    FLAGS_logbufsecs = flags.logbufsecs;

    if (flags.log_dir.isSome()) {
      Try<Nothing> mkdir = os::mkdir(flags.log_dir.get());
      if (mkdir.isError()) {
        return Error(
            "Failed to create directory " + flags.log_dir.get() + ": " +
            mkdir.error());
      }
      FLAGS_log_dir = flags.log_dir.get();
      // Do not log to stderr instead of log files.
      FLAGS_logtostderr = false;
    } else {
      // Log to stderr instead of log files.
      FLAGS_logtostderr = true;
    }

    // Log everything to stderr IN ADDITION to log files unless
    // otherwise specified.
    if (flags.quiet) {
      FLAGS_stderrthreshold = 3; // FATAL.

      // FLAGS_stderrthreshold is ignored when logging to stderr instead
      // of log files. Setting the minimum log level gets around this issue.
      if (FLAGS_logtostderr) {
        FLAGS_minloglevel = 3; // FATAL.
      }
    } else {
      FLAGS_stderrthreshold = FLAGS_minloglevel;
    }

#ifdef __linux__
    // Keep the in-memory buffers of log contents unless asked otherwise
    // through the environment.
    if (os::getenv("GLOG_drop_log_memory").isNone()) {
      FLAGS_drop_log_memory = false;
    }
#endif

    google::InitGoogleLogging(argv0.c_str());

    VLOG(1) << "Logging to "
            << (flags.log_dir.isSome() ? flags.log_dir.get() : "STDERR");

    initialized = true;
  }

  return Nothing();
}

} // namespace logging {
} // namespace internal {
} // namespace warden {
