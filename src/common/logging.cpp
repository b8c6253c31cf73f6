/**
 * Licensed to the Apache Software Foundation (ASF) under one
 * or more contributor license agreements.  See the NOTICE file
 * distributed with this work for additional information
 * regarding copyright ownership.  The ASF licenses this file
 * to you under the Apache License, Version 2.0 (the
 * "License"); you may not use this file except in compliance
 * with the License.  You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#include <string>

#include <glog/logging.h>

#include "common/logging.hpp"

using std::string;

namespace execmetrics {
namespace internal {
namespace logging {

void initialize(const string& argv0, const Configuration& conf)
{
  static bool initialized = false;
  if (initialized) {
    return;
  }

  string logDir = conf.get("log_dir", "");
  bool quiet = conf.get<bool>("quiet", false);

  if (logDir != "") {
    FLAGS_log_dir = logDir;
  } else {
    FLAGS_logtostderr = true;
  }

  FLAGS_logbufsecs = conf.get<int>("logbufsecs", 0);

  // Only errors and above reach stderr in quiet mode.
  FLAGS_stderrthreshold = quiet ? google::ERROR : google::INFO;

  google::InitGoogleLogging(argv0.c_str());
  google::InstallFailureSignalHandler();

  initialized = true;

  if (logDir != "") {
    LOG(INFO) << "Logging to " << logDir;
  }
}

} // namespace logging {
} // namespace internal {
} // namespace execmetrics {
