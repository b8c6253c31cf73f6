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

#ifndef __PROC_UTILS_HPP__
#define __PROC_UTILS_HPP__

#include <stdint.h>
#include <sys/types.h>

#include <string>

#include "common/seconds.hpp"
#include "common/try.hpp"

#include "metrics/process_stats.hpp"

namespace execmetrics {
namespace internal {
namespace metrics {

// Retrieves resource usage and metadata for a process. Takes the PID of
// the process to query and returns a ProcessStats struct containing the
// retrieved info.
Try<ProcessStats> getProcessStats(const pid_t& pid);

// Retrieves the system boot time (in time since epoch).
Try<seconds> getBootTime();

// Retrieves the start time (in time since epoch) of the process
// with the given PID.
Try<seconds> getStartTime(const pid_t& pid);

// Retrieves a "kB" valued field of /proc/<pid>/status, e.g. "RssFile",
// in bytes.
Try<int64_t> getStatusBytes(const pid_t& pid, const std::string& field);

// Returns the current time (in time since epoch).
seconds now();

} // namespace metrics {
} // namespace internal {
} // namespace execmetrics {

#endif // __PROC_UTILS_HPP__
