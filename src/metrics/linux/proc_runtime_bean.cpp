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

#include <unistd.h>

#include <string>

#include "common/seconds.hpp"

#include "metrics/linux/proc_runtime_bean.hpp"
#include "metrics/linux/proc_utils.hpp"

using std::string;

namespace execmetrics {
namespace internal {
namespace metrics {

ProcRuntimeBean::ProcRuntimeBean(pid_t _pid) : pid(_pid) {}


Try<int64_t> ProcRuntimeBean::heapMemoryUsed()
{
  Try<ProcessStats> stats = getProcessStats(pid);
  if (stats.isError()) {
    return Try<int64_t>::error(stats.error());
  }
  return static_cast<int64_t>(stats.get().memUsage);
}


Try<int64_t> ProcRuntimeBean::nonHeapMemoryUsed()
{
  Try<ProcessStats> stats = getProcessStats(pid);
  if (stats.isError()) {
    return Try<int64_t>::error(stats.error());
  }

  double nonResident = stats.get().virtualMemUsage - stats.get().memUsage;
  return static_cast<int64_t>(nonResident > 0 ? nonResident : 0);
}


Try<int64_t> ProcRuntimeBean::memoryUsed(const string& pool)
{
  if (pool == "mapped") {
    return getStatusBytes(pid, "RssFile");
  }
  return Try<int64_t>::error("Buffer pool '" + pool + "' is not available");
}


Try<int64_t> ProcRuntimeBean::processCpuTime()
{
  Try<ProcessStats> stats = getProcessStats(pid);
  if (stats.isError()) {
    return Try<int64_t>::error(stats.error());
  }
  return static_cast<int64_t>(stats.get().cpuTime.value * 1000000000.0);
}


Try<int64_t> ProcRuntimeBean::uptime()
{
  Try<seconds> startTime = getStartTime(pid);
  if (startTime.isError()) {
    return Try<int64_t>::error(startTime.error());
  }
  return static_cast<int64_t>((now().value - startTime.get().value) * 1000.0);
}


int ProcRuntimeBean::availableProcessors()
{
  long processors = sysconf(_SC_NPROCESSORS_ONLN);
  return processors > 0 ? static_cast<int>(processors) : 1;
}

} // namespace metrics {
} // namespace internal {
} // namespace execmetrics {
