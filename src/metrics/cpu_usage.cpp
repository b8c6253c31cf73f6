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

#include <sys/types.h>
#include <unistd.h>

#include <glog/logging.h>

#include "metrics/cpu_usage.hpp"

#ifdef __linux__
#include "metrics/linux/proc_runtime_bean.hpp"
#endif

namespace execmetrics {
namespace internal {
namespace metrics {

CpuUsageReader::CpuUsageReader(ProcessCpuBean* _bean, double _scale)
  : bean(_bean),
    ownsBean(false),
    scale(_scale),
    prevCpuTime(0),
    prevUptime(0)
{
  CHECK(bean != NULL);
  CHECK_GT(scale, 0.0);
}


CpuUsageReader* CpuUsageReader::create(const Configuration& conf)
{
#ifdef __linux__
  pid_t pid = conf.get<pid_t>("cpu_usage_pid", 0);
  if (pid == 0) {
    pid = getpid();
  }

  double scale = conf.get<double>("cpu_usage_scale", DEFAULT_CPU_USAGE_SCALE);
  if (scale <= 0) {
    LOG(WARNING) << "Ignoring non-positive cpu_usage_scale " << scale;
    scale = DEFAULT_CPU_USAGE_SCALE;
  }

  VLOG(1) << "Reading CPU usage of process " << pid
          << " with scale " << scale;

  CpuUsageReader* reader = new CpuUsageReader(new ProcRuntimeBean(pid), scale);
  reader->ownsBean = true;
  return reader;
#else
  return NULL;
#endif
}


CpuUsageReader::~CpuUsageReader()
{
  if (ownsBean) {
    delete bean;
  }
}


Try<bool> CpuUsageReader::start()
{
  Try<int64_t> cpuTime = bean->processCpuTime();
  if (cpuTime.isError()) {
    return Try<bool>::error(cpuTime.error());
  }

  Try<int64_t> uptime = bean->uptime();
  if (uptime.isError()) {
    return Try<bool>::error(uptime.error());
  }

  prevCpuTime = cpuTime.get();
  prevUptime = uptime.get();
  return true;
}


Try<float> CpuUsageReader::usage()
{
  Try<int64_t> cpuTime = bean->processCpuTime();
  if (cpuTime.isError()) {
    return Try<float>::error(cpuTime.error());
  }

  Try<int64_t> uptime = bean->uptime();
  if (uptime.isError()) {
    return Try<float>::error(uptime.error());
  }

  // CPU time is in nanoseconds, uptime in milliseconds.
  int64_t elapsedCpuTime = cpuTime.get() - prevCpuTime;
  int64_t elapsedUptime = uptime.get() - prevUptime;

  if (elapsedUptime <= 0) {
    return Try<float>::error("No time has elapsed since the last CPU sample");
  }

  int processors = bean->availableProcessors();
  if (processors <= 0) {
    processors = 1;
  }

  // Total uptime on all the available processors.
  double totalElapsedUptime = static_cast<double>(elapsedUptime) * processors;

  float usage = static_cast<float>(elapsedCpuTime / (totalElapsedUptime * scale));

  VLOG(2) << "CPU time " << prevCpuTime << "ns -> " << cpuTime.get()
          << "ns, uptime " << prevUptime << "ms -> " << uptime.get()
          << "ms, " << processors << " processors, usage " << usage << "%";

  prevCpuTime = cpuTime.get();
  prevUptime = uptime.get();

  return usage;
}

} // namespace metrics {
} // namespace internal {
} // namespace execmetrics {
