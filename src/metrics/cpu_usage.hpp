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

#ifndef __CPU_USAGE_HPP__
#define __CPU_USAGE_HPP__

#include <stdint.h>

#include "common/configuration.hpp"
#include "common/try.hpp"

#include "metrics/metric_context.hpp"

namespace execmetrics {
namespace internal {
namespace metrics {

// Converts nanoseconds of CPU time per millisecond of uptime into a
// percentage: divide by 1000000 for the unit and multiply by 100.
const double DEFAULT_CPU_USAGE_SCALE = 10000.0;


/*
 * Computes the CPU usage of a process as a percentage of all
 * available processors over the time since the previous call.
 *
 * Call start() once to mark the beginning of the first interval and
 * then poll usage() periodically. Without start() the first interval
 * begins when the process started.
 */
class CpuUsageReader
{
public:
  // Does not take ownership of 'bean'.
  CpuUsageReader(ProcessCpuBean* bean,
                 double scale = DEFAULT_CPU_USAGE_SCALE);

  // Creates a reader for the process selected by the configuration
  // parameter "cpu_usage_pid" (0, the default, is this process).
  // Returns NULL if process CPU accounting is not supported on this
  // system. The returned reader owns its bean.
  static CpuUsageReader* create(const Configuration& conf);

  virtual ~CpuUsageReader();

  Try<bool> start();

  // Returns the usage over the last interval. On error the interval
  // is not consumed, so the next successful call covers it.
  Try<float> usage();

private:
  CpuUsageReader(const CpuUsageReader&);
  CpuUsageReader& operator = (const CpuUsageReader&);

  ProcessCpuBean* bean;
  bool ownsBean;
  const double scale;

  int64_t prevCpuTime;
  int64_t prevUptime;
};

} // namespace metrics {
} // namespace internal {
} // namespace execmetrics {

#endif // __CPU_USAGE_HPP__
