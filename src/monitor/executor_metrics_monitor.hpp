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

#ifndef __EXECUTOR_METRICS_MONITOR_HPP__
#define __EXECUTOR_METRICS_MONITOR_HPP__

#include <string>

#include <process/future.hpp>
#include <process/process.hpp>

#include <execmetrics/execmetrics.hpp>

#include "common/try.hpp"

#include "metrics/cpu_usage.hpp"
#include "metrics/executor_metrics_registry.hpp"
#include "metrics/metric_context.hpp"

namespace execmetrics {
namespace internal {
namespace monitor {

// Seconds between two collections.
const double DEFAULT_COLLECTION_INTERVAL = 10.0;


// Periodically reads the metrics of this process and feeds them to the
// registry for every registered executor. Reporting code asks for an
// ExecutorMetricsReport of an executor at any time.
class ExecutorMetricsMonitor
  : public process::Process<ExecutorMetricsMonitor>
{
public:
  // Does not take ownership of 'registry' or of the capabilities in
  // 'context'. Takes ownership of 'cpuUsageReader', which may be NULL
  // if CPU usage cannot be read. Stops after 'maxTicks' collections
  // unless 'maxTicks' is 0.
  ExecutorMetricsMonitor(metrics::ExecutorMetricsRegistry* registry,
                         const metrics::MetricContext& context,
                         metrics::CpuUsageReader* cpuUsageReader,
                         double interval = DEFAULT_COLLECTION_INTERVAL,
                         int maxTicks = 0);

  virtual ~ExecutorMetricsMonitor();

  // Takes one snapshot and one CPU usage sample and records them for
  // the executor. Returns whether any peak changed.
  Try<bool> collect(const std::string& executorId);

  // Returns the current metrics of the executor. Fails if the
  // executor is not registered.
  process::Future<ExecutorMetricsReport> report(const std::string& executorId);

  int getTicks() const { return ticks; }

protected:
  virtual void initialize();

private:
  // Collects for every registered executor and schedules the next tick.
  void tick();

  Try<bool> record(const std::string& executorId,
                   const metrics::Snapshot& snapshot,
                   const Try<float>& cpuUsage);

  Try<float> sampleCpuUsage();

  metrics::ExecutorMetricsRegistry* registry;
  const metrics::MetricContext context;
  metrics::CpuUsageReader* cpuUsageReader;
  const double interval;
  const int maxTicks;
  int ticks;
};

} // namespace monitor {
} // namespace internal {
} // namespace execmetrics {

#endif // __EXECUTOR_METRICS_MONITOR_HPP__
