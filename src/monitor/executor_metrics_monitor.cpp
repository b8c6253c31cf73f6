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
#include <vector>

#include <glog/logging.h>

#include <process/delay.hpp>
#include <process/process.hpp>

#include "common/foreach.hpp"

#include "metrics/metric_kind.hpp"

#include "monitor/executor_metrics_monitor.hpp"

using process::Clock;
using process::Future;
using process::Promise;

using std::string;
using std::vector;

using namespace execmetrics::internal::metrics;

namespace execmetrics {
namespace internal {
namespace monitor {

ExecutorMetricsMonitor::ExecutorMetricsMonitor(
    ExecutorMetricsRegistry* _registry,
    const MetricContext& _context,
    CpuUsageReader* _cpuUsageReader,
    double _interval,
    int _maxTicks)
  : registry(_registry),
    context(_context),
    cpuUsageReader(_cpuUsageReader),
    interval(_interval),
    maxTicks(_maxTicks),
    ticks(0)
{
  CHECK(registry != NULL);
  CHECK_GT(interval, 0.0);
}


ExecutorMetricsMonitor::~ExecutorMetricsMonitor()
{
  delete cpuUsageReader;
}


void ExecutorMetricsMonitor::initialize()
{
  if (cpuUsageReader != NULL) {
    Try<bool> started = cpuUsageReader->start();
    if (started.isError()) {
      LOG(WARNING) << "Failed to start CPU usage reader: " << started.error();
    }
  }

  process::delay(interval, self(), &ExecutorMetricsMonitor::tick);
}


Try<bool> ExecutorMetricsMonitor::collect(const string& executorId)
{
  Snapshot snapshot = takeSnapshot(context);
  return record(executorId, snapshot, sampleCpuUsage());
}


Future<ExecutorMetricsReport> ExecutorMetricsMonitor::report(
    const string& executorId)
{
  Promise<ExecutorMetricsReport> p;

  Try<vector<int64_t> > peaks = registry->peaks(executorId);
  if (peaks.isError()) {
    p.fail(peaks.error());
    return p.future();
  }

  ExecutorMetricsReport report;
  report.mutable_executor_id()->set_value(executorId);
  report.set_timestamp(Clock::now());

  const vector<int64_t> values = peaks.get();
  const vector<string> names = metricNames();
  CHECK_EQ(values.size(), names.size());

  report.set_peaks_recorded(values[0] != -1);
  for (size_t i = 0; i < values.size(); i++) {
    MetricValue* metric = report.add_peaks();
    metric->set_name(names[i]);
    metric->set_value(values[i]);
  }

  // A registered executor always has a CPU usage window, unless it was
  // deregistered after the peaks were read.
  Try<CpuUsageWindow> window = registry->cpuUsageWindow(executorId);
  if (window.isSome()) {
    foreach (float usage, window.get().samples) {
      report.add_cpu_usage(usage);
    }
    report.set_average_cpu_usage(window.get().average);
  }

  return report;
}


void ExecutorMetricsMonitor::tick()
{
  ticks++;

  // One snapshot and one CPU sample per tick, shared by all executors.
  Snapshot snapshot = takeSnapshot(context);
  Try<float> cpuUsage = sampleCpuUsage();

  foreach (const string& executorId, registry->executors()) {
    Try<bool> updated = record(executorId, snapshot, cpuUsage);
    if (updated.isError()) {
      // The executor was deregistered while we were collecting.
      VLOG(1) << "Skipping executor " << executorId << ": "
              << updated.error();
      continue;
    }

    Future<ExecutorMetricsReport> current = report(executorId);
    if (current.isReady()) {
      LOG(INFO) << "Executor " << current.get().executor_id() << ": "
                << current.get().ShortDebugString();
    }
  }

  if (maxTicks > 0 && ticks >= maxTicks) {
    LOG(INFO) << "Stopping after " << ticks << " collections";
    process::terminate(self());
    return;
  }

  process::delay(interval, self(), &ExecutorMetricsMonitor::tick);
}


Try<bool> ExecutorMetricsMonitor::record(const string& executorId,
                                         const Snapshot& snapshot,
                                         const Try<float>& cpuUsage)
{
  if (cpuUsage.isSome()) {
    return registry->recordSample(executorId, snapshot, cpuUsage.get());
  }
  return registry->recordSnapshot(executorId, snapshot);
}


Try<float> ExecutorMetricsMonitor::sampleCpuUsage()
{
  if (cpuUsageReader == NULL) {
    return Try<float>::error("CPU usage is not available");
  }

  Try<float> usage = cpuUsageReader->usage();
  if (usage.isError()) {
    LOG(WARNING) << "Failed to sample CPU usage: " << usage.error();
  }
  return usage;
}

} // namespace monitor {
} // namespace internal {
} // namespace execmetrics {
