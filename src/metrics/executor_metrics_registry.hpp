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

#ifndef __EXECUTOR_METRICS_REGISTRY_HPP__
#define __EXECUTOR_METRICS_REGISTRY_HPP__

#include <pthread.h>
#include <stdint.h>

#include <map>
#include <string>
#include <vector>

#include "common/try.hpp"

#include "metrics/cpu_usage_tracker.hpp"
#include "metrics/metric_kind.hpp"
#include "metrics/peak_executor_metrics.hpp"

namespace execmetrics {
namespace internal {
namespace metrics {

// The CPU usage samples of an executor and their average, read
// together.
struct CpuUsageWindow
{
  std::vector<float> samples;
  float average;
};


/*
 * Owns the metric state of every executor: the peak value of each
 * metric and the window of recent CPU usage samples.
 *
 * An executor's state lives from registerExecutor() until
 * deregisterExecutor(). Queries for executors without state return an
 * error rather than a default so callers can tell "no data yet" from
 * "zero usage".
 *
 * Safe to use from several threads. Updates for one executor are
 * applied in the order they are made.
 */
class ExecutorMetricsRegistry
{
public:
  explicit ExecutorMetricsRegistry(
      size_t cpuUsageWindow = DEFAULT_CPU_USAGE_WINDOW);

  ~ExecutorMetricsRegistry();

  // Creates empty state for the executor. Returns false if the
  // executor was already registered, in which case its state is kept.
  bool registerExecutor(const std::string& executorId);

  // Drops all state of the executor. Returns false if it was not
  // registered.
  bool deregisterExecutor(const std::string& executorId);

  bool isRegistered(const std::string& executorId) const;

  std::vector<std::string> executors() const;

  // Compares the snapshot with the executor's peak values. Returns
  // whether any peak changed.
  Try<bool> recordSnapshot(const std::string& executorId,
                           const Snapshot& snapshot);

  // Appends a CPU usage sample to the executor's window.
  Try<bool> recordCpuUsage(const std::string& executorId, float usage);

  // Records a snapshot and a CPU usage sample of one collection
  // atomically. Returns whether any peak changed.
  Try<bool> recordSample(const std::string& executorId,
                         const Snapshot& snapshot,
                         float cpuUsage);

  // Forgets the executor's peak values, e.g. when a new stage starts.
  Try<bool> resetPeaks(const std::string& executorId);

  Try<std::vector<int64_t> > peaks(const std::string& executorId) const;

  Try<std::vector<float> > cpuUsage(const std::string& executorId) const;

  Try<float> averageCpuUsage(const std::string& executorId) const;

  Try<CpuUsageWindow> cpuUsageWindow(const std::string& executorId) const;

private:
  ExecutorMetricsRegistry(const ExecutorMetricsRegistry&);
  ExecutorMetricsRegistry& operator = (const ExecutorMetricsRegistry&);

  // Callers hold 'mutex'.
  Try<bool> updatePeaks(const std::string& executorId,
                        const Snapshot& snapshot);

  std::map<std::string, PeakExecutorMetrics> peakMetrics;

  CpuUsageTracker cpuUsages;

  mutable pthread_mutex_t mutex;
};

} // namespace metrics {
} // namespace internal {
} // namespace execmetrics {

#endif // __EXECUTOR_METRICS_REGISTRY_HPP__
