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

#include <map>
#include <string>
#include <vector>

#include <glog/logging.h>

#include "common/lock.hpp"

#include "metrics/executor_metrics_registry.hpp"

using std::map;
using std::string;
using std::vector;

namespace execmetrics {
namespace internal {
namespace metrics {

static string notRegistered(const string& executorId)
{
  return "Executor '" + executorId + "' is not registered";
}


ExecutorMetricsRegistry::ExecutorMetricsRegistry(size_t cpuUsageWindow)
  : cpuUsages(cpuUsageWindow)
{
  pthread_mutex_init(&mutex, NULL);
}


ExecutorMetricsRegistry::~ExecutorMetricsRegistry()
{
  pthread_mutex_destroy(&mutex);
}


bool ExecutorMetricsRegistry::registerExecutor(const string& executorId)
{
  Lock lock(&mutex);
  if (peakMetrics.count(executorId) > 0) {
    return false;
  }

  LOG(INFO) << "Registering executor " << executorId;
  peakMetrics.insert(std::make_pair(executorId, PeakExecutorMetrics()));
  cpuUsages.init(executorId);
  return true;
}


bool ExecutorMetricsRegistry::deregisterExecutor(const string& executorId)
{
  Lock lock(&mutex);
  bool registered = peakMetrics.erase(executorId) > 0;
  cpuUsages.clear(executorId);

  if (registered) {
    LOG(INFO) << "Deregistered executor " << executorId;
  }
  return registered;
}


bool ExecutorMetricsRegistry::isRegistered(const string& executorId) const
{
  Lock lock(&mutex);
  return peakMetrics.count(executorId) > 0;
}


vector<string> ExecutorMetricsRegistry::executors() const
{
  Lock lock(&mutex);
  vector<string> result;
  map<string, PeakExecutorMetrics>::const_iterator it;
  for (it = peakMetrics.begin(); it != peakMetrics.end(); ++it) {
    result.push_back(it->first);
  }
  return result;
}


Try<bool> ExecutorMetricsRegistry::recordSnapshot(const string& executorId,
                                                  const Snapshot& snapshot)
{
  Lock lock(&mutex);
  return updatePeaks(executorId, snapshot);
}


Try<bool> ExecutorMetricsRegistry::recordCpuUsage(const string& executorId,
                                                  float usage)
{
  Lock lock(&mutex);
  if (peakMetrics.count(executorId) == 0) {
    return Try<bool>::error(notRegistered(executorId));
  }

  cpuUsages.update(executorId, usage);
  return true;
}


Try<bool> ExecutorMetricsRegistry::recordSample(const string& executorId,
                                                const Snapshot& snapshot,
                                                float cpuUsage)
{
  Lock lock(&mutex);
  Try<bool> updated = updatePeaks(executorId, snapshot);
  if (updated.isError()) {
    return updated;
  }

  cpuUsages.update(executorId, cpuUsage);
  return updated;
}


Try<bool> ExecutorMetricsRegistry::resetPeaks(const string& executorId)
{
  Lock lock(&mutex);
  map<string, PeakExecutorMetrics>::iterator it = peakMetrics.find(executorId);
  if (it == peakMetrics.end()) {
    return Try<bool>::error(notRegistered(executorId));
  }

  it->second.reset();
  return true;
}


Try<vector<int64_t> > ExecutorMetricsRegistry::peaks(
    const string& executorId) const
{
  Lock lock(&mutex);
  map<string, PeakExecutorMetrics>::const_iterator it =
    peakMetrics.find(executorId);
  if (it == peakMetrics.end()) {
    return Try<vector<int64_t> >::error(notRegistered(executorId));
  }
  return it->second.values();
}


Try<vector<float> > ExecutorMetricsRegistry::cpuUsage(
    const string& executorId) const
{
  Lock lock(&mutex);
  return cpuUsages.get(executorId);
}


Try<float> ExecutorMetricsRegistry::averageCpuUsage(
    const string& executorId) const
{
  Lock lock(&mutex);
  return cpuUsages.average(executorId);
}


Try<CpuUsageWindow> ExecutorMetricsRegistry::cpuUsageWindow(
    const string& executorId) const
{
  Lock lock(&mutex);
  Try<vector<float> > samples = cpuUsages.get(executorId);
  if (samples.isError()) {
    return Try<CpuUsageWindow>::error(samples.error());
  }

  Try<float> average = cpuUsages.average(executorId);
  if (average.isError()) {
    return Try<CpuUsageWindow>::error(average.error());
  }

  CpuUsageWindow window;
  window.samples = samples.get();
  window.average = average.get();
  return window;
}


Try<bool> ExecutorMetricsRegistry::updatePeaks(const string& executorId,
                                               const Snapshot& snapshot)
{
  map<string, PeakExecutorMetrics>::iterator it = peakMetrics.find(executorId);
  if (it == peakMetrics.end()) {
    return Try<bool>::error(notRegistered(executorId));
  }

  bool updated = it->second.compareAndUpdate(snapshot);
  if (updated) {
    VLOG(2) << "New peak metrics for executor " << executorId;
  }
  return updated;
}

} // namespace metrics {
} // namespace internal {
} // namespace execmetrics {
