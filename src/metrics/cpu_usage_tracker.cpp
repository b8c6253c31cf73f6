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

#include "common/foreach.hpp"
#include "common/lock.hpp"

#include "metrics/cpu_usage_tracker.hpp"

using std::map;
using std::string;
using std::vector;

namespace execmetrics {
namespace internal {
namespace metrics {

static string notFound(const string& executorId)
{
  return "No CPU usage recorded for executor '" + executorId + "'";
}


CpuUsageTracker::CpuUsageTracker(size_t capacity)
  : windowSize(capacity)
{
  CHECK_GT(windowSize, 0u);
  pthread_mutex_init(&mutex, NULL);
}


CpuUsageTracker::~CpuUsageTracker()
{
  pthread_mutex_destroy(&mutex);
}


void CpuUsageTracker::init(const string& executorId)
{
  Lock lock(&mutex);
  initLocked(executorId);
}


void CpuUsageTracker::update(const string& executorId, float usage)
{
  Lock lock(&mutex);
  initLocked(executorId);

  vector<float>& window = windows[executorId];
  for (size_t i = 0; i + 1 < window.size(); i++) {
    window[i] = window[i + 1];
  }
  window[window.size() - 1] = usage;
}


void CpuUsageTracker::clear(const string& executorId)
{
  Lock lock(&mutex);
  windows.erase(executorId);
}


bool CpuUsageTracker::contains(const string& executorId) const
{
  Lock lock(&mutex);
  return windows.count(executorId) > 0;
}


Try<vector<float> > CpuUsageTracker::get(const string& executorId) const
{
  Lock lock(&mutex);
  map<string, vector<float> >::const_iterator it = windows.find(executorId);
  if (it == windows.end()) {
    return Try<vector<float> >::error(notFound(executorId));
  }
  return it->second;
}


Try<float> CpuUsageTracker::average(const string& executorId) const
{
  Lock lock(&mutex);
  map<string, vector<float> >::const_iterator it = windows.find(executorId);
  if (it == windows.end()) {
    return Try<float>::error(notFound(executorId));
  }

  float sum = 0.0f;
  foreach (float usage, it->second) {
    sum += usage;
  }
  return sum / it->second.size();
}


void CpuUsageTracker::initLocked(const string& executorId)
{
  if (windows.count(executorId) == 0) {
    VLOG(1) << "Tracking CPU usage of executor " << executorId;
    windows[executorId] = vector<float>(windowSize, INITIAL_CPU_USAGE);
  }
}

} // namespace metrics {
} // namespace internal {
} // namespace execmetrics {
