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

#include <glog/logging.h>

#include "metrics/peak_executor_metrics.hpp"

namespace execmetrics {
namespace internal {
namespace metrics {

PeakExecutorMetrics::PeakExecutorMetrics()
  : peaks(numMetrics(), 0)
{
  peaks[0] = -1;
}


bool PeakExecutorMetrics::compareAndUpdate(const Snapshot& snapshot)
{
  // A misaligned snapshot would attribute values to the wrong metrics.
  CHECK_EQ(snapshot.size(), peaks.size());

  bool updated = false;
  for (size_t i = 0; i < peaks.size(); i++) {
    if (snapshot[i] > peaks[i]) {
      peaks[i] = snapshot[i];
      updated = true;
    }
  }
  return updated;
}


void PeakExecutorMetrics::reset()
{
  peaks.assign(peaks.size(), 0);
  peaks[0] = -1;
}

} // namespace metrics {
} // namespace internal {
} // namespace execmetrics {
