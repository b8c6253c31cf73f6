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

#ifndef __PEAK_EXECUTOR_METRICS_HPP__
#define __PEAK_EXECUTOR_METRICS_HPP__

#include <stdint.h>

#include <vector>

#include "metrics/metric_kind.hpp"

namespace execmetrics {
namespace internal {
namespace metrics {

// Records the peak values of the executor level metrics, indexed by
// MetricKind. If the first value (JVM_HEAP_MEMORY) is -1 then no
// values have been recorded yet.
class PeakExecutorMetrics
{
public:
  PeakExecutorMetrics();

  // Compares the given snapshot with the saved peak values and saves
  // every value that is a new peak. Returns true if any metric has a
  // new peak. The snapshot must have one value per metric kind.
  bool compareAndUpdate(const Snapshot& snapshot);

  // Clears the saved peak values.
  void reset();

  // Returns true until the first snapshot has been compared.
  bool empty() const { return peaks[0] == -1; }

  const std::vector<int64_t>& values() const { return peaks; }

private:
  std::vector<int64_t> peaks;
};

} // namespace metrics {
} // namespace internal {
} // namespace execmetrics {

#endif // __PEAK_EXECUTOR_METRICS_HPP__
