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

#ifndef __METRIC_KIND_HPP__
#define __METRIC_KIND_HPP__

#include <stdint.h>

#include <string>
#include <vector>

#include "common/try.hpp"

#include "metrics/metric_context.hpp"

namespace execmetrics {
namespace internal {
namespace metrics {

// The executor level metrics, in reporting order. The value of each
// enumerator is the metric's offset in a Snapshot and in the peak
// values of an executor.
enum MetricKind {
  JVM_HEAP_MEMORY = 0,
  JVM_OFF_HEAP_MEMORY,
  ON_HEAP_EXECUTION_MEMORY,
  OFF_HEAP_EXECUTION_MEMORY,
  ON_HEAP_STORAGE_MEMORY,
  OFF_HEAP_STORAGE_MEMORY,
  ON_HEAP_UNIFIED_MEMORY,
  OFF_HEAP_UNIFIED_MEMORY,
  DIRECT_POOL_MEMORY,
  MAPPED_POOL_MEMORY,
  CPU_TIME
};

// Which capability of a MetricContext a metric is read from.
enum Capability {
  MEMORY_MANAGER_COUNTER,
  RUNTIME_HEAP_BEAN,
  RUNTIME_BUFFER_POOL_BEAN,
  OS_PROCESS_CPU
};

// One reading per metric, indexed by MetricKind.
typedef std::vector<int64_t> Snapshot;


// Returns every metric kind in index order. Never empty.
const std::vector<MetricKind>& listKinds();

// Returns the number of metric kinds, i.e. the length of a Snapshot.
size_t numMetrics();

// Returns the stable name of a metric, e.g. "JVMHeapMemory".
const std::string& metricName(MetricKind kind);

// Returns the metric names in index order.
std::vector<std::string> metricNames();

// Looks up a metric by name.
Try<MetricKind> metricKind(const std::string& name);

Capability capability(MetricKind kind);

// Reads the current value of a metric. Returns an error if the
// capability the metric needs is missing from 'context' or cannot be
// read.
Try<int64_t> read(MetricKind kind, const MetricContext& context);

// Reads every metric once. A metric that cannot be read is reported
// as 0 so that one unavailable source does not lose the others.
Snapshot takeSnapshot(const MetricContext& context);

} // namespace metrics {
} // namespace internal {
} // namespace execmetrics {

#endif // __METRIC_KIND_HPP__
