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

#include "common/foreach.hpp"
#include "common/try.hpp"

#include "metrics/metric_kind.hpp"

using std::string;
using std::vector;

namespace execmetrics {
namespace internal {
namespace metrics {

static Try<int64_t> unavailable(const string& capability)
{
  return Try<int64_t>::error(capability + " is not available");
}


static Try<int64_t> readHeap(const MetricContext& context)
{
  if (context.memoryBean == NULL) {
    return unavailable("Memory bean");
  }
  return context.memoryBean->heapMemoryUsed();
}


static Try<int64_t> readNonHeap(const MetricContext& context)
{
  if (context.memoryBean == NULL) {
    return unavailable("Memory bean");
  }
  return context.memoryBean->nonHeapMemoryUsed();
}


// Execution and/or storage memory of one memory mode.
template <MemoryMode mode, bool execution, bool storage>
static Try<int64_t> readMemoryManager(const MetricContext& context)
{
  if (context.memoryManager == NULL) {
    return unavailable("Memory manager");
  }

  int64_t used = 0;
  if (execution) {
    used += context.memoryManager->executionMemoryUsed(mode);
  }
  if (storage) {
    used += context.memoryManager->storageMemoryUsed(mode);
  }
  return used;
}


static Try<int64_t> readBufferPool(const MetricContext& context,
                                   const string& pool)
{
  if (context.bufferPools == NULL) {
    return unavailable("Buffer pool bean");
  }
  return context.bufferPools->memoryUsed(pool);
}


static Try<int64_t> readDirectPool(const MetricContext& context)
{
  return readBufferPool(context, "direct");
}


static Try<int64_t> readMappedPool(const MetricContext& context)
{
  return readBufferPool(context, "mapped");
}


static Try<int64_t> readCpuTime(const MetricContext& context)
{
  if (context.processCpu == NULL) {
    return unavailable("Process CPU bean");
  }
  return context.processCpu->processCpuTime();
}


namespace {

struct MetricDescriptor
{
  MetricKind kind;
  const char* name;
  Capability capability;
  Try<int64_t> (*read)(const MetricContext&);
};

// Must be in MetricKind order.
const MetricDescriptor DESCRIPTORS[] = {
  { JVM_HEAP_MEMORY, "JVMHeapMemory",
    RUNTIME_HEAP_BEAN, readHeap },
  { JVM_OFF_HEAP_MEMORY, "JVMOffHeapMemory",
    RUNTIME_HEAP_BEAN, readNonHeap },
  { ON_HEAP_EXECUTION_MEMORY, "OnHeapExecutionMemory",
    MEMORY_MANAGER_COUNTER, readMemoryManager<ON_HEAP, true, false> },
  { OFF_HEAP_EXECUTION_MEMORY, "OffHeapExecutionMemory",
    MEMORY_MANAGER_COUNTER, readMemoryManager<OFF_HEAP, true, false> },
  { ON_HEAP_STORAGE_MEMORY, "OnHeapStorageMemory",
    MEMORY_MANAGER_COUNTER, readMemoryManager<ON_HEAP, false, true> },
  { OFF_HEAP_STORAGE_MEMORY, "OffHeapStorageMemory",
    MEMORY_MANAGER_COUNTER, readMemoryManager<OFF_HEAP, false, true> },
  { ON_HEAP_UNIFIED_MEMORY, "OnHeapUnifiedMemory",
    MEMORY_MANAGER_COUNTER, readMemoryManager<ON_HEAP, true, true> },
  { OFF_HEAP_UNIFIED_MEMORY, "OffHeapUnifiedMemory",
    MEMORY_MANAGER_COUNTER, readMemoryManager<OFF_HEAP, true, true> },
  { DIRECT_POOL_MEMORY, "DirectPoolMemory",
    RUNTIME_BUFFER_POOL_BEAN, readDirectPool },
  { MAPPED_POOL_MEMORY, "MappedPoolMemory",
    RUNTIME_BUFFER_POOL_BEAN, readMappedPool },
  { CPU_TIME, "CpuTime",
    OS_PROCESS_CPU, readCpuTime }
};

const size_t NUM_METRICS = sizeof(DESCRIPTORS) / sizeof(DESCRIPTORS[0]);


const MetricDescriptor& descriptor(MetricKind kind)
{
  CHECK_LT(static_cast<size_t>(kind), NUM_METRICS);
  CHECK_EQ(DESCRIPTORS[kind].kind, kind);
  return DESCRIPTORS[kind];
}


vector<MetricKind> initKinds()
{
  vector<MetricKind> kinds;
  for (size_t i = 0; i < NUM_METRICS; i++) {
    CHECK_EQ(static_cast<size_t>(DESCRIPTORS[i].kind), i)
      << "Metric " << DESCRIPTORS[i].name << " is out of order";
    kinds.push_back(DESCRIPTORS[i].kind);
  }
  return kinds;
}

} // namespace {


const vector<MetricKind>& listKinds()
{
  static const vector<MetricKind> kinds = initKinds();
  return kinds;
}


size_t numMetrics()
{
  return NUM_METRICS;
}


const string& metricName(MetricKind kind)
{
  static vector<string> names = metricNames();
  CHECK_LT(static_cast<size_t>(kind), names.size());
  return names[kind];
}


vector<string> metricNames()
{
  vector<string> names;
  foreach (MetricKind kind, listKinds()) {
    names.push_back(descriptor(kind).name);
  }
  return names;
}


Try<MetricKind> metricKind(const string& name)
{
  foreach (MetricKind kind, listKinds()) {
    if (name == descriptor(kind).name) {
      return kind;
    }
  }
  return Try<MetricKind>::error("Unknown metric '" + name + "'");
}


Capability capability(MetricKind kind)
{
  return descriptor(kind).capability;
}


Try<int64_t> read(MetricKind kind, const MetricContext& context)
{
  return descriptor(kind).read(context);
}


Snapshot takeSnapshot(const MetricContext& context)
{
  Snapshot snapshot(numMetrics(), 0);
  foreach (MetricKind kind, listKinds()) {
    Try<int64_t> value = read(kind, context);
    if (value.isSome()) {
      snapshot[kind] = value.get();
    } else {
      VLOG(1) << "Reporting 0 for " << metricName(kind)
              << ": " << value.error();
    }
  }
  return snapshot;
}

} // namespace metrics {
} // namespace internal {
} // namespace execmetrics {
