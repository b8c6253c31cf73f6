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

#ifndef __METRIC_CONTEXT_HPP__
#define __METRIC_CONTEXT_HPP__

#include <stdint.h>

#include <string>

#include "common/try.hpp"

namespace execmetrics {
namespace internal {
namespace metrics {

enum MemoryMode {
  ON_HEAP,
  OFF_HEAP
};


// Bytes handed out by the executor's memory manager, split into the
// execution and storage pools of each memory mode.
class MemoryManager
{
public:
  virtual ~MemoryManager() {}

  virtual int64_t executionMemoryUsed(MemoryMode mode) const = 0;

  virtual int64_t storageMemoryUsed(MemoryMode mode) const = 0;
};


// Heap and non-heap usage of the process as reported by the runtime.
class MemoryBean
{
public:
  virtual ~MemoryBean() {}

  virtual Try<int64_t> heapMemoryUsed() = 0;

  virtual Try<int64_t> nonHeapMemoryUsed() = 0;
};


// Usage of the named buffer pools ("direct", "mapped") of the process.
class BufferPoolBean
{
public:
  virtual ~BufferPoolBean() {}

  virtual Try<int64_t> memoryUsed(const std::string& pool) = 0;
};


// CPU accounting for a process.
class ProcessCpuBean
{
public:
  virtual ~ProcessCpuBean() {}

  // Returns the CPU time (user + system) used by the process, in
  // nanoseconds.
  virtual Try<int64_t> processCpuTime() = 0;

  // Returns the time since the process started, in milliseconds.
  virtual Try<int64_t> uptime() = 0;

  virtual int availableProcessors() = 0;
};


// The instrumentation capabilities a metric may be read from. A NULL
// member means the capability is not available on this platform. The
// context does not own the capabilities.
struct MetricContext
{
  MetricContext()
    : memoryManager(NULL),
      memoryBean(NULL),
      bufferPools(NULL),
      processCpu(NULL) {}

  MemoryManager* memoryManager;
  MemoryBean* memoryBean;
  BufferPoolBean* bufferPools;
  ProcessCpuBean* processCpu;
};

} // namespace metrics {
} // namespace internal {
} // namespace execmetrics {

#endif // __METRIC_CONTEXT_HPP__
