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

#ifndef __MEMORY_MANAGER_HPP__
#define __MEMORY_MANAGER_HPP__

#include <pthread.h>
#include <stdint.h>

#include "metrics/metric_context.hpp"

namespace execmetrics {
namespace internal {
namespace metrics {

// A MemoryManager that hands out execution and storage memory from
// one shared pool per memory mode. Execution and storage compete for
// the same bytes: an acquire succeeds while the sum of both stays
// within the pool size of that mode.
class UnifiedMemoryManager : public MemoryManager
{
public:
  UnifiedMemoryManager(int64_t onHeapSize, int64_t offHeapSize);

  virtual ~UnifiedMemoryManager();

  // Returns false, and acquires nothing, if the pool cannot fit
  // 'bytes' more.
  bool acquireExecutionMemory(int64_t bytes, MemoryMode mode);
  bool acquireStorageMemory(int64_t bytes, MemoryMode mode);

  void releaseExecutionMemory(int64_t bytes, MemoryMode mode);
  void releaseStorageMemory(int64_t bytes, MemoryMode mode);

  int64_t poolSize(MemoryMode mode) const;

  virtual int64_t executionMemoryUsed(MemoryMode mode) const;
  virtual int64_t storageMemoryUsed(MemoryMode mode) const;

private:
  struct Pool
  {
    Pool(int64_t _size) : size(_size), execution(0), storage(0) {}

    const int64_t size;
    int64_t execution;
    int64_t storage;
  };

  bool acquire(int64_t bytes, MemoryMode mode, bool execution);
  void release(int64_t bytes, MemoryMode mode, bool execution);

  Pool& pool(MemoryMode mode);
  const Pool& pool(MemoryMode mode) const;

  Pool onHeap;
  Pool offHeap;

  mutable pthread_mutex_t mutex;
};

} // namespace metrics {
} // namespace internal {
} // namespace execmetrics {

#endif // __MEMORY_MANAGER_HPP__
