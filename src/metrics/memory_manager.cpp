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

#include "common/lock.hpp"

#include "metrics/memory_manager.hpp"

namespace execmetrics {
namespace internal {
namespace metrics {

static const char* modeName(MemoryMode mode)
{
  return mode == ON_HEAP ? "on-heap" : "off-heap";
}


UnifiedMemoryManager::UnifiedMemoryManager(int64_t onHeapSize,
                                           int64_t offHeapSize)
  : onHeap(onHeapSize), offHeap(offHeapSize)
{
  CHECK_GE(onHeapSize, 0);
  CHECK_GE(offHeapSize, 0);
  pthread_mutex_init(&mutex, NULL);
}


UnifiedMemoryManager::~UnifiedMemoryManager()
{
  pthread_mutex_destroy(&mutex);
}


bool UnifiedMemoryManager::acquireExecutionMemory(int64_t bytes,
                                                  MemoryMode mode)
{
  return acquire(bytes, mode, true);
}


bool UnifiedMemoryManager::acquireStorageMemory(int64_t bytes,
                                                MemoryMode mode)
{
  return acquire(bytes, mode, false);
}


void UnifiedMemoryManager::releaseExecutionMemory(int64_t bytes,
                                                  MemoryMode mode)
{
  release(bytes, mode, true);
}


void UnifiedMemoryManager::releaseStorageMemory(int64_t bytes,
                                                MemoryMode mode)
{
  release(bytes, mode, false);
}


int64_t UnifiedMemoryManager::poolSize(MemoryMode mode) const
{
  return pool(mode).size;
}


int64_t UnifiedMemoryManager::executionMemoryUsed(MemoryMode mode) const
{
  Lock lock(&mutex);
  return pool(mode).execution;
}


int64_t UnifiedMemoryManager::storageMemoryUsed(MemoryMode mode) const
{
  Lock lock(&mutex);
  return pool(mode).storage;
}


bool UnifiedMemoryManager::acquire(int64_t bytes,
                                   MemoryMode mode,
                                   bool execution)
{
  CHECK_GE(bytes, 0);

  Lock lock(&mutex);
  Pool& p = pool(mode);
  if (bytes > p.size - p.execution - p.storage) {
    VLOG(1) << "Refusing to acquire " << bytes << " bytes of "
            << modeName(mode) << (execution ? " execution" : " storage")
            << " memory, " << p.size - p.execution - p.storage
            << " bytes free";
    return false;
  }

  if (execution) {
    p.execution += bytes;
  } else {
    p.storage += bytes;
  }
  return true;
}


void UnifiedMemoryManager::release(int64_t bytes,
                                   MemoryMode mode,
                                   bool execution)
{
  CHECK_GE(bytes, 0);

  Lock lock(&mutex);
  int64_t& used = execution ? pool(mode).execution : pool(mode).storage;
  if (bytes > used) {
    LOG(WARNING) << "Attempted to release " << bytes << " bytes of "
                 << modeName(mode) << (execution ? " execution" : " storage")
                 << " memory when only " << used << " bytes are held";
    used = 0;
  } else {
    used -= bytes;
  }
}


UnifiedMemoryManager::Pool& UnifiedMemoryManager::pool(MemoryMode mode)
{
  return mode == ON_HEAP ? onHeap : offHeap;
}


const UnifiedMemoryManager::Pool& UnifiedMemoryManager::pool(
    MemoryMode mode) const
{
  return mode == ON_HEAP ? onHeap : offHeap;
}

} // namespace metrics {
} // namespace internal {
} // namespace execmetrics {
