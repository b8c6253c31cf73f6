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

#include <stdint.h>

#include <gtest/gtest.h>

#include "metrics/memory_manager.hpp"

using namespace execmetrics::internal::metrics;


TEST(UnifiedMemoryManagerTest, Initial)
{
  UnifiedMemoryManager memoryManager(1024, 256);
  EXPECT_EQ(1024, memoryManager.poolSize(ON_HEAP));
  EXPECT_EQ(256, memoryManager.poolSize(OFF_HEAP));
  EXPECT_EQ(0, memoryManager.executionMemoryUsed(ON_HEAP));
  EXPECT_EQ(0, memoryManager.storageMemoryUsed(ON_HEAP));
  EXPECT_EQ(0, memoryManager.executionMemoryUsed(OFF_HEAP));
  EXPECT_EQ(0, memoryManager.storageMemoryUsed(OFF_HEAP));
}


TEST(UnifiedMemoryManagerTest, ExecutionAndStorageShareThePool)
{
  UnifiedMemoryManager memoryManager(100, 0);

  EXPECT_TRUE(memoryManager.acquireExecutionMemory(60, ON_HEAP));
  EXPECT_TRUE(memoryManager.acquireStorageMemory(40, ON_HEAP));

  // The pool is full now.
  EXPECT_FALSE(memoryManager.acquireStorageMemory(1, ON_HEAP));
  EXPECT_FALSE(memoryManager.acquireExecutionMemory(1, ON_HEAP));
  EXPECT_EQ(60, memoryManager.executionMemoryUsed(ON_HEAP));
  EXPECT_EQ(40, memoryManager.storageMemoryUsed(ON_HEAP));

  memoryManager.releaseStorageMemory(30, ON_HEAP);
  EXPECT_EQ(10, memoryManager.storageMemoryUsed(ON_HEAP));
  EXPECT_TRUE(memoryManager.acquireExecutionMemory(30, ON_HEAP));
  EXPECT_EQ(90, memoryManager.executionMemoryUsed(ON_HEAP));
}


TEST(UnifiedMemoryManagerTest, ModesAreSeparate)
{
  UnifiedMemoryManager memoryManager(10, 20);

  EXPECT_FALSE(memoryManager.acquireExecutionMemory(15, ON_HEAP));
  EXPECT_TRUE(memoryManager.acquireExecutionMemory(15, OFF_HEAP));

  EXPECT_EQ(0, memoryManager.executionMemoryUsed(ON_HEAP));
  EXPECT_EQ(15, memoryManager.executionMemoryUsed(OFF_HEAP));

  // No off-heap memory configured.
  UnifiedMemoryManager onHeapOnly(10, 0);
  EXPECT_FALSE(onHeapOnly.acquireStorageMemory(1, OFF_HEAP));
  EXPECT_TRUE(onHeapOnly.acquireStorageMemory(0, OFF_HEAP));
}


TEST(UnifiedMemoryManagerTest, ReleaseMoreThanHeld)
{
  UnifiedMemoryManager memoryManager(100, 100);
  ASSERT_TRUE(memoryManager.acquireExecutionMemory(10, OFF_HEAP));
  ASSERT_TRUE(memoryManager.acquireStorageMemory(10, OFF_HEAP));

  memoryManager.releaseExecutionMemory(25, OFF_HEAP);
  EXPECT_EQ(0, memoryManager.executionMemoryUsed(OFF_HEAP));
  EXPECT_EQ(10, memoryManager.storageMemoryUsed(OFF_HEAP));
}


TEST(UnifiedMemoryManagerTest, HugeRequest)
{
  UnifiedMemoryManager memoryManager(100, 0);
  ASSERT_TRUE(memoryManager.acquireExecutionMemory(50, ON_HEAP));
  ASSERT_TRUE(memoryManager.acquireStorageMemory(10, ON_HEAP));

  EXPECT_FALSE(memoryManager.acquireExecutionMemory(INT64_MAX, ON_HEAP));
  EXPECT_FALSE(memoryManager.acquireStorageMemory(INT64_MAX - 20, ON_HEAP));
  EXPECT_EQ(50, memoryManager.executionMemoryUsed(ON_HEAP));
  EXPECT_EQ(10, memoryManager.storageMemoryUsed(ON_HEAP));

  EXPECT_TRUE(memoryManager.acquireExecutionMemory(40, ON_HEAP));
}
