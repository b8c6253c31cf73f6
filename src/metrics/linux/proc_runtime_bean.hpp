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

#ifndef __PROC_RUNTIME_BEAN_HPP__
#define __PROC_RUNTIME_BEAN_HPP__

#include <stdint.h>
#include <sys/types.h>

#include <string>

#include "common/try.hpp"

#include "metrics/metric_context.hpp"

namespace execmetrics {
namespace internal {
namespace metrics {

// Reads the memory and CPU usage of a process from /proc.
//
// Heap memory is the resident set size and non-heap memory is the
// part of the virtual size that is not resident. The "mapped" buffer
// pool is the resident file backed memory (RssFile). There is no
// "direct" buffer pool in a native process, so reading it fails.
class ProcRuntimeBean : public MemoryBean,
                        public BufferPoolBean,
                        public ProcessCpuBean
{
public:
  explicit ProcRuntimeBean(pid_t pid);

  virtual ~ProcRuntimeBean() {}

  virtual Try<int64_t> heapMemoryUsed();
  virtual Try<int64_t> nonHeapMemoryUsed();

  virtual Try<int64_t> memoryUsed(const std::string& pool);

  virtual Try<int64_t> processCpuTime();
  virtual Try<int64_t> uptime();
  virtual int availableProcessors();

  pid_t getPid() const { return pid; }

private:
  const pid_t pid;
};

} // namespace metrics {
} // namespace internal {
} // namespace execmetrics {

#endif // __PROC_RUNTIME_BEAN_HPP__
