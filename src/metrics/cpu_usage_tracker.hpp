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

#ifndef __CPU_USAGE_TRACKER_HPP__
#define __CPU_USAGE_TRACKER_HPP__

#include <pthread.h>

#include <map>
#include <string>
#include <vector>

#include "common/try.hpp"

namespace execmetrics {
namespace internal {
namespace metrics {

const size_t DEFAULT_CPU_USAGE_WINDOW = 5;

// Usage reported for a window slot that has not seen a sample yet. A
// new executor is treated as fully busy until real samples arrive.
const float INITIAL_CPU_USAGE = 100.0f;


// Keeps the most recent CPU usage samples (percentages) of each
// executor, oldest first, in a window of fixed size.
//
// All operations are serialized by an internal lock; samples for one
// executor are applied in the order update() is called.
class CpuUsageTracker
{
public:
  explicit CpuUsageTracker(size_t capacity = DEFAULT_CPU_USAGE_WINDOW);

  ~CpuUsageTracker();

  // Creates a window filled with INITIAL_CPU_USAGE, unless the
  // executor already has one.
  void init(const std::string& executorId);

  // Drops the oldest sample and appends 'usage'. Creates the window
  // first if needed.
  void update(const std::string& executorId, float usage);

  void clear(const std::string& executorId);

  bool contains(const std::string& executorId) const;

  // Returns the samples, oldest first, or an error if the executor has
  // no window.
  Try<std::vector<float> > get(const std::string& executorId) const;

  // Returns the mean over the whole window, or an error if the
  // executor has no window.
  Try<float> average(const std::string& executorId) const;

  size_t capacity() const { return windowSize; }

private:
  CpuUsageTracker(const CpuUsageTracker&);
  CpuUsageTracker& operator = (const CpuUsageTracker&);

  void initLocked(const std::string& executorId);

  const size_t windowSize;

  std::map<std::string, std::vector<float> > windows;

  mutable pthread_mutex_t mutex;
};

} // namespace metrics {
} // namespace internal {
} // namespace execmetrics {

#endif // __CPU_USAGE_TRACKER_HPP__
