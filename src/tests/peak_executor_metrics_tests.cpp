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

#include <gtest/gtest.h>

#include <algorithm>
#include <vector>

#include "metrics/metric_kind.hpp"
#include "metrics/peak_executor_metrics.hpp"

using namespace execmetrics::internal::metrics;

using std::vector;

// Returns a snapshot with 'value' for every metric.
static Snapshot uniform(int64_t value)
{
  return Snapshot(numMetrics(), value);
}


TEST(PeakExecutorMetricsTest, InitialState)
{
  PeakExecutorMetrics peaks;

  const vector<int64_t>& values = peaks.values();
  ASSERT_EQ(numMetrics(), values.size());
  EXPECT_EQ(-1, values[0]);
  for (size_t i = 1; i < values.size(); i++) {
    EXPECT_EQ(0, values[i]) << "metric " << i;
  }
  EXPECT_TRUE(peaks.empty());
}


TEST(PeakExecutorMetricsTest, FirstUpdateAlwaysUpdates)
{
  PeakExecutorMetrics peaks;

  // Even an all zero snapshot replaces the "nothing recorded" marker.
  EXPECT_TRUE(peaks.compareAndUpdate(uniform(0)));
  EXPECT_FALSE(peaks.empty());
  EXPECT_EQ(uniform(0), peaks.values());

  EXPECT_FALSE(peaks.compareAndUpdate(uniform(0)));
}


TEST(PeakExecutorMetricsTest, TracksMaximumPerMetric)
{
  PeakExecutorMetrics peaks;

  Snapshot first = uniform(10);
  first[JVM_HEAP_MEMORY] = 100;
  first[CPU_TIME] = 5;
  EXPECT_TRUE(peaks.compareAndUpdate(first));

  // Lower values never replace a peak.
  EXPECT_FALSE(peaks.compareAndUpdate(uniform(1)));
  EXPECT_EQ(first, peaks.values());

  // A new peak in one metric leaves the others alone.
  Snapshot second = uniform(0);
  second[CPU_TIME] = 50;
  EXPECT_TRUE(peaks.compareAndUpdate(second));

  Snapshot expected = first;
  expected[CPU_TIME] = 50;
  EXPECT_EQ(expected, peaks.values());
}


TEST(PeakExecutorMetricsTest, PeaksAreRunningMaximum)
{
  const int64_t samples[][3] = {
    { 5, 1, 9 },
    { 3, 7, 2 },
    { 8, 0, 4 },
    { 6, 6, 6 }
  };
  const MetricKind kinds[] = {
    JVM_HEAP_MEMORY, ON_HEAP_STORAGE_MEMORY, MAPPED_POOL_MEMORY
  };

  PeakExecutorMetrics peaks;
  int64_t maximum[] = { -1, 0, 0 };

  for (size_t s = 0; s < 4; s++) {
    Snapshot snapshot = uniform(0);
    for (size_t k = 0; k < 3; k++) {
      snapshot[kinds[k]] = samples[s][k];
    }

    vector<int64_t> before = peaks.values();
    peaks.compareAndUpdate(snapshot);

    for (size_t k = 0; k < 3; k++) {
      maximum[k] = std::max(maximum[k], samples[s][k]);
      EXPECT_EQ(maximum[k], peaks.values()[kinds[k]]);
      EXPECT_GE(peaks.values()[kinds[k]], before[kinds[k]]);
    }
  }
}


TEST(PeakExecutorMetricsTest, Reset)
{
  PeakExecutorMetrics peaks;
  peaks.compareAndUpdate(uniform(42));

  peaks.reset();
  EXPECT_EQ(PeakExecutorMetrics().values(), peaks.values());
  EXPECT_TRUE(peaks.empty());

  // Resetting again changes nothing.
  peaks.reset();
  EXPECT_EQ(PeakExecutorMetrics().values(), peaks.values());

  // After a reset the next snapshot counts as the first one.
  EXPECT_TRUE(peaks.compareAndUpdate(uniform(0)));
}


TEST(PeakExecutorMetricsDeathTest, MisalignedSnapshot)
{
  PeakExecutorMetrics peaks;
  Snapshot tooShort(numMetrics() - 1, 1);
  EXPECT_DEATH(peaks.compareAndUpdate(tooShort), "");
}
