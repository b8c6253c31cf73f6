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

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "common/configuration.hpp"
#include "common/try.hpp"

#include "metrics/cpu_usage.hpp"

#include "tests/mock_beans.hpp"

using namespace execmetrics::internal;
using namespace execmetrics::internal::metrics;
using namespace execmetrics::internal::tests;

using testing::Return;


TEST(CpuUsageReaderTest, Usage)
{
  MockProcessCpuBean bean;

  // Two intervals of one second each. The process is busy on both
  // processors during the first and idle during the second.
  EXPECT_CALL(bean, processCpuTime())
    .WillOnce(Return(Try<int64_t>::some(1000000000LL)))
    .WillOnce(Return(Try<int64_t>::some(3000000000LL)))
    .WillOnce(Return(Try<int64_t>::some(3000000000LL)));
  EXPECT_CALL(bean, uptime())
    .WillOnce(Return(Try<int64_t>::some(5000)))
    .WillOnce(Return(Try<int64_t>::some(6000)))
    .WillOnce(Return(Try<int64_t>::some(7000)));
  EXPECT_CALL(bean, availableProcessors())
    .WillRepeatedly(Return(2));

  CpuUsageReader reader(&bean);
  ASSERT_TRUE(reader.start().isSome());

  Try<float> usage = reader.usage();
  ASSERT_TRUE(usage.isSome());
  EXPECT_FLOAT_EQ(100.0f, usage.get());

  usage = reader.usage();
  ASSERT_TRUE(usage.isSome());
  EXPECT_FLOAT_EQ(0.0f, usage.get());
}


TEST(CpuUsageReaderTest, Scale)
{
  MockProcessCpuBean bean;

  EXPECT_CALL(bean, processCpuTime())
    .WillOnce(Return(Try<int64_t>::some(0)))
    .WillOnce(Return(Try<int64_t>::some(500000000LL)));
  EXPECT_CALL(bean, uptime())
    .WillOnce(Return(Try<int64_t>::some(0)))
    .WillOnce(Return(Try<int64_t>::some(1000)));
  EXPECT_CALL(bean, availableProcessors())
    .WillRepeatedly(Return(1));

  // A fraction of one rather than a percentage.
  CpuUsageReader reader(&bean, 1000000.0);
  ASSERT_TRUE(reader.start().isSome());

  Try<float> usage = reader.usage();
  ASSERT_TRUE(usage.isSome());
  EXPECT_FLOAT_EQ(0.5f, usage.get());
}


TEST(CpuUsageReaderTest, NoElapsedTime)
{
  MockProcessCpuBean bean;

  EXPECT_CALL(bean, processCpuTime())
    .WillOnce(Return(Try<int64_t>::some(0)))
    .WillOnce(Return(Try<int64_t>::some(100000000LL)))
    .WillOnce(Return(Try<int64_t>::some(250000000LL)));
  EXPECT_CALL(bean, uptime())
    .WillOnce(Return(Try<int64_t>::some(2000)))
    .WillOnce(Return(Try<int64_t>::some(2000)))
    .WillOnce(Return(Try<int64_t>::some(2500)));
  EXPECT_CALL(bean, availableProcessors())
    .WillRepeatedly(Return(1));

  CpuUsageReader reader(&bean);
  ASSERT_TRUE(reader.start().isSome());

  EXPECT_TRUE(reader.usage().isError());

  // The failed sample did not consume the interval.
  Try<float> usage = reader.usage();
  ASSERT_TRUE(usage.isSome());
  EXPECT_FLOAT_EQ(50.0f, usage.get());
}


TEST(CpuUsageReaderTest, BeanError)
{
  MockProcessCpuBean bean;

  EXPECT_CALL(bean, processCpuTime())
    .WillOnce(Return(Try<int64_t>::error("Failed to read CPU time")))
    .WillOnce(Return(Try<int64_t>::some(0)))
    .WillOnce(Return(Try<int64_t>::error("Failed to read CPU time")));
  EXPECT_CALL(bean, uptime())
    .WillOnce(Return(Try<int64_t>::some(0)));

  CpuUsageReader reader(&bean);

  Try<bool> start = reader.start();
  ASSERT_TRUE(start.isError());
  EXPECT_EQ("Failed to read CPU time", start.error());

  ASSERT_TRUE(reader.start().isSome());

  Try<float> usage = reader.usage();
  ASSERT_TRUE(usage.isError());
  EXPECT_EQ("Failed to read CPU time", usage.error());
}


TEST(CpuUsageReaderTest, UnknownProcessorCount)
{
  MockProcessCpuBean bean;

  EXPECT_CALL(bean, processCpuTime())
    .WillOnce(Return(Try<int64_t>::some(0)))
    .WillOnce(Return(Try<int64_t>::some(1000000000LL)));
  EXPECT_CALL(bean, uptime())
    .WillOnce(Return(Try<int64_t>::some(0)))
    .WillOnce(Return(Try<int64_t>::some(1000)));
  EXPECT_CALL(bean, availableProcessors())
    .WillOnce(Return(0));

  CpuUsageReader reader(&bean);
  ASSERT_TRUE(reader.start().isSome());

  Try<float> usage = reader.usage();
  ASSERT_TRUE(usage.isSome());
  EXPECT_FLOAT_EQ(100.0f, usage.get());
}


#ifdef __linux__
TEST(CpuUsageReaderTest, CreateForThisProcess)
{
  Configuration conf;
  conf.set("cpu_usage_scale", "10000");

  CpuUsageReader* reader = CpuUsageReader::create(conf);
  ASSERT_TRUE(reader != NULL);
  ASSERT_TRUE(reader->start().isSome());

  // Burn some CPU so that uptime advances between the samples.
  volatile double x = 0;
  Try<float> usage = Try<float>::error("No sample");
  for (int i = 0; i < 1000 && usage.isError(); i++) {
    for (int j = 0; j < 1000000; j++) {
      x += j;
    }
    usage = reader->usage();
  }

  ASSERT_TRUE(usage.isSome());
  EXPECT_GE(usage.get(), 0.0f);

  delete reader;
}
#endif
