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

#include <stdlib.h>
#include <unistd.h>

#include <gtest/gtest.h>

#include <fstream>
#include <string>

#include "common/configuration.hpp"
#include "common/try.hpp"

using namespace execmetrics::internal;

using std::ofstream;
using std::string;


class ConfigurationTest : public ::testing::Test
{
protected:
  virtual void SetUp()
  {
    char temp[] = "/tmp/execmetrics_conf_XXXXXX";
    int fd = mkstemp(temp);
    ASSERT_NE(-1, fd);
    close(fd);
    path = temp;
  }

  virtual void TearDown()
  {
    unlink(path.c_str());
    unsetenv("EXECMETRICS_COLLECTION_INTERVAL");
    unsetenv("EXECMETRICS_EXECUTOR_ID");
  }

  void write(const string& contents)
  {
    ofstream file(path.c_str());
    file << contents;
  }

  string path;
};


TEST_F(ConfigurationTest, LoadFile)
{
  write("# Executor metrics\n"
        "\n"
        "executor_id = exec-1\n"
        "collection_interval=2.5\n"
        "  quiet = true  \n");

  Configuration conf;
  Try<int> loaded = conf.loadFile(path);
  ASSERT_TRUE(loaded.isSome());
  EXPECT_EQ(3, loaded.get());

  EXPECT_EQ("exec-1", conf.get("executor_id", ""));
  EXPECT_DOUBLE_EQ(2.5, conf.get<double>("collection_interval", 10.0));
  EXPECT_TRUE(conf.get<bool>("quiet", false));
}


TEST_F(ConfigurationTest, MalformedFile)
{
  write("executor_id=exec-1\n"
        "this is not a parameter\n");

  Configuration conf;
  Try<int> loaded = conf.loadFile(path);
  ASSERT_TRUE(loaded.isError());
  EXPECT_NE(string::npos, loaded.error().find("line 2"));

  EXPECT_TRUE(conf.loadFile("/nonexistent/execmetrics.conf").isError());
}


TEST_F(ConfigurationTest, LoadCommandLine)
{
  char* argv[] = {
    (char*) "execmetrics-agent",
    (char*) "--executor_id=exec-2",
    (char*) "--ticks=3",
    (char*) "--quiet"
  };

  Configuration conf;
  Try<int> loaded = conf.loadCommandLine(4, argv);
  ASSERT_TRUE(loaded.isSome());
  EXPECT_EQ(3, loaded.get());

  EXPECT_EQ("exec-2", conf.get("executor_id", ""));
  EXPECT_EQ(3, conf.get<int>("ticks", 0));
  EXPECT_EQ("true", conf.get("quiet", ""));

  char* bad[] = { (char*) "execmetrics-agent", (char*) "ticks=3" };
  EXPECT_TRUE(Configuration().loadCommandLine(2, bad).isError());
}


TEST_F(ConfigurationTest, LoadEnv)
{
  setenv("EXECMETRICS_COLLECTION_INTERVAL", "0.5", 1);

  Configuration conf;
  EXPECT_GE(conf.loadEnv(), 1);
  EXPECT_DOUBLE_EQ(0.5, conf.get<double>("collection_interval", 10.0));
}


TEST_F(ConfigurationTest, Precedence)
{
  write("executor_id=from-file\n"
        "collection_interval=1\n"
        "ticks=7\n");
  setenv("EXECMETRICS_EXECUTOR_ID", "from-env", 1);
  setenv("EXECMETRICS_COLLECTION_INTERVAL", "2", 1);

  string conf = "--conf=" + path;
  char* argv[] = {
    (char*) "execmetrics-agent",
    (char*) conf.c_str(),
    (char*) "--collection_interval=3"
  };

  Configuration configuration;
  ASSERT_TRUE(configuration.load(3, argv).isSome());

  EXPECT_EQ(7, configuration.get<int>("ticks", 0));
  EXPECT_EQ("from-env", configuration.get("executor_id", ""));
  EXPECT_EQ(3, configuration.get<int>("collection_interval", 0));
}


TEST_F(ConfigurationTest, Conversions)
{
  Configuration conf;
  conf.set("ticks", "five");
  conf.set("quiet", "No");
  conf.set("logbufsecs", "yes please");

  // A bad value falls back to the default.
  EXPECT_EQ(4, conf.get<int>("ticks", 4));
  EXPECT_TRUE(conf.validate<int>("ticks").isError());
  EXPECT_TRUE(conf.validate<int>("missing").isError());

  Try<bool> quiet = conf.validate<bool>("quiet");
  ASSERT_TRUE(quiet.isSome());
  EXPECT_FALSE(quiet.get());
  EXPECT_TRUE(conf.validate<bool>("logbufsecs").isError());

  EXPECT_EQ("default", conf.get("missing", "default"));
}


TEST_F(ConfigurationTest, NegativeCounts)
{
  Configuration conf;
  conf.set("cpu_usage_window", "-1");

  // Counts are read as signed so a negative value can be rejected.
  EXPECT_EQ(-1, conf.get<int>("cpu_usage_window", 5));
  Try<int> window = conf.validate<int>("cpu_usage_window");
  ASSERT_TRUE(window.isSome());
  EXPECT_LT(window.get(), 0);
}
