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

#include <sys/types.h>
#include <unistd.h>

#include <iostream>
#include <string>

#include <glog/logging.h>

#include <process/process.hpp>

#include "common/configuration.hpp"
#include "common/logging.hpp"
#include "common/try.hpp"

#include "metrics/cpu_usage.hpp"
#include "metrics/executor_metrics_registry.hpp"
#include "metrics/linux/proc_runtime_bean.hpp"
#include "metrics/memory_manager.hpp"
#include "metrics/metric_context.hpp"

#include "monitor/executor_metrics_monitor.hpp"

using namespace execmetrics::internal;
using namespace execmetrics::internal::metrics;
using namespace execmetrics::internal::monitor;

using std::cerr;
using std::endl;
using std::string;


void usage(const char* programName)
{
  cerr << "Usage: " << programName << " [--conf=FILE] [--key=value ...]"
       << endl
       << endl
       << "Parameters may also be set in the environment as "
       << ENV_PREFIX << "KEY=value." << endl
       << endl
       << "  executor_id          executor to report as (default: driver)"
       << endl
       << "  collection_interval  seconds between collections (default: 10)"
       << endl
       << "  cpu_usage_pid        process to monitor, 0 for this one"
       << " (default: 0)" << endl
       << "  cpu_usage_scale      CPU usage scale (default: 10000)" << endl
       << "  cpu_usage_window     CPU usage samples to average (default: 5)"
       << endl
       << "  on_heap_memory       on-heap memory pool bytes (default: 0)"
       << endl
       << "  off_heap_memory      off-heap memory pool bytes (default: 0)"
       << endl
       << "  ticks                collections before exiting, 0 to run"
       << " forever (default: 0)" << endl
       << "  log_dir              directory for log files (default: stderr)"
       << endl
       << "  quiet                only log errors to stderr" << endl;
}


int main(int argc, char** argv)
{
  Configuration conf;
  Try<int> loaded = conf.load(argc, argv);
  if (loaded.isError()) {
    cerr << loaded.error() << endl;
    usage(argv[0]);
    return 1;
  }

  if (conf.get<bool>("help", false)) {
    usage(argv[0]);
    return 0;
  }

  logging::initialize(argv[0], conf);

  string executorId = conf.get("executor_id", "driver");
  double interval =
    conf.get<double>("collection_interval", DEFAULT_COLLECTION_INTERVAL);
  int window = conf.get<int>("cpu_usage_window",
                            static_cast<int>(DEFAULT_CPU_USAGE_WINDOW));
  int ticks = conf.get<int>("ticks", 0);
  pid_t pid = conf.get<pid_t>("cpu_usage_pid", 0);
  int64_t onHeapMemory = conf.get<int64_t>("on_heap_memory", 0);
  int64_t offHeapMemory = conf.get<int64_t>("off_heap_memory", 0);

  if (interval <= 0 || window <= 0 || ticks < 0 ||
      onHeapMemory < 0 || offHeapMemory < 0) {
    LOG(ERROR) << "collection_interval and cpu_usage_window must be"
               << " positive, ticks and memory sizes must not be negative";
    usage(argv[0]);
    return 1;
  }

  bool self = pid == 0;
  if (self) {
    pid = getpid();
  }

  LOG(INFO) << "Monitoring process " << pid << " as executor " << executorId
            << " every " << interval << " seconds";

  ProcRuntimeBean runtime(pid);

  // The memory manager only describes this process.
  UnifiedMemoryManager memoryManager(onHeapMemory, offHeapMemory);

  MetricContext context;
  context.memoryManager = self ? &memoryManager : NULL;
  context.memoryBean = &runtime;
  context.bufferPools = &runtime;
  context.processCpu = &runtime;

  CpuUsageReader* cpuUsageReader = CpuUsageReader::create(conf);
  if (cpuUsageReader == NULL) {
    LOG(WARNING) << "CPU usage is not supported on this system";
  }

  ExecutorMetricsRegistry registry(window);
  registry.registerExecutor(executorId);

  ExecutorMetricsMonitor monitor(
      &registry, context, cpuUsageReader, interval, ticks);

  process::spawn(&monitor);
  process::wait(&monitor);

  registry.deregisterExecutor(executorId);

  return 0;
}
