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

#include <pthread.h>
#include <sys/time.h>
#include <sys/types.h>
#include <unistd.h>

#include <fstream>
#include <sstream>
#include <string>

#include "common/seconds.hpp"
#include "common/try.hpp"
#include "common/utils.hpp"

#include "metrics/linux/proc_utils.hpp"

using std::ifstream;
using std::string;

namespace execmetrics {
namespace internal {
namespace metrics {

// Code for initializing cached boot time.
static pthread_once_t isBootTimeInitialized = PTHREAD_ONCE_INIT;
static Try<seconds> cachedBootTime = Try<seconds>::error("not initialized");


static void initCachedBootTime()
{
  string line;
  ifstream statFile("/proc/stat");

  if (statFile.is_open()) {
    while (getline(statFile, line)) {
      if (line.compare(0, 6, "btime ") == 0) {
        Try<double> bootTime = utils::numify<double>(utils::trim(line.substr(6)));
        if (bootTime.isSome()) {
          cachedBootTime = seconds(bootTime.get());
          return;
        }
      }
    }
  }
  cachedBootTime = Try<seconds>::error("Failed to read boot time from proc");
}


// Converts time in system ticks (as defined by _SC_CLK_TCK, NOT CPU
// clock ticks) to seconds.
static inline seconds ticksToSeconds(double ticks)
{
  return seconds(ticks / sysconf(_SC_CLK_TCK));
}


Try<ProcessStats> getProcessStats(const pid_t& pid)
{
  string procPath = "/proc/" + utils::stringify(pid) + "/stat";

  ifstream pStatFile(procPath.c_str());
  if (!pStatFile.is_open()) {
    return Try<ProcessStats>::error("Cannot open " + procPath + " for stats");
  }

  string line;
  getline(pStatFile, line);

  // The command name is in parentheses and may itself contain spaces
  // or parentheses, so parse the remaining fields from the last ')'.
  size_t commEnd = line.rfind(')');
  if (commEnd == string::npos) {
    return Try<ProcessStats>::error("Failed to read ProcessStats from proc");
  }

  std::istringstream fields(line.substr(commEnd + 1));

  // Dummy vars for entries in stat that we don't care about.
  string state, tty_nr, tpgid, flags, minflt, cminflt, majflt, cmajflt;
  string cutime, cstime, priority, nice, num_threads, itrealvalue;

  // These are the fields we want.
  double rss, vsize, utime, stime, starttime;
  pid_t ppid, pgrp, sid;

  // Parse all fields from stat.
  fields >> state >> ppid >> pgrp >> sid >> tty_nr >>
            tpgid >> flags >> minflt >> cminflt >> majflt >> cmajflt >>
            utime >> stime >> cutime >> cstime >> priority >> nice >>
            num_threads >> itrealvalue >> starttime >> vsize >> rss;

  // Check for any read/parse errors.
  if (!fields) {
    return Try<ProcessStats>::error("Failed to read ProcessStats from proc");
  }

  Try<seconds> bootTime = getBootTime();
  if (bootTime.isError()) {
    return Try<ProcessStats>::error(bootTime.error());
  }

  return ProcessStats(pid, ppid, pgrp, sid,
      ticksToSeconds(utime + stime),
      seconds(bootTime.get().value + ticksToSeconds(starttime).value),
      rss * sysconf(_SC_PAGE_SIZE),
      vsize);
}


Try<seconds> getBootTime()
{
  pthread_once(&isBootTimeInitialized, initCachedBootTime);
  return cachedBootTime;
}


Try<seconds> getStartTime(const pid_t& pid)
{
  Try<ProcessStats> pStats = getProcessStats(pid);
  if (pStats.isSome()) {
    return pStats.get().startTime;
  } else {
    return Try<seconds>::error(pStats.error());
  }
}


Try<int64_t> getStatusBytes(const pid_t& pid, const string& field)
{
  string procPath = "/proc/" + utils::stringify(pid) + "/status";

  ifstream statusFile(procPath.c_str());
  if (!statusFile.is_open()) {
    return Try<int64_t>::error("Cannot open " + procPath);
  }

  // Lines look like "RssFile:	    5120 kB".
  const string prefix = field + ":";
  string line;
  while (getline(statusFile, line)) {
    if (line.compare(0, prefix.size(), prefix) != 0) {
      continue;
    }

    string value = utils::trim(line.substr(prefix.size()));
    size_t unit = value.find(" kB");
    if (unit != string::npos) {
      value = value.substr(0, unit);
    }

    Try<int64_t> kilobytes = utils::numify<int64_t>(value);
    if (kilobytes.isError()) {
      return Try<int64_t>::error("Failed to parse " + field + " in " +
                                 procPath + ": " + kilobytes.error());
    }
    return kilobytes.get() * 1024;
  }

  return Try<int64_t>::error(field + " not found in " + procPath);
}


seconds now()
{
  timeval tv;
  gettimeofday(&tv, NULL);
  return seconds(tv.tv_sec + tv.tv_usec / 1000000.0);
}

} // namespace metrics {
} // namespace internal {
} // namespace execmetrics {
