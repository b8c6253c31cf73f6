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

#include <fstream>
#include <map>
#include <string>

#include "common/configuration.hpp"
#include "common/foreach.hpp"
#include "common/utils.hpp"

extern char** environ;

using std::ifstream;
using std::map;
using std::string;

namespace execmetrics {
namespace internal {

Try<int> Configuration::load(int argc, char** argv)
{
  Configuration commandLine;
  Try<int> parsed = commandLine.loadCommandLine(argc, argv);
  if (parsed.isError()) {
    return parsed;
  }

  int count = 0;

  if (commandLine.contains("conf")) {
    Try<int> loaded = loadFile(commandLine.get("conf", ""));
    if (loaded.isError()) {
      return loaded;
    }
    count += loaded.get();
  }

  count += loadEnv();

  string key, value;
  foreachpair (key, value, commandLine.getMap()) {
    set(key, value);
  }

  return count + parsed.get();
}


Try<int> Configuration::loadFile(const string& path)
{
  ifstream file(path.c_str());
  if (!file.is_open()) {
    return Try<int>::error("Cannot open config file " + path);
  }

  int count = 0;
  int lineNumber = 0;
  string line;
  while (getline(file, line)) {
    lineNumber++;
    line = utils::trim(line);
    if (line.empty() || line[0] == '#') {
      continue;
    }

    size_t eq = line.find('=');
    if (eq == string::npos || eq == 0) {
      return Try<int>::error("Malformed line " + utils::stringify(lineNumber) +
                             " in config file " + path + ": " + line);
    }

    set(utils::trim(line.substr(0, eq)), utils::trim(line.substr(eq + 1)));
    count++;
  }

  VLOG(1) << "Read " << count << " parameters from " << path;
  return count;
}


int Configuration::loadEnv(const string& prefix)
{
  int count = 0;
  for (char** env = environ; *env != NULL; env++) {
    string variable = *env;
    if (variable.compare(0, prefix.size(), prefix) != 0) {
      continue;
    }

    size_t eq = variable.find('=');
    if (eq == string::npos || eq <= prefix.size()) {
      continue;
    }

    string key = utils::lower(variable.substr(prefix.size(), eq - prefix.size()));
    set(key, variable.substr(eq + 1));
    count++;
  }
  return count;
}


Try<int> Configuration::loadCommandLine(int argc, char** argv)
{
  int count = 0;
  for (int i = 1; i < argc; i++) {
    string arg = argv[i];
    if (arg.compare(0, 2, "--") != 0 || arg.size() == 2) {
      return Try<int>::error("Unrecognized argument '" + arg + "'");
    }

    size_t eq = arg.find('=');
    if (eq == string::npos) {
      set(arg.substr(2), "true");
    } else {
      set(arg.substr(2, eq - 2), arg.substr(eq + 1));
    }
    count++;
  }
  return count;
}

} // namespace internal {
} // namespace execmetrics {
