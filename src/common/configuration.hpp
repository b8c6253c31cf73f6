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

#ifndef __CONFIGURATION_HPP__
#define __CONFIGURATION_HPP__

#include <map>
#include <string>

#include <glog/logging.h>

#include "common/try.hpp"
#include "common/utils.hpp"

namespace execmetrics {
namespace internal {

// Prefix of environment variables that are read as parameters, e.g.
// EXECMETRICS_COLLECTION_INTERVAL=5 sets "collection_interval".
const std::string ENV_PREFIX = "EXECMETRICS_";


// Key/value parameters gathered from a config file, the environment
// and the command line. Values are kept as strings and converted on
// lookup.
class Configuration
{
public:
  Configuration() {}

  // Loads, in increasing order of precedence, the file named by
  // --conf (if any), the environment and the command line.
  Try<int> load(int argc, char** argv);

  // Reads "key=value" lines. Blank lines and lines starting with '#'
  // are skipped. Returns the number of parameters read.
  Try<int> loadFile(const std::string& path);

  // Reads every environment variable starting with 'prefix'.
  int loadEnv(const std::string& prefix = ENV_PREFIX);

  // Reads "--key=value" and "--key" (as "true") arguments.
  Try<int> loadCommandLine(int argc, char** argv);

  bool contains(const std::string& key) const
  {
    return params.count(key) > 0;
  }

  void set(const std::string& key, const std::string& value)
  {
    params[key] = value;
  }

  std::string get(const std::string& key, const char* defaultValue) const
  {
    std::map<std::string, std::string>::const_iterator it = params.find(key);
    return it == params.end() ? std::string(defaultValue) : it->second;
  }

  template <typename T>
  T get(const std::string& key, const T& defaultValue) const
  {
    if (!contains(key)) {
      return defaultValue;
    }

    Try<T> value = validate<T>(key);
    if (value.isError()) {
      LOG(WARNING) << "Ignoring configuration parameter " << key
                   << ": " << value.error();
      return defaultValue;
    }
    return value.get();
  }

  // Converts the value of 'key' to T, or returns an error if the key
  // is missing or the value does not convert.
  template <typename T>
  Try<T> validate(const std::string& key) const
  {
    std::map<std::string, std::string>::const_iterator it = params.find(key);
    if (it == params.end()) {
      return Try<T>::error("Missing parameter '" + key + "'");
    }
    return utils::numify<T>(it->second);
  }

  const std::map<std::string, std::string>& getMap() const
  {
    return params;
  }

private:
  std::map<std::string, std::string> params;
};


template <>
inline Try<bool> Configuration::validate<bool>(const std::string& key) const
{
  std::map<std::string, std::string>::const_iterator it = params.find(key);
  if (it == params.end()) {
    return Try<bool>::error("Missing parameter '" + key + "'");
  }

  const std::string value = utils::lower(it->second);
  if (value == "true" || value == "yes" || value == "1") {
    return true;
  } else if (value == "false" || value == "no" || value == "0") {
    return false;
  }
  return Try<bool>::error("Failed to convert '" + it->second + "' to bool");
}

} // namespace internal {
} // namespace execmetrics {

#endif // __CONFIGURATION_HPP__
