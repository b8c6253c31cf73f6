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

#ifndef __UTILS_HPP__
#define __UTILS_HPP__

#include <sstream>
#include <string>
#include <vector>

#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>

#include "common/try.hpp"

namespace execmetrics {
namespace internal {
namespace utils {

template <typename T>
std::string stringify(T t)
{
  std::ostringstream out;
  out << t;
  return out.str();
}


template <typename T>
Try<T> numify(const std::string& s)
{
  try {
    return boost::lexical_cast<T>(s);
  } catch (const boost::bad_lexical_cast&) {
    return Try<T>::error("Failed to convert '" + s + "' to number");
  }
}


inline std::string trim(const std::string& s)
{
  return boost::trim_copy(s);
}


inline std::string lower(const std::string& s)
{
  return boost::to_lower_copy(s);
}

} // namespace utils {
} // namespace internal {
} // namespace execmetrics {

#endif // __UTILS_HPP__
