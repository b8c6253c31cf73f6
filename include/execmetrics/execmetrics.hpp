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

#ifndef __EXECMETRICS_HPP__
#define __EXECMETRICS_HPP__

#include <iostream>

#include <execmetrics/execmetrics.pb.h>

namespace execmetrics {

inline bool operator == (const ExecutorID& left, const ExecutorID& right)
{
  return left.value() == right.value();
}


inline bool operator != (const ExecutorID& left, const ExecutorID& right)
{
  return !(left == right);
}


inline std::ostream& operator << (std::ostream& stream,
                                  const ExecutorID& executorId)
{
  return stream << executorId.value();
}

} // namespace execmetrics {

#endif // __EXECMETRICS_HPP__
