/*
 *     Copyright 2021 Couchbase, Inc.
 *
 *   Licensed under the Apache License, Version 2.0 (the "License");
 *   you may not use this file except in compliance with the License.
 *   You may obtain a copy of the License at
 *
 *       http://www.apache.org/licenses/LICENSE-2.0
 *
 *   Unless required by applicable law or agreed to in writing, software
 *   distributed under the License is distributed on an "AS IS" BASIS,
 *   WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 *   See the License for the specific language governing permissions and
 *   limitations under the License.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace datastore
{
namespace longrunning
{
    /**
     * @brief A different type is already registered for a type url.
     */
    class registration_conflict : public std::runtime_error
    {
      public:
        explicit registration_conflict(const std::string& what)
          : std::runtime_error(what)
        {
        }
    };

    /**
     * @brief finished() was called on an operation already known to be complete.
     */
    class operation_complete_error : public std::runtime_error
    {
      public:
        explicit operation_complete_error(const std::string& what)
          : std::runtime_error(what)
        {
        }
    };
} // namespace longrunning
} // namespace datastore
