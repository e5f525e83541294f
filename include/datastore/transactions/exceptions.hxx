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

#include <cstddef>
#include <stdexcept>
#include <string>

#include <datastore/transactions/unit_of_work_status.hxx>

namespace datastore
{
namespace transactions
{
    /**
     * @brief A batch or transaction was used in a state that does not allow the operation.
     *
     * Raised before any RPC is attempted, so nothing has been applied.
     */
    class state_error : public std::runtime_error
    {
      private:
        unit_of_work_status status_;

      public:
        state_error(unit_of_work_status status, const std::string& what)
          : std::runtime_error(what)
          , status_(status)
        {
        }

        unit_of_work_status status() const
        {
            return status_;
        }
    };

    /**
     * @brief The server committed, but returned a different number of allocated keys than the
     * number of entities waiting for one.
     *
     * No entity key was modified.
     */
    class invalid_commit_response : public std::runtime_error
    {
      private:
        size_t expected_;
        size_t received_;

      public:
        invalid_commit_response(size_t expected, size_t received)
          : std::runtime_error("commit returned " + std::to_string(received) + " allocated keys, expected " + std::to_string(expected))
          , expected_(expected)
          , received_(received)
        {
        }

        size_t expected() const
        {
            return expected_;
        }

        size_t received() const
        {
            return received_;
        }
    };
} // namespace transactions
} // namespace datastore
