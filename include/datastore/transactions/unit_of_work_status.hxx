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
namespace transactions
{
    /**
     * The lifecycle of a batch or transaction.
     */
    enum class unit_of_work_status {
        /**
         * Created, begin() not called yet.
         */
        NOT_STARTED,

        /**
         * begin() succeeded; mutations may be committed or rolled back.
         */
        IN_PROGRESS,

        /**
         * Rolled back.  Terminal.
         */
        ABORTED,

        /**
         * Committed.  Terminal.
         */
        COMMITTED
    };

    inline const char* unit_of_work_status_name(unit_of_work_status status)
    {
        switch (status) {
            case unit_of_work_status::NOT_STARTED:
                return "NOT_STARTED";
            case unit_of_work_status::IN_PROGRESS:
                return "IN_PROGRESS";
            case unit_of_work_status::ABORTED:
                return "ABORTED";
            case unit_of_work_status::COMMITTED:
                return "COMMITTED";
            default:
                throw std::runtime_error("unknown unit of work status");
        }
    }
} // namespace transactions
} // namespace datastore
