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

#include <datastore/client/logging.hxx>

namespace datastore
{
namespace transactions
{
    /**
     * @brief Set the level of the transactions logger.
     *
     * The transactions logger reports begin, commit and rollback of batches and transactions.
     */
    void set_transactions_log_level(log_level level);
} // namespace transactions
} // namespace datastore
