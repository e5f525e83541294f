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
#include "../client/logging.hxx"
#include <datastore/transactions/logging.hxx>

#define TXN_LOGGER "transactions"
namespace datastore
{
namespace transactions
{
    static std::shared_ptr<spdlog::logger> init_txn_log()
    {
        static std::shared_ptr<spdlog::logger> txnlogger = spdlog::stdout_logger_mt(TXN_LOGGER);
        txnlogger->set_pattern(LOGGER_PATTERN);
        return txnlogger;
    }
    static std::shared_ptr<spdlog::logger> txn_log = spdlog::get(TXN_LOGGER) ? spdlog::get(TXN_LOGGER) : init_txn_log();
} // namespace transactions
} // namespace datastore
