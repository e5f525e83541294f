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

#include <functional>
#include <string>

#include <boost/optional.hpp>
#include <datastore/support.hxx>
#include <datastore/transactions/batch.hxx>

namespace datastore
{
namespace transactions
{
    /**
     * @brief A unit of work committed atomically in a server-side transaction.
     *
     * A transaction can be used once: begin() moves it from NOT_STARTED to IN_PROGRESS and
     * obtains an id from the store; commit() or rollback() ends it and clears the id.  Calling
     * begin() again afterwards fails.  The id is set exactly while the transaction is
     * IN_PROGRESS.
     *
     * @code{.cpp}
     * auto txn = client.new_transaction();
     * txn->run([&](transactions::transaction& t) {
     *     auto account = client.get(account_key);   // read inside t
     *     account->set("balance", account->get<int>("balance") - 10);
     *     t.put(*account);
     * });
     * @endcode
     */
    class transaction : public batch
    {
      public:
        explicit transaction(datastore::client& c);

        ~transaction() override;

        /**
         * @brief Server-assigned id, set only while IN_PROGRESS.
         */
        DS_NODISCARD const boost::optional<std::string>& id() const
        {
            return id_;
        }

        /**
         * @brief The innermost open transaction on this transaction's client.
         *
         * nullptr if no transaction is open, or if a plain batch is open on top of it.  The
         * answer is the same for every transaction of the client.
         */
        DS_NODISCARD transaction* current() const;

        /**
         * @throws state_error if the transaction was already begun, committed or rolled back.
         */
        void begin() override;

        /**
         * @brief Commit the staged mutations in the transaction and end it.
         *
         * @throws state_error if the transaction is not in progress.
         * @throws invalid_commit_response see @ref batch::complete_partial_keys; the transaction
         *         is still ended in that case.
         */
        void commit() override;

        /**
         * @brief Abandon the server-side transaction and end it.
         *
         * The transaction is ended even if the request to the store fails; that failure is
         * rethrown afterwards.
         *
         * @throws state_error if the transaction is not in progress.
         */
        void rollback() override;

        void run(const std::function<void(transaction&)>& logic);

        DS_NODISCARD unit_of_work_stack::entry stack_entry() override;

      private:
        boost::optional<std::string> id_;
    };
} // namespace transactions
} // namespace datastore
