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

#include <memory>
#include <string>
#include <vector>

#include <boost/optional.hpp>
#include <datastore/client/client_config.hxx>
#include <datastore/client/datastore_api.hxx>
#include <datastore/client/entity.hxx>
#include <datastore/client/key.hxx>
#include <datastore/support.hxx>
#include <datastore/transactions/unit_of_work_stack.hxx>

namespace datastore
{
namespace transactions
{
    class batch;
    class transaction;
} // namespace transactions

/**
 * @brief Entry point for talking to the store.
 *
 * A client binds a project and namespace to a @ref datastore_api, and owns the stack of units
 * of work (batches and transactions) opened on it.  Writes issued through the client go to the
 * innermost open unit of work, or are committed immediately when none is open:
 *
 * @code{.cpp}
 * datastore::client c(client_config("my-project"), api);
 * auto txn = c.new_transaction();
 * txn->run([&](transactions::transaction&) {
 *     entity e(c.key({ path_element("Task") }));
 *     e.set("done", false);
 *     c.put(e);                     // staged on txn
 * });                               // committed here, e.key() now complete
 * @endcode
 *
 * A client is not safe to share between threads without external locking.
 */
class client
{
  private:
    client_config config_;
    datastore_api& api_;
    transactions::unit_of_work_stack stack_;

  public:
    client(const client_config& config, datastore_api& api);

    ~client();

    client(const client&) = delete;
    client& operator=(const client&) = delete;

    DS_NODISCARD const std::string& project() const
    {
        return config_.project();
    }

    DS_NODISCARD const std::string& namespace_name() const
    {
        return config_.namespace_name();
    }

    DS_NODISCARD datastore_api& api()
    {
        return api_;
    }

    DS_NODISCARD transactions::unit_of_work_stack& stack()
    {
        return stack_;
    }

    DS_NODISCARD const transactions::unit_of_work_stack& stack() const
    {
        return stack_;
    }

    /**
     * @brief Open a unit of work on this client.  A transaction is recorded as a transaction
     * whatever the static type of the reference.
     */
    void push_batch(transactions::batch& b);

    transactions::batch* pop_batch();

    /**
     * @brief The innermost open unit of work, batch or transaction, or nullptr.
     */
    DS_NODISCARD transactions::batch* current_batch() const;

    /**
     * @brief The innermost open unit of work if it is a transaction, otherwise nullptr.
     */
    DS_NODISCARD transactions::transaction* current_transaction() const;

    DS_NODISCARD std::unique_ptr<transactions::batch> new_batch();

    DS_NODISCARD std::unique_ptr<transactions::transaction> new_transaction();

    /**
     * @brief Build a key in this client's project and namespace.
     */
    DS_NODISCARD datastore::key key(std::vector<path_element> path) const;

    void put(entity& e);

    /**
     * @brief Save entities.
     *
     * Staged on the current unit of work if there is one, otherwise committed at once in an
     * implicit batch.  Entities with partial keys get their allocated keys written back when
     * the write commits.
     */
    void put_multi(const std::vector<entity*>& entities);

    void remove(const datastore::key& k);

    void remove_multi(const std::vector<datastore::key>& keys);

    /**
     * @brief Fetch one entity, reading inside the current transaction if one is open.
     */
    DS_NODISCARD boost::optional<entity> get(const datastore::key& k);

    /**
     * @brief Fetch entities, reading inside the current transaction if one is open.
     *
     * @param keys The keys to fetch, all from this client's project.
     * @param missing If not null, receives the keys the store has no entity for.
     * @return The entities found, in the order the store returned them.
     */
    DS_NODISCARD std::vector<entity> get_multi(const std::vector<datastore::key>& keys, std::vector<datastore::key>* missing = nullptr);
};
} // namespace datastore
