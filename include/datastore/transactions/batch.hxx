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

#include <exception>
#include <functional>
#include <string>
#include <vector>

#include <boost/optional.hpp>
#include <datastore/client/datastore_api.hxx>
#include <datastore/client/entity.hxx>
#include <datastore/client/key.hxx>
#include <datastore/client/mutation.hxx>
#include <datastore/support.hxx>
#include <datastore/transactions/exceptions.hxx>
#include <datastore/transactions/unit_of_work_stack.hxx>
#include <datastore/transactions/unit_of_work_status.hxx>

namespace datastore
{
class client;

namespace transactions
{
    /**
     * @brief A group of writes committed together, without transactional isolation.
     *
     * Writes are buffered in the order they are staged and sent in a single commit.  Entities
     * put with a partial key have the key allocated by the server written back after the commit.
     *
     * The usual way to use a batch is @ref run, which opens it on the client so that writes
     * issued through the client land in it:
     *
     * @code{.cpp}
     * auto b = client.new_batch();
     * b->run([&](transactions::batch& batch) {
     *     batch.put(first);
     *     client.remove(old_key);   // also staged on b
     * });
     * @endcode
     */
    class batch
    {
      public:
        explicit batch(datastore::client& c);

        virtual ~batch();

        batch(const batch&) = delete;
        batch& operator=(const batch&) = delete;

        DS_NODISCARD const std::string& project() const;

        DS_NODISCARD const std::string& namespace_name() const;

        /**
         * @brief The staged mutations, in staging order.
         */
        DS_NODISCARD const std::vector<mutation>& mutations() const
        {
            return mutations_;
        }

        /**
         * @brief Entities put with a partial key, in staging order.
         */
        DS_NODISCARD const std::vector<entity*>& partial_key_entities() const
        {
            return partial_key_entities_;
        }

        DS_NODISCARD unit_of_work_status status() const
        {
            return status_;
        }

        DS_NODISCARD datastore::client& client_ref()
        {
            return client_;
        }

        /**
         * @brief Stage an upsert of the entity.
         *
         * The entity is referenced, not copied, when its key is partial: it must stay alive until
         * the commit so that the allocated key can be written back into it.
         *
         * @throws invalid_key if the entity has no key, or its key is from another project or
         *         namespace.
         */
        void put(entity& e);

        /**
         * @brief Stage a delete.
         *
         * @throws invalid_key if the key is partial or from another project.
         */
        void remove(const datastore::key& k);

        virtual void begin();

        /**
         * @brief Send the staged mutations in one non-transactional commit.
         *
         * If the call to the store fails, the mutations and status are left as they were.
         */
        virtual void commit();

        /**
         * @brief Discard the staged mutations.  No request is sent to the store.
         */
        virtual void rollback();

        /**
         * @brief Run the logic with this batch open on the client.
         *
         * Pushes the batch, begins it and calls the logic.  Commits if the logic returns, rolls
         * back and rethrows if it throws.  The batch is popped from the client on every path.
         */
        void run(const std::function<void(batch&)>& logic);

        /**
         * @brief How this unit of work is recorded on a unit_of_work_stack.
         */
        DS_NODISCARD virtual unit_of_work_stack::entry stack_entry();

      protected:
        datastore::client& client_;
        std::vector<mutation> mutations_;
        std::vector<entity*> partial_key_entities_;
        unit_of_work_status status_;

        DS_NODISCARD commit_response send_commit(commit_mode mode, const boost::optional<std::string>& transaction_id);

        /**
         * @brief Write allocated keys back into the partial-key entities, then clear the buffers.
         *
         * @throws invalid_commit_response if the key count does not match, in which case no
         *         entity is touched.
         */
        void complete_partial_keys(const commit_response& response);

        void clear_mutations();

        /**
         * @brief Roll back after the logic in run() threw.  Failures are logged, not raised, so
         *        the logic's exception is the one the caller sees.
         */
        void rollback_after_error(std::exception_ptr cause);

        template<typename Unit, typename Logic>
        static void run_scoped(Unit& unit, const Logic& logic);
    };

    template<typename Unit, typename Logic>
    void batch::run_scoped(Unit& unit, const Logic& logic)
    {
        unit_of_work_scope scope(unit.client_ref().stack(), unit);
        unit.begin();
        try {
            logic(unit);
        } catch (...) {
            unit.rollback_after_error(std::current_exception());
            throw;
        }
        unit.commit();
    }
} // namespace transactions
} // namespace datastore
