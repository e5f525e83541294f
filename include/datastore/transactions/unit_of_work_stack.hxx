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
#include <variant>
#include <vector>

#include <datastore/support.hxx>

namespace datastore
{
namespace transactions
{
    class batch;
    class transaction;

    /**
     * @brief The units of work open on a client, innermost on top.
     *
     * Entries are tagged: a plain batch on top hides any transaction below it, so
     * current_transaction() only reports a transaction when it is the innermost unit of work.
     * An empty stack means client writes are committed immediately.  No locking: one stack
     * belongs to one thread of control.
     */
    class unit_of_work_stack
    {
      public:
        using entry = std::variant<batch*, transaction*>;

        /**
         * @brief Push a unit of work, tagged by what it actually is.
         *
         * A transaction referred to as a batch is still pushed as a transaction.
         */
        void push(batch& unit);

        /**
         * @brief Remove the top entry.
         *
         * @return the unit of work that was on top.
         * @throws std::out_of_range if the stack is empty.
         */
        batch* pop();

        DS_NODISCARD batch* current_batch() const;

        DS_NODISCARD transaction* current_transaction() const;

        DS_NODISCARD size_t depth() const
        {
            return entries_.size();
        }

        DS_NODISCARD bool empty() const
        {
            return entries_.empty();
        }

      private:
        std::vector<entry> entries_;
    };

    /**
     * @brief Keeps a unit of work on a stack for the lifetime of the scope.
     *
     * The destructor pops on every exit path, normal or exceptional.
     */
    class unit_of_work_scope
    {
      public:
        unit_of_work_scope(unit_of_work_stack& stack, batch& unit);

        ~unit_of_work_scope();

        unit_of_work_scope(const unit_of_work_scope&) = delete;
        unit_of_work_scope& operator=(const unit_of_work_scope&) = delete;

      private:
        unit_of_work_stack& stack_;
        batch* unit_;
        size_t depth_;
    };
} // namespace transactions
} // namespace datastore
