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

#include "logging.hxx"
#include <datastore/client/client.hxx>
#include <datastore/transactions/transaction.hxx>

namespace tx = datastore::transactions;

tx::transaction::transaction(datastore::client& c)
  : batch(c)
{
}

tx::transaction::~transaction()
{
    if (id_) {
        txn_log->warn("transaction {} destroyed while still in progress, it will expire on the server", *id_);
    }
}

tx::transaction*
tx::transaction::current() const
{
    return client_.current_transaction();
}

void
tx::transaction::begin()
{
    if (status_ == unit_of_work_status::IN_PROGRESS) {
        throw state_error(status_, "transaction already begun, id " + *id_);
    }
    if (status_ != unit_of_work_status::NOT_STARTED) {
        throw state_error(status_, std::string("transaction is tombstoned (") + unit_of_work_status_name(status_) + "), it cannot be begun again");
    }
    // on failure, nothing is recorded and begin may be called again
    auto id = client_.api().begin_transaction(project());
    id_ = id;
    status_ = unit_of_work_status::IN_PROGRESS;
    txn_log->debug("began transaction {} in {}", id, project());
}

void
tx::transaction::commit()
{
    if (!id_) {
        throw state_error(status_, std::string("no transaction in progress to commit, status is ") + unit_of_work_status_name(status_));
    }
    auto response = send_commit(commit_mode::TRANSACTIONAL, id_);
    txn_log->debug("committed transaction {}", *id_);
    id_.reset();
    status_ = unit_of_work_status::COMMITTED;
    complete_partial_keys(response);
}

void
tx::transaction::rollback()
{
    if (!id_) {
        throw state_error(status_, std::string("no transaction in progress to roll back, status is ") + unit_of_work_status_name(status_));
    }
    auto id = *id_;
    txn_log->debug("rolling back transaction {}, discarding {} mutations", id, mutations_.size());
    // the transaction is over whether or not the server hears about it
    id_.reset();
    status_ = unit_of_work_status::ABORTED;
    clear_mutations();
    client_.api().rollback(project(), id);
}

void
tx::transaction::run(const std::function<void(transaction&)>& logic)
{
    run_scoped(*this, logic);
}

tx::unit_of_work_stack::entry
tx::transaction::stack_entry()
{
    return this;
}
