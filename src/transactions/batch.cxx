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
#include <datastore/transactions/batch.hxx>

namespace tx = datastore::transactions;

tx::batch::batch(datastore::client& c)
  : client_(c)
  , status_(unit_of_work_status::NOT_STARTED)
{
}

tx::batch::~batch()
{
    if (!mutations_.empty() && status_ != unit_of_work_status::COMMITTED) {
        txn_log->debug("discarding {} uncommitted mutations ({})", mutations_.size(), unit_of_work_status_name(status_));
    }
}

const std::string&
tx::batch::project() const
{
    return client_.project();
}

const std::string&
tx::batch::namespace_name() const
{
    return client_.namespace_name();
}

void
tx::batch::put(entity& e)
{
    const auto& k = e.key();
    if (k.empty()) {
        throw invalid_key("entity must have a key");
    }
    if (k.project() != project()) {
        throw invalid_key("key " + k.to_string() + " must be from the same project as the batch (" + project() + ")");
    }
    if (k.namespace_name() != namespace_name()) {
        throw invalid_key("key " + k.to_string() + " must be from the same namespace as the batch ('" + namespace_name() + "')");
    }
    mutations_.push_back(mutation::upsert(e));
    if (k.is_partial()) {
        partial_key_entities_.push_back(&e);
    }
    txn_log->trace("staged upsert of {}", k.to_string());
}

void
tx::batch::remove(const datastore::key& k)
{
    if (k.is_partial()) {
        throw invalid_key("key must be complete to be deleted, got " + k.to_string());
    }
    if (k.project() != project()) {
        throw invalid_key("key " + k.to_string() + " must be from the same project as the batch (" + project() + ")");
    }
    mutations_.push_back(mutation::remove(k));
    txn_log->trace("staged delete of {}", k.to_string());
}

void
tx::batch::begin()
{
    if (status_ != unit_of_work_status::NOT_STARTED) {
        throw state_error(status_, std::string("batch already started previously, status is ") + unit_of_work_status_name(status_));
    }
    status_ = unit_of_work_status::IN_PROGRESS;
    txn_log->trace("batch begun");
}

void
tx::batch::commit()
{
    if (status_ != unit_of_work_status::IN_PROGRESS) {
        throw state_error(status_, std::string("batch must be in progress to commit, status is ") + unit_of_work_status_name(status_));
    }
    auto response = send_commit(commit_mode::NON_TRANSACTIONAL, {});
    status_ = unit_of_work_status::COMMITTED;
    complete_partial_keys(response);
}

void
tx::batch::rollback()
{
    if (status_ != unit_of_work_status::IN_PROGRESS) {
        throw state_error(status_, std::string("batch must be in progress to roll back, status is ") + unit_of_work_status_name(status_));
    }
    txn_log->debug("rolling back batch, discarding {} mutations", mutations_.size());
    clear_mutations();
    status_ = unit_of_work_status::ABORTED;
}

void
tx::batch::run(const std::function<void(batch&)>& logic)
{
    run_scoped(*this, logic);
}

tx::unit_of_work_stack::entry
tx::batch::stack_entry()
{
    return this;
}

datastore::commit_response
tx::batch::send_commit(commit_mode mode, const boost::optional<std::string>& transaction_id)
{
    txn_log->debug("committing {} mutations to {} ({}{})",
                   mutations_.size(),
                   project(),
                   commit_mode_name(mode),
                   transaction_id ? ", transaction " + *transaction_id : std::string());
    return client_.api().commit(project(), mode, mutations_, transaction_id);
}

void
tx::batch::complete_partial_keys(const commit_response& response)
{
    auto assigned = response.assigned_keys();
    if (assigned.size() != partial_key_entities_.size()) {
        txn_log->error("commit returned {} allocated keys for {} partial keys", assigned.size(), partial_key_entities_.size());
        auto expected = partial_key_entities_.size();
        clear_mutations();
        throw invalid_commit_response(expected, assigned.size());
    }
    // the n-th allocated key belongs to the n-th entity put with a partial key
    for (size_t i = 0; i < assigned.size(); ++i) {
        auto* e = partial_key_entities_[i];
        txn_log->trace("{} allocated as {}", e->key().to_string(), assigned[i].to_string());
        e->key().path(assigned[i].path());
    }
    clear_mutations();
}

void
tx::batch::clear_mutations()
{
    mutations_.clear();
    partial_key_entities_.clear();
}

void
tx::batch::rollback_after_error(std::exception_ptr cause)
{
    std::string what = "non-standard exception";
    try {
        std::rethrow_exception(cause);
    } catch (const std::exception& e) {
        what = e.what();
    } catch (...) {
        // non-standard exceptions are described generically, the caller rethrows them unchanged
    }
    txn_log->debug("logic raised '{}', rolling back", what);
    try {
        rollback();
    } catch (const std::exception& e) {
        txn_log->error("got error '{}' while rolling back after '{}', raising the original error", e.what(), what);
    } catch (...) {
        txn_log->error("got non-standard error while rolling back after '{}', raising the original error", what);
    }
}
