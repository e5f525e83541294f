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
#include <datastore/client/in_memory_api.hxx>

namespace datastore
{
namespace
{
    std::string storage_key(const key& k)
    {
        return nlohmann::json(k).dump();
    }
} // namespace

void
in_memory_api::check_transaction(const std::string& transaction) const
{
    if (open_transactions_.count(transaction) == 0) {
        throw rpc_error(status_code::INVALID_ARGUMENT, "unknown or expired transaction " + transaction);
    }
}

bool
in_memory_api::contains(const key& k) const
{
    return entities_.count(storage_key(k)) > 0;
}

std::string
in_memory_api::begin_transaction(const std::string& project)
{
    std::string id = project + "-txn-" + std::to_string(next_transaction_++);
    open_transactions_.insert(id);
    client_log->trace("in-memory store began transaction {}", id);
    return id;
}

commit_response
in_memory_api::commit(const std::string& project,
                      commit_mode mode,
                      const std::vector<mutation>& mutations,
                      const boost::optional<std::string>& transaction)
{
    if (mode == commit_mode::TRANSACTIONAL) {
        if (!transaction) {
            throw rpc_error(status_code::INVALID_ARGUMENT, "transactional commit without a transaction");
        }
        check_transaction(*transaction);
    } else if (transaction) {
        throw rpc_error(status_code::INVALID_ARGUMENT, "non-transactional commit with a transaction");
    }

    // apply to a copy so that a rejected mutation leaves the store untouched
    auto staged = entities_;
    auto next_id = next_id_;
    commit_response response;
    for (const auto& m : mutations) {
        if (m.key().project() != project) {
            throw rpc_error(status_code::INVALID_ARGUMENT, "mutation key " + m.key().to_string() + " is not in project " + project);
        }
        mutation_result result;
        switch (m.type()) {
            case mutation_type::UPSERT: {
                key k = m.key();
                if (k.is_partial()) {
                    k = k.completed_key(next_id++);
                    result.key = k;
                }
                entity e(k, m.properties());
                e.exclude_from_indexes(m.exclude_from_indexes());
                staged[storage_key(k)] = e;
                response.index_updates++;
                break;
            }
            case mutation_type::REMOVE:
                if (m.key().is_partial()) {
                    throw rpc_error(status_code::INVALID_ARGUMENT, "cannot delete partial key " + m.key().to_string());
                }
                if (staged.erase(storage_key(m.key())) > 0) {
                    response.index_updates++;
                }
                break;
        }
        response.mutation_results.push_back(result);
    }
    entities_.swap(staged);
    next_id_ = next_id;
    if (transaction) {
        open_transactions_.erase(*transaction);
    }
    client_log->trace("in-memory store committed {} mutations ({})", mutations.size(), commit_mode_name(mode));
    return response;
}

void
in_memory_api::rollback(const std::string&, const std::string& transaction)
{
    check_transaction(transaction);
    open_transactions_.erase(transaction);
    client_log->trace("in-memory store rolled back transaction {}", transaction);
}

lookup_response
in_memory_api::lookup(const std::string& project, const std::vector<key>& keys, const boost::optional<std::string>& transaction)
{
    if (transaction) {
        check_transaction(*transaction);
    }
    lookup_response response;
    for (const auto& k : keys) {
        if (k.project() != project || k.is_partial()) {
            throw rpc_error(status_code::INVALID_ARGUMENT, "cannot look up " + k.to_string() + " in project " + project);
        }
        auto it = entities_.find(storage_key(k));
        if (it == entities_.end()) {
            response.missing.push_back(k);
        } else {
            response.found.push_back(it->second);
        }
    }
    return response;
}
} // namespace datastore
