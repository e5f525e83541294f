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
#include <datastore/transactions.hxx>

#include <stdexcept>

namespace tx = datastore::transactions;

namespace datastore
{
client::client(const client_config& config, datastore_api& api)
  : config_(config)
  , api_(api)
{
    if (config_.project().empty()) {
        throw std::invalid_argument("client requires a project");
    }
    if (config_.log_level()) {
        set_client_log_level(*config_.log_level());
        tx::set_transactions_log_level(*config_.log_level());
    }
    client_log->debug("created client for project {}, namespace '{}'", project(), namespace_name());
}

client::~client()
{
    if (!stack_.empty()) {
        client_log->warn("client for project {} destroyed with {} open units of work", project(), stack_.depth());
    }
}

void
client::push_batch(tx::batch& b)
{
    stack_.push(b);
}

tx::batch*
client::pop_batch()
{
    return stack_.pop();
}

tx::batch*
client::current_batch() const
{
    return stack_.current_batch();
}

tx::transaction*
client::current_transaction() const
{
    return stack_.current_transaction();
}

std::unique_ptr<tx::batch>
client::new_batch()
{
    return std::unique_ptr<tx::batch>(new tx::batch(*this));
}

std::unique_ptr<tx::transaction>
client::new_transaction()
{
    return std::unique_ptr<tx::transaction>(new tx::transaction(*this));
}

key
client::key(std::vector<path_element> path) const
{
    return datastore::key(project(), namespace_name(), std::move(path));
}

void
client::put(entity& e)
{
    put_multi({ &e });
}

void
client::put_multi(const std::vector<entity*>& entities)
{
    if (entities.empty()) {
        return;
    }
    if (auto* current = current_batch()) {
        for (auto* e : entities) {
            current->put(*e);
        }
        return;
    }
    client_log->trace("no open unit of work, committing {} puts in an implicit batch", entities.size());
    tx::batch implicit(*this);
    implicit.begin();
    for (auto* e : entities) {
        implicit.put(*e);
    }
    implicit.commit();
}

void
client::remove(const datastore::key& k)
{
    remove_multi({ k });
}

void
client::remove_multi(const std::vector<datastore::key>& keys)
{
    if (keys.empty()) {
        return;
    }
    if (auto* current = current_batch()) {
        for (const auto& k : keys) {
            current->remove(k);
        }
        return;
    }
    client_log->trace("no open unit of work, committing {} deletes in an implicit batch", keys.size());
    tx::batch implicit(*this);
    implicit.begin();
    for (const auto& k : keys) {
        implicit.remove(k);
    }
    implicit.commit();
}

boost::optional<entity>
client::get(const datastore::key& k)
{
    auto found = get_multi({ k });
    if (found.empty()) {
        return {};
    }
    return found.front();
}

std::vector<entity>
client::get_multi(const std::vector<datastore::key>& keys, std::vector<datastore::key>* missing)
{
    if (keys.empty()) {
        return {};
    }
    for (const auto& k : keys) {
        if (k.project() != project()) {
            throw invalid_key("cannot get " + k.to_string() + " from project " + project());
        }
    }
    boost::optional<std::string> transaction_id;
    if (auto* txn = current_transaction()) {
        transaction_id = txn->id();
    }
    client_log->trace("looking up {} keys{}", keys.size(), transaction_id ? " in transaction " + *transaction_id : std::string());
    auto response = api_.lookup(project(), keys, transaction_id);
    if (missing != nullptr) {
        *missing = std::move(response.missing);
    }
    return std::move(response.found);
}
} // namespace datastore
