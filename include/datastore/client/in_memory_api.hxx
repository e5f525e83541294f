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

#include <cstdint>
#include <map>
#include <set>
#include <string>

#include <datastore/client/datastore_api.hxx>

namespace datastore
{
/**
 * @brief A process-local store implementing @ref datastore_api.
 *
 * Behaves like the store emulator: commits are applied atomically and in order, partial keys
 * receive sequential ids, and unknown transaction ids are rejected with
 * status_code::INVALID_ARGUMENT.  Useful for tests and examples; not thread safe.
 */
class in_memory_api : public datastore_api
{
  private:
    std::map<std::string, entity> entities_;
    std::set<std::string> open_transactions_;
    std::int64_t next_id_{ 1 };
    std::uint64_t next_transaction_{ 1 };

    void check_transaction(const std::string& transaction) const;

  public:
    in_memory_api() = default;

    std::string begin_transaction(const std::string& project) override;

    commit_response commit(const std::string& project,
                           commit_mode mode,
                           const std::vector<mutation>& mutations,
                           const boost::optional<std::string>& transaction) override;

    void rollback(const std::string& project, const std::string& transaction) override;

    lookup_response lookup(const std::string& project,
                           const std::vector<datastore::key>& keys,
                           const boost::optional<std::string>& transaction) override;

    DS_NODISCARD size_t size() const
    {
        return entities_.size();
    }

    DS_NODISCARD bool contains(const datastore::key& k) const;

    DS_NODISCARD size_t open_transactions() const
    {
        return open_transactions_.size();
    }
};
} // namespace datastore
