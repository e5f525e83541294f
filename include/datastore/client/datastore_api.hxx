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
#include <string>
#include <vector>

#include <boost/optional.hpp>
#include <datastore/client/entity.hxx>
#include <datastore/client/exceptions.hxx>
#include <datastore/client/key.hxx>
#include <datastore/client/mutation.hxx>
#include <datastore/support.hxx>

namespace datastore
{
enum class commit_mode { NON_TRANSACTIONAL, TRANSACTIONAL };

inline const char*
commit_mode_name(commit_mode mode)
{
    switch (mode) {
        case commit_mode::NON_TRANSACTIONAL:
            return "NON_TRANSACTIONAL";
        case commit_mode::TRANSACTIONAL:
            return "TRANSACTIONAL";
        default:
            throw std::runtime_error("unknown commit mode");
    }
}

/**
 * Result of a single mutation in a commit.  The key is only present when the server
 * allocated an identifier for an entity inserted with a partial key.
 */
struct mutation_result {
    boost::optional<datastore::key> key;
    bool conflict_detected{ false };
};

struct commit_response {
    /** @brief one entry per committed mutation, in commit order */
    std::vector<mutation_result> mutation_results;
    std::int32_t index_updates{ 0 };

    /**
     * @brief Keys allocated by the server, in the order of the mutations that needed them.
     */
    DS_NODISCARD std::vector<datastore::key> assigned_keys() const
    {
        std::vector<datastore::key> keys;
        for (const auto& res : mutation_results) {
            if (res.key) {
                keys.push_back(*res.key);
            }
        }
        return keys;
    }
};

struct lookup_response {
    std::vector<entity> found;
    std::vector<datastore::key> missing;
};

/**
 * @brief The RPC surface of the remote store used by the client and its units of work.
 *
 * Implementations report failures by throwing (usually @ref rpc_error).  Callers in this
 * library never retry, wrap or swallow those errors.
 */
class datastore_api
{
  public:
    virtual ~datastore_api() = default;

    /**
     * @brief Start a server-side transaction.
     *
     * @return opaque transaction identifier.
     */
    virtual std::string begin_transaction(const std::string& project) = 0;

    virtual commit_response commit(const std::string& project,
                                   commit_mode mode,
                                   const std::vector<mutation>& mutations,
                                   const boost::optional<std::string>& transaction) = 0;

    virtual void rollback(const std::string& project, const std::string& transaction) = 0;

    /**
     * @brief Fetch entities by key, optionally reading inside a transaction.
     */
    virtual lookup_response lookup(const std::string& project,
                                   const std::vector<datastore::key>& keys,
                                   const boost::optional<std::string>& transaction) = 0;
};
} // namespace datastore
