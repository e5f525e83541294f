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

#include <datastore/transactions.hxx>

#include <cstdint>
#include <exception>
#include <stdexcept>
#include <string>
#include <vector>

#include <boost/optional.hpp>

namespace ds = datastore;

#define TEST_PROJECT "PROJECT"

struct commit_call {
    std::string project;
    ds::commit_mode mode;
    std::vector<ds::mutation> mutations;
    boost::optional<std::string> transaction;
};

struct rollback_call {
    std::string project;
    std::string transaction;
};

struct lookup_call {
    std::string project;
    std::vector<ds::key> keys;
    boost::optional<std::string> transaction;
};

/**
 * datastore_api that records every call and answers with canned values.  Set one of the
 * *_error members to make the next calls of that kind throw.
 */
class recording_api : public ds::datastore_api
{
  public:
    explicit recording_api(std::string txn_id = "234")
      : transaction_id(std::move(txn_id))
    {
    }

    std::string begin_transaction(const std::string& project) override
    {
        begun.push_back(project);
        if (begin_error) {
            std::rethrow_exception(begin_error);
        }
        return transaction_id;
    }

    ds::commit_response commit(const std::string& project,
                               ds::commit_mode mode,
                               const std::vector<ds::mutation>& mutations,
                               const boost::optional<std::string>& transaction) override
    {
        commits.push_back(commit_call{ project, mode, mutations, transaction });
        if (commit_error) {
            std::rethrow_exception(commit_error);
        }
        return response;
    }

    void rollback(const std::string& project, const std::string& transaction) override
    {
        rollbacks.push_back(rollback_call{ project, transaction });
        if (rollback_error) {
            std::rethrow_exception(rollback_error);
        }
    }

    ds::lookup_response lookup(const std::string& project,
                               const std::vector<ds::key>& keys,
                               const boost::optional<std::string>& transaction) override
    {
        lookups.push_back(lookup_call{ project, keys, transaction });
        return found;
    }

    std::string transaction_id;
    ds::commit_response response;
    ds::lookup_response found;

    std::exception_ptr begin_error;
    std::exception_ptr commit_error;
    std::exception_ptr rollback_error;

    std::vector<std::string> begun;
    std::vector<commit_call> commits;
    std::vector<rollback_call> rollbacks;
    std::vector<lookup_call> lookups;
};

inline ds::key
make_key(const std::string& kind, std::int64_t id, const std::string& project = TEST_PROJECT)
{
    return ds::key(project, "", { ds::path_element(kind, id) });
}

inline ds::key
make_partial_key(const std::string& kind, const std::string& project = TEST_PROJECT)
{
    return ds::key(project, "", { ds::path_element(kind) });
}

/**
 * A commit response allocating the given keys, one mutation result per key.
 */
inline ds::commit_response
make_commit_response(const std::vector<ds::key>& keys)
{
    ds::commit_response response;
    for (const auto& k : keys) {
        ds::mutation_result result;
        result.key = k;
        response.mutation_results.push_back(result);
    }
    return response;
}

/**
 * Opens a batch on the client without beginning or committing it; popped on scope exit.
 */
class no_commit_batch
{
  public:
    explicit no_commit_batch(ds::client& c)
      : client_(c)
      , batch_(c)
    {
        client_.push_batch(batch_);
    }

    ~no_commit_batch()
    {
        client_.pop_batch();
    }

    ds::transactions::batch& get()
    {
        return batch_;
    }

  private:
    ds::client& client_;
    ds::transactions::batch batch_;
};

class test_failure : public std::runtime_error
{
  public:
    explicit test_failure(const std::string& what)
      : std::runtime_error(what)
    {
    }
};
